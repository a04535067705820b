/// @file src/core/price_loader.cpp
/// @brief CSV price loader and universe assembly.

#include "statarb/price_loader.hpp"
#include "statarb/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <numeric>
#include <optional>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace statarb {

namespace {

/// Split a CSV line on commas and trim whitespace from each field.
std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        const auto first = field.find_first_not_of(" \t\r\n\"");
        const auto last  = field.find_last_not_of(" \t\r\n\"");
        if (first == std::string::npos) {
            fields.emplace_back();
        } else {
            fields.push_back(field.substr(first, last - first + 1));
        }
    }
    return fields;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

/// Parse a finite double, rejecting trailing garbage.
std::optional<double> parse_double(const std::string& s) {
    if (s.empty()) return std::nullopt;
    try {
        std::size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

// ─── canonicalize ─────────────────────────────────────────────────────────────

void canonicalize(PriceSeries& series) {
    const std::size_t n = std::min(series.dates.size(), series.log_prices.size());

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return series.dates[a] < series.dates[b];
    });

    std::vector<Date>   dates;
    std::vector<double> values;
    dates.reserve(n);
    values.reserve(n);
    for (std::size_t idx : order) {
        const double v = series.log_prices[idx];
        if (!std::isfinite(v)) continue;
        if (!dates.empty() && dates.back() == series.dates[idx]) continue;
        dates.push_back(series.dates[idx]);
        values.push_back(v);
    }
    series.dates      = std::move(dates);
    series.log_prices = std::move(values);
}

// ─── parse_price_csv ──────────────────────────────────────────────────────────

PriceSeries parse_price_csv(const std::string& csv_content, const std::string& ticker) {
    PriceSeries series;
    series.ticker = ticker;

    std::istringstream stream(csv_content);
    std::string line;
    std::optional<std::size_t> date_col;
    std::optional<std::size_t> price_col;
    bool header_seen = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        const auto fields = split_csv(line);
        if (!header_seen) {
            header_seen = true;
            for (std::size_t i = 0; i < fields.size(); ++i) {
                const std::string name = lower(fields[i]);
                if (name == "date") date_col = i;
                if (name == "prc")  price_col = i;
            }
            if (!date_col || !price_col) return series;
            continue;
        }

        if (fields.size() <= std::max(*date_col, *price_col)) continue;

        const auto date  = Date::parse(fields[*date_col]);
        const auto price = parse_double(fields[*price_col]);
        if (!date || !price) continue;
        // Non-positive prices have no logarithm.
        if (!std::isfinite(*price) || *price <= 0.0) continue;

        series.dates.push_back(*date);
        series.log_prices.push_back(std::log(*price));
    }

    canonicalize(series);
    return series;
}

// ─── CsvPriceLoader ───────────────────────────────────────────────────────────

CsvPriceLoader::CsvPriceLoader(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)) {}

std::filesystem::path CsvPriceLoader::path_for(const std::string& ticker) const {
    return data_dir_ / (ticker + FILE_SUFFIX);
}

PriceSeries CsvPriceLoader::load(const std::string& ticker, Date start, Date end) const {
    const auto path = path_for(ticker);
    std::ifstream file(path);
    if (!file.is_open()) {
        throw StatArbError(ErrorKind::MissingData,
            fmt::format("Missing CSV for {}: {} (requested {} to {})",
                        ticker, path.string(), start.to_string(), end.to_string()));
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_price_csv(contents.str(), ticker).slice(start, end);
}

std::vector<std::string> CsvPriceLoader::discover_tickers() const {
    std::vector<std::string> tickers;
    std::error_code ec;
    if (!std::filesystem::is_directory(data_dir_, ec)) return tickers;

    const std::string_view suffix(FILE_SUFFIX);
    for (const auto& entry : std::filesystem::directory_iterator(data_dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        const std::string name = entry.path().filename().string();
        if (name.size() <= suffix.size()) continue;
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;
        tickers.push_back(name.substr(0, name.size() - suffix.size()));
    }
    std::sort(tickers.begin(), tickers.end());
    return tickers;
}

// ─── load_universe ────────────────────────────────────────────────────────────

Universe load_universe(const PriceLoader&              loader,
                       const std::vector<std::string>& tickers,
                       Date start,
                       Date end,
                       bool verbose) {
    Universe universe;
    for (const auto& ticker : tickers) {
        try {
            PriceSeries s = loader.load(ticker, start, end);
            if (s.empty()) {
                if (verbose) {
                    fmt::print(stderr, "[loader] {}: no prices in {} to {}, skipped\n",
                               ticker, start.to_string(), end.to_string());
                }
                continue;
            }
            universe.emplace(ticker, std::move(s));
        } catch (const StatArbError& ex) {
            if (ex.kind() != ErrorKind::MissingData) throw;
            fmt::print(stderr, "[loader] {}, skipped\n", ex.what());
        }
    }

    if (universe.empty()) {
        throw StatArbError(ErrorKind::MissingData,
            fmt::format("no usable price history for any of {} tickers in {} to {}",
                        tickers.size(), start.to_string(), end.to_string()));
    }
    return universe;
}

}  // namespace statarb
