/// @file src/core/pair_filters.cpp
/// @brief Whitelist and sector-label parsing.

#include "statarb/pair_filters.hpp"
#include "statarb/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace statarb {

namespace {

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        const auto first = field.find_first_not_of(" \t\r\n\"");
        const auto last  = field.find_last_not_of(" \t\r\n\"");
        fields.push_back(first == std::string::npos
                             ? std::string{}
                             : field.substr(first, last - first + 1));
    }
    return fields;
}

/// Column index of `name` in a header row (case-insensitive).
std::optional<std::size_t> column(const std::vector<std::string>& header,
                                  const std::string& name) {
    for (std::size_t i = 0; i < header.size(); ++i) {
        std::string h = header[i];
        std::transform(h.begin(), h.end(), h.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (h == name) return i;
    }
    return std::nullopt;
}

/// Read every non-empty line; the first is the header.
std::vector<std::vector<std::string>> read_rows(const std::string& content) {
    std::vector<std::vector<std::string>> rows;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        rows.push_back(split_fields(line));
    }
    return rows;
}

std::optional<double> to_double(const std::string& s) {
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

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return s;
}

// ─── PairWhitelist ────────────────────────────────────────────────────────────

void PairWhitelist::add(const std::string& a, const std::string& b) {
    std::string x = to_upper(a);
    std::string y = to_upper(b);
    if (y < x) std::swap(x, y);
    pairs_.emplace(std::move(x), std::move(y));
}

bool PairWhitelist::contains(const std::string& a, const std::string& b) const {
    std::string x = to_upper(a);
    std::string y = to_upper(b);
    if (y < x) std::swap(x, y);
    return pairs_.count({x, y}) > 0;
}

std::optional<PairWhitelist>
PairWhitelist::parse_csv(const std::string& csv_content, double pval_max) {
    const auto rows = read_rows(csv_content);
    if (rows.empty()) return std::nullopt;

    const auto c1 = column(rows.front(), "ticker1");
    const auto c2 = column(rows.front(), "ticker2");
    const auto cp = column(rows.front(), "pval");
    if (!c1 || !c2) return std::nullopt;

    PairWhitelist wl;
    for (std::size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (row.size() <= std::max(*c1, *c2)) continue;
        if (row[*c1].empty() || row[*c2].empty()) continue;
        if (cp) {
            if (row.size() <= *cp) continue;
            const auto p = to_double(row[*cp]);
            if (!p || !(*p <= pval_max)) continue;
        }
        wl.add(row[*c1], row[*c2]);
    }
    return wl;
}

std::optional<PairWhitelist>
PairWhitelist::load_csv(const std::filesystem::path& path, double pval_max) {
    std::ifstream file(path);
    if (!file.is_open()) {
        fmt::print(stderr, "[whitelist] cannot read '{}', no whitelist applied\n", path.string());
        return std::nullopt;
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    auto wl = parse_csv(contents.str(), pval_max);
    if (!wl) {
        fmt::print(stderr, "[whitelist] '{}' missing ticker1/ticker2 columns, ignored\n",
                   path.string());
    }
    return wl;
}

// ─── SectorMap ────────────────────────────────────────────────────────────────

void SectorMap::set(const std::string& ticker, std::optional<int> sic2) {
    codes_[to_upper(ticker)] = sic2;
}

std::optional<int> SectorMap::sector(const std::string& ticker) const {
    const auto it = codes_.find(to_upper(ticker));
    if (it == codes_.end()) return std::nullopt;
    return it->second;
}

bool SectorMap::same_sector(const std::string& a, const std::string& b) const {
    const auto sa = sector(a);
    const auto sb = sector(b);
    return sa.has_value() && sb.has_value() && *sa == *sb;
}

SectorMap SectorMap::parse_csv(const std::string& csv_content) {
    SectorMap map;
    const auto rows = read_rows(csv_content);
    if (rows.empty()) return map;

    const auto ct = column(rows.front(), "ticker");
    const auto cs = column(rows.front(), "sic2");
    if (!ct || !cs) return map;

    for (std::size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (row.size() <= *ct || row[*ct].empty()) continue;

        std::optional<int> code;
        if (row.size() > *cs) {
            const auto v = to_double(row[*cs]);
            // Codes outside the int range are treated as missing labels.
            if (v && *v >= std::numeric_limits<int>::min() &&
                     *v <= std::numeric_limits<int>::max()) {
                code = static_cast<int>(*v);
            }
        }
        map.set(row[*ct], code);
    }
    return map;
}

std::filesystem::path SectorMap::labels_path(const std::filesystem::path& meta_dir,
                                             const std::string& labels_date) {
    return meta_dir / fmt::format("sic_map_{}.csv", labels_date);
}

SectorMap SectorMap::load_csv(const std::filesystem::path& path,
                              const std::string& labels_date) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw StatArbError(ErrorKind::SectorLabelMissing,
            fmt::format("Missing labels file: {}. Regenerate the SIC labels for {} "
                        "(labels step with --on {}) before retrying.",
                        path.string(), labels_date, labels_date));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv(contents.str());
}

}  // namespace statarb
