/// @file src/main.cpp
/// @brief statarb CLI entry point.
///
/// Usage:
///   statarb [walkforward] [options]   Walk-forward pairs backtest (default)
///   statarb find-pairs [options]      Engle-Granger scan → pairs.csv
///   statarb static [options]          Full-sample threshold backtest per pair
///   statarb --help                    Print usage

#include "statarb/backtest.hpp"
#include "statarb/errors.hpp"
#include "statarb/pair_discovery.hpp"
#include "statarb/pair_filters.hpp"
#include "statarb/price_loader.hpp"
#include "statarb/report.hpp"
#include "statarb/walk_forward.hpp"

#include <fmt/core.h>

#include <charconv>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

namespace fs = std::filesystem;
using statarb::Date;
using statarb::ErrorKind;
using statarb::StatArbError;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  statarb [walkforward] [options]   Walk-forward pairs backtest\n"
        "  statarb find-pairs [options]      Cointegration scan, writes pairs.csv\n"
        "  statarb static [options]          Static threshold backtest per pair\n"
        "  statarb --help                    Show this help\n"
        "\n"
        "Options:\n"
        "  --start YYYY-MM-DD      first date             (default {})\n"
        "  --end YYYY-MM-DD        last date              (default {})\n"
        "  --formation N           formation trading days (default {})\n"
        "  --trade N               trading-window days    (default {})\n"
        "  --lookback N            z-score window         (default {})\n"
        "  --entry Z               entry threshold        (default {})\n"
        "  --exit Z                exit threshold         (default {})\n"
        "  --time-stop D           calendar-day stop, 0 disables (default {})\n"
        "  --cost-bps B            cost per leg in bps    (default {})\n"
        "  --within-sector         pair only tickers with equal SIC2 codes\n"
        "  --labels-date YYYY-MM-DD  sector label snapshot (default --end)\n"
        "  --data-dir DIR          price files            (default data/raw)\n"
        "  --meta-dir DIR          sector labels          (default data/meta)\n"
        "  --out-dir DIR           results                (default results)\n"
        "  --whitelist FILE        pair whitelist         (default <out-dir>/pairs.csv)\n"
        "  --no-whitelist          trade every pair that passes the gates\n"
        "  --tickers A,B,...       universe               (default: every file in --data-dir)\n"
        "  --pair T1,T2            static mode: pair to test (repeatable)\n"
        "  --z Z                   static mode: threshold (default {})\n"
        "  --verbose               per-cycle diagnostics\n"
        "\n"
        "Price files: <data-dir>/<TICKER>_dsf_1y.csv with columns date,prc\n",
        statarb::constants::DEFAULT_START, statarb::constants::DEFAULT_END,
        statarb::constants::DEFAULT_FORMATION, statarb::constants::DEFAULT_TRADE,
        statarb::constants::DEFAULT_LOOKBACK, statarb::constants::DEFAULT_ENTRY_Z,
        statarb::constants::DEFAULT_EXIT_Z, statarb::constants::DEFAULT_TIME_STOP_DAYS,
        statarb::constants::DEFAULT_COST_BPS, statarb::constants::DEFAULT_STATIC_Z);
}

// ─── CLI Argument Parsing ─────────────────────────────────────────────────────

struct Args {
    std::string mode = "walkforward";
    std::string start = statarb::constants::DEFAULT_START;
    std::string end   = statarb::constants::DEFAULT_END;
    std::size_t formation      = statarb::constants::DEFAULT_FORMATION;
    std::size_t trade          = statarb::constants::DEFAULT_TRADE;
    std::size_t lookback       = statarb::constants::DEFAULT_LOOKBACK;
    double      entry_z        = statarb::constants::DEFAULT_ENTRY_Z;
    double      exit_z         = statarb::constants::DEFAULT_EXIT_Z;
    int         time_stop_days = statarb::constants::DEFAULT_TIME_STOP_DAYS;
    double      cost_bps       = statarb::constants::DEFAULT_COST_BPS;
    double      static_z       = statarb::constants::DEFAULT_STATIC_Z;
    bool        within_sector  = false;
    bool        use_whitelist  = true;
    bool        verbose        = false;
    std::string labels_date;
    std::string data_dir = "data/raw";
    std::string meta_dir = "data/meta";
    std::string out_dir  = "results";
    std::string whitelist;
    std::vector<std::string> tickers;
    std::vector<std::pair<std::string, std::string>> pairs;
};

template <typename T>
T parse_number(const std::string& flag, const std::string& text) {
    T value{};
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        throw StatArbError(ErrorKind::InvalidConfiguration,
                           fmt::format("{} expects a number, got '{}'", flag, text));
    }
    return value;
}

Date parse_date(const std::string& flag, const std::string& text) {
    const auto d = Date::parse(text);
    if (!d) {
        throw StatArbError(ErrorKind::InvalidConfiguration,
                           fmt::format("{} expects YYYY-MM-DD, got '{}'", flag, text));
    }
    return *d;
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(statarb::to_upper(item));
    }
    return out;
}

/// Returns nullopt (after printing the reason) on unknown or incomplete flags.
std::optional<Args> parse_args(int argc, char* argv[]) {
    Args args;
    int i = 1;
    if (argc > 1 && argv[1][0] != '-') {
        args.mode = argv[1];
        i = 2;
    }

    for (; i < argc; ++i) {
        const std::string key(argv[i]);

        if (key == "--within-sector") { args.within_sector = true;  continue; }
        if (key == "--no-whitelist")  { args.use_whitelist = false; continue; }
        if (key == "--verbose")       { args.verbose       = true;  continue; }

        if (i + 1 >= argc) {
            fmt::print(stderr, "Error: {} requires a value\n", key);
            return std::nullopt;
        }
        const std::string val(argv[++i]);

        if      (key == "--start")       args.start = val;
        else if (key == "--end")         args.end = val;
        else if (key == "--formation")   args.formation = parse_number<std::size_t>(key, val);
        else if (key == "--trade")       args.trade = parse_number<std::size_t>(key, val);
        else if (key == "--lookback")    args.lookback = parse_number<std::size_t>(key, val);
        else if (key == "--entry")       args.entry_z = parse_number<double>(key, val);
        else if (key == "--exit")        args.exit_z = parse_number<double>(key, val);
        else if (key == "--time-stop")   args.time_stop_days = parse_number<int>(key, val);
        else if (key == "--cost-bps")    args.cost_bps = parse_number<double>(key, val);
        else if (key == "--z")           args.static_z = parse_number<double>(key, val);
        else if (key == "--labels-date") args.labels_date = val;
        else if (key == "--data-dir")    args.data_dir = val;
        else if (key == "--meta-dir")    args.meta_dir = val;
        else if (key == "--out-dir")     args.out_dir = val;
        else if (key == "--whitelist")   args.whitelist = val;
        else if (key == "--tickers")     args.tickers = split_list(val);
        else if (key == "--pair") {
            const auto legs = split_list(val);
            if (legs.size() != 2) {
                fmt::print(stderr, "Error: --pair expects T1,T2, got '{}'\n", val);
                return std::nullopt;
            }
            args.pairs.emplace_back(legs[0], legs[1]);
        } else {
            fmt::print(stderr, "Unknown option: {}\n", key);
            return std::nullopt;
        }
    }

    if (args.labels_date.empty()) args.labels_date = args.end;
    if (args.whitelist.empty())   args.whitelist = (fs::path(args.out_dir) / statarb::report::PAIRS_FILE).string();
    return args;
}

// ─── Shared setup ─────────────────────────────────────────────────────────────

std::vector<std::string> resolve_tickers(const Args& args,
                                         const statarb::CsvPriceLoader& loader) {
    if (!args.tickers.empty()) return args.tickers;
    auto tickers = loader.discover_tickers();
    if (tickers.empty()) {
        throw StatArbError(ErrorKind::MissingData,
            fmt::format("no *{} price files found in '{}'",
                        statarb::CsvPriceLoader::FILE_SUFFIX, args.data_dir));
    }
    return tickers;
}

// ─── Modes ────────────────────────────────────────────────────────────────────

int run_walk_forward(const Args& args) {
    fmt::print("Starting walk-forward backtest...\n");

    statarb::backtest::WalkForwardConfig cfg;
    cfg.start         = parse_date("--start", args.start);
    cfg.end           = parse_date("--end", args.end);
    cfg.formation     = args.formation;
    cfg.trade         = args.trade;
    cfg.within_sector = args.within_sector;
    cfg.labels_date   = args.labels_date;
    cfg.verbose       = args.verbose;
    cfg.signal = statarb::signal::SignalConfig{
        .lookback       = args.lookback,
        .entry_z        = args.entry_z,
        .exit_z         = args.exit_z,
        .time_stop_days = args.time_stop_days,
        .cost_bps       = args.cost_bps,
    };
    cfg.validate();

    const statarb::CsvPriceLoader loader(args.data_dir);
    const auto tickers = resolve_tickers(args, loader);
    fmt::print("Loaded tickers: {}\n", tickers.size());

    std::optional<statarb::PairWhitelist> whitelist;
    if (args.use_whitelist) {
        whitelist = statarb::PairWhitelist::load_csv(args.whitelist, cfg.screener.pval_max);
        if (whitelist) {
            fmt::print("'{}' whitelist loaded: {} pairs (p <= {})\n",
                       args.whitelist, whitelist->size(), cfg.screener.pval_max);
        }
    }

    std::optional<statarb::SectorMap> sectors;
    if (cfg.within_sector) {
        sectors = statarb::SectorMap::load_csv(
            statarb::SectorMap::labels_path(args.meta_dir, args.labels_date), args.labels_date);
    }

    const statarb::backtest::WalkForwardEngine engine(cfg, std::move(whitelist), std::move(sectors));
    const auto universe = statarb::load_universe(loader, tickers, cfg.start, cfg.end, cfg.verbose);
    const auto result   = engine.run(universe);

    const auto paths = statarb::report::write_walk_forward(args.out_dir, cfg, result);
    fmt::print("Walk-forward saved to:\n");
    for (const auto& p : paths) fmt::print("  {}\n", p.string());
    fmt::print("{}, Cycles={}, Pairs={}\n",
               result.metrics.to_string(), result.cycles.size(), result.pairs_selected);
    return 0;
}

int run_find_pairs(const Args& args) {
    const Date start = parse_date("--start", args.start);
    const Date end   = parse_date("--end", args.end);

    const statarb::CsvPriceLoader loader(args.data_dir);
    const auto universe = statarb::load_universe(loader, resolve_tickers(args, loader),
                                                 start, end, args.verbose);
    const auto scores = statarb::scan_cointegration(universe, start, end);

    const fs::path out = fs::path(args.out_dir) / statarb::report::PAIRS_FILE;
    statarb::report::write_text_file(out, statarb::report::pairs_csv(scores));
    fmt::print("Saved {} pairs to {}\n", scores.size(), out.string());
    return 0;
}

int run_static(const Args& args) {
    const Date start = parse_date("--start", args.start);
    const Date end   = parse_date("--end", args.end);

    const statarb::CsvPriceLoader loader(args.data_dir);

    auto pairs = args.pairs;
    std::vector<std::string> tickers;
    if (pairs.empty()) {
        tickers = resolve_tickers(args, loader);
        for (std::size_t a = 0; a < tickers.size(); ++a) {
            for (std::size_t b = a + 1; b < tickers.size(); ++b) {
                pairs.emplace_back(tickers[a], tickers[b]);
            }
        }
        fmt::print("Generated {} pairs from {} tickers\n", pairs.size(), tickers.size());
    } else {
        for (const auto& [t1, t2] : pairs) {
            tickers.push_back(t1);
            tickers.push_back(t2);
        }
        fmt::print("Using {} specified pairs\n", pairs.size());
    }

    const auto universe = statarb::load_universe(loader, tickers, start, end, args.verbose);

    std::vector<statarb::backtest::StaticPairResult> results;
    for (const auto& [t1, t2] : pairs) {
        const auto it1 = universe.find(t1);
        const auto it2 = universe.find(t2);
        if (it1 == universe.end() || it2 == universe.end()) {
            fmt::print(stderr, "Failed to backtest {}-{}: missing price history\n", t1, t2);
            continue;
        }
        const auto r = statarb::backtest::static_pair_backtest(
            it1->second, it2->second, start, end, args.static_z);
        if (!r) {
            fmt::print(stderr, "Failed to backtest {}-{}: degenerate spread\n", t1, t2);
            continue;
        }
        fmt::print("{}-{}: {:.4f} return, {:.4f} sharpe\n", t1, t2, r->ann_return, r->sharpe_ratio);
        results.push_back(*r);
    }

    if (results.empty()) {
        fmt::print("No successful backtests completed\n");
        return 1;
    }

    const fs::path out = fs::path(args.out_dir) / statarb::report::STATIC_RESULTS_FILE;
    statarb::report::write_text_file(out, statarb::report::static_results_csv(results));

    double sharpe_sum = 0.0;
    for (const auto& r : results) sharpe_sum += r.sharpe_ratio;
    fmt::print("Saved backtest results -> {}\n", out.string());
    fmt::print("Tested {} pairs, avg sharpe: {:.4f}\n",
               results.size(), sharpe_sum / static_cast<double>(results.size()));
    return 0;
}

}  // anonymous namespace

// ─── main ─────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc > 1) {
        const std::string first(argv[1]);
        if (first == "--help" || first == "-h") {
            print_usage();
            return 0;
        }
    }

    try {
        const auto maybe_args = parse_args(argc, argv);
        if (!maybe_args.has_value()) {
            print_usage();
            return 1;
        }
        const Args& args = *maybe_args;

        if (args.mode == "walkforward") return run_walk_forward(args);
        if (args.mode == "find-pairs")  return run_find_pairs(args);
        if (args.mode == "static")      return run_static(args);

        fmt::print(stderr, "Unknown mode: {}\n", args.mode);
        print_usage();
        return 1;
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[FATAL] {}\n", ex.what());
        return 1;
    }
}
