/// @file src/backtest/report.cpp
/// @brief CSV rendering and persistence of run artifacts.

#include "statarb/report.hpp"
#include "statarb/errors.hpp"

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace statarb::report {

// ─── Rendering ────────────────────────────────────────────────────────────────

std::string equity_csv(const backtest::WalkForwardResult& result) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "date,portfolio_ret,equity\n");
    for (std::size_t i = 0; i < result.pnl.size(); ++i) {
        fmt::format_to(std::back_inserter(buf), "{},{},{}\n",
                       result.pnl.dates[i].to_string(),
                       result.pnl.values[i],
                       result.equity[i]);
    }
    return fmt::to_string(buf);
}

std::string summary_csv(const backtest::WalkForwardConfig& config,
                        const backtest::WalkForwardResult& result) {
    const auto& m = result.metrics;
    return fmt::format(
        "start,end,formation,trade,lookback,entry_z,exit_z,time_stop,cost_bps,within_sector,"
        "ann_return,ann_vol,sharpe,max_drawdown,sortino,num_days,num_cycles,pairs_selected\n"
        "{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{},{}\n",
        config.start.to_string(), config.end.to_string(),
        config.formation, config.trade,
        config.signal.lookback, config.signal.entry_z, config.signal.exit_z,
        config.signal.time_stop_days, config.signal.cost_bps, config.within_sector,
        m.ann_return, m.ann_vol, m.sharpe_ratio, m.max_drawdown, m.sortino_ratio,
        m.num_days, result.cycles.size(), result.pairs_selected);
}

std::string pair_stats_csv(const backtest::PairStatsBook& book) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "t1,t2,ret_sum,ret_cnt,cycles\n");
    for (const auto& [pair, s] : book) {
        fmt::format_to(std::back_inserter(buf), "{},{},{},{},{}\n",
                       pair.first, pair.second, s.ret_sum, s.ret_cnt, s.cycles);
    }
    return fmt::to_string(buf);
}

std::string pairs_csv(const std::vector<PairScore>& scores) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "ticker1,ticker2,pval\n");
    for (const auto& s : scores) {
        fmt::format_to(std::back_inserter(buf), "{},{},{}\n", s.ticker1, s.ticker2, s.pvalue);
    }
    return fmt::to_string(buf);
}

std::string static_results_csv(const std::vector<backtest::StaticPairResult>& results) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "t1,t2,ann_return,sharpe,total_return\n");
    for (const auto& r : results) {
        fmt::format_to(std::back_inserter(buf), "{},{},{},{},{}\n",
                       r.ticker1, r.ticker2, r.ann_return, r.sharpe_ratio, r.total_return);
    }
    return fmt::to_string(buf);
}

// ─── Persistence ──────────────────────────────────────────────────────────────

void write_text_file(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw StatArbError(ErrorKind::Io,
                fmt::format("cannot create directory '{}': {}",
                            path.parent_path().string(), ec.message()));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw StatArbError(ErrorKind::Io, fmt::format("cannot open output '{}'", path.string()));
    }
    out << content;
    out.flush();
    if (!out) {
        throw StatArbError(ErrorKind::Io, fmt::format("failed writing '{}'", path.string()));
    }
}

std::vector<std::filesystem::path>
write_walk_forward(const std::filesystem::path&       out_dir,
                   const backtest::WalkForwardConfig& config,
                   const backtest::WalkForwardResult& result) {
    const std::vector<std::filesystem::path> paths{
        out_dir / EQUITY_FILE,
        out_dir / SUMMARY_FILE,
        out_dir / PAIR_STATS_FILE,
    };
    write_text_file(paths[0], equity_csv(result));
    write_text_file(paths[1], summary_csv(config, result));
    write_text_file(paths[2], pair_stats_csv(result.pair_stats));
    return paths;
}

}  // namespace statarb::report
