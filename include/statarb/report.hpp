#pragma once

/// @file include/statarb/report.hpp
/// @brief CSV artifacts of a run.
///
/// | file                      | columns                                          |
/// |---------------------------|--------------------------------------------------|
/// | equity_walkforward.csv    | date,portfolio_ret,equity                        |
/// | wf_summary.csv            | configuration, then ann_return … pairs_selected  |
/// | wf_pairs_stats.csv        | t1,t2,ret_sum,ret_cnt,cycles                     |
/// | pairs.csv                 | ticker1,ticker2,pval                             |
/// | backtest_results.csv      | t1,t2,ann_return,sharpe,total_return             |
///
/// The `*_csv` functions render text; `write_text_file` persists it and
/// throws `StatArbError{Io}` naming the path on failure.

#include "statarb/backtest.hpp"
#include "statarb/pair_discovery.hpp"
#include "statarb/walk_forward.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace statarb::report {

inline constexpr const char* EQUITY_FILE       = "equity_walkforward.csv";
inline constexpr const char* SUMMARY_FILE      = "wf_summary.csv";
inline constexpr const char* PAIR_STATS_FILE   = "wf_pairs_stats.csv";
inline constexpr const char* PAIRS_FILE        = "pairs.csv";
inline constexpr const char* STATIC_RESULTS_FILE = "backtest_results.csv";

[[nodiscard]] std::string equity_csv(const backtest::WalkForwardResult& result);

[[nodiscard]] std::string summary_csv(const backtest::WalkForwardConfig& config,
                                      const backtest::WalkForwardResult& result);

[[nodiscard]] std::string pair_stats_csv(const backtest::PairStatsBook& book);

[[nodiscard]] std::string pairs_csv(const std::vector<PairScore>& scores);

[[nodiscard]] std::string static_results_csv(
    const std::vector<backtest::StaticPairResult>& results);

/// Write `content` to `path`, creating parent directories.
///
/// # Throws
/// `StatArbError{Io}` if the file cannot be opened or written.
void write_text_file(const std::filesystem::path& path, const std::string& content);

/// Write the three walk-forward artifacts into `out_dir`.
///
/// # Returns
/// The paths written, in table order.
std::vector<std::filesystem::path>
write_walk_forward(const std::filesystem::path&       out_dir,
                   const backtest::WalkForwardConfig& config,
                   const backtest::WalkForwardResult& result);

}  // namespace statarb::report
