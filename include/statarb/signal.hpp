#pragma once

/// @file include/statarb/signal.hpp
/// @brief Signal Generator: rolling spread z-scores and the position state machine.
///
/// # Module: Signal Generator
///
/// ## Responsibility
/// Turn one selected pair (frozen α, β, weight) into a date-indexed series
/// of weighted, cost-adjusted daily returns over a trading window.
///
/// ## Pipeline
///   1. spread_t = lp1_t − (α + β·lp2_t) over the full aligned history
///   2. z_t = (spread_t − μ_{t−1}) / σ_{t−1}, rolling window of L
///      observations, at least ⌊L/2⌋ required, σ = 0 treated as undefined
///   3. FLAT / LONG / SHORT scan over the defined z-scores inside the window
///   4. Positions reindexed onto the window's spread dates (leading gap FLAT,
///      forward-filled otherwise)
///   5. gross_t = pos_{t−1} · (spread_t − spread_{t−1}), zero on day one
///   6. net_t = (gross_t − cost_t) · weight, see cost_model.hpp
///
/// ## State Machine
/// ```
///   FLAT  ──z ≤ −Ez──▶ LONG   (entry_date = today)
///   FLAT  ──z ≥ +Ez──▶ SHORT  (entry_date = today)
///   LONG/SHORT ──|z| ≤ Xz  or  today − entry_date ≥ Td──▶ FLAT
/// ```
/// Td counts calendar days; Td = 0 disables the time stop. A LONG/SHORT
/// position never flips directly within one step.
///
/// ## Guarantees
/// - No lookahead: z_t depends only on spread values strictly before t
///   (and spread_t itself)
/// - Deterministic and free of shared state

#include "statarb/constants.hpp"
#include "statarb/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace statarb::signal {

// ─── Configuration ────────────────────────────────────────────────────────────

struct SignalConfig {
    std::size_t lookback       = constants::DEFAULT_LOOKBACK;
    double      entry_z        = constants::DEFAULT_ENTRY_Z;
    double      exit_z         = constants::DEFAULT_EXIT_Z;
    int         time_stop_days = constants::DEFAULT_TIME_STOP_DAYS;  ///< 0 disables
    double      cost_bps       = constants::DEFAULT_COST_BPS;
};

// ─── Spread and z-score ───────────────────────────────────────────────────────

/// lp1 − (α + β·lp2) on the shared dates of the two series.
[[nodiscard]] DatedSeries compute_spread(const PriceSeries& p1,
                                         const PriceSeries& p2,
                                         double alpha,
                                         double beta);

/// Trailing z-score of `spread`, one entry per input value.
///
/// Entry t is nullopt when fewer than ⌊lookback/2⌋ observations (and at
/// least two) end at t−1, or when their sample std-dev is zero.
[[nodiscard]] std::vector<std::optional<double>>
rolling_zscore(std::span<const double> spread, std::size_t lookback);

// ─── State machine ────────────────────────────────────────────────────────────

/// Scan defined z-scores in chronological order, starting FLAT.
///
/// # Arguments
/// * `dates`: strictly increasing, same length as `z`
/// * `z`: defined z-scores only
///
/// # Returns
/// One position per input date.
[[nodiscard]] PositionTrace run_state_machine(std::span<const Date>   dates,
                                              std::span<const double> z,
                                              const SignalConfig&     cfg);

/// Reindex a scan onto `calendar` ∩ [first, last]: each date takes the
/// latest scanned position at or before it, FLAT before the first.
///
/// Applying it to its own output (with that output's dates as calendar)
/// returns the input unchanged.
[[nodiscard]] PositionTrace fill_positions(const PositionTrace&  scan,
                                           std::span<const Date> calendar,
                                           Date                  first,
                                           Date                  last);

// ─── Per-pair returns ─────────────────────────────────────────────────────────

/// Everything computed for one pair over one trading window, aligned to
/// `positions.dates`.
struct PairTrace {
    PositionTrace       positions;
    std::vector<double> gross;
    std::vector<int>    legs;
    std::vector<double> cost;
    DatedSeries         net;  ///< (gross − cost) · weight
};

/// Run the full pipeline for one pair over [trade_start, trade_end].
///
/// # Returns
/// An empty trace when no defined z-score falls inside the window.
[[nodiscard]] PairTrace generate_pair_returns(const PairSpec&     spec,
                                              const PriceSeries&  p1,
                                              const PriceSeries&  p2,
                                              Date                trade_start,
                                              Date                trade_end,
                                              const SignalConfig& cfg);

} // namespace statarb::signal
