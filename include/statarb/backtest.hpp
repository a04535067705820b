#pragma once

/// @file include/statarb/backtest.hpp
/// @brief Performance metrics for daily PnL series and the static pair backtest.
///
/// # Module: Performance Metrics
///
/// ## Responsibility
/// Summarise a daily portfolio return series:
///   - annualised return:      mean(R) × ann
///   - annualised volatility:  σ(R) × √ann            (Bessel-corrected)
///   - Sharpe ratio:           ann_return / ann_vol   (0 if vol ≤ 0)
///   - Sortino ratio:          (mean − r_f) / σ_down × √ann
///   - maximum drawdown:       max peak-to-trough loss of ∏(1 + R)
///
/// # Module: Static Pair Backtest
///
/// Research baseline without walk-forward re-estimation: over one date range
/// the spread is lp1 − lp2, z is its full-sample z-score, position is −1
/// above +threshold, +1 below −threshold, 0 otherwise, and each day earns
/// position_t × (spread_{t+1} − spread_t).
///
/// ## Guarantees
/// - Zero UB: all fallible operations return `std::optional`
/// - NaN/Inf inputs produce `std::nullopt`
/// - Stateless; safe to call concurrently

#include "statarb/constants.hpp"
#include "statarb/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace statarb::backtest {

// ─── Types ────────────────────────────────────────────────────────────────────

/// Terminal statistics of a daily return series. Undefined ratios are 0.
struct PerformanceMetrics {
    double      ann_return   = 0.0;
    double      ann_vol      = 0.0;
    double      sharpe_ratio = 0.0;
    double      sortino_ratio = 0.0;
    double      max_drawdown = 0.0;  ///< Fraction in [0, 1]
    std::size_t num_days     = 0;

    /// Human-readable summary line.
    [[nodiscard]] std::string to_string() const;
};

// ─── PerformanceCalculator ────────────────────────────────────────────────────

/// Stateless utility for computing performance metrics.
class PerformanceCalculator {
public:
    /// mean(R) × ann.
    ///
    /// # Returns
    /// `nullopt` on empty or non-finite input.
    [[nodiscard]] static std::optional<double>
    annualised_return(std::span<const double> returns,
                      double annualisation = constants::ANNUALISATION_FACTOR) noexcept;

    /// σ(R) × √ann, sample std-dev.
    ///
    /// # Returns
    /// `nullopt` if fewer than 2 elements or any NaN/Inf; exactly 0 for a
    /// constant series.
    [[nodiscard]] static std::optional<double>
    annualised_volatility(std::span<const double> returns,
                          double annualisation = constants::ANNUALISATION_FACTOR) noexcept;

    /// Compute annualised Sharpe ratio.
    ///
    /// # Formula
    ///   Sharpe = (mean(R) − r_f) / σ(R) × √ann
    ///
    /// With r_f = 0 this equals annualised return / annualised volatility.
    ///
    /// # Returns
    /// `nullopt` if series has fewer than 2 elements, σ is negligible next to
    /// the returns themselves, or any NaN/Inf.
    [[nodiscard]] static std::optional<double>
    sharpe(std::span<const double> returns,
           double risk_free_rate = 0.0,
           double annualisation  = constants::ANNUALISATION_FACTOR) noexcept;

    /// Compute annualised Sortino ratio (downside-deviation denominator).
    ///
    /// # Returns
    /// `nullopt` if series is too short, downside-vol is zero, or any NaN/Inf.
    [[nodiscard]] static std::optional<double>
    sortino(std::span<const double> returns,
            double risk_free_rate = 0.0,
            double annualisation  = constants::ANNUALISATION_FACTOR) noexcept;

    /// Maximum drawdown of the compounded equity curve ∏(1 + R).
    ///
    /// # Returns
    /// Maximum drawdown in [0, 1] for returns > −1. `nullopt` on empty input.
    [[nodiscard]] static std::optional<double>
    max_drawdown(std::span<const double> returns) noexcept;

    /// equity_t = ∏_{s ≤ t} (1 + R_s).
    [[nodiscard]] static std::vector<double>
    equity_curve(std::span<const double> returns);

    /// All metrics at once, with undefined values reported as 0.
    [[nodiscard]] static PerformanceMetrics
    summarize(std::span<const double> returns,
              double annualisation = constants::ANNUALISATION_FACTOR) noexcept;

private:
    /// Mean of a span.  Unchecked; caller must ensure non-empty, finite.
    static double mean(std::span<const double> v) noexcept;
    /// Sample std-dev of a span.  Unchecked; caller ensures length ≥ 2.
    static double stddev(std::span<const double> v, double mean_val) noexcept;
    /// Downside std-dev relative to `threshold`.
    static double downside_stddev(std::span<const double> v,
                                  double threshold) noexcept;
};

// ─── Static pair backtest ─────────────────────────────────────────────────────

/// Result of `static_pair_backtest`.
struct StaticPairResult {
    std::string ticker1;
    std::string ticker2;
    double      ann_return   = 0.0;
    double      ann_vol      = 0.0;
    double      total_return = 0.0;
    double      sharpe_ratio = 0.0;  ///< ann_return / ann_vol, 0 if vol is 0
    std::size_t num_days     = 0;
};

/// Full-sample threshold strategy on lp1 − lp2 over [start, end].
///
/// # Returns
/// `nullopt` if fewer than three aligned observations fall in the range or
/// the spread has zero variance.
[[nodiscard]] std::optional<StaticPairResult>
static_pair_backtest(const PriceSeries& p1,
                     const PriceSeries& p2,
                     Date               start,
                     Date               end,
                     double             z_threshold = constants::DEFAULT_STATIC_Z);

}  // namespace statarb::backtest
