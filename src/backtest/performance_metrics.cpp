/// @file src/backtest/performance_metrics.cpp
/// @brief Implementation of PerformanceCalculator.
///
/// Fallible paths return std::nullopt; no function ever calls abort(),
/// assert(), or throws an exception.

#include "statarb/backtest.hpp"
#include "statarb/constants.hpp"
#include "statarb/stats.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numeric>
#include <span>

namespace statarb::backtest {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

/// Return false if any element of `v` is NaN or ±Inf.
[[nodiscard]] bool all_finite(std::span<const double> v) noexcept {
    for (double x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

}  // namespace

// ─── PerformanceCalculator: private statics ───────────────────────────────────

double PerformanceCalculator::mean(std::span<const double> v) noexcept {
    const double sum = std::accumulate(v.begin(), v.end(), 0.0);
    return sum / static_cast<double>(v.size());
}

double PerformanceCalculator::stddev(std::span<const double> v,
                                     double mean_val) noexcept {
    // Sample std-dev (Bessel-corrected, n−1 denominator).
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mean_val;
        sq_sum += d * d;
    }
    return std::sqrt(sq_sum / static_cast<double>(v.size() - 1));
}

double PerformanceCalculator::downside_stddev(std::span<const double> v,
                                              double threshold) noexcept {
    // RMS of returns below `threshold` (Bessel-corrected).
    // If fewer than 2 negative deviations exist, returns 0.0.
    double sq_sum = 0.0;
    std::size_t count = 0;
    for (double x : v) {
        if (x < threshold) {
            const double d = x - threshold;
            sq_sum += d * d;
            ++count;
        }
    }
    if (count < 2) return 0.0;
    return std::sqrt(sq_sum / static_cast<double>(count - 1));
}

// ─── Annualised return / volatility ──────────────────────────────────────────

std::optional<double>
PerformanceCalculator::annualised_return(std::span<const double> returns,
                                         double annualisation) noexcept {
    if (returns.empty())       return std::nullopt;
    if (!all_finite(returns))  return std::nullopt;
    return mean(returns) * annualisation;
}

std::optional<double>
PerformanceCalculator::annualised_volatility(std::span<const double> returns,
                                             double annualisation) noexcept {
    if (returns.size() < constants::MIN_RETURN_SERIES_LENGTH) return std::nullopt;
    if (!all_finite(returns))                                  return std::nullopt;
    if (annualisation <= 0.0)                                  return std::nullopt;
    const double sd = stddev(returns, mean(returns));
    if (stats::negligible_dispersion(returns, sd)) return 0.0;
    return sd * std::sqrt(annualisation);
}

// ─── PerformanceCalculator: Sharpe ───────────────────────────────────────────

std::optional<double>
PerformanceCalculator::sharpe(std::span<const double> returns,
                              double risk_free_rate,
                              double annualisation) noexcept {
    if (returns.size() < constants::MIN_RETURN_SERIES_LENGTH) return std::nullopt;
    if (!all_finite(returns))                                  return std::nullopt;
    if (!std::isfinite(risk_free_rate))                        return std::nullopt;
    if (annualisation <= 0.0)                                  return std::nullopt;

    const double mu = mean(returns);
    const double sd = stddev(returns, mu);

    if (stats::negligible_dispersion(returns, sd)) return std::nullopt;  // ratio undefined

    // (μ − r_f) / σ × √ann
    return (mu - risk_free_rate) / sd * std::sqrt(annualisation);
}

// ─── PerformanceCalculator: Sortino ──────────────────────────────────────────

std::optional<double>
PerformanceCalculator::sortino(std::span<const double> returns,
                               double risk_free_rate,
                               double annualisation) noexcept {
    if (returns.size() < constants::MIN_RETURN_SERIES_LENGTH) return std::nullopt;
    if (!all_finite(returns))                                  return std::nullopt;
    if (!std::isfinite(risk_free_rate))                        return std::nullopt;
    if (annualisation <= 0.0)                                  return std::nullopt;

    const double mu    = mean(returns);
    const double sd_dn = downside_stddev(returns, risk_free_rate);

    if (sd_dn <= 0.0) return std::nullopt;

    return (mu - risk_free_rate) / sd_dn * std::sqrt(annualisation);
}

// ─── PerformanceCalculator: MaxDrawdown ───────────────────────────────────────

std::optional<double>
PerformanceCalculator::max_drawdown(std::span<const double> returns) noexcept {
    if (returns.empty())         return std::nullopt;
    if (!all_finite(returns))    return std::nullopt;

    double equity  = 1.0;
    double peak    = 1.0;
    double max_dd  = 0.0;

    for (double r : returns) {
        equity *= (1.0 + r);
        if (equity > peak) {
            peak = equity;
        } else {
            const double dd = (peak - equity) / peak;
            if (dd > max_dd) max_dd = dd;
        }
    }
    return max_dd;
}

// ─── Equity curve / summary ───────────────────────────────────────────────────

std::vector<double>
PerformanceCalculator::equity_curve(std::span<const double> returns) {
    std::vector<double> curve;
    curve.reserve(returns.size());
    double equity = 1.0;
    for (double r : returns) {
        equity *= (1.0 + r);
        curve.push_back(equity);
    }
    return curve;
}

PerformanceMetrics
PerformanceCalculator::summarize(std::span<const double> returns,
                                 double annualisation) noexcept {
    PerformanceMetrics m;
    m.num_days      = returns.size();
    m.ann_return    = annualised_return(returns, annualisation).value_or(0.0);
    m.ann_vol       = annualised_volatility(returns, annualisation).value_or(0.0);
    m.sharpe_ratio  = sharpe(returns, 0.0, annualisation).value_or(0.0);
    m.sortino_ratio = sortino(returns, 0.0, annualisation).value_or(0.0);
    m.max_drawdown  = max_drawdown(returns).value_or(0.0);
    return m;
}

// ─── PerformanceMetrics ───────────────────────────────────────────────────────

std::string PerformanceMetrics::to_string() const {
    return fmt::format(
        "Sharpe={:.2f}, AnnRet={:.4f}, AnnVol={:.4f}, Sortino={:.2f}, MaxDD={:.4f}, Days={}",
        sharpe_ratio, ann_return, ann_vol, sortino_ratio, max_drawdown, num_days);
}

}  // namespace statarb::backtest
