#pragma once

#include <cstddef>

/// @file include/statarb/constants.hpp
/// @brief Screening gates, strategy defaults and numerical constants.
///
/// Every configuration struct takes its defaults from here so that the CLI,
/// the tests and the benchmarks agree on one set of values.

namespace statarb::constants {

// ─── Walk-Forward Windows ─────────────────────────────────────────────────────

/// Trading days in each pair-estimation (formation) window.
static constexpr std::size_t DEFAULT_FORMATION = 252;

/// Trading days in each trading window that follows a formation window.
static constexpr std::size_t DEFAULT_TRADE = 21;

/// Default backtest bounds (inclusive, ISO dates).
static constexpr const char* DEFAULT_START = "2015-01-01";
static constexpr const char* DEFAULT_END   = "2024-12-31";

// ─── Signal Defaults ──────────────────────────────────────────────────────────

/// Rolling window (observations) for the spread z-score.
static constexpr std::size_t DEFAULT_LOOKBACK = 60;

/// Open a position when |z| reaches this level.
static constexpr double DEFAULT_ENTRY_Z = 2.0;

/// Close a position when |z| falls back to this level.
static constexpr double DEFAULT_EXIT_Z = 0.5;

/// Maximum holding period in calendar days. Zero disables the time stop.
static constexpr int DEFAULT_TIME_STOP_DAYS = 30;

/// Transaction cost per leg, in basis points.
static constexpr double DEFAULT_COST_BPS = 5.0;

/// One basis point.
static constexpr double BPS = 1e-4;

// ─── Screening Gates ──────────────────────────────────────────────────────────

/// Aligned observations a pair needs inside a formation window, before the
/// 80 % formation-length cap and the lookback floor are applied.
static constexpr std::size_t MIN_OVERLAP_DAYS = 200;

/// Fraction of the formation length that caps MIN_OVERLAP_DAYS.
static constexpr double OVERLAP_FRACTION = 0.8;

/// Maximum Engle-Granger p-value for a pair to be tradable.
static constexpr double PVAL_MAX = 0.05;

/// Minimum Pearson correlation between the two log-price series.
static constexpr double MIN_LOG_CORR = 0.70;

/// Accepted hedge-ratio band [BETA_MIN, BETA_MAX].
static constexpr double BETA_MIN = 0.25;
static constexpr double BETA_MAX = 4.0;

/// Spread first-difference volatility below this is treated as degenerate.
static constexpr double MIN_SIGMA_DIFF = 1e-6;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// Weight-sum tolerance used by normalization checks.
static constexpr double WEIGHT_SUM_TOLERANCE = 1e-12;

/// A standard deviation at or below DISPERSION_RTOL · max|x| is rounding
/// noise: the window is treated as constant.
static constexpr double DISPERSION_RTOL = 1e-12;

/// R² above 1 − COLLINEARITY_SLACK marks a pair as perfectly collinear.
/// 100 · √(DBL_EPSILON).
static constexpr double COLLINEARITY_SLACK = 1.4901161193847656e-06;

// ─── Performance ──────────────────────────────────────────────────────────────

/// Trading days per year used to annualise daily statistics.
static constexpr double ANNUALISATION_FACTOR = 252.0;

/// Minimum return observations for Sharpe / Sortino / volatility.
static constexpr std::size_t MIN_RETURN_SERIES_LENGTH = 2;

/// Full-sample z threshold for the static pair backtest.
static constexpr double DEFAULT_STATIC_Z = 2.0;

} // namespace statarb::constants
