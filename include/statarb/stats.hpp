#pragma once

/// @file include/statarb/stats.hpp
/// @brief Descriptive statistics, OLS and the Engle-Granger cointegration test.
///
/// # Module: Statistics Toolkit
///
/// ## Responsibility
/// The numerical primitives the pair screener is built from:
///   - mean, Bessel-corrected sample standard deviation, Pearson correlation
///   - ordinary least squares  y = α + β·x  (Eigen QR)
///   - augmented Dickey-Fuller regression on a residual series, lag order
///     chosen by AIC
///   - MacKinnon (1994) approximate p-values
///   - Engle-Granger two-step test combining the above
///
/// ## Engle-Granger Procedure
/// ```
/// 1.  y_t = α + β·x_t + u_t                    (OLS, cointegrating regression)
/// 2.  Δu_t = ρ·u_{t−1} + Σ_{j=1..p} φ_j·Δu_{t−j} + ε_t   (no constant)
/// 3.  τ = ρ̂ / se(ρ̂),   p = Φ(poly(τ))          (MacKinnon, N = 2, constant)
/// ```
///
/// ## Guarantees
/// - Every function is `noexcept`; degenerate input yields `std::nullopt`
/// - Inputs are never modified
/// - No function reads global state: identical input → identical output

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace statarb::stats {

// ─── Descriptive ──────────────────────────────────────────────────────────────

/// Arithmetic mean. nullopt on empty input.
[[nodiscard]] std::optional<double> mean(std::span<const double> v) noexcept;

/// Sample standard deviation (n − 1 denominator). nullopt if fewer than two
/// observations or any value is non-finite.
[[nodiscard]] std::optional<double> sample_stddev(std::span<const double> v) noexcept;

/// True when `sd`, a dispersion measured on `v`, is indistinguishable from
/// zero: `sd <= DISPERSION_RTOL · max|v|`. A constant window whose mean is
/// not bit-exact (ten copies of 0.1) lands here.
[[nodiscard]] bool negligible_dispersion(std::span<const double> v, double sd) noexcept;

/// Pearson correlation. nullopt on length mismatch, fewer than two points,
/// or zero variance in either input.
[[nodiscard]] std::optional<double>
pearson(std::span<const double> a, std::span<const double> b) noexcept;

/// First difference: out[i] = v[i+1] − v[i]. Empty for fewer than 2 values.
[[nodiscard]] std::vector<double> diff(std::span<const double> v);

// ─── Ordinary Least Squares ───────────────────────────────────────────────────

/// Result of y = α + β·x.
struct OlsFit {
    double alpha;                   ///< Intercept
    double beta;                    ///< Slope
    double r_squared;               ///< Centred R²
    std::vector<double> residuals;  ///< y − (α + β·x)
};

/// Fit y on a constant and x.
///
/// # Returns
/// nullopt if lengths differ, fewer than 3 observations, x is constant,
/// or the fit produces non-finite coefficients.
[[nodiscard]] std::optional<OlsFit>
ols_fit(std::span<const double> y, std::span<const double> x) noexcept;

// ─── Augmented Dickey-Fuller ──────────────────────────────────────────────────

/// ADF regression output.
struct AdfResult {
    double      statistic;  ///< t-statistic of the lagged level coefficient
    std::size_t used_lag;   ///< Number of lagged differences retained
    std::size_t nobs;       ///< Observations in the final regression
};

/// Default upper lag bound: ⌈12·(n/100)^{1/4}⌉, capped at n/2 − 1.
[[nodiscard]] std::size_t default_max_lag(std::size_t n) noexcept;

/// No-constant ADF test on `series`, lag order chosen by minimum AIC over
/// 0..max_lag on a common estimation sample, then re-estimated on the
/// largest sample the chosen lag allows.
///
/// # Returns
/// nullopt if the series is too short for `max_lag`, contains non-finite
/// values, or a regression is singular.
[[nodiscard]] std::optional<AdfResult>
adf_test(std::span<const double> series,
         std::optional<std::size_t> max_lag = std::nullopt) noexcept;

/// MacKinnon (1994) approximate asymptotic p-value for a unit-root /
/// no-cointegration τ statistic, constant-term case.
///
/// # Arguments
/// * `tau`: test statistic
/// * `n_vars`: number of series in the cointegrating regression (1..5)
///
/// # Returns
/// p ∈ [0, 1]; nullopt for unsupported `n_vars` or NaN τ.
[[nodiscard]] std::optional<double>
mackinnon_pvalue(double tau, std::size_t n_vars) noexcept;

// ─── Engle-Granger ────────────────────────────────────────────────────────────

/// Two-step cointegration test result.
struct CointegrationResult {
    double statistic;  ///< ADF τ on the OLS residuals (−∞ if collinear)
    double pvalue;     ///< MacKinnon p-value
    double alpha;      ///< Cointegrating-regression intercept
    double beta;       ///< Cointegrating-regression slope
    OlsFit fit;        ///< Full cointegrating regression
};

/// Engle-Granger test of y against x.
///
/// When y and x are (almost) perfectly collinear the residual ADF is not
/// meaningful; τ is reported as −∞ and p as 0 so later gates (hedge ratio,
/// spread volatility) decide the pair.
///
/// # Returns
/// nullopt if the regression or the residual ADF fails numerically.
[[nodiscard]] std::optional<CointegrationResult>
engle_granger(std::span<const double> y, std::span<const double> x) noexcept;

} // namespace statarb::stats
