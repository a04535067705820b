/// @file src/stats/cointegration.cpp
/// @brief ADF regression, MacKinnon p-values and the Engle-Granger test.
///
/// ADF layout for a residual series u₀…u_{n−1} with p lagged differences,
/// over rows r = 0…nobs−1 where nobs = n − 1 − p:
///
///   target  Δu_{p+r}
///   col 0   u_{p+r}                   (lagged level)
///   col j   Δu_{p+r−j},  j = 1…p      (lagged differences)
///
/// Lag selection fits every p ∈ [0, max_lag] on the rows common to all
/// candidates (nobs = n − 1 − max_lag), keeps the smallest AIC, then refits
/// the chosen p on its own full sample.

#include "statarb/stats.hpp"
#include "statarb/constants.hpp"

#include <Eigen/Dense>

#include <array>
#include <cmath>
#include <limits>
#include <numbers>
#include <utility>

namespace statarb::stats {

namespace {

// ─── Least squares without intercept ──────────────────────────────────────────

struct Regression {
    double coef0;   ///< First coefficient (lagged level)
    double ssr;     ///< Residual sum of squares
    double var00;   ///< [(XᵀX)⁻¹]₀₀
};

[[nodiscard]] std::optional<Regression>
least_squares(const Eigen::MatrixXd& design, const Eigen::VectorXd& target) noexcept {
    if (design.rows() <= design.cols()) return std::nullopt;

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
    if (qr.rank() < design.cols()) return std::nullopt;

    const Eigen::VectorXd coef  = qr.solve(target);
    const Eigen::VectorXd resid = target - design * coef;

    const Eigen::MatrixXd xtx = design.transpose() * design;
    Eigen::LDLT<Eigen::MatrixXd> ldlt(xtx);
    if (ldlt.info() != Eigen::Success) return std::nullopt;

    Eigen::VectorXd unit = Eigen::VectorXd::Zero(design.cols());
    unit(0) = 1.0;
    const Eigen::VectorXd col0 = ldlt.solve(unit);

    Regression out{
        .coef0 = coef(0),
        .ssr   = resid.squaredNorm(),
        .var00 = col0(0),
    };
    if (!std::isfinite(out.coef0) || !std::isfinite(out.ssr) || !(out.var00 > 0.0)) {
        return std::nullopt;
    }
    return out;
}

/// Build the ADF design for `lag` differences over the last `nobs` rows.
void build_adf_system(std::span<const double> level,
                      std::span<const double> delta,
                      std::size_t lag,
                      std::size_t nobs,
                      Eigen::MatrixXd& design,
                      Eigen::VectorXd& target) {
    const std::size_t first = delta.size() - nobs;  // index of first target diff
    design.resize(static_cast<Eigen::Index>(nobs), static_cast<Eigen::Index>(lag + 1));
    target.resize(static_cast<Eigen::Index>(nobs));

    for (std::size_t r = 0; r < nobs; ++r) {
        const std::size_t t = first + r;
        const auto row = static_cast<Eigen::Index>(r);
        target(row)    = delta[t];
        design(row, 0) = level[t];
        for (std::size_t j = 1; j <= lag; ++j) {
            design(row, static_cast<Eigen::Index>(j)) = delta[t - j];
        }
    }
}

/// Gaussian log-likelihood based AIC, matching the OLS convention
/// AIC = −2·llf + 2·k.
[[nodiscard]] double aic(double ssr, std::size_t nobs, std::size_t k) noexcept {
    if (ssr <= 0.0) return -std::numeric_limits<double>::infinity();
    const double n   = static_cast<double>(nobs);
    const double llf = -0.5 * n * (std::log(2.0 * std::numbers::pi) + std::log(ssr / n) + 1.0);
    return -2.0 * llf + 2.0 * static_cast<double>(k);
}

// ─── MacKinnon (1994) response-surface coefficients, constant term ────────────
//
// Rows are indexed by the number of series N − 1. The small-p polynomial
// applies for τ ≤ τ*, the large-p polynomial above it; p = Φ(poly(τ)).

constexpr std::size_t MACKINNON_MAX_VARS = 5;

constexpr std::array<double, MACKINNON_MAX_VARS> TAU_MAX_C  = {2.74, 0.92, 0.55, 0.61, 0.79};
constexpr std::array<double, MACKINNON_MAX_VARS> TAU_MIN_C  = {-18.83, -18.86, -23.48, -28.07, -25.96};
constexpr std::array<double, MACKINNON_MAX_VARS> TAU_STAR_C = {-1.61, -2.62, -3.13, -3.47, -3.78};

constexpr std::array<std::array<double, 3>, MACKINNON_MAX_VARS> TAU_C_SMALLP = {{
    {2.1659, 1.4412, 0.038269},
    {2.92,   1.5012, 0.039796},
    {3.4699, 1.4856, 0.03164},
    {3.9673, 1.4777, 0.026315},
    {4.5509, 1.5338, 0.029545},
}};

// Already multiplied by the table scaling {1, 1e-1, 1e-1, 1e-2}.
constexpr std::array<std::array<double, 4>, MACKINNON_MAX_VARS> TAU_C_LARGEP = {{
    {1.7339, 0.93202, -0.12745, -0.010368},
    {2.1945, 0.64695, -0.29198, -0.042377},
    {2.5893, 0.45168, -0.36529, -0.050074},
    {3.0387, 0.45452, -0.33666, -0.041921},
    {3.5049, 0.52098, -0.29158, -0.033468},
}};

template <std::size_t K>
[[nodiscard]] double polyval(const std::array<double, K>& c, double x) noexcept {
    // Ascending powers, Horner form.
    double acc = 0.0;
    for (std::size_t i = K; i-- > 0;) {
        acc = acc * x + c[i];
    }
    return acc;
}

[[nodiscard]] double normal_cdf(double x) noexcept {
    return 0.5 * std::erfc(-x / std::numbers::sqrt2);
}

}  // namespace

// ─── default_max_lag ──────────────────────────────────────────────────────────

std::size_t default_max_lag(std::size_t n) noexcept {
    const double raw = std::ceil(12.0 * std::pow(static_cast<double>(n) / 100.0, 0.25));
    const auto lag   = static_cast<std::size_t>(raw);
    const std::size_t half = n / 2;
    const std::size_t cap  = half >= 1 ? half - 1 : 0;
    return lag < cap ? lag : cap;
}

// ─── adf_test ─────────────────────────────────────────────────────────────────

std::optional<AdfResult>
adf_test(std::span<const double> series, std::optional<std::size_t> max_lag) noexcept {
    const std::size_t n = series.size();
    if (n < 4) return std::nullopt;
    for (double v : series) {
        if (!std::isfinite(v)) return std::nullopt;
    }

    const std::size_t maxlag = max_lag.value_or(default_max_lag(n));
    if (n < maxlag + 3) return std::nullopt;

    const std::vector<double> delta = diff(series);

    Eigen::MatrixXd design;
    Eigen::VectorXd target;

    // ── Lag selection on the common sample ──────────────────────────────────
    std::size_t best_lag = 0;
    if (maxlag > 0) {
        const std::size_t common = delta.size() - maxlag;
        double best_aic = std::numeric_limits<double>::infinity();
        bool   any_fit  = false;
        for (std::size_t lag = 0; lag <= maxlag; ++lag) {
            build_adf_system(series, delta, lag, common, design, target);
            const auto reg = least_squares(design, target);
            if (!reg.has_value()) continue;
            const double score = aic(reg->ssr, common, lag + 1);
            if (!any_fit || score < best_aic) {
                best_aic = score;
                best_lag = lag;
                any_fit  = true;
            }
        }
        if (!any_fit) return std::nullopt;
    }

    // ── Final regression on the chosen lag's full sample ────────────────────
    const std::size_t nobs = delta.size() - best_lag;
    build_adf_system(series, delta, best_lag, nobs, design, target);
    const auto reg = least_squares(design, target);
    if (!reg.has_value()) return std::nullopt;

    const double dof = static_cast<double>(nobs) - static_cast<double>(best_lag + 1);
    if (dof <= 0.0) return std::nullopt;

    const double sigma2 = reg->ssr / dof;
    const double se     = std::sqrt(sigma2 * reg->var00);
    if (!(se > 0.0)) return std::nullopt;

    const double tau = reg->coef0 / se;
    if (!std::isfinite(tau)) return std::nullopt;

    return AdfResult{
        .statistic = tau,
        .used_lag  = best_lag,
        .nobs      = nobs,
    };
}

// ─── mackinnon_pvalue ─────────────────────────────────────────────────────────

std::optional<double> mackinnon_pvalue(double tau, std::size_t n_vars) noexcept {
    if (n_vars < 1 || n_vars > MACKINNON_MAX_VARS) return std::nullopt;
    if (std::isnan(tau))                           return std::nullopt;

    const std::size_t row = n_vars - 1;
    if (tau > TAU_MAX_C[row]) return 1.0;
    if (tau < TAU_MIN_C[row]) return 0.0;

    const double z = (tau <= TAU_STAR_C[row])
        ? polyval(TAU_C_SMALLP[row], tau)
        : polyval(TAU_C_LARGEP[row], tau);
    return normal_cdf(z);
}

// ─── engle_granger ────────────────────────────────────────────────────────────

std::optional<CointegrationResult>
engle_granger(std::span<const double> y, std::span<const double> x) noexcept {
    auto fit = ols_fit(y, x);
    if (!fit.has_value()) return std::nullopt;

    double tau = 0.0;
    if (fit->r_squared >= 1.0 - constants::COLLINEARITY_SLACK) {
        // Perfectly collinear legs: the residual ADF is meaningless.
        tau = -std::numeric_limits<double>::infinity();
    } else {
        const auto adf = adf_test(fit->residuals);
        if (!adf.has_value()) return std::nullopt;
        tau = adf->statistic;
    }

    const auto p = mackinnon_pvalue(tau, 2);
    if (!p.has_value()) return std::nullopt;

    const double alpha = fit->alpha;
    const double beta  = fit->beta;
    return CointegrationResult{
        .statistic = tau,
        .pvalue    = *p,
        .alpha     = alpha,
        .beta      = beta,
        .fit       = std::move(*fit),
    };
}

}  // namespace statarb::stats
