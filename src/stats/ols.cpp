/// @file src/stats/ols.cpp
/// @brief Ordinary least squares y = α + β·x via Eigen column-pivoting QR.

#include "statarb/stats.hpp"

#include <Eigen/Dense>

#include <cmath>

namespace statarb::stats {

std::optional<OlsFit>
ols_fit(std::span<const double> y, std::span<const double> x) noexcept {
    const std::size_t n = y.size();
    if (x.size() != n || n < 3) return std::nullopt;

    const auto count = static_cast<Eigen::Index>(n);
    Eigen::MatrixXd design(count, 2);
    Eigen::VectorXd target(count);
    for (Eigen::Index i = 0; i < count; ++i) {
        const auto k = static_cast<std::size_t>(i);
        if (!std::isfinite(y[k]) || !std::isfinite(x[k])) return std::nullopt;
        design(i, 0) = 1.0;
        design(i, 1) = x[k];
        target(i)    = y[k];
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
    if (qr.rank() < 2) return std::nullopt;  // x is constant

    const Eigen::VectorXd coef = qr.solve(target);
    const double alpha = coef(0);
    const double beta  = coef(1);
    if (!std::isfinite(alpha) || !std::isfinite(beta)) return std::nullopt;

    const Eigen::VectorXd resid = target - design * coef;
    const double ssr   = resid.squaredNorm();
    const double y_bar = target.mean();
    const double tss   = (target.array() - y_bar).square().sum();

    OlsFit fit{
        .alpha     = alpha,
        .beta      = beta,
        .r_squared = tss > 0.0 ? 1.0 - ssr / tss : 0.0,
        .residuals = std::vector<double>(resid.data(), resid.data() + resid.size()),
    };
    return fit;
}

}  // namespace statarb::stats
