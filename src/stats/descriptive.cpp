/// @file src/stats/descriptive.cpp
/// @brief Mean, sample standard deviation, Pearson correlation, differencing.

#include "statarb/stats.hpp"
#include "statarb/constants.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace statarb::stats {

namespace {

[[nodiscard]] bool all_finite(std::span<const double> v) noexcept {
    for (double x : v) {
        if (!std::isfinite(x)) return false;
    }
    return true;
}

}  // namespace

// ─── mean ─────────────────────────────────────────────────────────────────────

std::optional<double> mean(std::span<const double> v) noexcept {
    if (v.empty()) return std::nullopt;
    const double sum = std::accumulate(v.begin(), v.end(), 0.0);
    return sum / static_cast<double>(v.size());
}

// ─── sample_stddev ────────────────────────────────────────────────────────────

std::optional<double> sample_stddev(std::span<const double> v) noexcept {
    if (v.size() < 2)    return std::nullopt;
    if (!all_finite(v))  return std::nullopt;

    const double mu = *mean(v);
    double sq_sum = 0.0;
    for (double x : v) {
        const double d = x - mu;
        sq_sum += d * d;
    }
    // Bessel-corrected (n − 1) denominator.
    return std::sqrt(sq_sum / static_cast<double>(v.size() - 1));
}

// ─── negligible_dispersion ────────────────────────────────────────────────────

bool negligible_dispersion(std::span<const double> v, double sd) noexcept {
    double scale = 0.0;
    for (double x : v) scale = std::max(scale, std::abs(x));
    return sd <= constants::DISPERSION_RTOL * scale;
}

// ─── pearson ──────────────────────────────────────────────────────────────────

std::optional<double>
pearson(std::span<const double> a, std::span<const double> b) noexcept {
    if (a.size() != b.size() || a.size() < 2)  return std::nullopt;
    if (!all_finite(a) || !all_finite(b))       return std::nullopt;

    const double ma = *mean(a);
    const double mb = *mean(b);

    double sab = 0.0;
    double saa = 0.0;
    double sbb = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const double da = a[i] - ma;
        const double db = b[i] - mb;
        sab += da * db;
        saa += da * da;
        sbb += db * db;
    }
    if (saa <= 0.0 || sbb <= 0.0) return std::nullopt;  // constant input

    const double r = sab / std::sqrt(saa * sbb);
    if (!std::isfinite(r)) return std::nullopt;
    return r;
}

// ─── diff ─────────────────────────────────────────────────────────────────────

std::vector<double> diff(std::span<const double> v) {
    std::vector<double> out;
    if (v.size() < 2) return out;
    out.reserve(v.size() - 1);
    for (std::size_t i = 1; i < v.size(); ++i) {
        out.push_back(v[i] - v[i - 1]);
    }
    return out;
}

}  // namespace statarb::stats
