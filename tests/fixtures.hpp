#pragma once

/// @file tests/fixtures.hpp
/// @brief Deterministic synthetic price data shared by the test suites.
///
/// Normal draws use std::minstd_rand (fully specified by the standard) with
/// a Box-Muller transform, so every fixture is identical on every platform.

#include "statarb/calendar.hpp"
#include "statarb/price_loader.hpp"
#include "statarb/types.hpp"

#include <cmath>
#include <cstddef>
#include <numbers>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace statarb::testing {

/// Standard normal generator; two uniforms per draw, no caching.
class Gaussian {
public:
    explicit Gaussian(unsigned seed) : engine_(seed) {}

    double next() {
        const double u1 = uniform();
        const double u2 = uniform();
        return std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * std::numbers::pi * u2);
    }

private:
    double uniform() {
        return static_cast<double>(engine_()) / 2147483647.0;
    }

    std::minstd_rand engine_;
};

/// The first `n` Monday–Friday dates on or after `first`.
inline std::vector<Date> business_dates(Date first, std::size_t n) {
    std::vector<Date> out;
    out.reserve(n);
    for (Date d = first; out.size() < n; d = d.plus_days(1)) {
        if (d.is_business_day()) out.push_back(d);
    }
    return out;
}

/// `n` consecutive calendar dates starting at `first`.
inline std::vector<Date> calendar_dates(Date first, std::size_t n) {
    std::vector<Date> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(first.plus_days(static_cast<std::int32_t>(i)));
    }
    return out;
}

inline PriceSeries make_series(std::string ticker,
                               std::vector<Date> dates,
                               std::vector<double> log_prices) {
    return PriceSeries{
        .ticker     = std::move(ticker),
        .dates      = std::move(dates),
        .log_prices = std::move(log_prices),
    };
}

/// Gaussian random walk of length `n` starting at `start`.
inline std::vector<double> random_walk(std::size_t n, double start, double step_sd,
                                       unsigned seed) {
    Gaussian g(seed);
    std::vector<double> out;
    out.reserve(n);
    double x = start;
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) x += step_sd * g.next();
        out.push_back(x);
    }
    return out;
}

struct SyntheticPair {
    std::vector<double> lp1;
    std::vector<double> lp2;
};

/// lp2 is a random walk from log(50); lp1 = α + β·lp2 + e with AR(1) e.
/// Each step draws the lp2 innovation (from step 1) then the e innovation.
inline SyntheticPair cointegrated_pair(std::size_t n, double alpha, double beta,
                                       double phi, double noise_sd, double step_sd,
                                       unsigned seed) {
    Gaussian g(seed);
    SyntheticPair out;
    out.lp1.reserve(n);
    out.lp2.reserve(n);
    double x = std::log(50.0);
    double e = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) x += step_sd * g.next();
        e = phi * e + noise_sd * g.next();
        out.lp2.push_back(x);
        out.lp1.push_back(alpha + beta * x + e);
    }
    return out;
}

/// Three-ticker universe used across suites: AAA/BBB cointegrated
/// (α = 0.2, β = 1, φ = 0.5), CCC an independent random walk, all on the
/// same `n` business days from 2020-01-01.
inline std::vector<PriceSeries> three_ticker_universe(std::size_t n = 200) {
    const auto dates = business_dates(Date::from_ymd(2020, 1, 1), n);
    const auto pair  = cointegrated_pair(n, 0.2, 1.0, 0.5, 0.01, 0.01, 42);
    const auto walk  = random_walk(n, std::log(30.0), 0.01, 1042);
    return {
        make_series("AAA", dates, pair.lp1),
        make_series("BBB", dates, pair.lp2),
        make_series("CCC", dates, walk),
    };
}

inline Universe to_universe(std::vector<PriceSeries> series) {
    Universe u;
    for (auto& s : series) {
        std::string key = s.ticker;
        u.emplace(std::move(key), std::move(s));
    }
    return u;
}

}  // namespace statarb::testing
