#include <gtest/gtest.h>
#include "statarb/backtest.hpp"
#include "statarb/constants.hpp"

#include <cmath>
#include <limits>
#include <numeric>
#include <vector>

using namespace statarb;
using namespace statarb::backtest;
using namespace statarb::constants;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static std::vector<double> make_constant_returns(std::size_t n, double val) {
    return std::vector<double>(n, val);
}

static std::vector<double> make_returns_with_mean_stddev(
        double target_mean, double target_stddev, std::size_t n) {
    // Alternating series: half at (mean + stddev), half at (mean - stddev)
    std::vector<double> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = (i % 2 == 0) ? target_mean + target_stddev
                              : target_mean - target_stddev;
    }
    return v;
}

// ─── Annualised return / volatility ──────────────────────────────────────────

TEST(PerformanceCalculator_AnnReturn, MeanTimesFactor) {
    const std::vector<double> r = {0.01, -0.02, 0.04};
    const auto ann = PerformanceCalculator::annualised_return(r);
    ASSERT_TRUE(ann.has_value());
    EXPECT_NEAR(*ann, 0.01 * ANNUALISATION_FACTOR, 1e-12);
}

TEST(PerformanceCalculator_AnnReturn, EmptyOrNonFinite_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::annualised_return(std::span<const double>{}).has_value());
    const std::vector<double> r = {0.01, std::numeric_limits<double>::quiet_NaN()};
    EXPECT_FALSE(PerformanceCalculator::annualised_return(r).has_value());
}

TEST(PerformanceCalculator_AnnVol, SampleStddevTimesRootFactor) {
    // {0, 0, 0, 0, 10}: mean 2, sample variance 20
    const std::vector<double> r = {0, 0, 0, 0, 10};
    const auto vol = PerformanceCalculator::annualised_volatility(r);
    ASSERT_TRUE(vol.has_value());
    EXPECT_NEAR(*vol, std::sqrt(20.0) * std::sqrt(252.0), 1e-9);
}

TEST(PerformanceCalculator_AnnVol, InexactConstant_Zero) {
    const auto vol = PerformanceCalculator::annualised_volatility(make_constant_returns(50, 0.01));
    ASSERT_TRUE(vol.has_value());
    EXPECT_DOUBLE_EQ(*vol, 0.0);
}

TEST(PerformanceCalculator_AnnVol, SingleReturn_Nullopt) {
    const std::vector<double> one = {0.01};
    EXPECT_FALSE(PerformanceCalculator::annualised_volatility(one).has_value());
}

// ─── Sharpe: Basic Correctness ────────────────────────────────────────────────

TEST(PerformanceCalculator_Sharpe, ConstantReturns_ZeroVariance_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::sharpe(make_constant_returns(100, 0.0), 0.0, 1.0).has_value())
        << "Constant-zero returns have zero variance, so Sharpe is undefined";
    EXPECT_FALSE(PerformanceCalculator::sharpe(make_constant_returns(50, 0.01), 0.0, 1.0).has_value());
}

TEST(PerformanceCalculator_Sharpe, KnownValues_CorrectAnnualised) {
    // Daily mean = 0.001, daily std ≈ 0.01
    // Annualised Sharpe (252 days) = (0.001 / 0.01) * sqrt(252) ≈ 1.5874
    auto returns = make_returns_with_mean_stddev(0.001, 0.01, 500);
    auto result  = PerformanceCalculator::sharpe(returns, 0.0, ANNUALISATION_FACTOR);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, 0.001 / 0.01 * std::sqrt(252.0), 0.05);
}

TEST(PerformanceCalculator_Sharpe, EqualsAnnReturnOverAnnVol) {
    const std::vector<double> r = {0.003, -0.001, 0.002, 0.0005, -0.004, 0.006};
    const auto sh  = PerformanceCalculator::sharpe(r);
    const auto ret = PerformanceCalculator::annualised_return(r);
    const auto vol = PerformanceCalculator::annualised_volatility(r);
    ASSERT_TRUE(sh && ret && vol);
    EXPECT_NEAR(*sh, *ret / *vol, 1e-12);
}

TEST(PerformanceCalculator_Sharpe, RiskFreeSubtracted) {
    auto returns = make_returns_with_mean_stddev(0.001, 0.01, 500);
    auto result  = PerformanceCalculator::sharpe(returns, 0.0005, ANNUALISATION_FACTOR);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, 0.0005 / 0.01 * std::sqrt(252.0), 0.05);
}

TEST(PerformanceCalculator_Sharpe, TooFewReturns_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::sharpe(std::span<const double>{}, 0.0, 1.0).has_value());
    std::vector<double> one = {0.01};
    EXPECT_FALSE(PerformanceCalculator::sharpe(one, 0.0, 1.0).has_value());
}

TEST(PerformanceCalculator_Sharpe, NonFiniteInput_Nullopt) {
    std::vector<double> nan_r = {0.01, std::numeric_limits<double>::quiet_NaN(), 0.02};
    std::vector<double> inf_r = {0.01, std::numeric_limits<double>::infinity(), 0.02};
    EXPECT_FALSE(PerformanceCalculator::sharpe(nan_r, 0.0, 1.0).has_value());
    EXPECT_FALSE(PerformanceCalculator::sharpe(inf_r, 0.0, 1.0).has_value());
}

TEST(PerformanceCalculator_Sharpe, NegativeMean_NegativeSharpe) {
    auto returns = make_returns_with_mean_stddev(-0.001, 0.01, 500);
    auto result  = PerformanceCalculator::sharpe(returns, 0.0, ANNUALISATION_FACTOR);
    ASSERT_TRUE(result.has_value());
    EXPECT_LT(*result, 0.0);
}

// ─── Sortino ─────────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_Sortino, NoDownsideReturns_Nullopt) {
    auto returns = make_constant_returns(100, 0.01);
    EXPECT_FALSE(PerformanceCalculator::sortino(returns, 0.0, 1.0).has_value());
}

TEST(PerformanceCalculator_Sortino, KnownValue_DownsideOnly) {
    // Mean 0.0025; downside deviations −0.01 and −0.03 give σ_dn = √(1e-3 / 1).
    const std::vector<double> r = {0.02, -0.01, 0.03, -0.03};
    const auto so = PerformanceCalculator::sortino(r, 0.0, 1.0);
    ASSERT_TRUE(so.has_value());
    EXPECT_NEAR(*so, 0.0025 / std::sqrt(1e-3), 1e-12);
}

TEST(PerformanceCalculator_Sortino, CanFallBelowSharpe) {
    // Rare but deep losses: the downside deviation exceeds the full one.
    std::vector<double> r;
    for (int i = 0; i < 100; ++i) r.push_back(i % 10 == 0 ? -0.005 : 0.002);
    const auto sh = PerformanceCalculator::sharpe(r, 0.0, ANNUALISATION_FACTOR);
    const auto so = PerformanceCalculator::sortino(r, 0.0, ANNUALISATION_FACTOR);
    ASSERT_TRUE(sh && so);
    EXPECT_GT(*so, 0.0);
    EXPECT_LT(*so, *sh);
}

TEST(PerformanceCalculator_Sortino, TooFewReturns_Nullopt) {
    std::vector<double> one = {-0.01};
    EXPECT_FALSE(PerformanceCalculator::sortino(one, 0.0, 1.0).has_value());
}

// ─── Max Drawdown ─────────────────────────────────────────────────────────────

TEST(PerformanceCalculator_MaxDrawdown, EmptyInput_Nullopt) {
    EXPECT_FALSE(PerformanceCalculator::max_drawdown(std::span<const double>{}).has_value());
}

TEST(PerformanceCalculator_MaxDrawdown, MonotonicallyRising_ZeroDrawdown) {
    auto result = PerformanceCalculator::max_drawdown(make_constant_returns(100, 0.01));
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, 0.0, 1e-12);
}

TEST(PerformanceCalculator_MaxDrawdown, SingleDropThenRecover_KnownMDD) {
    // Equity: 1 → 1.1 → 0.9 → 1.1
    std::vector<double> returns = {
        0.10,
        (0.90 - 1.10) / 1.10,
        (1.10 - 0.90) / 0.90,
    };
    auto result = PerformanceCalculator::max_drawdown(returns);
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(*result, (1.10 - 0.90) / 1.10, 1e-9);
}

TEST(PerformanceCalculator_MaxDrawdown, MaxDrawdownInRange) {
    std::vector<double> r;
    for (int i = 0; i < 200; ++i) {
        r.push_back((i % 3 == 0) ? -0.05 : 0.02);
    }
    auto result = PerformanceCalculator::max_drawdown(r);
    ASSERT_TRUE(result.has_value());
    EXPECT_GE(*result, 0.0);
    EXPECT_LE(*result, 1.0);
}

// ─── Equity curve / summary ──────────────────────────────────────────────────

TEST(PerformanceCalculator_EquityCurve, CompoundsFromOne) {
    const std::vector<double> r = {0.1, -0.5, 0.0};
    const auto eq = PerformanceCalculator::equity_curve(r);
    ASSERT_EQ(eq.size(), 3u);
    EXPECT_DOUBLE_EQ(eq[0], 1.1);
    EXPECT_DOUBLE_EQ(eq[1], 0.55);
    EXPECT_DOUBLE_EQ(eq[2], 0.55);
}

TEST(PerformanceCalculator_Summarize, AllZeroReturns_ZeroMetrics) {
    const auto m = PerformanceCalculator::summarize(make_constant_returns(80, 0.0));
    EXPECT_EQ(m.num_days, 80u);
    EXPECT_DOUBLE_EQ(m.ann_return, 0.0);
    EXPECT_DOUBLE_EQ(m.ann_vol, 0.0);
    EXPECT_DOUBLE_EQ(m.sharpe_ratio, 0.0) << "undefined Sharpe reported as zero";
    EXPECT_DOUBLE_EQ(m.sortino_ratio, 0.0);
    EXPECT_DOUBLE_EQ(m.max_drawdown, 0.0);
}

TEST(PerformanceCalculator_Summarize, ConstantNonzeroReturns_ZeroSharpe) {
    const auto m = PerformanceCalculator::summarize(make_constant_returns(80, 0.01));
    EXPECT_NEAR(m.ann_return, 0.01 * ANNUALISATION_FACTOR, 1e-9);
    EXPECT_DOUBLE_EQ(m.ann_vol, 0.0);
    EXPECT_DOUBLE_EQ(m.sharpe_ratio, 0.0) << "flat PnL has no defined Sharpe";
    EXPECT_DOUBLE_EQ(m.sortino_ratio, 0.0);
}

TEST(PerformanceCalculator_Summarize, EmptySeries) {
    const auto m = PerformanceCalculator::summarize(std::span<const double>{});
    EXPECT_EQ(m.num_days, 0u);
    EXPECT_DOUBLE_EQ(m.sharpe_ratio, 0.0);
}

TEST(PerformanceCalculator_Summarize, SharpeMatchesRatio) {
    const auto r = make_returns_with_mean_stddev(0.001, 0.01, 200);
    const auto m = PerformanceCalculator::summarize(r);
    EXPECT_NEAR(m.sharpe_ratio, m.ann_return / m.ann_vol, 1e-12);
    EXPECT_NEAR(m.sharpe_ratio, *PerformanceCalculator::sharpe(r), 1e-9);
}

TEST(PerformanceMetrics_ToString, ContainsFields) {
    PerformanceMetrics m;
    m.sharpe_ratio = 1.234;
    m.num_days     = 42;
    const std::string s = m.to_string();
    EXPECT_NE(s.find("Sharpe=1.23"), std::string::npos);
    EXPECT_NE(s.find("Days=42"), std::string::npos);
}
