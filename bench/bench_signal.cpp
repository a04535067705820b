/**
 * @file  bench/bench_signal.cpp
 * @brief Google Benchmark suite for the per-pair signal path.
 *
 * Benchmarks
 * ----------
 *   BM_RollingZscore       : trailing z-score over N days
 *   BM_StateMachine        : threshold scan over N defined z values
 *   BM_GeneratePairReturns : spread → z → positions → net returns
 *   BM_EngleGranger        : OLS + ADF + MacKinnon p-value
 *
 * Build (CMake):
 *   cmake -B build -DSTATARB_BENCH=ON
 *   cmake --build build --target bench_statarb
 *   ./build/bench_statarb --benchmark_filter=Signal --benchmark_format=json
 *
 * Throughput units: items/second (days processed).
 */

#include "benchmark/benchmark.h"

#include "statarb/calendar.hpp"
#include "statarb/signal.hpp"
#include "statarb/stats.hpp"

#include <cmath>
#include <cstddef>
#include <vector>

using namespace statarb;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Mean-reverting sinusoid with a slow drift; crosses ±2σ regularly.
static std::vector<double> make_spread(std::size_t n) {
    std::vector<double> s(n);
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        s[i] = 0.05 * std::sin(t / 7.0) + 0.01 * std::sin(t / 53.0);
    }
    return s;
}

static std::vector<Date> make_dates(std::size_t n) {
    return business_days(Date::from_ymd(2000, 1, 3),
                         Date::from_ymd(2000, 1, 3).plus_days(static_cast<std::int32_t>(n * 2)));
}

/// Log-price legs whose spread is `make_spread` with α = 0.1, β = 0.9.
static void make_legs(std::size_t n, PriceSeries& p1, PriceSeries& p2) {
    auto dates = make_dates(n);
    dates.resize(n);
    const auto spread = make_spread(n);
    p1 = PriceSeries{.ticker = "AAA", .dates = dates, .log_prices = {}};
    p2 = PriceSeries{.ticker = "BBB", .dates = dates, .log_prices = {}};
    for (std::size_t i = 0; i < n; ++i) {
        const double x = std::log(50.0) + 0.001 * static_cast<double>(i);
        p2.log_prices.push_back(x);
        p1.log_prices.push_back(0.1 + 0.9 * x + spread[i]);
    }
}

// ── z-score / state machine ────────────────────────────────────────────────────

static void BM_Signal_RollingZscore(benchmark::State& state) {
    const auto n      = static_cast<std::size_t>(state.range(0));
    const auto spread = make_spread(n);
    for (auto _ : state) {
        auto z = signal::rolling_zscore(spread, 60);
        benchmark::DoNotOptimize(z.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Signal_RollingZscore)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

static void BM_Signal_StateMachine(benchmark::State& state) {
    const auto n     = static_cast<std::size_t>(state.range(0));
    auto       dates = make_dates(n);
    dates.resize(n);
    std::vector<double> z(n);
    for (std::size_t i = 0; i < n; ++i) z[i] = 3.0 * std::sin(static_cast<double>(i) / 5.0);

    const signal::SignalConfig cfg;
    for (auto _ : state) {
        auto trace = signal::run_state_machine(dates, z, cfg);
        benchmark::DoNotOptimize(trace.positions.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Signal_StateMachine)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── Full pair path ─────────────────────────────────────────────────────────────

static void BM_Signal_GeneratePairReturns(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    PriceSeries p1;
    PriceSeries p2;
    make_legs(n, p1, p2);

    PairSpec spec;
    spec.ticker1 = "AAA";
    spec.ticker2 = "BBB";
    spec.alpha   = 0.1;
    spec.beta    = 0.9;
    spec.weight  = 1.0;
    const signal::SignalConfig cfg;

    for (auto _ : state) {
        auto trace = signal::generate_pair_returns(spec, p1, p2, p1.dates[n / 4], p1.dates.back(), cfg);
        benchmark::DoNotOptimize(trace.net.values.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Signal_GeneratePairReturns)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

static void BM_Signal_EngleGranger(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    PriceSeries p1;
    PriceSeries p2;
    make_legs(n, p1, p2);

    for (auto _ : state) {
        auto eg = stats::engle_granger(p1.log_prices, p2.log_prices);
        benchmark::DoNotOptimize(eg);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Signal_EngleGranger)->RangeMultiplier(2)->Range(128, 2048)->Unit(benchmark::kMicrosecond);
