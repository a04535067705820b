/**
 * @file  bench/bench_walk_forward.cpp
 * @brief Google Benchmark suite for pair screening and the walk-forward loop.
 *
 * Benchmarks
 * ----------
 *   BM_WalkForward_ScreenUniverse  one formation window over N tickers
 *   BM_WalkForward_Run             full run, N tickers × 750 days
 *
 * Build (CMake):
 *   cmake -B build -DSTATARB_BENCH=ON
 *   cmake --build build --target bench_statarb
 *   ./build/bench_statarb --benchmark_filter=WalkForward
 *
 * The universe is deterministic: tickers share a few common random-walk
 * factors plus idiosyncratic AR(1) noise, so every cycle has candidates.
 */

#include "benchmark/benchmark.h"

#include "statarb/calendar.hpp"
#include "statarb/screener.hpp"
#include "statarb/walk_forward.hpp"

#include <cmath>
#include <cstddef>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace statarb;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static std::string ticker_name(std::size_t i) {
    return "T" + std::to_string(1000 + i);
}

static Universe make_universe(std::size_t tickers, std::size_t days) {
    std::minstd_rand                 rng(7);
    std::normal_distribution<double> step(0.0, 0.01);

    auto dates = business_days(Date::from_ymd(2015, 1, 1), Date::from_ymd(2030, 12, 31));
    dates.resize(days);

    constexpr std::size_t kFactors = 4;
    std::vector<std::vector<double>> factors(kFactors, std::vector<double>(days));
    for (auto& f : factors) {
        double x = std::log(50.0);
        for (auto& v : f) {
            x += step(rng);
            v = x;
        }
    }

    Universe u;
    for (std::size_t t = 0; t < tickers; ++t) {
        const std::string name = ticker_name(t);
        PriceSeries s{.ticker = name, .dates = dates, .log_prices = std::vector<double>(days)};
        const auto& f    = factors[t % kFactors];
        double       e    = 0.0;
        const double beta = 0.8 + 0.05 * static_cast<double>(t % 7);
        for (std::size_t i = 0; i < days; ++i) {
            e = 0.5 * e + step(rng);
            s.log_prices[i] = 0.1 * static_cast<double>(t) + beta * f[i] + e;
        }
        u.emplace(name, std::move(s));
    }
    return u;
}

// ── Benchmarks ─────────────────────────────────────────────────────────────────

static void BM_WalkForward_ScreenUniverse(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto u = make_universe(n, 300);
    const auto& dates = u.begin()->second.dates;

    const screen::PairScreener screener;
    for (auto _ : state) {
        auto sel = screener.screen_universe(u, dates.front(), dates[251], 252);
        benchmark::DoNotOptimize(sel.chosen.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations())
                            * static_cast<int64_t>(n * (n - 1) / 2));
}
BENCHMARK(BM_WalkForward_ScreenUniverse)->RangeMultiplier(2)->Range(4, 32)->Unit(benchmark::kMillisecond);

static void BM_WalkForward_Run(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto u = make_universe(n, 750);

    backtest::WalkForwardConfig cfg;
    cfg.start = Date::from_ymd(2015, 1, 1);
    cfg.end   = Date::from_ymd(2030, 12, 31);
    const backtest::WalkForwardEngine engine(cfg);

    for (auto _ : state) {
        auto res = engine.run(u);
        benchmark::DoNotOptimize(res.pnl.values.data());
    }
    state.counters["tickers"] = static_cast<double>(n);
}
BENCHMARK(BM_WalkForward_Run)->RangeMultiplier(2)->Range(4, 16)->Unit(benchmark::kMillisecond);
