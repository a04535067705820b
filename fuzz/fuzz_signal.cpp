/**
 * @file  fuzz_signal.cpp
 * @brief libFuzzer target for the z-score → state machine → cost pipeline
 *
 * Build:
 *   cmake -DSTATARB_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_signal
 *
 * Run for 60 seconds:
 *   ./fuzz_signal -max_total_time=60
 *
 * Input layout:
 *   byte 0        lookback (2 + b % 64)
 *   byte 1        time stop in days (b % 40, 0 disables)
 *   bytes 2..     spread, one signed byte per day scaled by 1/16
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception.
 *   2. rolling_zscore returns one entry per spread value; defined entries
 *      are finite.
 *   3. The state machine emits one position per defined z, starting from
 *      Flat (the first position is never a flip).
 *   4. Legs are in {0, 2, 4} and costs are non-negative.
 *   5. With the time stop enabled no position is held longer than the stop.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "statarb/cost_model.hpp"
#include "statarb/signal.hpp"

using namespace statarb;
using namespace statarb::signal;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 3) return 0;

    SignalConfig cfg;
    cfg.lookback       = 2 + data[0] % 64;
    cfg.time_stop_days = data[1] % 40;

    std::vector<double> spread;
    spread.reserve(size - 2);
    for (size_t i = 2; i < size; ++i) {
        spread.push_back(static_cast<double>(static_cast<int8_t>(data[i])) / 16.0);
    }

    // ── z-score ──────────────────────────────────────────────────────────────
    const auto z = rolling_zscore(spread, cfg.lookback);
    assert(z.size() == spread.size());

    std::vector<Date>   dates;
    std::vector<double> values;
    for (std::size_t i = 0; i < z.size(); ++i) {
        if (!z[i].has_value()) continue;
        assert(std::isfinite(*z[i]));
        dates.push_back(Date{static_cast<std::int32_t>(i)});
        values.push_back(*z[i]);
    }

    // ── State machine ────────────────────────────────────────────────────────
    const PositionTrace trace = run_state_machine(dates, values, cfg);
    assert(trace.size() == dates.size());
    assert(trace.positions.size() == trace.dates.size());

    Date entry{};
    Position prev = Position::Flat;
    for (std::size_t k = 0; k < trace.size(); ++k) {
        const Position p = trace.positions[k];
        if (p != Position::Flat && p != prev) entry = trace.dates[k];
        if (p != Position::Flat && cfg.time_stop_days > 0) {
            assert(days_between(entry, trace.dates[k]) < cfg.time_stop_days);
        }
        prev = p;
    }

    // ── Costs ────────────────────────────────────────────────────────────────
    const auto legs = cost::leg_counts(trace);
    const auto cost = cost::transaction_costs(trace, cfg.cost_bps);
    assert(legs.size() == trace.size());
    for (std::size_t k = 0; k < legs.size(); ++k) {
        assert(legs[k] == 0 || legs[k] == 2 || legs[k] == 4);
        assert(cost[k] >= 0.0);
    }
    if (!legs.empty()) assert(legs.front() != 4);

    return 0;
}
