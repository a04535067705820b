#pragma once

/// @file include/statarb/cost_model.hpp
/// @brief Leg-counted transaction costs for spread position changes.
///
/// # Module: Cost Model
///
/// | transition            | legs |
/// |-----------------------|------|
/// | 0 → ±1, ±1 → 0        | 2    |
/// | +1 → −1, −1 → +1      | 4    |
/// | unchanged             | 0    |
///
/// The first day of a trace is treated as opening from FLAT.
/// cost = legs · cost_bps · 1e-4.

#include "statarb/constants.hpp"
#include "statarb/types.hpp"

#include <vector>

namespace statarb::cost {

/// Legs traded moving from `prev` to `cur`.
[[nodiscard]] constexpr int count_legs(Position prev, Position cur) noexcept {
    if (prev == cur) return 0;
    if (prev == Position::Flat || cur == Position::Flat) return 2;
    return 4;
}

/// Cost, as a return, of trading `legs` legs.
[[nodiscard]] constexpr double leg_cost(int legs, double cost_bps) noexcept {
    return static_cast<double>(legs) * cost_bps * constants::BPS;
}

/// Per-date leg counts for a position trace.
[[nodiscard]] std::vector<int> leg_counts(const PositionTrace& trace);

/// Per-date costs for a position trace.
[[nodiscard]] std::vector<double> transaction_costs(const PositionTrace& trace,
                                                    double cost_bps);

} // namespace statarb::cost
