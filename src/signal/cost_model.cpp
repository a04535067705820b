/// @file src/signal/cost_model.cpp
/// @brief Per-date leg counts and costs.

#include "statarb/cost_model.hpp"

namespace statarb::cost {

std::vector<int> leg_counts(const PositionTrace& trace) {
    std::vector<int> legs;
    legs.reserve(trace.size());
    Position prev = Position::Flat;
    for (const Position cur : trace.positions) {
        legs.push_back(count_legs(prev, cur));
        prev = cur;
    }
    return legs;
}

std::vector<double> transaction_costs(const PositionTrace& trace, double cost_bps) {
    const std::vector<int> legs = leg_counts(trace);
    std::vector<double> cost;
    cost.reserve(legs.size());
    for (const int l : legs) {
        cost.push_back(leg_cost(l, cost_bps));
    }
    return cost;
}

}  // namespace statarb::cost
