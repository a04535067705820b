/**
 * @file  prop_leg_counting.cpp
 * @brief Property: ∀ position traces, legs[k] = 2·|p[k] − p[k−1]| with p[−1] = Flat
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_leg_counting
 *
 * Each unit change of position trades one leg in each ticker, so an entry or
 * exit costs two legs and a direct flip costs four. The total cost of a
 * trace equals the cost of its total leg count.
 */

#include <rapidcheck.h>
#include <cmath>
#include <cstdlib>
#include <numeric>
#include <vector>

#include "statarb/cost_model.hpp"

using namespace statarb;
using namespace statarb::cost;

static PositionTrace make_trace(const std::vector<Position>& positions) {
    PositionTrace t;
    for (std::size_t i = 0; i < positions.size(); ++i) {
        t.dates.push_back(Date{static_cast<std::int32_t>(i)});
    }
    t.positions = positions;
    return t;
}

static rc::Gen<std::vector<Position>> gen_positions() {
    return rc::gen::container<std::vector<Position>>(
        rc::gen::element(Position::Short, Position::Flat, Position::Long));
}

int main() {
    // ── Property 1: per-day legs from the position change ───────────────────
    rc::check(
        "leg_counting: legs[k] == 2 * |p[k] - p[k-1]|",
        [] {
            const auto positions = *gen_positions();
            const auto legs      = leg_counts(make_trace(positions));
            RC_ASSERT(legs.size() == positions.size());

            Position prev = Position::Flat;
            for (std::size_t k = 0; k < positions.size(); ++k) {
                const int expected = 2 * std::abs(to_int(positions[k]) - to_int(prev));
                RC_ASSERT(legs[k] == expected);
                prev = positions[k];
            }
        }
    );

    // ── Property 2: costs are non-negative and additive ─────────────────────
    rc::check(
        "leg_counting: sum(cost) == leg_cost(sum(legs))",
        [] {
            const auto   positions = *gen_positions();
            const double bps       = *rc::gen::inRange(0, 1000) / 10.0;
            const auto   trace     = make_trace(positions);

            const auto legs = leg_counts(trace);
            const auto cost = transaction_costs(trace, bps);
            RC_ASSERT(cost.size() == legs.size());

            double total = 0.0;
            for (double c : cost) {
                RC_ASSERT(c >= 0.0);
                total += c;
            }
            const int leg_total = std::accumulate(legs.begin(), legs.end(), 0);
            RC_ASSERT(leg_total % 2 == 0);
            RC_ASSERT(std::abs(total - leg_cost(leg_total, bps)) < 1e-12);
        }
    );

    // ── Property 3: holding a position is free ──────────────────────────────
    rc::check(
        "leg_counting: count_legs(p, p) == 0",
        [] {
            const Position p = *rc::gen::element(Position::Short, Position::Flat, Position::Long);
            RC_ASSERT(count_legs(p, p) == 0);
        }
    );

    return 0;
}
