/// @file src/signal/signal_generator.cpp
/// @brief Spread construction, trailing z-scores and the FLAT/LONG/SHORT scan.

#include "statarb/signal.hpp"
#include "statarb/cost_model.hpp"
#include "statarb/stats.hpp"

#include <algorithm>
#include <cmath>

namespace statarb::signal {

// ─── compute_spread ───────────────────────────────────────────────────────────

DatedSeries compute_spread(const PriceSeries& p1,
                           const PriceSeries& p2,
                           double alpha,
                           double beta) {
    const AlignedPair joined = align(p1, p2);
    DatedSeries out;
    out.dates = joined.dates;
    out.values.resize(joined.size());
    for (std::size_t i = 0; i < joined.size(); ++i) {
        out.values[i] = joined.lp1[i] - (alpha + beta * joined.lp2[i]);
    }
    return out;
}

// ─── rolling_zscore ───────────────────────────────────────────────────────────

std::vector<std::optional<double>>
rolling_zscore(std::span<const double> spread, std::size_t lookback) {
    std::vector<std::optional<double>> z(spread.size());
    const std::size_t min_obs = std::max<std::size_t>(lookback / 2, 2);

    // Statistics for day t come from the window ending at t − 1.
    for (std::size_t t = 1; t < spread.size(); ++t) {
        const std::size_t count = std::min(lookback, t);
        if (count < min_obs) continue;

        const auto window = spread.subspan(t - count, count);
        const auto mu     = stats::mean(window);
        const auto sd     = stats::sample_stddev(window);
        if (!mu || !sd || stats::negligible_dispersion(window, *sd)) continue;

        const double value = (spread[t] - *mu) / *sd;
        if (std::isfinite(value)) z[t] = value;
    }
    return z;
}

// ─── run_state_machine ────────────────────────────────────────────────────────

PositionTrace run_state_machine(std::span<const Date>   dates,
                                std::span<const double> z,
                                const SignalConfig&     cfg) {
    PositionTrace trace;
    const std::size_t n = std::min(dates.size(), z.size());
    trace.dates.assign(dates.begin(), dates.begin() + static_cast<std::ptrdiff_t>(n));
    trace.positions.reserve(n);

    Position            state = Position::Flat;
    std::optional<Date> entry_date;

    for (std::size_t i = 0; i < n; ++i) {
        const Date   today = dates[i];
        const double zt    = z[i];

        if (state == Position::Flat) {
            if (zt <= -cfg.entry_z) {
                state      = Position::Long;
                entry_date = today;
            } else if (zt >= cfg.entry_z) {
                state      = Position::Short;
                entry_date = today;
            }
        } else {
            const bool reverted  = std::abs(zt) <= cfg.exit_z;
            const bool timed_out = cfg.time_stop_days > 0 && entry_date.has_value()
                && days_between(*entry_date, today) >= cfg.time_stop_days;
            if (reverted || timed_out) {
                state = Position::Flat;
                entry_date.reset();
            }
        }
        trace.positions.push_back(state);
    }
    return trace;
}

// ─── fill_positions ───────────────────────────────────────────────────────────

PositionTrace fill_positions(const PositionTrace&  scan,
                             std::span<const Date> calendar,
                             Date                  first,
                             Date                  last) {
    PositionTrace out;
    Position      carried = Position::Flat;
    std::size_t   k       = 0;

    for (const Date d : calendar) {
        while (k < scan.size() && scan.dates[k] <= d) {
            carried = scan.positions[k];
            ++k;
        }
        if (d < first || last < d) continue;
        out.dates.push_back(d);
        out.positions.push_back(carried);
    }
    return out;
}

// ─── generate_pair_returns ────────────────────────────────────────────────────

PairTrace generate_pair_returns(const PairSpec&     spec,
                                const PriceSeries&  p1,
                                const PriceSeries&  p2,
                                Date                trade_start,
                                Date                trade_end,
                                const SignalConfig& cfg) {
    const DatedSeries spread = compute_spread(p1, p2, spec.alpha, spec.beta);
    const auto        z      = rolling_zscore(spread.values, cfg.lookback);

    std::vector<Date>   z_dates;
    std::vector<double> z_values;
    for (std::size_t i = 0; i < spread.size(); ++i) {
        const Date d = spread.dates[i];
        if (z[i].has_value() && trade_start <= d && d <= trade_end) {
            z_dates.push_back(d);
            z_values.push_back(*z[i]);
        }
    }
    if (z_dates.empty()) return PairTrace{};

    PairTrace out;
    out.positions = fill_positions(run_state_machine(z_dates, z_values, cfg),
                                   spread.dates, trade_start, trade_end);

    const auto lo = static_cast<std::size_t>(
        std::lower_bound(spread.dates.begin(), spread.dates.end(), trade_start)
        - spread.dates.begin());

    const std::size_t n = out.positions.size();
    out.gross.assign(n, 0.0);
    for (std::size_t k = 1; k < n; ++k) {
        const double change = spread.values[lo + k] - spread.values[lo + k - 1];
        out.gross[k] = static_cast<double>(to_int(out.positions.positions[k - 1])) * change;
    }

    out.legs = cost::leg_counts(out.positions);
    out.cost = cost::transaction_costs(out.positions, cfg.cost_bps);

    out.net.dates = out.positions.dates;
    out.net.values.resize(n);
    for (std::size_t k = 0; k < n; ++k) {
        out.net.values[k] = (out.gross[k] - out.cost[k]) * spec.weight;
    }
    return out;
}

}  // namespace statarb::signal
