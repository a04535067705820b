#pragma once

/// @file include/statarb/types.hpp
/// @brief Shared value types for the statarb walk-forward engine.
///
/// Every module includes this file. It defines the price series consumed
/// from the loader, the per-cycle pair specification, the spread position
/// encoding and the date-indexed series used for spreads and returns.

#include "statarb/calendar.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace statarb {

// ─── Price History ────────────────────────────────────────────────────────────

/// Date-ordered natural-log prices for one ticker.
///
/// Invariants (established by the loader, relied on everywhere else):
/// dates strictly increasing, `dates.size() == log_prices.size()`, all
/// values finite.
struct PriceSeries {
    std::string         ticker;
    std::vector<Date>   dates;
    std::vector<double> log_prices;

    [[nodiscard]] std::size_t size() const noexcept { return dates.size(); }
    [[nodiscard]] bool empty() const noexcept { return dates.empty(); }

    /// Sub-series with dates in [first, last].
    [[nodiscard]] PriceSeries slice(Date first, Date last) const;
};

/// A scalar series keyed by strictly increasing dates.
struct DatedSeries {
    std::vector<Date>   dates;
    std::vector<double> values;

    [[nodiscard]] std::size_t size() const noexcept { return dates.size(); }
    [[nodiscard]] bool empty() const noexcept { return dates.empty(); }
};

/// Two price series inner-joined on their shared dates.
struct AlignedPair {
    std::vector<Date>   dates;
    std::vector<double> lp1;
    std::vector<double> lp2;

    [[nodiscard]] std::size_t size() const noexcept { return dates.size(); }
};

/// Inner-join two series on common dates (both inputs must be date-sorted).
[[nodiscard]] AlignedPair align(const PriceSeries& a, const PriceSeries& b);

// ─── Pairs ────────────────────────────────────────────────────────────────────

/// An ordered ticker pair (ticker1 is the dependent leg of the regression).
struct TickerPair {
    std::string first;
    std::string second;

    auto operator<=>(const TickerPair&) const = default;
};

/// Hedge parameters and weight for one pair selected in one formation window.
///
/// Created by the screener, normalised once per cycle, then frozen for the
/// pair's trading window.
struct PairSpec {
    std::string ticker1;
    std::string ticker2;
    double alpha        = 0.0;  ///< OLS intercept of lp1 on lp2
    double beta         = 0.0;  ///< OLS slope (hedge ratio)
    double sigma_spread = 0.0;  ///< Sample std-dev of the formation spread
    double sigma_diff   = 0.0;  ///< Sample std-dev of the spread's daily change
    double pvalue       = 1.0;  ///< Engle-Granger p-value on the formation window
    double weight       = 0.0;  ///< Pre-weight 1/σ_diff, then normalised share

    [[nodiscard]] TickerPair key() const { return TickerPair{ticker1, ticker2}; }
};

// ─── Positions ────────────────────────────────────────────────────────────────

/// Spread position: long spread buys ticker1 / sells β·ticker2.
enum class Position : std::int8_t {
    Short = -1,
    Flat  = 0,
    Long  = 1,
};

[[nodiscard]] constexpr int to_int(Position p) noexcept {
    return static_cast<int>(p);
}

[[nodiscard]] const char* to_string(Position p) noexcept;

/// Position per date, aligned to `dates`.
struct PositionTrace {
    std::vector<Date>     dates;
    std::vector<Position> positions;

    [[nodiscard]] std::size_t size() const noexcept { return dates.size(); }
    [[nodiscard]] bool empty() const noexcept { return dates.empty(); }

    bool operator==(const PositionTrace&) const = default;
};

} // namespace statarb
