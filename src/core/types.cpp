/// @file src/core/types.cpp
/// @brief Series slicing, date alignment and enum names.

#include "statarb/types.hpp"
#include "statarb/errors.hpp"

#include <algorithm>

namespace statarb {

// ─── PriceSeries::slice ───────────────────────────────────────────────────────

PriceSeries PriceSeries::slice(Date first, Date last) const {
    PriceSeries out;
    out.ticker = ticker;
    if (last < first) return out;

    const auto lo = std::lower_bound(dates.begin(), dates.end(), first);
    const auto hi = std::upper_bound(dates.begin(), dates.end(), last);
    const auto b  = static_cast<std::size_t>(lo - dates.begin());
    const auto e  = static_cast<std::size_t>(hi - dates.begin());
    if (b >= e) return out;

    out.dates.assign(dates.begin() + static_cast<std::ptrdiff_t>(b),
                     dates.begin() + static_cast<std::ptrdiff_t>(e));
    out.log_prices.assign(log_prices.begin() + static_cast<std::ptrdiff_t>(b),
                          log_prices.begin() + static_cast<std::ptrdiff_t>(e));
    return out;
}

// ─── align ────────────────────────────────────────────────────────────────────

AlignedPair align(const PriceSeries& a, const PriceSeries& b) {
    AlignedPair out;
    const std::size_t cap = std::min(a.size(), b.size());
    out.dates.reserve(cap);
    out.lp1.reserve(cap);
    out.lp2.reserve(cap);

    // Merge-join: both date vectors are strictly increasing.
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (a.dates[i] < b.dates[j]) {
            ++i;
        } else if (b.dates[j] < a.dates[i]) {
            ++j;
        } else {
            out.dates.push_back(a.dates[i]);
            out.lp1.push_back(a.log_prices[i]);
            out.lp2.push_back(b.log_prices[j]);
            ++i;
            ++j;
        }
    }
    return out;
}

// ─── Enum names ───────────────────────────────────────────────────────────────

const char* to_string(Position p) noexcept {
    switch (p) {
        case Position::Short: return "SHORT";
        case Position::Flat:  return "FLAT";
        case Position::Long:  return "LONG";
    }
    return "UNKNOWN";
}

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MissingData:          return "Missing-Data";
        case ErrorKind::InvalidConfiguration: return "Invalid-Configuration";
        case ErrorKind::SectorLabelMissing:   return "Sector-Label-Missing";
        case ErrorKind::Io:                   return "I/O";
    }
    return "Unknown";
}

}  // namespace statarb
