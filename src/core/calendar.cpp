/// @file src/core/calendar.cpp
/// @brief Civil-date conversion, ISO parsing and the business-day calendar.
///
/// Conversion uses the era/day-of-era decomposition of the proleptic
/// Gregorian calendar (400-year cycles of 146097 days), shifted so that the
/// year starts in March and the leap day falls at the end.

#include "statarb/calendar.hpp"

#include <fmt/format.h>

#include <charconv>

namespace statarb {

namespace {

constexpr std::int32_t EPOCH_SHIFT = 719468;  // 0000-03-01 → 1970-01-01

[[nodiscard]] std::int32_t days_from_civil(int y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const int era      = (y >= 0 ? y : y - 399) / 400;
    const auto yoe     = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int32_t>(doe) - EPOCH_SHIFT;
}

struct Civil {
    int      year;
    unsigned month;
    unsigned day;
};

[[nodiscard]] Civil civil_from_days(std::int32_t z) noexcept {
    z += EPOCH_SHIFT;
    const int era      = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe     = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp  = (5 * doy + 2) / 153;
    const unsigned d   = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m   = mp < 10 ? mp + 3 : mp - 9;
    const int y        = static_cast<int>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
    return Civil{y, m, d};
}

[[nodiscard]] bool is_leap(int y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

[[nodiscard]] unsigned days_in_month(int y, unsigned m) noexcept {
    static constexpr unsigned DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29u : DAYS[m - 1];
}

template <typename T>
[[nodiscard]] bool parse_field(std::string_view s, T& out) noexcept {
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

}  // namespace

// ─── Date ─────────────────────────────────────────────────────────────────────

Date Date::from_ymd(int year, unsigned month, unsigned day) noexcept {
    return Date{days_from_civil(year, month, day)};
}

std::optional<Date> Date::parse(std::string_view text) noexcept {
    // Strip surrounding whitespace and quotes.
    while (!text.empty() && (text.front() == ' ' || text.front() == '"')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '"' || text.back() == '\r')) {
        text.remove_suffix(1);
    }

    if (text.size() < 10)                return std::nullopt;
    if (text[4] != '-' || text[7] != '-') return std::nullopt;
    if (text.size() > 10 && text[10] != ' ' && text[10] != 'T') return std::nullopt;

    int      year  = 0;
    unsigned month = 0;
    unsigned day   = 0;
    if (!parse_field(text.substr(0, 4), year))  return std::nullopt;
    if (!parse_field(text.substr(5, 2), month)) return std::nullopt;
    if (!parse_field(text.substr(8, 2), day))   return std::nullopt;

    if (month < 1 || month > 12)                    return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;

    return from_ymd(year, month, day);
}

std::string Date::to_string() const {
    const Civil c = civil_from_days(days);
    return fmt::format("{:04d}-{:02d}-{:02d}", c.year, c.month, c.day);
}

unsigned Date::weekday() const noexcept {
    // 1970-01-01 was a Thursday (index 3 with Monday = 0).
    const std::int32_t w = (days + 3) % 7;
    return static_cast<unsigned>(w < 0 ? w + 7 : w);
}

// ─── business_days ────────────────────────────────────────────────────────────

std::vector<Date> business_days(Date first, Date last) {
    std::vector<Date> out;
    if (last < first) return out;
    out.reserve(static_cast<std::size_t>(days_between(first, last) + 1));
    for (Date d = first; d <= last; d = d.plus_days(1)) {
        if (d.is_business_day()) out.push_back(d);
    }
    return out;
}

}  // namespace statarb
