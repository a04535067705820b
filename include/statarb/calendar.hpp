#pragma once

/// @file include/statarb/calendar.hpp
/// @brief Date value type and business-day calendar.
///
/// # Module: Calendar
///
/// ## Responsibility
/// Represent trading dates as a strong integer type (days since 1970-01-01)
/// so that ordering, equality and calendar-day differences are exact and
/// cheap. Parsing and formatting use the ISO `YYYY-MM-DD` layout found in
/// the price files.
///
/// ## Guarantees
/// - `Date` is trivially copyable and totally ordered
/// - `parse` never throws; malformed text yields `std::nullopt`
/// - Civil-date conversion is exact for the proleptic Gregorian calendar

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace statarb {

/// A calendar date, stored as days since the Unix epoch.
struct Date {
    std::int32_t days = 0;

    /// Build from a civil year/month/day triple (no range checks).
    [[nodiscard]] static Date from_ymd(int year, unsigned month, unsigned day) noexcept;

    /// Parse `YYYY-MM-DD`. A trailing time component (`2024-01-02 00:00:00`)
    /// is ignored. Returns nullopt for malformed or out-of-range fields.
    [[nodiscard]] static std::optional<Date> parse(std::string_view text) noexcept;

    /// ISO `YYYY-MM-DD` rendering.
    [[nodiscard]] std::string to_string() const;

    /// 0 = Monday … 6 = Sunday.
    [[nodiscard]] unsigned weekday() const noexcept;

    /// Monday through Friday.
    [[nodiscard]] bool is_business_day() const noexcept { return weekday() < 5; }

    [[nodiscard]] Date plus_days(std::int32_t n) const noexcept { return Date{days + n}; }

    auto operator<=>(const Date&) const = default;
};

/// Calendar days from `from` to `to` (negative when `to` precedes `from`).
[[nodiscard]] inline std::int32_t days_between(Date from, Date to) noexcept {
    return to.days - from.days;
}

/// Every Monday–Friday date in [first, last], ascending. Empty if first > last.
[[nodiscard]] std::vector<Date> business_days(Date first, Date last);

} // namespace statarb
