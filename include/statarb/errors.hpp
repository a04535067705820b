#pragma once

/// @file include/statarb/errors.hpp
/// @brief Fatal error type for run-level failures.
///
/// Per-pair problems (short overlap, failed cointegration, hedge ratio out of
/// range) are not errors: the screener reports them as a `RejectReason` and
/// the cycle carries on. Only conditions that make the whole run meaningless
/// are thrown, and the message always names the resource and date range
/// involved.

#include <stdexcept>
#include <string>

namespace statarb {

/// Category of a fatal failure.
enum class ErrorKind {
    MissingData,           ///< Price history unavailable (file, ticker, range)
    InvalidConfiguration,  ///< Parameters or calendar cannot support one cycle
    SectorLabelMissing,    ///< Sector restriction requested without labels
    Io,                    ///< An output artifact could not be written
};

[[nodiscard]] const char* to_string(ErrorKind kind) noexcept;

/// Exception thrown for run-level failures.
class StatArbError : public std::runtime_error {
public:
    StatArbError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(to_string(kind)) + ": " + message)
        , kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace statarb
