#pragma once

/// @file include/statarb/price_loader.hpp
/// @brief Price history loading: the loader contract and a CSV implementation.
///
/// # Module: Price Loader
///
/// ## Responsibility
/// Produce, for a ticker and a date range, the date-ordered natural-log
/// price series the walk-forward engine consumes. The engine only depends on
/// the abstract `PriceLoader`; `CsvPriceLoader` reads the per-ticker daily
/// files produced by the download step.
///
/// ## Expected CSV Format
/// ```
/// date,permno,prc,vol
/// 2024-01-02,14593,185.64,82488700
/// 2024-01-03,14593,184.25,58414500
/// ```
/// The header must contain `date` and `prc`; any other columns are ignored.
/// File name: `<data_dir>/<TICKER>_dsf_1y.csv`.
///
/// ## Guarantees
/// - Returned series: dates strictly ascending, no duplicates, finite values
/// - Rows with unparsable dates or non-finite / non-positive prices are
///   skipped silently
/// - A missing file throws `StatArbError{MissingData}` naming the path

#include "statarb/types.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace statarb {

// ─── PriceLoader ──────────────────────────────────────────────────────────────

/// Source of log-price history for one ticker.
class PriceLoader {
public:
    virtual ~PriceLoader() = default;

    /// Log-price series for `ticker` restricted to [start, end].
    ///
    /// # Throws
    /// `StatArbError{MissingData}` if the ticker's history is unavailable.
    [[nodiscard]] virtual PriceSeries
    load(const std::string& ticker, Date start, Date end) const = 0;
};

// ─── CSV parsing ──────────────────────────────────────────────────────────────

/// Parse a price CSV held in memory into a log-price series.
///
/// The first non-empty line is the header. Never throws on malformed
/// content; a header without `date`/`prc` yields an empty series.
[[nodiscard]] PriceSeries parse_price_csv(const std::string& csv_content,
                                          const std::string& ticker);

/// Sort by date, drop duplicate dates (first occurrence wins) and
/// non-finite values. Used by every loader before returning a series.
void canonicalize(PriceSeries& series);

// ─── CsvPriceLoader ───────────────────────────────────────────────────────────

/// Reads `<data_dir>/<TICKER>_dsf_1y.csv` files.
class CsvPriceLoader final : public PriceLoader {
public:
    explicit CsvPriceLoader(std::filesystem::path data_dir);

    [[nodiscard]] PriceSeries
    load(const std::string& ticker, Date start, Date end) const override;

    /// Path of the file backing `ticker`.
    [[nodiscard]] std::filesystem::path path_for(const std::string& ticker) const;

    /// Tickers with a `*_dsf_1y.csv` file in the data directory, sorted.
    /// Empty if the directory does not exist.
    [[nodiscard]] std::vector<std::string> discover_tickers() const;

    static constexpr const char* FILE_SUFFIX = "_dsf_1y.csv";

private:
    std::filesystem::path data_dir_;
};

// ─── Universe ─────────────────────────────────────────────────────────────────

/// Ticker → log-price series. Ordered so that pair enumeration is
/// deterministic.
using Universe = std::map<std::string, PriceSeries>;

/// Load every ticker, skipping those whose history is missing or empty.
///
/// # Arguments
/// * `verbose`: log each skipped ticker to stderr
///
/// # Throws
/// `StatArbError{MissingData}` if no ticker could be loaded.
[[nodiscard]] Universe load_universe(const PriceLoader&              loader,
                                     const std::vector<std::string>& tickers,
                                     Date start,
                                     Date end,
                                     bool verbose = false);

} // namespace statarb
