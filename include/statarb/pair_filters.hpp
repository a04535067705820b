#pragma once

/// @file include/statarb/pair_filters.hpp
/// @brief Externally supplied pair eligibility: whitelist and sector labels.
///
/// # Module: Pair Filters
///
/// ## Responsibility
/// Hold the two optional inputs the screener consults before any statistics
/// are computed:
///   - `PairWhitelist`: unordered ticker pairs allowed to trade, usually the
///     output of a previous cointegration scan, optionally pre-filtered by
///     its p-value column
///   - `SectorMap`: ticker → two-digit SIC code, for within-sector pairing
///
/// Tickers are compared upper-cased; pair membership ignores order.

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace statarb {

/// Upper-case ASCII copy of `s`.
[[nodiscard]] std::string to_upper(std::string s);

// ─── PairWhitelist ────────────────────────────────────────────────────────────

/// Set of unordered ticker pairs.
class PairWhitelist {
public:
    PairWhitelist() = default;

    /// Insert a pair (order and case are normalised).
    void add(const std::string& a, const std::string& b);

    /// True if {a, b} was inserted, in either order.
    [[nodiscard]] bool contains(const std::string& a, const std::string& b) const;

    [[nodiscard]] std::size_t size() const noexcept { return pairs_.size(); }
    [[nodiscard]] bool empty() const noexcept { return pairs_.empty(); }

    /// Parse `ticker1,ticker2[,pval]` CSV text. When a `pval` column is
    /// present, rows above `pval_max` (or with unparsable p-values) are
    /// dropped.
    ///
    /// # Returns
    /// nullopt if the header lacks `ticker1` or `ticker2`.
    [[nodiscard]] static std::optional<PairWhitelist>
    parse_csv(const std::string& csv_content, double pval_max);

    /// Load from a file.
    ///
    /// # Returns
    /// nullopt if the file cannot be opened or lacks the ticker columns; the
    /// reason is logged to stderr and the run proceeds without a whitelist.
    [[nodiscard]] static std::optional<PairWhitelist>
    load_csv(const std::filesystem::path& path, double pval_max);

private:
    std::set<std::pair<std::string, std::string>> pairs_;
};

// ─── SectorMap ────────────────────────────────────────────────────────────────

/// Ticker → two-digit SIC code (absent when the label source had none).
class SectorMap {
public:
    SectorMap() = default;

    void set(const std::string& ticker, std::optional<int> sic2);

    /// Sector code for `ticker`, nullopt if unknown or unlabelled.
    [[nodiscard]] std::optional<int> sector(const std::string& ticker) const;

    /// Both tickers labelled with the same code.
    [[nodiscard]] bool same_sector(const std::string& a, const std::string& b) const;

    [[nodiscard]] std::size_t size() const noexcept { return codes_.size(); }

    /// Parse `ticker,...,sic2` CSV text. Missing or non-numeric `sic2`
    /// values map to "unlabelled". A header without `ticker`/`sic2` yields
    /// an empty map.
    [[nodiscard]] static SectorMap parse_csv(const std::string& csv_content);

    /// `<meta_dir>/sic_map_<labels_date>.csv`
    [[nodiscard]] static std::filesystem::path
    labels_path(const std::filesystem::path& meta_dir, const std::string& labels_date);

    /// Load the label file for a sector-restricted run.
    ///
    /// # Throws
    /// `StatArbError{SectorLabelMissing}` if the file does not exist; the
    /// message tells the operator to regenerate labels for `labels_date`.
    [[nodiscard]] static SectorMap load_csv(const std::filesystem::path& path,
                                            const std::string& labels_date);

private:
    std::map<std::string, std::optional<int>> codes_;
};

} // namespace statarb
