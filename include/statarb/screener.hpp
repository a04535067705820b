#pragma once

/// @file include/statarb/screener.hpp
/// @brief Pair Screener and Weight Normalizer.
///
/// # Module: Pair Screener
///
/// ## Responsibility
/// For one formation window, decide which ticker pairs are tradable and
/// estimate their frozen hedge parameters. Gates run in a fixed order and
/// the first failure rejects the pair for this cycle only:
///
///   1. whitelist membership (unordered pair)          → NotWhitelisted
///   2. same sector code (when restriction requested)  → SectorMismatch
///   3. aligned observations ≥ max(L, min(MIN_OVERLAP, ⌊0.8·F⌋))
///                                                     → InsufficientOverlap
///   4. Pearson ρ(lp1, lp2) ≥ MIN_LOG_CORR             → LowCorrelation
///   5. Engle-Granger succeeds, p ≤ PVAL_MAX           → CointegrationFailed /
///                                                       PValueTooHigh
///   6. OLS β ∈ [BETA_MIN, BETA_MAX]                   → HedgeRatioOutOfRange
///   7. σ_diff finite and ≥ MIN_SIGMA_DIFF             → DegenerateSpread
///
/// Survivors carry pre-weight 1/σ_diff.
///
/// # Module: Weight Normalizer
/// Rescales one cycle's surviving pre-weights to sum to 1. A non-positive
/// sum empties the selection.
///
/// ## Guarantees
/// - Evaluation of one pair never depends on any other pair
/// - Const methods only; a screener can be shared across threads

#include "statarb/constants.hpp"
#include "statarb/pair_filters.hpp"
#include "statarb/price_loader.hpp"
#include "statarb/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace statarb::screen {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Gate thresholds.
struct ScreenerConfig {
    std::size_t min_overlap_days = constants::MIN_OVERLAP_DAYS;
    double      pval_max         = constants::PVAL_MAX;
    double      min_log_corr     = constants::MIN_LOG_CORR;
    double      beta_min         = constants::BETA_MIN;
    double      beta_max         = constants::BETA_MAX;
    double      min_sigma_diff   = constants::MIN_SIGMA_DIFF;
    std::size_t lookback         = constants::DEFAULT_LOOKBACK;  ///< Overlap floor
};

/// Aligned observations a pair needs in a formation window of
/// `formation_length` trading days.
[[nodiscard]] std::size_t required_overlap(const ScreenerConfig& cfg,
                                           std::size_t formation_length) noexcept;

// ─── Verdicts ─────────────────────────────────────────────────────────────────

/// Why a pair was not selected. `None` means accepted.
enum class RejectReason {
    None,
    NotWhitelisted,
    SectorMismatch,
    InsufficientOverlap,
    LowCorrelation,
    CointegrationFailed,
    PValueTooHigh,
    HedgeRatioOutOfRange,
    DegenerateSpread,
};

[[nodiscard]] const char* to_string(RejectReason reason) noexcept;

/// Outcome of screening one pair.
struct ScreenVerdict {
    std::optional<PairSpec> spec;    ///< Set iff accepted (weight = 1/σ_diff)
    RejectReason            reason;  ///< None iff accepted

    [[nodiscard]] bool accepted() const noexcept { return spec.has_value(); }
};

/// All pairs screened for one formation window.
struct CycleSelection {
    std::vector<PairSpec> candidates;  ///< Survivors, pre-weights, pair order
    std::vector<PairSpec> chosen;      ///< After normalization
    std::size_t           evaluated = 0;
    std::map<RejectReason, std::size_t> rejections;
};

// ─── PairScreener ─────────────────────────────────────────────────────────────

class PairScreener {
public:
    /// # Arguments
    /// * `whitelist`: if set, only listed pairs are eligible
    /// * `sectors`: if set, both tickers must share a sector code
    explicit PairScreener(ScreenerConfig               config    = ScreenerConfig{},
                          std::optional<PairWhitelist> whitelist = std::nullopt,
                          std::optional<SectorMap>     sectors   = std::nullopt);

    /// Run every gate for (a, b) over dates in [form_start, form_end].
    [[nodiscard]] ScreenVerdict evaluate(const PriceSeries& a,
                                         const PriceSeries& b,
                                         Date               form_start,
                                         Date               form_end,
                                         std::size_t        formation_length) const;

    /// Statistical gates (3–7) on an already aligned formation sample.
    [[nodiscard]] ScreenVerdict evaluate_aligned(const std::string& ticker1,
                                                 const std::string& ticker2,
                                                 const AlignedPair& window,
                                                 std::size_t        formation_length) const;

    /// Screen every unordered pair of the universe (ticker1 < ticker2 in map
    /// order) and normalize the survivors' weights.
    [[nodiscard]] CycleSelection screen_universe(const Universe& universe,
                                                 Date            form_start,
                                                 Date            form_end,
                                                 std::size_t     formation_length) const;

    [[nodiscard]] const ScreenerConfig& config() const noexcept { return config_; }

private:
    ScreenerConfig               config_;
    std::optional<PairWhitelist> whitelist_;
    std::optional<SectorMap>     sectors_;
};

// ─── Weight Normalizer ────────────────────────────────────────────────────────

/// weight_i ← preweight_i / Σ preweight.
///
/// # Returns
/// The rescaled pairs, or an empty vector if there are no candidates or
/// the pre-weight sum is not positive and finite.
[[nodiscard]] std::vector<PairSpec> normalize_weights(std::vector<PairSpec> candidates);

} // namespace statarb::screen
