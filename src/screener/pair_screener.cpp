/// @file src/screener/pair_screener.cpp
/// @brief Formation-window gates for candidate pairs.

#include "statarb/screener.hpp"
#include "statarb/stats.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace statarb::screen {

// ─── required_overlap ─────────────────────────────────────────────────────────

std::size_t required_overlap(const ScreenerConfig& cfg,
                             std::size_t formation_length) noexcept {
    const auto capped = static_cast<std::size_t>(
        constants::OVERLAP_FRACTION * static_cast<double>(formation_length));
    return std::max(cfg.lookback, std::min(cfg.min_overlap_days, capped));
}

const char* to_string(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::None:                 return "accepted";
        case RejectReason::NotWhitelisted:       return "not-whitelisted";
        case RejectReason::SectorMismatch:       return "sector-mismatch";
        case RejectReason::InsufficientOverlap:  return "insufficient-overlap";
        case RejectReason::LowCorrelation:       return "low-correlation";
        case RejectReason::CointegrationFailed:  return "cointegration-failed";
        case RejectReason::PValueTooHigh:        return "pvalue-too-high";
        case RejectReason::HedgeRatioOutOfRange: return "hedge-ratio-out-of-range";
        case RejectReason::DegenerateSpread:     return "degenerate-spread";
    }
    return "unknown";
}

// ─── PairScreener ─────────────────────────────────────────────────────────────

PairScreener::PairScreener(ScreenerConfig               config,
                           std::optional<PairWhitelist> whitelist,
                           std::optional<SectorMap>     sectors)
    : config_(config)
    , whitelist_(std::move(whitelist))
    , sectors_(std::move(sectors)) {}

ScreenVerdict PairScreener::evaluate(const PriceSeries& a,
                                     const PriceSeries& b,
                                     Date               form_start,
                                     Date               form_end,
                                     std::size_t        formation_length) const {
    if (whitelist_ && !whitelist_->contains(a.ticker, b.ticker)) {
        return ScreenVerdict{std::nullopt, RejectReason::NotWhitelisted};
    }
    if (sectors_ && !sectors_->same_sector(a.ticker, b.ticker)) {
        return ScreenVerdict{std::nullopt, RejectReason::SectorMismatch};
    }

    const AlignedPair window = align(a.slice(form_start, form_end),
                                     b.slice(form_start, form_end));
    return evaluate_aligned(a.ticker, b.ticker, window, formation_length);
}

ScreenVerdict PairScreener::evaluate_aligned(const std::string& ticker1,
                                             const std::string& ticker2,
                                             const AlignedPair& window,
                                             std::size_t        formation_length) const {
    // ── Gate 3: overlap ──────────────────────────────────────────────────────
    if (window.size() < required_overlap(config_, formation_length)) {
        return ScreenVerdict{std::nullopt, RejectReason::InsufficientOverlap};
    }

    // ── Gate 4: correlation of log prices ────────────────────────────────────
    const auto rho = stats::pearson(window.lp1, window.lp2);
    if (!rho.has_value() || *rho < config_.min_log_corr) {
        return ScreenVerdict{std::nullopt, RejectReason::LowCorrelation};
    }

    // ── Gate 5: Engle-Granger ────────────────────────────────────────────────
    const auto eg = stats::engle_granger(window.lp1, window.lp2);
    if (!eg.has_value()) {
        return ScreenVerdict{std::nullopt, RejectReason::CointegrationFailed};
    }
    if (eg->pvalue > config_.pval_max) {
        return ScreenVerdict{std::nullopt, RejectReason::PValueTooHigh};
    }

    // ── Gate 6: hedge ratio ──────────────────────────────────────────────────
    if (!(eg->beta >= config_.beta_min && eg->beta <= config_.beta_max)) {
        return ScreenVerdict{std::nullopt, RejectReason::HedgeRatioOutOfRange};
    }

    // ── Gate 7: spread volatility ────────────────────────────────────────────
    std::vector<double> spread(window.size());
    for (std::size_t i = 0; i < window.size(); ++i) {
        spread[i] = window.lp1[i] - (eg->alpha + eg->beta * window.lp2[i]);
    }
    const auto sigma_spread = stats::sample_stddev(spread);
    const auto sigma_diff   = stats::sample_stddev(stats::diff(spread));
    if (!sigma_spread.has_value() || !sigma_diff.has_value()
        || !std::isfinite(*sigma_diff) || *sigma_diff <= 0.0
        || *sigma_diff < config_.min_sigma_diff) {
        return ScreenVerdict{std::nullopt, RejectReason::DegenerateSpread};
    }

    PairSpec spec{
        .ticker1      = ticker1,
        .ticker2      = ticker2,
        .alpha        = eg->alpha,
        .beta         = eg->beta,
        .sigma_spread = *sigma_spread,
        .sigma_diff   = *sigma_diff,
        .pvalue       = eg->pvalue,
        .weight       = 1.0 / *sigma_diff,
    };
    return ScreenVerdict{std::move(spec), RejectReason::None};
}

CycleSelection PairScreener::screen_universe(const Universe& universe,
                                             Date            form_start,
                                             Date            form_end,
                                             std::size_t     formation_length) const {
    CycleSelection out;
    for (auto a = universe.begin(); a != universe.end(); ++a) {
        for (auto b = std::next(a); b != universe.end(); ++b) {
            ++out.evaluated;
            ScreenVerdict v = evaluate(a->second, b->second,
                                       form_start, form_end, formation_length);
            if (v.accepted()) {
                out.candidates.push_back(std::move(*v.spec));
            } else {
                ++out.rejections[v.reason];
            }
        }
    }
    out.chosen = normalize_weights(out.candidates);
    return out;
}

}  // namespace statarb::screen
