#pragma once

/// @file include/statarb/walk_forward.hpp
/// @brief Walk-Forward Orchestrator and PnL Aggregator.
///
/// # Module: Walk-Forward Orchestrator
///
/// ## Responsibility
/// Slide a formation window and the trading window that follows it across
/// the union of all tickers' trading dates:
///
/// ```
///   dates:  ... | F formation dates | T trade dates | ...
///                 ^ i − F             ^ i             cursor i += T
/// ```
///
/// For every cycle: screen all pairs on the formation window, normalise the
/// survivors' weights, trade each chosen pair over the trading window,
/// reindex its net returns onto the Monday–Friday calendar of that window
/// (absent dates = 0), sum across pairs, and book per-pair diagnostics.
///
/// ## State across cycles
/// Only the append-only PnL series and the `PairStatsBook` survive a cycle.
/// Pair selections, hedge parameters and positions are rebuilt every cycle.
///
/// ## Failure modes (thrown as `StatArbError`)
/// - InvalidConfiguration: bad parameters, or fewer trading dates than one
///   formation + trade cycle needs
/// - SectorLabelMissing: `within_sector` requested without a sector map

#include "statarb/backtest.hpp"
#include "statarb/calendar.hpp"
#include "statarb/pair_filters.hpp"
#include "statarb/price_loader.hpp"
#include "statarb/screener.hpp"
#include "statarb/signal.hpp"
#include "statarb/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace statarb::backtest {

// ─── Configuration ────────────────────────────────────────────────────────────

struct WalkForwardConfig {
    Date        start         = Date::from_ymd(2015, 1, 1);
    Date        end           = Date::from_ymd(2024, 12, 31);
    std::size_t formation     = constants::DEFAULT_FORMATION;
    std::size_t trade         = constants::DEFAULT_TRADE;
    bool        within_sector = false;
    std::string labels_date;                 ///< Sector label snapshot, informational

    screen::ScreenerConfig screener;         ///< `lookback` is taken from `signal`
    signal::SignalConfig   signal;

    bool verbose = false;

    /// Warns on stderr when `exit_z >= entry_z`: that band is legal, but a
    /// position can close on any day after entry whose |z| is still above
    /// the entry threshold.
    ///
    /// # Throws
    /// `StatArbError{InvalidConfiguration}` naming the offending parameter.
    void validate() const;
};

// ─── Per-pair diagnostics ─────────────────────────────────────────────────────

struct PerPairStats {
    double      ret_sum = 0.0;  ///< Σ weighted net returns over all cycles
    std::size_t ret_cnt = 0;    ///< Days with a nonzero return
    std::size_t cycles  = 0;    ///< Cycles in which the pair was chosen
};

/// Keyed by (ticker1, ticker2), iterated in sorted ticker-pair order.
using PairStatsBook = std::map<TickerPair, PerPairStats>;

// ─── Results ──────────────────────────────────────────────────────────────────

struct CycleReport {
    std::size_t index = 0;  ///< 1-based
    Date form_start;
    Date form_end;
    Date trade_start;
    Date trade_end;
    std::size_t           evaluated = 0;
    std::size_t           candidates = 0;
    std::vector<PairSpec> chosen;
    std::map<screen::RejectReason, std::size_t> rejections;
    DatedSeries           pnl;  ///< Business days of the trading window
};

struct WalkForwardResult {
    DatedSeries              pnl;     ///< Concatenated cycle PnL
    std::vector<double>      equity;  ///< ∏(1 + pnl)
    std::vector<CycleReport> cycles;
    PairStatsBook            pair_stats;
    PerformanceMetrics       metrics;
    std::size_t              pairs_selected = 0;
};

// ─── Building blocks ──────────────────────────────────────────────────────────

/// Sorted union of every series' dates within [start, end].
[[nodiscard]] std::vector<Date> trading_calendar(const Universe& universe,
                                                 Date start,
                                                 Date end);

/// Trade `chosen` over [trade_start, trade_end], sum the weighted net
/// returns on the window's business-day calendar and book every chosen
/// pair into `book`.
[[nodiscard]] DatedSeries trade_cycle(const std::vector<PairSpec>& chosen,
                                      const Universe&              universe,
                                      Date                         trade_start,
                                      Date                         trade_end,
                                      const signal::SignalConfig&  cfg,
                                      PairStatsBook&               book);

// ─── WalkForwardEngine ────────────────────────────────────────────────────────

class WalkForwardEngine {
public:
    /// # Throws
    /// `StatArbError{InvalidConfiguration}` if `config.validate()` fails,
    /// `StatArbError{SectorLabelMissing}` if `config.within_sector` is set
    /// and `sectors` is empty.
    explicit WalkForwardEngine(WalkForwardConfig            config,
                               std::optional<PairWhitelist> whitelist = std::nullopt,
                               std::optional<SectorMap>     sectors   = std::nullopt);

    /// Run every cycle over `universe`.
    ///
    /// # Throws
    /// `StatArbError{InvalidConfiguration}` if the universe has fewer trading
    /// dates in [start, end] than formation + trade.
    [[nodiscard]] WalkForwardResult run(const Universe& universe) const;

    [[nodiscard]] const WalkForwardConfig& config() const noexcept { return config_; }

private:
    WalkForwardConfig    config_;
    screen::PairScreener screener_;
};

}  // namespace statarb::backtest
