/// @file src/backtest/walk_forward.cpp
/// @brief Cycle loop, per-cycle PnL aggregation and per-pair bookkeeping.

#include "statarb/walk_forward.hpp"
#include "statarb/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace statarb::backtest {

namespace {

[[noreturn]] void invalid(const std::string& what) {
    throw StatArbError(ErrorKind::InvalidConfiguration, what);
}

screen::PairScreener make_screener(const WalkForwardConfig&     cfg,
                                   std::optional<PairWhitelist> whitelist,
                                   std::optional<SectorMap>     sectors) {
    cfg.validate();
    if (cfg.within_sector && !sectors.has_value()) {
        throw StatArbError(ErrorKind::SectorLabelMissing,
            fmt::format("within-sector pairing requested but no sector labels were "
                        "supplied (labels date '{}'); regenerate the labels before retrying",
                        cfg.labels_date));
    }

    screen::ScreenerConfig sc = cfg.screener;
    sc.lookback = cfg.signal.lookback;
    return screen::PairScreener(sc, std::move(whitelist),
                                cfg.within_sector ? std::move(sectors) : std::optional<SectorMap>{});
}

}  // namespace

// ─── WalkForwardConfig ────────────────────────────────────────────────────────

void WalkForwardConfig::validate() const {
    if (formation == 0) invalid("formation must be at least 1 trading day");
    if (trade == 0)     invalid("trade must be at least 1 trading day");
    if (end < start) {
        invalid(fmt::format("start {} is after end {}", start.to_string(), end.to_string()));
    }
    if (signal.lookback < 2) {
        invalid(fmt::format("lookback must be at least 2, got {}", signal.lookback));
    }
    if (!std::isfinite(signal.entry_z) || signal.entry_z <= 0.0) {
        invalid(fmt::format("entry_z must be positive, got {}", signal.entry_z));
    }
    if (!std::isfinite(signal.exit_z) || signal.exit_z < 0.0) {
        invalid(fmt::format("exit_z must be >= 0, got {}", signal.exit_z));
    }
    if (signal.exit_z >= signal.entry_z) {
        fmt::print(stderr, "Warning: exit_z {} >= entry_z {}; the exit band contains the entry threshold\n",
                   signal.exit_z, signal.entry_z);
    }
    if (signal.time_stop_days < 0) {
        invalid(fmt::format("time_stop must be >= 0 days, got {}", signal.time_stop_days));
    }
    if (!std::isfinite(signal.cost_bps) || signal.cost_bps < 0.0) {
        invalid(fmt::format("cost_bps must be >= 0, got {}", signal.cost_bps));
    }
    if (!(screener.beta_min <= screener.beta_max)) {
        invalid(fmt::format("beta band [{}, {}] is empty", screener.beta_min, screener.beta_max));
    }
    if (!(screener.pval_max > 0.0 && screener.pval_max <= 1.0)) {
        invalid(fmt::format("pval_max must lie in (0, 1], got {}", screener.pval_max));
    }
}

// ─── trading_calendar ─────────────────────────────────────────────────────────

std::vector<Date> trading_calendar(const Universe& universe, Date start, Date end) {
    std::vector<Date> all;
    for (const auto& [ticker, series] : universe) {
        for (const Date d : series.dates) {
            if (start <= d && d <= end) all.push_back(d);
        }
    }
    std::sort(all.begin(), all.end());
    all.erase(std::unique(all.begin(), all.end()), all.end());
    return all;
}

// ─── trade_cycle ──────────────────────────────────────────────────────────────

DatedSeries trade_cycle(const std::vector<PairSpec>& chosen,
                        const Universe&              universe,
                        Date                         trade_start,
                        Date                         trade_end,
                        const signal::SignalConfig&  cfg,
                        PairStatsBook&               book) {
    DatedSeries pnl;
    pnl.dates = business_days(trade_start, trade_end);
    pnl.values.assign(pnl.dates.size(), 0.0);

    for (const auto& spec : chosen) {
        PerPairStats& stats = book[spec.key()];
        ++stats.cycles;

        const auto it1 = universe.find(spec.ticker1);
        const auto it2 = universe.find(spec.ticker2);
        if (it1 == universe.end() || it2 == universe.end()) continue;

        const signal::PairTrace trace = signal::generate_pair_returns(
            spec, it1->second, it2->second, trade_start, trade_end, cfg);

        // Reindex onto the business-day calendar; returns on other dates drop.
        std::size_t k = 0;
        for (std::size_t i = 0; i < pnl.dates.size(); ++i) {
            while (k < trace.net.size() && trace.net.dates[k] < pnl.dates[i]) ++k;
            if (k == trace.net.size()) break;
            if (trace.net.dates[k] != pnl.dates[i]) continue;

            const double r = trace.net.values[k];
            pnl.values[i] += r;
            stats.ret_sum += r;
            if (r != 0.0) ++stats.ret_cnt;
        }
    }
    return pnl;
}

// ─── WalkForwardEngine ────────────────────────────────────────────────────────

WalkForwardEngine::WalkForwardEngine(WalkForwardConfig            config,
                                     std::optional<PairWhitelist> whitelist,
                                     std::optional<SectorMap>     sectors)
    : config_(std::move(config))
    , screener_(make_screener(config_, std::move(whitelist), std::move(sectors))) {}

WalkForwardResult WalkForwardEngine::run(const Universe& universe) const {
    const std::vector<Date> dates = trading_calendar(universe, config_.start, config_.end);
    const std::size_t F = config_.formation;
    const std::size_t T = config_.trade;

    if (dates.size() < F + T) {
        throw StatArbError(ErrorKind::InvalidConfiguration,
            fmt::format("{} trading dates across {} tickers in [{}, {}]; one cycle needs "
                        "formation {} + trade {} = {}",
                        dates.size(), universe.size(),
                        config_.start.to_string(), config_.end.to_string(), F, T, F + T));
    }

    WalkForwardResult result;
    for (std::size_t i = F; i + T <= dates.size(); i += T) {
        CycleReport cycle;
        cycle.index       = result.cycles.size() + 1;
        cycle.form_start  = dates[i - F];
        cycle.form_end    = dates[i - 1];
        cycle.trade_start = dates[i];
        cycle.trade_end   = dates[i + T - 1];

        screen::CycleSelection sel =
            screener_.screen_universe(universe, cycle.form_start, cycle.form_end, F);
        cycle.evaluated  = sel.evaluated;
        cycle.candidates = sel.candidates.size();
        cycle.rejections = std::move(sel.rejections);
        cycle.chosen     = std::move(sel.chosen);

        if (config_.verbose) {
            fmt::print("Cycle {}: candidates={}, chosen={} [{}→{} | trade {}→{}]\n",
                       cycle.index, cycle.candidates, cycle.chosen.size(),
                       cycle.form_start.to_string(), cycle.form_end.to_string(),
                       cycle.trade_start.to_string(), cycle.trade_end.to_string());
            for (const auto& [reason, count] : cycle.rejections) {
                fmt::print("  rejected {:<26} {}\n", screen::to_string(reason), count);
            }
        }

        cycle.pnl = trade_cycle(cycle.chosen, universe, cycle.trade_start,
                                cycle.trade_end, config_.signal, result.pair_stats);

        result.pnl.dates.insert(result.pnl.dates.end(),
                                cycle.pnl.dates.begin(), cycle.pnl.dates.end());
        result.pnl.values.insert(result.pnl.values.end(),
                                 cycle.pnl.values.begin(), cycle.pnl.values.end());
        result.pairs_selected += cycle.chosen.size();
        result.cycles.push_back(std::move(cycle));
    }

    result.equity  = PerformanceCalculator::equity_curve(result.pnl.values);
    result.metrics = PerformanceCalculator::summarize(result.pnl.values);
    return result;
}

}  // namespace statarb::backtest
