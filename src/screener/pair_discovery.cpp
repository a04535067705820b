/// @file src/screener/pair_discovery.cpp
/// @brief Engle-Granger scan over every pair of a universe.

#include "statarb/pair_discovery.hpp"
#include "statarb/stats.hpp"

#include <algorithm>
#include <iterator>

namespace statarb {

std::vector<PairScore> scan_cointegration(const Universe& universe, Date start, Date end) {
    std::vector<PriceSeries> windows;
    windows.reserve(universe.size());
    for (const auto& [ticker, series] : universe) {
        windows.push_back(series.slice(start, end));
    }

    std::vector<PairScore> scores;
    for (std::size_t a = 0; a < windows.size(); ++a) {
        for (std::size_t b = a + 1; b < windows.size(); ++b) {
            const PriceSeries& s1 = windows[a];
            const PriceSeries& s2 = windows[b];
            if (s1.size() != s2.size() || s1.dates != s2.dates) continue;

            const auto eg = stats::engle_granger(s1.log_prices, s2.log_prices);
            if (!eg.has_value()) continue;

            scores.push_back(PairScore{
                .ticker1   = s1.ticker,
                .ticker2   = s2.ticker,
                .statistic = eg->statistic,
                .pvalue    = eg->pvalue,
            });
        }
    }

    std::stable_sort(scores.begin(), scores.end(),
                     [](const PairScore& x, const PairScore& y) { return x.pvalue < y.pvalue; });
    return scores;
}

}  // namespace statarb
