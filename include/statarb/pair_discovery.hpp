#pragma once

/// @file include/statarb/pair_discovery.hpp
/// @brief Cointegration scan that produces candidate whitelists.
///
/// Every unordered ticker pair whose histories cover exactly the same dates
/// in [start, end] is tested with Engle-Granger on log prices. The result,
/// sorted by ascending p-value, is what `report::pairs_csv` renders (written
/// with `report::write_text_file`) and what `PairWhitelist::load_csv` reads
/// back.

#include "statarb/price_loader.hpp"
#include "statarb/types.hpp"

#include <string>
#include <vector>

namespace statarb {

struct PairScore {
    std::string ticker1;
    std::string ticker2;
    double      statistic = 0.0;  ///< Engle-Granger τ
    double      pvalue    = 1.0;
};

/// Score all pairs of `universe` over [start, end].
///
/// Pairs whose date sets differ, or whose test is numerically undefined, are
/// omitted. Ties in p-value keep ticker order.
[[nodiscard]] std::vector<PairScore> scan_cointegration(const Universe& universe,
                                                        Date start,
                                                        Date end);

}  // namespace statarb
