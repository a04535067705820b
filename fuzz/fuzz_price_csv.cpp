/**
 * @file  fuzz_price_csv.cpp
 * @brief libFuzzer target for the CSV readers (prices, whitelist, sectors)
 *
 * Build:
 *   cmake -DSTATARB_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_price_csv
 *
 * Run for 60 seconds:
 *   ./fuzz_price_csv -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception for any byte sequence.
 *   2. Parsed price series:
 *      a. dates.size() == log_prices.size()
 *      b. dates strictly ascending
 *      c. every log price finite
 *   3. A parsed whitelist is symmetric: contains(a, b) == contains(b, a).
 *
 * Fuzzer strategy:
 *   The input is handed verbatim to each parser, so the corpus should hold
 *   real `date,permno,prc,vol` files alongside `ticker1,ticker2,pval` and
 *   `ticker,sic2` files.  Interesting mutations:
 *     • Missing or reordered header columns
 *     • Quoted fields, CR/LF mixes, empty lines, `#` comments
 *     • "NaN", "inf", negative and zero prices
 *     • Dates with time suffixes, out-of-range months and days
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "statarb/pair_filters.hpp"
#include "statarb/price_loader.hpp"

using namespace statarb;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    // ── Prices ───────────────────────────────────────────────────────────────
    const PriceSeries series = parse_price_csv(input, "FUZZ");
    assert(series.dates.size() == series.log_prices.size());
    for (std::size_t i = 0; i < series.size(); ++i) {
        assert(std::isfinite(series.log_prices[i]));
        if (i > 0) assert(series.dates[i - 1] < series.dates[i]);
    }

    // ── Whitelist ────────────────────────────────────────────────────────────
    if (const auto wl = PairWhitelist::parse_csv(input, 0.05)) {
        assert(wl->contains("AAA", "BBB") == wl->contains("BBB", "AAA"));
    }

    // ── Sector labels ────────────────────────────────────────────────────────
    const SectorMap sectors = SectorMap::parse_csv(input);
    if (sectors.same_sector("AAA", "BBB")) {
        assert(sectors.sector("AAA").has_value());
        assert(sectors.sector("AAA") == sectors.sector("BBB"));
    }

    return 0;
}
