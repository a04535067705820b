/// @file src/screener/weight_normalizer.cpp
/// @brief Per-cycle pre-weight normalization.

#include "statarb/screener.hpp"

#include <cmath>

namespace statarb::screen {

std::vector<PairSpec> normalize_weights(std::vector<PairSpec> candidates) {
    if (candidates.empty()) return {};

    double total = 0.0;
    for (const auto& c : candidates) {
        total += c.weight;
    }
    if (!std::isfinite(total) || total <= 0.0) return {};

    for (auto& c : candidates) {
        c.weight /= total;
    }
    return candidates;
}

}  // namespace statarb::screen
