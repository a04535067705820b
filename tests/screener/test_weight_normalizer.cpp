#include <gtest/gtest.h>
#include "statarb/screener.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace statarb;
using namespace statarb::screen;

static PairSpec spec_with_weight(const char* t1, const char* t2, double w) {
    PairSpec s;
    s.ticker1 = t1;
    s.ticker2 = t2;
    s.weight  = w;
    return s;
}

TEST(WeightNormalizer, SumsToOneAndKeepsProportions) {
    const auto out = normalize_weights({
        spec_with_weight("A", "B", 100.0),
        spec_with_weight("C", "D", 300.0),
    });
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0].weight, 0.25);
    EXPECT_DOUBLE_EQ(out[1].weight, 0.75);
    EXPECT_EQ(out[0].ticker1, "A") << "order preserved";
}

TEST(WeightNormalizer, SingleCandidateGetsUnitWeight) {
    const auto out = normalize_weights({spec_with_weight("A", "B", 87.3)});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0].weight, 1.0);
}

TEST(WeightNormalizer, EmptyInputEmptyOutput) {
    EXPECT_TRUE(normalize_weights({}).empty());
}

TEST(WeightNormalizer, NonPositiveSumEmptiesSelection) {
    EXPECT_TRUE(normalize_weights({spec_with_weight("A", "B", 0.0)}).empty());
    EXPECT_TRUE(normalize_weights({
        spec_with_weight("A", "B", 1.0),
        spec_with_weight("C", "D", -1.0),
    }).empty());
}

TEST(WeightNormalizer, NonFiniteSumEmptiesSelection) {
    EXPECT_TRUE(normalize_weights({
        spec_with_weight("A", "B", std::numeric_limits<double>::infinity()),
    }).empty());
    EXPECT_TRUE(normalize_weights({spec_with_weight("A", "B", NAN)}).empty());
}

TEST(WeightNormalizer, ManyCandidatesSumWithinTolerance) {
    std::vector<PairSpec> in;
    for (int i = 1; i <= 37; ++i) {
        in.push_back(spec_with_weight("X", "Y", 1.0 / (0.001 * i)));
    }
    const auto out = normalize_weights(in);
    ASSERT_EQ(out.size(), in.size());
    double sum = 0.0;
    for (const auto& s : out) {
        EXPECT_GT(s.weight, 0.0);
        sum += s.weight;
    }
    EXPECT_NEAR(sum, 1.0, 1e-12);
}
