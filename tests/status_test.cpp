#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <vector>

#include "include/status.hpp"

using namespace speedwatch;

namespace {

const Thresholds kDefault{};

}  // namespace

TEST(ClassifyTest, PicksHighestSatisfiedLowerBound) {
    EXPECT_EQ(classify(10.0, 0, 0, kDefault), Tier::VeryLow);
    EXPECT_EQ(classify(50.0, 0, 0, kDefault), Tier::VeryLow);
    EXPECT_EQ(classify(199.9, 0, 0, kDefault), Tier::VeryLow);
    EXPECT_EQ(classify(200.0, 0, 0, kDefault), Tier::Low);
    EXPECT_EQ(classify(500.0, 0, 0, kDefault), Tier::Medium);
    EXPECT_EQ(classify(1000.0, 0, 0, kDefault), Tier::Good);
    EXPECT_EQ(classify(2500.0, 0, 0, kDefault), Tier::Excellent);
}

TEST(ClassifyTest, FinScenarioIsVeryLow) {
    Thresholds t;
    t.very_low = 50;
    t.low = 200;
    t.medium = 500;
    t.good = 1000;
    const Tier tier = classify(120.4, 45.0, 22.0, t);
    EXPECT_EQ(tier, Tier::VeryLow);
    EXPECT_EQ(tier_name(tier), "very_low");
}

TEST(ClassifyTest, UploadAndPingDoNotChangeTier) {
    EXPECT_EQ(classify(600.0, 0.1, 900.0, kDefault), classify(600.0, 900.0, 1.0, kDefault));
}

TEST(ClassifyTest, MonotonicInDownload) {
    Tier previous = Tier::VeryLow;
    for (double d = 0.0; d <= 3000.0; d += 7.5) {
        const Tier current = classify(d, 0, 0, kDefault);
        EXPECT_GE(current, previous) << "download " << d;
        previous = current;
    }
}

TEST(ClassifyTest, NonFiniteIsVeryLow) {
    EXPECT_EQ(classify(std::numeric_limits<double>::quiet_NaN(), 0, 0, kDefault), Tier::VeryLow);
    EXPECT_EQ(classify(-std::numeric_limits<double>::infinity(), 0, 0, kDefault), Tier::VeryLow);
}

TEST(ClusterStatusTest, OkWhenAllFreshAndAtLeastLow) {
    std::vector<NodeHealth> nodes{{Tier::Low, false}, {Tier::Excellent, false}};
    EXPECT_EQ(cluster_status(nodes), ClusterStatus::Ok);
    EXPECT_EQ(cluster_status(std::vector<NodeHealth>{}), ClusterStatus::Ok);
}

TEST(ClusterStatusTest, DegradedByStaleOrVeryLowNode) {
    std::vector<NodeHealth> stale{{Tier::Good, false}, {Tier::Good, true}};
    EXPECT_EQ(cluster_status(stale), ClusterStatus::Degraded);

    std::vector<NodeHealth> slow{{Tier::Good, false}, {Tier::VeryLow, false}};
    EXPECT_EQ(cluster_status(slow), ClusterStatus::Degraded);
}

TEST(ClusterStatusTest, IndependentOfOrder) {
    std::vector<NodeHealth> nodes{{Tier::Good, false}, {Tier::VeryLow, false}, {Tier::Medium, true}};
    const auto expected = cluster_status(nodes);
    std::ranges::reverse(nodes);
    EXPECT_EQ(cluster_status(nodes), expected);
}

TEST(TierTest, NamesAndGlyphs) {
    EXPECT_EQ(tier_name(Tier::Medium), "medium");
    EXPECT_EQ(tier_glyph(Tier::Excellent), "🚀⚡");
    EXPECT_EQ(tier_glyph(Tier::VeryLow), "🚨❌");
}
