#include <gtest/gtest.h>
#include "core/HealthScorer.hpp"

using namespace wmn;

TEST(HealthScorer, AbsentOnlyWhenEveryInputAbsent) {
    EXPECT_FALSE(compute_health_score(std::nullopt, std::nullopt, std::nullopt, std::nullopt).has_value());
    EXPECT_EQ(compute_health_score(-50.0, std::nullopt, std::nullopt, std::nullopt), 100);
    EXPECT_EQ(compute_health_score(std::nullopt, std::nullopt, std::nullopt, 0.0), 100);
}

TEST(HealthScorer, ZeroIsAReading) {
    // rssi 0 dBm is a (very strong) reading, loss 0 % is perfect
    EXPECT_EQ(compute_health_score(0.0, 0.0, 0.0, 0.0), 100);
}

TEST(HealthScorer, TierBoundaries) {
    EXPECT_EQ(rssi_penalty(-60.0), 0);
    EXPECT_EQ(rssi_penalty(-60.1), 8);
    EXPECT_EQ(rssi_penalty(-70.0), 8);
    EXPECT_EQ(rssi_penalty(-80.0), 20);
    EXPECT_EQ(rssi_penalty(-80.5), 35);

    EXPECT_EQ(latency_penalty(60.0), 0);
    EXPECT_EQ(latency_penalty(60.5), 10);
    EXPECT_EQ(latency_penalty(200.0), 25);
    EXPECT_EQ(latency_penalty(201.0), 40);

    EXPECT_EQ(jitter_penalty(15.0), 0);
    EXPECT_EQ(jitter_penalty(35.0), 10);
    EXPECT_EQ(jitter_penalty(60.0), 20);
    EXPECT_EQ(jitter_penalty(61.0), 30);

    EXPECT_EQ(loss_penalty(1.0), 0);
    EXPECT_EQ(loss_penalty(3.0), 15);
    EXPECT_EQ(loss_penalty(6.0), 30);
    EXPECT_EQ(loss_penalty(6.5), 45);
}

TEST(HealthScorer, WeakSignalScenario) {
    EXPECT_EQ(compute_health_score(-85.0, 40.0, 5.0, 0.0), 65);
}

TEST(HealthScorer, WorstCaseClampsAtZero) {
    // 100 - 35 - 40 - 30 - 45 < 0
    EXPECT_EQ(compute_health_score(-95.0, 500.0, 100.0, 50.0), 0);
}

TEST(HealthScorer, RangeAndMonotonicity) {
    const double rssis[] = {-30, -60, -65, -70, -75, -80, -85, -100};
    const double lats[] = {5, 60, 90, 120, 150, 200, 300};
    const double jits[] = {1, 15, 30, 35, 50, 60, 90};
    const double losses[] = {0, 1, 2, 3, 5, 6, 20};

    for (double l : lats) {
        for (double j : jits) {
            for (double p : losses) {
                int prev = 101;
                for (double r : rssis) { // decreasing RSSI
                    auto s = compute_health_score(r, l, j, p);
                    ASSERT_TRUE(s.has_value());
                    EXPECT_GE(*s, 0);
                    EXPECT_LE(*s, 100);
                    EXPECT_LE(*s, prev);
                    prev = *s;
                }
            }
        }
    }
    for (double r : rssis) {
        int prev = 101;
        for (double l : lats) { // increasing latency
            int s = *compute_health_score(r, l, 10.0, 0.5);
            EXPECT_LE(s, prev);
            prev = s;
        }
        prev = 101;
        for (double p : losses) {
            int s = *compute_health_score(r, 30.0, 10.0, p);
            EXPECT_LE(s, prev);
            prev = s;
        }
    }
}

TEST(HealthScorer, AnalyzerScoreTakesPrecedence) {
    MetricSnapshot m;
    m.rssi_dbm = -85.0;
    m.latency_ms = 180.0;
    m.jitter_ms = 10.0;
    m.packet_loss_pct = 0.5;
    ASSERT_EQ(compute_health_score(m.rssi_dbm, m.latency_ms, m.jitter_ms, m.packet_loss_pct), 40);

    AnalysisSnapshot a;
    a.score = 92.0;
    auto h = assess_health(m, a);
    ASSERT_TRUE(h.score.has_value());
    EXPECT_DOUBLE_EQ(*h.score, 92.0);
    EXPECT_EQ(h.source, HealthSource::Analyzer);

    // analysis record without a score falls back to the local value
    a.score.reset();
    h = assess_health(m, a);
    EXPECT_DOUBLE_EQ(*h.score, 40.0);
    EXPECT_EQ(h.source, HealthSource::Computed);
}

TEST(HealthScorer, NoRecordsNoHealth) {
    auto h = assess_health(std::nullopt, std::nullopt);
    EXPECT_FALSE(h.score.has_value());
    EXPECT_EQ(h.source, HealthSource::None);
    EXPECT_STREQ(to_string(h.source), "none");

    // metrics record with nothing numeric in it
    h = assess_health(MetricSnapshot{}, std::nullopt);
    EXPECT_FALSE(h.score.has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
