#include <gtest/gtest.h>
#include "core/DeviceStore.hpp"

#include <atomic>
#include <thread>

using namespace wmn;

static TimePoint at(double s) {
    return from_epoch_seconds(1700000000.0 + s);
}

static TelemetryMessage metrics_msg(const std::string& id, std::optional<double> latency) {
    TelemetryMessage m;
    m.kind = MessageKind::Metrics;
    m.device_id = id;
    MetricSnapshot s;
    s.latency_ms = latency;
    s.rssi_dbm = -60.0;
    m.metrics = s;
    return m;
}

static TelemetryMessage analysis_msg(const std::string& id, std::optional<double> score) {
    TelemetryMessage m;
    m.kind = MessageKind::Analysis;
    m.device_id = id;
    AnalysisSnapshot a;
    a.score = score;
    m.analysis = a;
    return m;
}

TEST(DeviceStore, RejectsZeroCapacity) {
    EXPECT_THROW((DeviceStore(StoreConfig{0, 10})), std::invalid_argument);
    EXPECT_THROW((DeviceStore(StoreConfig{10, 0})), std::invalid_argument);
}

TEST(DeviceStore, LatestWinsWithoutFieldMerge) {
    DeviceStore store;
    auto first = metrics_msg("ap", 10.0);
    first.metrics->jitter_ms = 3.0;
    store.ingest(first, at(0));
    store.ingest(metrics_msg("ap", 20.0), at(1));

    auto v = store.device("ap");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->metrics->latency_ms, 20.0);
    // the second message had no jitter, so none is kept
    EXPECT_FALSE(v->metrics->jitter_ms.has_value());
    EXPECT_EQ(v->last_seen, at(1));
}

TEST(DeviceStore, HistoryIsBoundedFifo) {
    DeviceStore store(StoreConfig{5, 5});
    for (int i = 0; i < 12; ++i) store.ingest(metrics_msg("ap", double(i)), at(i));
    auto h = store.latency_history("ap");
    ASSERT_EQ(h.size(), 5u);
    for (int i = 0; i < 5; ++i) EXPECT_DOUBLE_EQ(h[i].value, 7.0 + i);
}

TEST(DeviceStore, EvictionFollowsArrivalNotTimestamp) {
    DeviceStore store(StoreConfig{3, 3});
    TelemetryMessage m = metrics_msg("ap", 1.0);
    m.origin_ts = at(100);
    store.ingest(m, at(0));
    for (int i = 2; i <= 4; ++i) {
        TelemetryMessage n = metrics_msg("ap", double(i));
        n.origin_ts = at(i);
        store.ingest(n, at(i));
    }
    auto h = store.latency_history("ap");
    ASSERT_EQ(h.size(), 3u);
    EXPECT_DOUBLE_EQ(h[0].value, 2.0);
    EXPECT_DOUBLE_EQ(h[2].value, 4.0);
}

TEST(DeviceStore, SampleTimestampPrefersOrigin) {
    DeviceStore store;
    TelemetryMessage m = metrics_msg("ap", 5.0);
    m.origin_ts = at(-30);
    store.ingest(m, at(0));
    store.ingest(metrics_msg("ap", 6.0), at(1));
    auto h = store.latency_history("ap");
    ASSERT_EQ(h.size(), 2u);
    EXPECT_EQ(h[0].ts, at(-30));
    EXPECT_EQ(h[1].ts, at(1));
    // last_seen is arrival time
    EXPECT_EQ(store.device("ap")->last_seen, at(1));
}

TEST(DeviceStore, OnlyNumericValuesFeedHistories) {
    DeviceStore store;
    store.ingest(metrics_msg("ap", std::nullopt), at(0));
    store.ingest(analysis_msg("ap", std::nullopt), at(1));
    EXPECT_TRUE(store.latency_history("ap").empty());
    EXPECT_TRUE(store.score_history("ap").empty());

    store.ingest(metrics_msg("ap", 0.0), at(2));
    store.ingest(analysis_msg("ap", 0.0), at(3));
    EXPECT_EQ(store.latency_history("ap").size(), 1u);
    EXPECT_EQ(store.score_history("ap").size(), 1u);
}

TEST(DeviceStore, SnapshotIsSortedUnionAcrossKinds) {
    DeviceStore store;
    store.ingest(metrics_msg("c", 1.0), at(0));
    store.ingest(analysis_msg("a", 90.0), at(1));
    TelemetryMessage e;
    e.kind = MessageKind::Explain;
    e.device_id = "b";
    e.explanation = ExplanationSnapshot{"text"};
    store.ingest(e, at(2));

    auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), 3u);
    EXPECT_EQ(snap[0].device_id, "a");
    EXPECT_EQ(snap[1].device_id, "b");
    EXPECT_EQ(snap[2].device_id, "c");
    EXPECT_TRUE(snap[0].analysis.has_value());
    EXPECT_FALSE(snap[0].metrics.has_value());
    EXPECT_EQ(snap[1].explanation->text, "text");

    // per-kind key sets stay independent
    EXPECT_EQ(store.device_ids(MessageKind::Metrics), std::vector<std::string>{"c"});
    EXPECT_EQ(store.device_ids(MessageKind::Analysis), std::vector<std::string>{"a"});
    EXPECT_EQ(store.device_ids(MessageKind::Explain), std::vector<std::string>{"b"});
}

TEST(DeviceStore, UnknownDeviceIsNotListed) {
    DeviceStore store;
    store.ingest(metrics_msg("ap", 1.0), at(0));
    EXPECT_FALSE(store.device("ghost").has_value());
    EXPECT_TRUE(store.latency_history("ghost").empty());
    for (const auto& v : store.snapshot()) EXPECT_NE(v.device_id, "ghost");
}

TEST(DeviceStore, ConsecutiveSnapshotsAreEqual) {
    DeviceStore store;
    store.ingest(metrics_msg("x", 1.0), at(0));
    store.ingest(analysis_msg("y", 50.0), at(1));
    EXPECT_EQ(store.snapshot(), store.snapshot());
    EXPECT_EQ(store.messages_ingested(), 2u);
    EXPECT_EQ(store.last_message_at(), at(1));
}

TEST(DeviceStore, ConcurrentReadersSeeWholeMessages) {
    DeviceStore store(StoreConfig{100000, 100});
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    // Each write carries latency == i and arrives at t = i; a reader must
    // never see last_seen ahead of or behind the metrics it sits beside.
    std::thread writer([&]() {
        for (int i = 1; i <= 20000; ++i) store.ingest(metrics_msg("ap", double(i)), at(i));
        done = true;
    });
    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&]() {
            while (!done) {
                for (const auto& rec : store.snapshot_with_history()) {
                    if (!rec.view.metrics || !rec.view.last_seen) continue;
                    const double lat = *rec.view.metrics->latency_ms;
                    if (at(lat) != *rec.view.last_seen) ++torn;
                    if (rec.latency_history.size() != static_cast<std::size_t>(lat)) ++torn;
                }
            }
        });
    }
    writer.join();
    for (auto& t : readers) t.join();
    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(store.latency_history("ap").size(), 20000u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
