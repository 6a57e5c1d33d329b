#include <gtest/gtest.h>

#include <QThread>
#include <QThreadPool>

#include <memory>

#include "fake_metrics_provider.hpp"
#include "soakmon/snapshot_collector.hpp"
#include "soakmon/telemetry.hpp"

using soakmon::ErrorCode;
using soakmon::SnapshotCollector;
using soakmon::SnapshotResult;
using soakmon::Telemetry;
using soakmon::test::FakeMetricsProvider;

namespace {

SnapshotCollector::Clock fixedClock(qint64* now) {
    return [now]() { return *now; };
}

}  // namespace

TEST(SnapshotCollectorTest, RequiresBaselineBeforeSnapshots) {
    auto provider = std::make_shared<FakeMetricsProvider>();
    SnapshotCollector collector(provider, 1000);
    const SnapshotResult result = collector.takeSnapshot(0);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error.code, ErrorCode::SnapshotCollection);
}

TEST(SnapshotCollectorTest, ComputesGrowthAndUtilization) {
    auto provider = std::make_shared<FakeMetricsProvider>(QVector<double>{100.0, 112.0}, 1000.0);
    qint64 now = 1'000'000;
    SnapshotCollector collector(provider, 1000, nullptr, fixedClock(&now));

    const SnapshotResult baseline = collector.establishBaseline(now);
    ASSERT_TRUE(baseline.success());
    EXPECT_TRUE(baseline.snapshot.isBaseline);
    EXPECT_DOUBLE_EQ(baseline.snapshot.growthFromBaselineMB, 0.0);

    now += 30000;
    const SnapshotResult next = collector.takeSnapshot(3);
    ASSERT_TRUE(next.success());
    EXPECT_FALSE(next.snapshot.isBaseline);
    EXPECT_DOUBLE_EQ(next.snapshot.growthFromBaselineMB, 12.0);
    EXPECT_DOUBLE_EQ(next.snapshot.utilizationPercent, 11.2);
    EXPECT_EQ(next.snapshot.trackedUnitCount, 3);
    EXPECT_EQ(next.snapshot.elapsedMs, 30000);
}

TEST(SnapshotCollectorTest, AbsentProbesStayAbsent) {
    auto provider = std::make_shared<FakeMetricsProvider>();
    SnapshotCollector collector(provider, 1000);
    const SnapshotResult baseline = collector.establishBaseline(0);
    ASSERT_TRUE(baseline.success());
    EXPECT_FALSE(baseline.snapshot.frameRate.has_value());
    EXPECT_FALSE(baseline.snapshot.connectionCount.has_value());
    EXPECT_TRUE(baseline.snapshot.toJson().value("connection_count").isNull());
    EXPECT_EQ(baseline.snapshot.structuralTotal.value_or(-1), 0);

    provider->structureAbsent = true;
    const SnapshotResult next = collector.takeSnapshot(0);
    ASSERT_TRUE(next.success());
    EXPECT_FALSE(next.snapshot.structuralTotal.has_value());
    EXPECT_TRUE(next.snapshot.toJson().value("structural_total").isNull());
}

TEST(SnapshotCollectorTest, TimestampsNeverGoBackwards) {
    auto provider = std::make_shared<FakeMetricsProvider>();
    qint64 now = 5000;
    SnapshotCollector collector(provider, 1000, nullptr, fixedClock(&now));
    ASSERT_TRUE(collector.establishBaseline(now).success());

    now = 1000;
    const SnapshotResult stepped = collector.takeSnapshot(0);
    ASSERT_TRUE(stepped.success());
    EXPECT_EQ(stepped.snapshot.timestampMs, 5000);
}

TEST(SnapshotCollectorTest, ProviderFailureIsReportedNotThrown) {
    auto provider = std::make_shared<FakeMetricsProvider>();
    Telemetry telemetry;
    SnapshotCollector collector(provider, 1000, &telemetry);
    ASSERT_TRUE(collector.establishBaseline(0).success());

    provider->failReads = 1;
    const SnapshotResult failed = collector.takeSnapshot(0);
    EXPECT_FALSE(failed.success());
    EXPECT_EQ(failed.error.code, ErrorCode::SnapshotCollection);
    EXPECT_EQ(telemetry.counter("snapshot.failures"), 1);

    provider->throwOnRead = true;
    const SnapshotResult thrown = collector.takeSnapshot(0);
    EXPECT_FALSE(thrown.success());
    EXPECT_TRUE(thrown.error.message.contains("probe exploded"));
}

TEST(SnapshotCollectorTest, SlowReadTimesOutAndBlocksOverlap) {
    auto provider = std::make_shared<FakeMetricsProvider>();
    SnapshotCollector collector(provider, 50);
    ASSERT_TRUE(collector.establishBaseline(0).success());

    provider->delayMs = 400;
    const SnapshotResult slow = collector.takeSnapshot(0);
    EXPECT_FALSE(slow.success());
    EXPECT_TRUE(slow.error.message.contains("timed out"));
    EXPECT_TRUE(collector.readInFlight());

    const SnapshotResult overlapping = collector.takeSnapshot(0);
    EXPECT_FALSE(overlapping.success());
    EXPECT_TRUE(overlapping.error.message.contains("in flight"));

    provider->delayMs = 0;
    QThreadPool::globalInstance()->waitForDone();
    EXPECT_FALSE(collector.readInFlight());
    EXPECT_TRUE(collector.takeSnapshot(0).success());
}
