#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <limits>

#include "soakmon/session_config.hpp"

using soakmon::ConfigLoadResult;
using soakmon::LeakThresholds;
using soakmon::SessionConfig;
using soakmon::Severity;

TEST(SessionConfigTest, DefaultsAreValid) {
    const SessionConfig config;
    EXPECT_TRUE(config.validate().isEmpty());
    EXPECT_EQ(config.sessionDurationMs, 8LL * 60 * 60 * 1000);
    EXPECT_EQ(config.snapshotIntervalMs, 30000);
    EXPECT_DOUBLE_EQ(config.componentCycleThresholdMB, config.leakThresholds.lowMB);
    EXPECT_FALSE(config.enableAutomaticRemediation);
}

TEST(SessionConfigTest, RejectsNonPositiveDurationAndIntervals) {
    SessionConfig config;
    config.sessionDurationMs = 0;
    config.snapshotIntervalMs = -5;
    const QStringList problems = config.validate();
    EXPECT_EQ(problems.size(), 2);
}

TEST(SessionConfigTest, RejectsUnorderedTiers) {
    SessionConfig config;
    config.leakThresholds.mediumMB = 30.0;
    EXPECT_FALSE(config.validate().isEmpty());
}

TEST(SessionConfigTest, FromJsonKeepsDefaultsForMissingKeys) {
    const QJsonObject json{
        {"session_duration_ms", 60000},
        {"leak_thresholds_mb", QJsonObject{{"low", 2.0}}},
        {"enable_automatic_remediation", true},
    };
    const SessionConfig config = SessionConfig::fromJson(json);
    EXPECT_EQ(config.sessionDurationMs, 60000);
    EXPECT_EQ(config.healthCheckIntervalMs, 60000);
    EXPECT_DOUBLE_EQ(config.leakThresholds.lowMB, 2.0);
    EXPECT_DOUBLE_EQ(config.leakThresholds.mediumMB, 10.0);
    EXPECT_DOUBLE_EQ(config.componentCycleThresholdMB, 2.0);
    EXPECT_TRUE(config.enableAutomaticRemediation);
}

TEST(SessionConfigTest, JsonRoundTripPreservesValues) {
    SessionConfig config;
    config.snapshotIntervalMs = 1234;
    config.memory.maxMemoryGrowthMB = 20.0;
    config.scoring.incompleteDataRatio = 0.5;
    const SessionConfig copy = SessionConfig::fromJson(config.toJson());
    EXPECT_EQ(copy.snapshotIntervalMs, 1234);
    EXPECT_DOUBLE_EQ(copy.memory.maxMemoryGrowthMB, 20.0);
    EXPECT_DOUBLE_EQ(copy.scoring.incompleteDataRatio, 0.5);
}

TEST(SessionConfigTest, ClassifiesDeltasIntoTiers) {
    const LeakThresholds tiers;
    EXPECT_FALSE(tiers.classify(2.0).has_value());
    EXPECT_EQ(tiers.classify(7.0), Severity::Low);
    EXPECT_EQ(tiers.classify(12.0), Severity::Medium);
    EXPECT_EQ(tiers.classify(35.0), Severity::High);
    EXPECT_EQ(tiers.classify(80.0), Severity::Critical);
}

TEST(SessionConfigTest, TimerIntervalsAreClampedToTimerRange) {
    EXPECT_EQ(soakmon::timerIntervalMs(250), 250);
    EXPECT_EQ(soakmon::timerIntervalMs(0), 1);
    EXPECT_EQ(soakmon::timerIntervalMs(3000000000LL), std::numeric_limits<int>::max());
}

TEST(SessionConfigTest, LoadFromFileReportsMissingFile) {
    const ConfigLoadResult result = soakmon::loadSessionConfig("/nonexistent/soakmon.json");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.isEmpty());
    EXPECT_EQ(result.toJson().value("success").toBool(true), false);
}

TEST(SessionConfigTest, LoadFromFileParsesAndValidates) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const QString goodPath = QDir(dir.path()).filePath("good.json");
    QFile good(goodPath);
    ASSERT_TRUE(good.open(QIODevice::WriteOnly));
    good.write(QJsonDocument(QJsonObject{{"snapshot_interval_ms", 500}}).toJson());
    good.close();

    const ConfigLoadResult loaded = soakmon::loadSessionConfig(goodPath);
    ASSERT_TRUE(loaded.success) << loaded.error.toStdString();
    EXPECT_EQ(loaded.config.snapshotIntervalMs, 500);

    const QString badPath = QDir(dir.path()).filePath("bad.json");
    QFile bad(badPath);
    ASSERT_TRUE(bad.open(QIODevice::WriteOnly));
    bad.write(QJsonDocument(QJsonObject{{"session_duration_ms", -1}}).toJson());
    bad.close();

    const ConfigLoadResult rejected = soakmon::loadSessionConfig(badPath);
    EXPECT_FALSE(rejected.success);
    EXPECT_TRUE(rejected.error.contains("session_duration_ms"));
}
