#include <gtest/gtest.h>

#include <QJsonArray>
#include <QSet>

#include "soakmon/report_generator.hpp"

using soakmon::Alert;
using soakmon::BreakdownSummary;
using soakmon::FinalReport;
using soakmon::GradeBreakdown;
using soakmon::HealthAnalysis;
using soakmon::HealthCheck;
using soakmon::LeakCandidate;
using soakmon::LeakType;
using soakmon::MemoryAnalysis;
using soakmon::OperationEvent;
using soakmon::PerformanceAnalysis;
using soakmon::Recommendation;
using soakmon::ReportGenerator;
using soakmon::SessionConfig;
using soakmon::SessionData;
using soakmon::SessionInfo;
using soakmon::Severity;
using soakmon::Snapshot;

namespace {

constexpr qint64 kMinute = 60 * 1000;

SessionData growingSession(const QVector<double>& usedMB, qint64 stepMs = kMinute) {
    SessionData data;
    for (int i = 0; i < usedMB.size(); ++i) {
        Snapshot snap;
        snap.timestampMs = i * stepMs;
        snap.elapsedMs = i * stepMs;
        snap.isBaseline = i == 0;
        snap.memoryUsedMB = usedMB[i];
        snap.memoryCapacityMB = 4096.0;
        snap.growthFromBaselineMB = usedMB[i] - usedMB.first();
        data.snapshots.append(snap);
    }
    return data;
}

SessionInfo sessionSpanning(qint64 elapsedMs, qint64 configuredMs = 8LL * 60 * kMinute) {
    SessionInfo info;
    info.sessionId = "session-report";
    info.startedAtMs = 0;
    info.endedAtMs = elapsedMs;
    info.configuredDurationMs = configuredMs;
    return info;
}

LeakCandidate candidate(LeakType type, Severity severity) {
    LeakCandidate out;
    out.type = type;
    out.severity = severity;
    return out;
}

}  // namespace

TEST(ReportGeneratorTest, GrowthBeyondLimitIsUnstableAndCostsMemoryComponent) {
    SessionConfig config;
    config.memory.maxMemoryGrowthMB = 20.0;
    const ReportGenerator generator(config);

    const SessionData data = growingSession({100.0, 105.0, 112.0, 121.0, 132.0}, 1000);
    const FinalReport report = generator.generate(data, sessionSpanning(4000));

    EXPECT_TRUE(report.memory.sufficientData);
    EXPECT_DOUBLE_EQ(report.memory.memoryGrowthMB, 32.0);
    EXPECT_DOUBLE_EQ(report.memory.peakMB, 132.0);
    EXPECT_FALSE(report.memory.memoryStable);
    EXPECT_DOUBLE_EQ(report.grade.memoryComponent, 0.0);
    EXPECT_LE(report.grade.score, 70.0);
    EXPECT_EQ(report.grade.grade, "C");
    EXPECT_EQ(report.snapshotCount, 5);
    EXPECT_FALSE(report.completeness.incompleteData);
}

TEST(ReportGeneratorTest, SingleSnapshotIsNeverStable) {
    const ReportGenerator generator;
    const MemoryAnalysis memory = generator.analyzeMemory(growingSession({100.0}).snapshots);
    EXPECT_FALSE(memory.sufficientData);
    EXPECT_FALSE(memory.memoryStable);
    EXPECT_TRUE(memory.toJson().contains("error"));
}

TEST(ReportGeneratorTest, AlertComponentIsClampedAtZero) {
    const ReportGenerator generator;
    MemoryAnalysis memory;
    memory.memoryStable = true;
    BreakdownSummary alerts;
    alerts.bySeverity.insert("critical", 3);
    alerts.bySeverity.insert("high", 1);

    const GradeBreakdown grade = generator.computeGrade(memory, PerformanceAnalysis{}, HealthAnalysis{}, alerts);
    EXPECT_DOUBLE_EQ(grade.alertComponent, 0.0);
    EXPECT_DOUBLE_EQ(grade.score, 80.0);
    EXPECT_EQ(grade.grade, "B");

    alerts.bySeverity.clear();
    alerts.bySeverity.insert("high", 1);
    EXPECT_DOUBLE_EQ(
        generator.computeGrade(memory, PerformanceAnalysis{}, HealthAnalysis{}, alerts).alertComponent, 15.0);
}

TEST(ReportGeneratorTest, ComponentsScaleWithFrameRateAndHealth) {
    const ReportGenerator generator;
    MemoryAnalysis memory;
    memory.memoryStable = true;
    PerformanceAnalysis performance;
    performance.averageFrameRate = 27.5;
    HealthAnalysis health;
    health.averageScore = 60.0;

    const GradeBreakdown grade = generator.computeGrade(memory, performance, health, BreakdownSummary{});
    EXPECT_DOUBLE_EQ(grade.memoryComponent, 30.0);
    EXPECT_DOUBLE_EQ(grade.performanceComponent, 12.5);
    EXPECT_DOUBLE_EQ(grade.healthComponent, 15.0);
    EXPECT_DOUBLE_EQ(grade.alertComponent, 20.0);
    EXPECT_DOUBLE_EQ(grade.score, 77.5);
    EXPECT_EQ(grade.grade, "C");
}

TEST(ReportGeneratorTest, LetterGradeCutoffs) {
    EXPECT_EQ(ReportGenerator::letterGrade(100.0), "A");
    EXPECT_EQ(ReportGenerator::letterGrade(90.0), "A");
    EXPECT_EQ(ReportGenerator::letterGrade(89.9), "B");
    EXPECT_EQ(ReportGenerator::letterGrade(70.0), "C");
    EXPECT_EQ(ReportGenerator::letterGrade(60.0), "D");
    EXPECT_EQ(ReportGenerator::letterGrade(59.9), "F");
    EXPECT_TRUE(ReportGenerator::gradeMessage("F").startsWith("Fail"));
    EXPECT_TRUE(ReportGenerator::gradeMessage("A").startsWith("Excellent"));
}

TEST(ReportGeneratorTest, SparseSessionIsFlaggedIncomplete) {
    SessionConfig config;
    config.snapshotIntervalMs = 30000;
    config.healthCheckIntervalMs = 60000;
    const ReportGenerator generator(config);

    const SessionData data = growingSession({100.0, 100.0, 100.0, 100.0, 100.0, 100.0}, 2 * kMinute);
    const FinalReport report = generator.generate(data, sessionSpanning(10 * kMinute));

    EXPECT_TRUE(report.completeness.incompleteData);
    EXPECT_EQ(report.completeness.expectedSnapshots, 20);
    EXPECT_EQ(report.completeness.observedSnapshots, 5);
    EXPECT_EQ(report.completeness.expectedHealthChecks, 10);

    bool recommended = false;
    for (const Recommendation& rec : report.recommendations) {
        recommended = recommended || rec.category == "data_collection";
    }
    EXPECT_TRUE(recommended);
}

TEST(ReportGeneratorTest, CompletenessUsesConfiguredDurationWhenShorter) {
    SessionConfig config;
    config.snapshotIntervalMs = kMinute;
    config.healthCheckIntervalMs = 0;
    const ReportGenerator generator(config);

    const SessionData data = growingSession({1.0, 1.0, 1.0, 1.0});
    const auto completeness = generator.assessCompleteness(data, sessionSpanning(60 * kMinute, 3 * kMinute));
    EXPECT_EQ(completeness.expectedSnapshots, 3);
    EXPECT_EQ(completeness.observedSnapshots, 3);
    EXPECT_FALSE(completeness.incompleteData);
}

TEST(ReportGeneratorTest, RecommendationsAreDedupedAndOrderedByPriority) {
    SessionConfig config;
    config.memory.maxMemoryGrowthMB = 20.0;
    const ReportGenerator generator(config);

    SessionData data = growingSession({100.0, 150.0});
    data.leakCandidates.append(candidate(LeakType::StructuralGrowth, Severity::Medium));
    data.leakCandidates.append(candidate(LeakType::MemoryPressure, Severity::High));
    data.leakCandidates.append(candidate(LeakType::MemoryPressure, Severity::Critical));

    const FinalReport report = generator.generate(data, sessionSpanning(kMinute));
    ASSERT_FALSE(report.recommendations.isEmpty());
    EXPECT_EQ(report.recommendations.first().category, "memory_leaks");
    EXPECT_EQ(report.recommendations.first().priority, Severity::Critical);

    QSet<QString> seen;
    for (int i = 0; i < report.recommendations.size(); ++i) {
        const Recommendation& rec = report.recommendations[i];
        EXPECT_FALSE(seen.contains(rec.category)) << rec.category.toStdString();
        seen.insert(rec.category);
        if (i > 0) {
            EXPECT_GE(soakmon::severityRank(report.recommendations[i - 1].priority),
                soakmon::severityRank(rec.priority));
        }
    }
    EXPECT_TRUE(seen.contains("memory"));
    EXPECT_TRUE(seen.contains("memory_pressure"));
    EXPECT_TRUE(seen.contains("structural_growth"));
    EXPECT_EQ(report.leaks.bySeverity.value("critical"), 1);
    EXPECT_EQ(report.leaks.byType.value("memory_pressure"), 2);
}

TEST(ReportGeneratorTest, JsonCarriesEverySection) {
    const ReportGenerator generator;
    SessionData data = growingSession({100.0, 101.0, 102.0});
    HealthCheck check;
    check.score = 90;
    data.healthChecks.append(check);
    Alert alert;
    alert.type = "leak_component_leak";
    alert.severity = Severity::High;
    data.alerts.append(alert);
    OperationEvent op;
    op.type = "unit_created";
    data.operations.append(op);

    const QJsonObject json = generator.generate(data, sessionSpanning(2 * kMinute)).toJson();
    for (const char* key : {"session_info", "summary", "memory_analysis", "performance_analysis",
             "operation_analysis", "health_analysis", "leak_summary", "alert_summary", "trend",
             "recommendations", "overall_grade", "data_completeness"}) {
        EXPECT_TRUE(json.contains(key)) << key;
    }
    EXPECT_EQ(json.value("summary").toObject().value("alerts").toInt(), 1);
    EXPECT_EQ(json.value("operation_analysis").toObject().value("operation_types").toObject().value("unit_created").toInt(),
        1);
    EXPECT_DOUBLE_EQ(json.value("health_analysis").toObject().value("average_health_score").toDouble(), 90.0);
    EXPECT_TRUE(json.value("performance_analysis").toObject().value("average_frame_rate").isNull());
    EXPECT_EQ(json.value("session_info").toObject().value("session_id").toString(), "session-report");
}
