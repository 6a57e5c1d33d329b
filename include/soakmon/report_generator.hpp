#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QVector>

#include <optional>

#include "soakmon/leak_analyzer.hpp"
#include "soakmon/session_config.hpp"
#include "soakmon/types.hpp"

namespace soakmon {

struct SessionInfo {
    QString sessionId;
    qint64 startedAtMs = 0;
    qint64 endedAtMs = 0;
    qint64 configuredDurationMs = 0;

    [[nodiscard]] qint64 elapsedMs() const { return qMax<qint64>(0, endedAtMs - startedAtMs); }
    [[nodiscard]] QJsonObject toJson() const;
};

struct MemoryAnalysis {
    bool sufficientData = false;
    double initialMB = 0.0;
    double finalMB = 0.0;
    double peakMB = 0.0;
    double averageMB = 0.0;
    double memoryGrowthMB = 0.0;
    double growthRateMBPerHour = 0.0;
    bool memoryStable = false;
    int snapshotsAnalyzed = 0;

    [[nodiscard]] QJsonObject toJson() const;
};

struct PerformanceAnalysis {
    std::optional<double> averageFrameRate;
    std::optional<double> minFrameRate;
    std::optional<double> maxFrameRate;
    std::optional<double> averageResponseTimeMs;
    int samples = 0;

    [[nodiscard]] QJsonObject toJson() const;
};

struct OperationAnalysis {
    int totalOperations = 0;
    QMap<QString, int> operationTypes;
    double operationsPerHour = 0.0;

    [[nodiscard]] QJsonObject toJson() const;
};

struct HealthAnalysis {
    int totalChecks = 0;
    std::optional<double> averageScore;
    QMap<QString, int> issueTypes;
    bool systemHealthy = false;

    [[nodiscard]] QJsonObject toJson() const;
};

struct BreakdownSummary {
    int total = 0;
    QMap<QString, int> bySeverity;
    QMap<QString, int> byType;
    double perHour = 0.0;

    [[nodiscard]] QJsonObject toJson() const;
};

struct Recommendation {
    QString category;
    Severity priority = Severity::Low;
    QString title;
    QString description;

    [[nodiscard]] QJsonObject toJson() const;
};

struct GradeBreakdown {
    double memoryComponent = 0.0;
    double performanceComponent = 0.0;
    double healthComponent = 0.0;
    double alertComponent = 0.0;
    double score = 0.0;
    QString grade;
    QString message;

    [[nodiscard]] QJsonObject toJson() const;
};

struct DataCompleteness {
    bool incompleteData = false;
    int expectedSnapshots = 0;
    int observedSnapshots = 0;
    int expectedHealthChecks = 0;
    int observedHealthChecks = 0;

    [[nodiscard]] QJsonObject toJson() const;
};

struct FinalReport {
    SessionInfo session;
    int snapshotCount = 0;
    int healthCheckCount = 0;
    int alertCount = 0;
    int leakCandidateCount = 0;
    int operationCount = 0;
    int remediationCount = 0;
    MemoryAnalysis memory;
    PerformanceAnalysis performance;
    OperationAnalysis operations;
    HealthAnalysis health;
    BreakdownSummary leaks;
    BreakdownSummary alerts;
    TrendResult trend;
    QVector<Recommendation> recommendations;
    GradeBreakdown grade;
    DataCompleteness completeness;

    [[nodiscard]] QJsonObject toJson() const;
};

// Pure function of the frozen session data.
class ReportGenerator final {
public:
    explicit ReportGenerator(const SessionConfig& config = {});

    [[nodiscard]] FinalReport generate(const SessionData& data, const SessionInfo& session) const;

    [[nodiscard]] MemoryAnalysis analyzeMemory(const QVector<Snapshot>& snapshots) const;
    [[nodiscard]] PerformanceAnalysis analyzePerformance(const QVector<Snapshot>& snapshots) const;
    [[nodiscard]] GradeBreakdown computeGrade(
        const MemoryAnalysis& memory,
        const PerformanceAnalysis& performance,
        const HealthAnalysis& health,
        const BreakdownSummary& alerts) const;
    [[nodiscard]] DataCompleteness assessCompleteness(const SessionData& data, const SessionInfo& session) const;

    static QString letterGrade(double score);
    static QString gradeMessage(const QString& grade);

private:
    QVector<Recommendation> buildRecommendations(const SessionData& data, const FinalReport& report) const;

    SessionConfig config_;
    LeakAnalyzer analyzer_;
};

}  // namespace soakmon
