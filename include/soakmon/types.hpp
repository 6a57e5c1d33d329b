#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

namespace soakmon {

enum class Severity {
    Low,
    Medium,
    High,
    Critical,
};

enum class LeakType {
    TrendGrowth,
    MemoryPressure,
    ComponentLeak,
    StructuralGrowth,
};

enum class SessionStatus {
    Idle,
    Initializing,
    Running,
    Stopping,
    Completed,
    Error,
};

QString severityName(Severity severity);
int severityRank(Severity severity);
QString leakTypeName(LeakType type);
QString sessionStatusName(SessionStatus status);

struct MemorySample {
    double usedMB = 0.0;
    double totalMB = 0.0;
    double capacityMB = 0.0;
};

struct StructuralCounts {
    QMap<QString, qint64> counts;

    [[nodiscard]] qint64 total() const;
};

struct PerformanceSample {
    std::optional<double> frameRate;
    std::optional<double> responseTimeMs;
};

struct RemediationOutcome {
    bool success = false;
    double reclaimedMB = 0.0;
    QString action;
    QString alertId;
    qint64 timestampMs = 0;

    [[nodiscard]] QJsonObject toJson() const;
};

struct Snapshot {
    qint64 timestampMs = 0;
    qint64 elapsedMs = 0;
    bool isBaseline = false;
    double memoryUsedMB = 0.0;
    double memoryTotalMB = 0.0;
    double memoryCapacityMB = 0.0;
    double utilizationPercent = 0.0;
    int trackedUnitCount = 0;
    QMap<QString, qint64> structuralCounts;
    std::optional<qint64> structuralTotal;
    double growthFromBaselineMB = 0.0;
    std::optional<double> frameRate;
    std::optional<double> responseTimeMs;
    std::optional<int> connectionCount;
    std::optional<RemediationOutcome> remediation;

    [[nodiscard]] QJsonObject toJson() const;
};

struct LeakCandidate {
    LeakType type = LeakType::TrendGrowth;
    Severity severity = Severity::Low;
    qint64 detectedAtMs = 0;
    QJsonObject metrics;
    QString recommendation;
    int severityScore = 0;

    [[nodiscard]] QJsonObject toJson() const;
};

struct HealthIssue {
    QString type;
    QString category;
    QString message;

    [[nodiscard]] QJsonObject toJson() const;
};

struct HealthCheck {
    qint64 timestampMs = 0;
    int score = 100;
    QString status;
    int memoryScore = 100;
    int performanceScore = 100;
    int alertScore = 100;
    QVector<HealthIssue> issues;

    [[nodiscard]] QJsonObject toJson() const;
};

struct Alert {
    QString id;
    QString type;
    Severity severity = Severity::Low;
    qint64 timestampMs = 0;
    QJsonObject details;
    QStringList recommendations;

    [[nodiscard]] QJsonObject toJson() const;
};

struct OperationEvent {
    QString type;
    QString unitId;
    qint64 timestampMs = 0;
    QJsonObject payload;

    [[nodiscard]] QJsonObject toJson() const;
};

// Append-only record of one session. Mutated only by the orchestrator.
struct SessionData {
    QVector<Snapshot> snapshots;
    QVector<HealthCheck> healthChecks;
    QVector<Alert> alerts;
    QVector<LeakCandidate> leakCandidates;
    QVector<OperationEvent> operations;
    QVector<RemediationOutcome> remediations;
};

struct ProgressReport {
    QString sessionId;
    qint64 timestampMs = 0;
    qint64 elapsedMs = 0;
    qint64 remainingMs = 0;
    double progressPercent = 0.0;
    int snapshotCount = 0;
    int healthCheckCount = 0;
    int alertCount = 0;
    int leakCandidateCount = 0;
    int operationCount = 0;
    int trackedUnitCount = 0;
    std::optional<int> latestHealthScore;
    std::optional<double> latestMemoryMB;

    [[nodiscard]] QJsonObject toJson() const;
};

}  // namespace soakmon
