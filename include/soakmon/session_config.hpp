#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

#include "soakmon/types.hpp"

namespace soakmon {

// Per-severity delta tiers in MB. A delta below `lowMB` is not a leak.
struct LeakThresholds {
    double lowMB = 5.0;
    double mediumMB = 10.0;
    double highMB = 20.0;
    double criticalMB = 50.0;

    [[nodiscard]] std::optional<Severity> classify(double deltaMB) const;
};

struct MemoryThresholds {
    double maxMemoryGrowthMB = 100.0;
    double maxMemoryLeakRateMBPerHour = 10.0;
    double pressureHighPercent = 85.0;
    double pressureCriticalPercent = 95.0;
    qint64 structuralGrowthThreshold = 100;
    qint64 structuralCriticalGrowth = 500;
    double trendConfidenceThreshold = 0.7;
};

struct PerformanceThresholds {
    double targetFrameRate = 55.0;
    double maxResponseTimeMs = 100.0;
    int minHealthScore = 80;
};

struct ScoringConstants {
    int criticalAlertPenalty = 10;
    int highAlertPenalty = 5;
    int maxAlertPenalty = 50;
    double incompleteDataRatio = 0.8;
};

struct SessionConfig {
    qint64 sessionDurationMs = 8LL * 60 * 60 * 1000;
    qint64 snapshotIntervalMs = 30000;
    qint64 healthCheckIntervalMs = 60000;
    qint64 reportingIntervalMs = 15LL * 60 * 1000;
    qint64 componentCheckIntervalMs = 60000;
    qint64 snapshotTimeoutMs = 5000;
    int trendWindow = 10;

    LeakThresholds leakThresholds;
    double componentCycleThresholdMB = 5.0;
    MemoryThresholds memory;
    PerformanceThresholds performance;
    ScoringConstants scoring;

    bool enableLeakDetection = true;
    bool enableAutomaticRemediation = false;

    [[nodiscard]] QStringList validate() const;
    [[nodiscard]] QJsonObject toJson() const;
    static SessionConfig fromJson(const QJsonObject& object);
};

struct ConfigLoadResult {
    bool success = false;
    QString error;
    QString path;
    SessionConfig config;

    [[nodiscard]] QJsonObject toJson() const;
};

ConfigLoadResult loadSessionConfig(const QString& filePath);

// Clamps a configured interval into the range QTimer accepts.
int timerIntervalMs(qint64 ms);

}  // namespace soakmon
