#include "soakmon/session_config.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

#include <limits>

namespace soakmon {

namespace {

qint64 readMs(const QJsonObject& object, const char* key, qint64 fallback) {
    const QJsonValue value = object.value(key);
    return value.isDouble() ? static_cast<qint64>(value.toDouble()) : fallback;
}

}  // namespace

std::optional<Severity> LeakThresholds::classify(double deltaMB) const {
    if (deltaMB > criticalMB) {
        return Severity::Critical;
    }
    if (deltaMB >= highMB) {
        return Severity::High;
    }
    if (deltaMB >= mediumMB) {
        return Severity::Medium;
    }
    if (deltaMB >= lowMB) {
        return Severity::Low;
    }
    return std::nullopt;
}

QStringList SessionConfig::validate() const {
    QStringList problems;
    if (sessionDurationMs <= 0) {
        problems.append("session_duration_ms must be positive.");
    }
    if (snapshotIntervalMs <= 0) {
        problems.append("snapshot_interval_ms must be positive.");
    }
    if (healthCheckIntervalMs <= 0) {
        problems.append("health_check_interval_ms must be positive.");
    }
    if (reportingIntervalMs <= 0) {
        problems.append("reporting_interval_ms must be positive.");
    }
    if (componentCheckIntervalMs <= 0) {
        problems.append("component_check_interval_ms must be positive.");
    }
    if (snapshotTimeoutMs <= 0) {
        problems.append("snapshot_timeout_ms must be positive.");
    }
    if (trendWindow < 3) {
        problems.append("trend_window must be at least 3.");
    }
    if (!(leakThresholds.lowMB > 0.0 && leakThresholds.lowMB < leakThresholds.mediumMB
            && leakThresholds.mediumMB < leakThresholds.highMB
            && leakThresholds.highMB < leakThresholds.criticalMB)) {
        problems.append("leak_thresholds_mb must be positive and strictly ascending.");
    }
    if (componentCycleThresholdMB <= 0.0) {
        problems.append("component_cycle_threshold_mb must be positive.");
    }
    if (memory.maxMemoryGrowthMB <= 0.0) {
        problems.append("max_memory_growth_mb must be positive.");
    }
    if (memory.pressureHighPercent >= memory.pressureCriticalPercent) {
        problems.append("pressure_high_percent must be below pressure_critical_percent.");
    }
    if (memory.structuralGrowthThreshold >= memory.structuralCriticalGrowth) {
        problems.append("structural_growth_threshold must be below structural_critical_growth.");
    }
    if (performance.targetFrameRate <= 0.0 || performance.maxResponseTimeMs <= 0.0) {
        problems.append("performance thresholds must be positive.");
    }
    if (scoring.incompleteDataRatio <= 0.0 || scoring.incompleteDataRatio > 1.0) {
        problems.append("incomplete_data_ratio must be in (0, 1].");
    }
    return problems;
}

QJsonObject SessionConfig::toJson() const {
    QJsonObject out;
    out.insert("session_duration_ms", static_cast<double>(sessionDurationMs));
    out.insert("snapshot_interval_ms", static_cast<double>(snapshotIntervalMs));
    out.insert("health_check_interval_ms", static_cast<double>(healthCheckIntervalMs));
    out.insert("reporting_interval_ms", static_cast<double>(reportingIntervalMs));
    out.insert("component_check_interval_ms", static_cast<double>(componentCheckIntervalMs));
    out.insert("snapshot_timeout_ms", static_cast<double>(snapshotTimeoutMs));
    out.insert("trend_window", trendWindow);
    out.insert("leak_thresholds_mb",
        QJsonObject{
            {"low", leakThresholds.lowMB},
            {"medium", leakThresholds.mediumMB},
            {"high", leakThresholds.highMB},
            {"critical", leakThresholds.criticalMB},
        });
    out.insert("component_cycle_threshold_mb", componentCycleThresholdMB);
    out.insert("max_memory_growth_mb", memory.maxMemoryGrowthMB);
    out.insert("max_memory_leak_rate_mb_per_hour", memory.maxMemoryLeakRateMBPerHour);
    out.insert("pressure_high_percent", memory.pressureHighPercent);
    out.insert("pressure_critical_percent", memory.pressureCriticalPercent);
    out.insert("structural_growth_threshold", static_cast<double>(memory.structuralGrowthThreshold));
    out.insert("structural_critical_growth", static_cast<double>(memory.structuralCriticalGrowth));
    out.insert("trend_confidence_threshold", memory.trendConfidenceThreshold);
    out.insert("target_frame_rate", performance.targetFrameRate);
    out.insert("max_response_time_ms", performance.maxResponseTimeMs);
    out.insert("min_health_score", performance.minHealthScore);
    out.insert("critical_alert_penalty", scoring.criticalAlertPenalty);
    out.insert("high_alert_penalty", scoring.highAlertPenalty);
    out.insert("max_alert_penalty", scoring.maxAlertPenalty);
    out.insert("incomplete_data_ratio", scoring.incompleteDataRatio);
    out.insert("enable_leak_detection", enableLeakDetection);
    out.insert("enable_automatic_remediation", enableAutomaticRemediation);
    return out;
}

SessionConfig SessionConfig::fromJson(const QJsonObject& object) {
    SessionConfig config;
    config.sessionDurationMs = readMs(object, "session_duration_ms", config.sessionDurationMs);
    config.snapshotIntervalMs = readMs(object, "snapshot_interval_ms", config.snapshotIntervalMs);
    config.healthCheckIntervalMs = readMs(object, "health_check_interval_ms", config.healthCheckIntervalMs);
    config.reportingIntervalMs = readMs(object, "reporting_interval_ms", config.reportingIntervalMs);
    config.componentCheckIntervalMs =
        readMs(object, "component_check_interval_ms", config.componentCheckIntervalMs);
    config.snapshotTimeoutMs = readMs(object, "snapshot_timeout_ms", config.snapshotTimeoutMs);
    config.trendWindow = object.value("trend_window").toInt(config.trendWindow);

    const QJsonObject tiers = object.value("leak_thresholds_mb").toObject();
    config.leakThresholds.lowMB = tiers.value("low").toDouble(config.leakThresholds.lowMB);
    config.leakThresholds.mediumMB = tiers.value("medium").toDouble(config.leakThresholds.mediumMB);
    config.leakThresholds.highMB = tiers.value("high").toDouble(config.leakThresholds.highMB);
    config.leakThresholds.criticalMB = tiers.value("critical").toDouble(config.leakThresholds.criticalMB);
    // The per-cycle threshold follows the low tier unless set explicitly.
    config.componentCycleThresholdMB =
        object.value("component_cycle_threshold_mb").toDouble(config.leakThresholds.lowMB);

    MemoryThresholds& mem = config.memory;
    mem.maxMemoryGrowthMB = object.value("max_memory_growth_mb").toDouble(mem.maxMemoryGrowthMB);
    mem.maxMemoryLeakRateMBPerHour =
        object.value("max_memory_leak_rate_mb_per_hour").toDouble(mem.maxMemoryLeakRateMBPerHour);
    mem.pressureHighPercent = object.value("pressure_high_percent").toDouble(mem.pressureHighPercent);
    mem.pressureCriticalPercent =
        object.value("pressure_critical_percent").toDouble(mem.pressureCriticalPercent);
    mem.structuralGrowthThreshold =
        readMs(object, "structural_growth_threshold", mem.structuralGrowthThreshold);
    mem.structuralCriticalGrowth = readMs(object, "structural_critical_growth", mem.structuralCriticalGrowth);
    mem.trendConfidenceThreshold =
        object.value("trend_confidence_threshold").toDouble(mem.trendConfidenceThreshold);

    PerformanceThresholds& perf = config.performance;
    perf.targetFrameRate = object.value("target_frame_rate").toDouble(perf.targetFrameRate);
    perf.maxResponseTimeMs = object.value("max_response_time_ms").toDouble(perf.maxResponseTimeMs);
    perf.minHealthScore = object.value("min_health_score").toInt(perf.minHealthScore);

    ScoringConstants& scoring = config.scoring;
    scoring.criticalAlertPenalty = object.value("critical_alert_penalty").toInt(scoring.criticalAlertPenalty);
    scoring.highAlertPenalty = object.value("high_alert_penalty").toInt(scoring.highAlertPenalty);
    scoring.maxAlertPenalty = object.value("max_alert_penalty").toInt(scoring.maxAlertPenalty);
    scoring.incompleteDataRatio = object.value("incomplete_data_ratio").toDouble(scoring.incompleteDataRatio);

    config.enableLeakDetection = object.value("enable_leak_detection").toBool(config.enableLeakDetection);
    config.enableAutomaticRemediation =
        object.value("enable_automatic_remediation").toBool(config.enableAutomaticRemediation);
    return config;
}

QJsonObject ConfigLoadResult::toJson() const {
    QJsonObject out{
        {"success", success},
        {"path", path},
    };
    if (!success) {
        out.insert("error", error);
    }
    return out;
}

ConfigLoadResult loadSessionConfig(const QString& filePath) {
    ConfigLoadResult result;
    result.path = filePath;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.error = "Failed to open session config file.";
        return result;
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError) {
        result.error = QString("Invalid session config JSON: %1").arg(parseError.errorString());
        return result;
    }
    if (!doc.isObject()) {
        result.error = "Session config must be a JSON object.";
        return result;
    }

    result.config = SessionConfig::fromJson(doc.object());
    const QStringList problems = result.config.validate();
    if (!problems.isEmpty()) {
        result.error = problems.join(' ');
        return result;
    }
    result.success = true;
    return result;
}

int timerIntervalMs(qint64 ms) {
    return static_cast<int>(qBound<qint64>(1, ms, std::numeric_limits<int>::max()));
}

}  // namespace soakmon
