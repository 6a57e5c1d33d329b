#include "soakmon/types.hpp"

#include <QDateTime>

namespace soakmon {

namespace {

QJsonObject countsToJson(const QMap<QString, qint64>& counts) {
    QJsonObject out;
    for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
        out.insert(it.key(), static_cast<double>(it.value()));
    }
    return out;
}

QString isoTime(qint64 epochMs) {
    return QDateTime::fromMSecsSinceEpoch(epochMs).toUTC().toString(Qt::ISODateWithMs);
}

}  // namespace

QString severityName(Severity severity) {
    switch (severity) {
    case Severity::Low:
        return "low";
    case Severity::Medium:
        return "medium";
    case Severity::High:
        return "high";
    case Severity::Critical:
        return "critical";
    }
    return "unknown";
}

int severityRank(Severity severity) {
    return static_cast<int>(severity);
}

QString leakTypeName(LeakType type) {
    switch (type) {
    case LeakType::TrendGrowth:
        return "trend_growth";
    case LeakType::MemoryPressure:
        return "memory_pressure";
    case LeakType::ComponentLeak:
        return "component_leak";
    case LeakType::StructuralGrowth:
        return "structural_growth";
    }
    return "unknown";
}

QString sessionStatusName(SessionStatus status) {
    switch (status) {
    case SessionStatus::Idle:
        return "idle";
    case SessionStatus::Initializing:
        return "initializing";
    case SessionStatus::Running:
        return "running";
    case SessionStatus::Stopping:
        return "stopping";
    case SessionStatus::Completed:
        return "completed";
    case SessionStatus::Error:
        return "error";
    }
    return "unknown";
}

qint64 StructuralCounts::total() const {
    qint64 sum = 0;
    for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
        sum += it.value();
    }
    return sum;
}

QJsonObject RemediationOutcome::toJson() const {
    return {
        {"success", success},
        {"reclaimed_mb", reclaimedMB},
        {"action", action},
        {"alert_id", alertId},
        {"timestamp_utc", isoTime(timestampMs)},
    };
}

QJsonObject Snapshot::toJson() const {
    QJsonObject out;
    out.insert("timestamp_utc", isoTime(timestampMs));
    out.insert("epoch_ms", static_cast<double>(timestampMs));
    out.insert("elapsed_ms", static_cast<double>(elapsedMs));
    out.insert("is_baseline", isBaseline);
    out.insert("memory_used_mb", memoryUsedMB);
    out.insert("memory_total_mb", memoryTotalMB);
    out.insert("memory_capacity_mb", memoryCapacityMB);
    out.insert("utilization_percent", utilizationPercent);
    out.insert("tracked_unit_count", trackedUnitCount);
    out.insert("structural_counts", countsToJson(structuralCounts));
    out.insert("growth_from_baseline_mb", growthFromBaselineMB);
    // Absent probes stay null so readers never mistake them for zero.
    out.insert("structural_total",
        structuralTotal ? QJsonValue(static_cast<double>(*structuralTotal)) : QJsonValue());
    out.insert("frame_rate", frameRate ? QJsonValue(*frameRate) : QJsonValue());
    out.insert("response_time_ms", responseTimeMs ? QJsonValue(*responseTimeMs) : QJsonValue());
    out.insert("connection_count", connectionCount ? QJsonValue(*connectionCount) : QJsonValue());
    if (remediation) {
        out.insert("remediation", remediation->toJson());
    }
    return out;
}

QJsonObject LeakCandidate::toJson() const {
    return {
        {"type", leakTypeName(type)},
        {"severity", severityName(severity)},
        {"detected_utc", isoTime(detectedAtMs)},
        {"metrics", metrics},
        {"recommendation", recommendation},
        {"severity_score", severityScore},
    };
}

QJsonObject HealthIssue::toJson() const {
    return {
        {"type", type},
        {"category", category},
        {"message", message},
    };
}

QJsonObject HealthCheck::toJson() const {
    QJsonArray issueArray;
    for (const HealthIssue& issue : issues) {
        issueArray.append(issue.toJson());
    }
    return {
        {"timestamp_utc", isoTime(timestampMs)},
        {"score", score},
        {"status", status},
        {"category_scores",
            QJsonObject{
                {"memory", memoryScore},
                {"performance", performanceScore},
                {"alerts", alertScore},
            }},
        {"issues", issueArray},
    };
}

QJsonObject Alert::toJson() const {
    return {
        {"id", id},
        {"type", type},
        {"severity", severityName(severity)},
        {"timestamp_utc", isoTime(timestampMs)},
        {"details", details},
        {"recommendations", QJsonArray::fromStringList(recommendations)},
    };
}

QJsonObject OperationEvent::toJson() const {
    return {
        {"type", type},
        {"unit_id", unitId},
        {"timestamp_utc", isoTime(timestampMs)},
        {"payload", payload},
    };
}

QJsonObject ProgressReport::toJson() const {
    QJsonObject out;
    out.insert("session_id", sessionId);
    out.insert("timestamp_utc", isoTime(timestampMs));
    out.insert("elapsed_ms", static_cast<double>(elapsedMs));
    out.insert("remaining_ms", static_cast<double>(remainingMs));
    out.insert("progress_percent", progressPercent);
    out.insert("snapshots", snapshotCount);
    out.insert("health_checks", healthCheckCount);
    out.insert("alerts", alertCount);
    out.insert("leak_candidates", leakCandidateCount);
    out.insert("operations", operationCount);
    out.insert("tracked_units", trackedUnitCount);
    out.insert("latest_health_score", latestHealthScore ? QJsonValue(*latestHealthScore) : QJsonValue());
    out.insert("latest_memory_mb", latestMemoryMB ? QJsonValue(*latestMemoryMB) : QJsonValue());
    return out;
}

}  // namespace soakmon
