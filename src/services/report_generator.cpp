#include "soakmon/report_generator.hpp"

#include <QDateTime>
#include <QJsonArray>

#include <algorithm>
#include <utility>

#include "soakmon/logging.hpp"

namespace soakmon {

namespace {

constexpr double kMsPerHour = 3600.0 * 1000.0;

QJsonValue optionalValue(const std::optional<double>& value) {
    return value ? QJsonValue(*value) : QJsonValue();
}

QJsonObject tallyToJson(const QMap<QString, int>& tally) {
    QJsonObject out;
    for (auto it = tally.constBegin(); it != tally.constEnd(); ++it) {
        out.insert(it.key(), it.value());
    }
    return out;
}

double perHour(int count, qint64 elapsedMs) {
    return elapsedMs > 0 ? count / (static_cast<double>(elapsedMs) / kMsPerHour) : 0.0;
}

Recommendation recommendation(const QString& category, Severity priority, const QString& title, const QString& text) {
    Recommendation out;
    out.category = category;
    out.priority = priority;
    out.title = title;
    out.description = text;
    return out;
}

}  // namespace

QJsonObject SessionInfo::toJson() const {
    return {
        {"session_id", sessionId},
        {"start_utc", QDateTime::fromMSecsSinceEpoch(startedAtMs).toUTC().toString(Qt::ISODateWithMs)},
        {"end_utc", QDateTime::fromMSecsSinceEpoch(endedAtMs).toUTC().toString(Qt::ISODateWithMs)},
        {"duration_ms", static_cast<double>(elapsedMs())},
        {"duration_hours", static_cast<double>(elapsedMs()) / kMsPerHour},
        {"configured_duration_ms", static_cast<double>(configuredDurationMs)},
    };
}

QJsonObject MemoryAnalysis::toJson() const {
    if (!sufficientData) {
        return {
            {"error", "Insufficient memory data"},
            {"memory_stable", memoryStable},
            {"snapshots_analyzed", snapshotsAnalyzed},
        };
    }
    return {
        {"initial_mb", initialMB},
        {"final_mb", finalMB},
        {"peak_mb", peakMB},
        {"average_mb", averageMB},
        {"memory_growth_mb", memoryGrowthMB},
        {"growth_rate_mb_per_hour", growthRateMBPerHour},
        {"memory_stable", memoryStable},
        {"snapshots_analyzed", snapshotsAnalyzed},
    };
}

QJsonObject PerformanceAnalysis::toJson() const {
    return {
        {"average_frame_rate", optionalValue(averageFrameRate)},
        {"min_frame_rate", optionalValue(minFrameRate)},
        {"max_frame_rate", optionalValue(maxFrameRate)},
        {"average_response_time_ms", optionalValue(averageResponseTimeMs)},
        {"samples", samples},
    };
}

QJsonObject OperationAnalysis::toJson() const {
    return {
        {"total_operations", totalOperations},
        {"operation_types", tallyToJson(operationTypes)},
        {"operations_per_hour", operationsPerHour},
    };
}

QJsonObject HealthAnalysis::toJson() const {
    return {
        {"total_checks", totalChecks},
        {"average_health_score", optionalValue(averageScore)},
        {"issue_types", tallyToJson(issueTypes)},
        {"system_healthy", systemHealthy},
    };
}

QJsonObject BreakdownSummary::toJson() const {
    return {
        {"total", total},
        {"by_severity", tallyToJson(bySeverity)},
        {"by_type", tallyToJson(byType)},
        {"per_hour", perHour},
    };
}

QJsonObject Recommendation::toJson() const {
    return {
        {"category", category},
        {"priority", severityName(priority)},
        {"title", title},
        {"description", description},
    };
}

QJsonObject GradeBreakdown::toJson() const {
    return {
        {"score", score},
        {"grade", grade},
        {"message", message},
        {"components",
            QJsonObject{
                {"memory_stability", memoryComponent},
                {"performance", performanceComponent},
                {"health", healthComponent},
                {"alerts", alertComponent},
            }},
    };
}

QJsonObject DataCompleteness::toJson() const {
    return {
        {"incomplete_data", incompleteData},
        {"expected_snapshots", expectedSnapshots},
        {"observed_snapshots", observedSnapshots},
        {"expected_health_checks", expectedHealthChecks},
        {"observed_health_checks", observedHealthChecks},
    };
}

QJsonObject FinalReport::toJson() const {
    QJsonArray recs;
    for (const Recommendation& rec : recommendations) {
        recs.append(rec.toJson());
    }
    return {
        {"session_info", session.toJson()},
        {"summary",
            QJsonObject{
                {"snapshots", snapshotCount},
                {"health_checks", healthCheckCount},
                {"alerts", alertCount},
                {"leak_candidates", leakCandidateCount},
                {"operations", operationCount},
                {"remediations", remediationCount},
            }},
        {"memory_analysis", memory.toJson()},
        {"performance_analysis", performance.toJson()},
        {"operation_analysis", operations.toJson()},
        {"health_analysis", health.toJson()},
        {"leak_summary", leaks.toJson()},
        {"alert_summary", alerts.toJson()},
        {"trend", trend.toJson()},
        {"recommendations", recs},
        {"overall_grade", grade.toJson()},
        {"data_completeness", completeness.toJson()},
    };
}

ReportGenerator::ReportGenerator(const SessionConfig& config)
    : config_(config),
      analyzer_(config.memory, config.trendWindow) {}

QString ReportGenerator::letterGrade(double score) {
    if (score >= 90.0) {
        return "A";
    }
    if (score >= 80.0) {
        return "B";
    }
    if (score >= 70.0) {
        return "C";
    }
    if (score >= 60.0) {
        return "D";
    }
    return "F";
}

QString ReportGenerator::gradeMessage(const QString& grade) {
    if (grade == "A") {
        return "Excellent - System stayed stable for the whole session";
    }
    if (grade == "B") {
        return "Good - System performs well with minor areas for improvement";
    }
    if (grade == "C") {
        return "Acceptable - System functional but requires optimization";
    }
    if (grade == "D") {
        return "Poor - System has significant stability issues";
    }
    if (grade == "F") {
        return "Fail - System is not ready for extended sessions";
    }
    return "Unknown grade";
}

MemoryAnalysis ReportGenerator::analyzeMemory(const QVector<Snapshot>& snapshots) const {
    MemoryAnalysis out;
    out.snapshotsAnalyzed = snapshots.size();
    if (snapshots.size() < 2) {
        return out;
    }
    out.sufficientData = true;

    const Snapshot& first = snapshots.first();
    const Snapshot& last = snapshots.last();
    out.initialMB = first.memoryUsedMB;
    out.finalMB = last.memoryUsedMB;
    out.peakMB = first.memoryUsedMB;
    double sum = 0.0;
    for (const Snapshot& snap : snapshots) {
        out.peakMB = qMax(out.peakMB, snap.memoryUsedMB);
        sum += snap.memoryUsedMB;
    }
    out.averageMB = sum / snapshots.size();
    out.memoryGrowthMB = out.finalMB - out.initialMB;
    const double hours = static_cast<double>(last.timestampMs - first.timestampMs) / kMsPerHour;
    out.growthRateMBPerHour = hours > 0.0 ? out.memoryGrowthMB / hours : 0.0;
    out.memoryStable = out.memoryGrowthMB < config_.memory.maxMemoryGrowthMB;
    return out;
}

PerformanceAnalysis ReportGenerator::analyzePerformance(const QVector<Snapshot>& snapshots) const {
    PerformanceAnalysis out;
    double frameSum = 0.0;
    int frameCount = 0;
    double responseSum = 0.0;
    int responseCount = 0;
    for (const Snapshot& snap : snapshots) {
        if (snap.frameRate) {
            const double fps = *snap.frameRate;
            frameSum += fps;
            ++frameCount;
            out.minFrameRate = out.minFrameRate ? qMin(*out.minFrameRate, fps) : fps;
            out.maxFrameRate = out.maxFrameRate ? qMax(*out.maxFrameRate, fps) : fps;
        }
        if (snap.responseTimeMs) {
            responseSum += *snap.responseTimeMs;
            ++responseCount;
        }
        if (snap.frameRate || snap.responseTimeMs) {
            ++out.samples;
        }
    }
    if (frameCount > 0) {
        out.averageFrameRate = frameSum / frameCount;
    }
    if (responseCount > 0) {
        out.averageResponseTimeMs = responseSum / responseCount;
    }
    return out;
}

GradeBreakdown ReportGenerator::computeGrade(
    const MemoryAnalysis& memory,
    const PerformanceAnalysis& performance,
    const HealthAnalysis& health,
    const BreakdownSummary& alerts) const {
    GradeBreakdown out;

    out.memoryComponent = memory.memoryStable ? 30.0 : 0.0;

    const double target = config_.performance.targetFrameRate;
    out.performanceComponent = 25.0;
    if (performance.averageFrameRate && *performance.averageFrameRate < target) {
        out.performanceComponent = 25.0 * qMax(0.0, *performance.averageFrameRate) / target;
    }

    out.healthComponent = 25.0;
    if (health.averageScore) {
        out.healthComponent = 25.0 * qBound(0.0, *health.averageScore, 100.0) / 100.0;
    }

    const int critical = alerts.bySeverity.value(severityName(Severity::Critical));
    const int high = alerts.bySeverity.value(severityName(Severity::High));
    const double alertPenalty =
        critical * config_.scoring.criticalAlertPenalty + high * config_.scoring.highAlertPenalty;
    out.alertComponent = qBound(0.0, 20.0 - alertPenalty, 20.0);

    out.score = qBound(0.0,
        out.memoryComponent + out.performanceComponent + out.healthComponent + out.alertComponent,
        100.0);
    out.grade = letterGrade(out.score);
    out.message = gradeMessage(out.grade);
    return out;
}

DataCompleteness ReportGenerator::assessCompleteness(const SessionData& data, const SessionInfo& session) const {
    DataCompleteness out;
    const qint64 span = qMin(session.elapsedMs(), session.configuredDurationMs);
    out.expectedSnapshots = config_.snapshotIntervalMs > 0 ? static_cast<int>(span / config_.snapshotIntervalMs) : 0;
    out.expectedHealthChecks =
        config_.healthCheckIntervalMs > 0 ? static_cast<int>(span / config_.healthCheckIntervalMs) : 0;
    for (const Snapshot& snap : data.snapshots) {
        if (!snap.isBaseline) {
            ++out.observedSnapshots;
        }
    }
    out.observedHealthChecks = data.healthChecks.size();

    const double ratio = config_.scoring.incompleteDataRatio;
    const bool sparseSnapshots =
        out.expectedSnapshots >= 1 && out.observedSnapshots < ratio * out.expectedSnapshots;
    const bool sparseChecks =
        out.expectedHealthChecks >= 1 && out.observedHealthChecks < ratio * out.expectedHealthChecks;
    out.incompleteData = sparseSnapshots || sparseChecks;
    return out;
}

QVector<Recommendation> ReportGenerator::buildRecommendations(
    const SessionData& data,
    const FinalReport& report) const {
    QVector<Recommendation> recs;
    auto add = [&recs](Recommendation rec) {
        for (const Recommendation& existing : recs) {
            if (existing.category == rec.category) {
                return;
            }
        }
        recs.append(std::move(rec));
    };

    if (report.memory.sufficientData && !report.memory.memoryStable) {
        add(recommendation("memory", Severity::High, "Excessive Memory Growth",
            QString("Memory grew by %1 MB during the session. Review object lifecycle management.")
                .arg(report.memory.memoryGrowthMB, 0, 'f', 2)));
    }
    if (!data.leakCandidates.isEmpty()) {
        add(recommendation("memory_leaks", Severity::Critical, "Memory Leaks Detected",
            QString("%1 leak candidate(s) detected. Immediate investigation required.")
                .arg(data.leakCandidates.size())));
    }

    bool pressure = false;
    bool cleanup = false;
    bool structural = false;
    for (const LeakCandidate& candidate : data.leakCandidates) {
        pressure = pressure || candidate.type == LeakType::MemoryPressure;
        structural = structural || candidate.type == LeakType::StructuralGrowth;
        cleanup = cleanup
            || (candidate.type == LeakType::ComponentLeak
                && candidate.metrics.value("phase").toString() == "cleanup");
    }
    if (pressure) {
        add(recommendation("memory_pressure", Severity::High, "Memory Pressure",
            "Resident memory approached the available capacity. Reduce the working set or raise the limit."));
    }
    if (cleanup) {
        add(recommendation("component_cleanup", Severity::High, "Incomplete Unit Cleanup",
            "Destroyed units retained memory. Release resources owned by a unit during teardown."));
    }
    if (structural) {
        add(recommendation("structural_growth", Severity::Medium, "Structural Growth",
            "Structural object counts kept growing. Check for objects that are created but never released."));
    }
    if (report.performance.averageFrameRate
        && *report.performance.averageFrameRate < config_.performance.targetFrameRate) {
        add(recommendation("performance", Severity::High, "Low Frame Rate",
            QString("Average frame rate was %1 FPS. Optimize the rendering pipeline.")
                .arg(*report.performance.averageFrameRate, 0, 'f', 1)));
    }
    if (report.performance.averageResponseTimeMs
        && *report.performance.averageResponseTimeMs > config_.performance.maxResponseTimeMs) {
        add(recommendation("response_time", Severity::High, "Slow Responses",
            QString("Average response time was %1 ms. Profile the slowest request paths.")
                .arg(*report.performance.averageResponseTimeMs, 0, 'f', 1)));
    }
    if (report.health.averageScore && *report.health.averageScore < config_.performance.minHealthScore) {
        add(recommendation("health", Severity::Medium, "System Health Score Low",
            QString("Average health score was %1/100. Review system optimization strategies.")
                .arg(*report.health.averageScore, 0, 'f', 1)));
    }
    if (report.completeness.incompleteData) {
        add(recommendation("data_collection", Severity::Medium, "Incomplete Data",
            QString("Only %1 of %2 expected snapshots were collected. Check the metrics provider.")
                .arg(report.completeness.observedSnapshots)
                .arg(report.completeness.expectedSnapshots)));
    }

    std::stable_sort(recs.begin(), recs.end(), [](const Recommendation& a, const Recommendation& b) {
        return severityRank(a.priority) > severityRank(b.priority);
    });
    return recs;
}

FinalReport ReportGenerator::generate(const SessionData& data, const SessionInfo& session) const {
    FinalReport report;
    report.session = session;
    report.snapshotCount = data.snapshots.size();
    report.healthCheckCount = data.healthChecks.size();
    report.alertCount = data.alerts.size();
    report.leakCandidateCount = data.leakCandidates.size();
    report.operationCount = data.operations.size();
    report.remediationCount = data.remediations.size();

    const qint64 elapsed = session.elapsedMs();
    report.memory = analyzeMemory(data.snapshots);
    report.performance = analyzePerformance(data.snapshots);
    report.trend = analyzer_.analyzeSeriesTrend(data.snapshots);

    report.operations.totalOperations = data.operations.size();
    for (const OperationEvent& op : data.operations) {
        report.operations.operationTypes[op.type] += 1;
    }
    report.operations.operationsPerHour = perHour(data.operations.size(), elapsed);

    report.health.totalChecks = data.healthChecks.size();
    if (!data.healthChecks.isEmpty()) {
        double sum = 0.0;
        for (const HealthCheck& check : data.healthChecks) {
            sum += check.score;
            for (const HealthIssue& issue : check.issues) {
                report.health.issueTypes[issue.type] += 1;
            }
        }
        report.health.averageScore = sum / data.healthChecks.size();
        report.health.systemHealthy = *report.health.averageScore >= config_.performance.minHealthScore;
    }

    report.leaks.total = data.leakCandidates.size();
    for (const LeakCandidate& candidate : data.leakCandidates) {
        report.leaks.bySeverity[severityName(candidate.severity)] += 1;
        report.leaks.byType[leakTypeName(candidate.type)] += 1;
    }
    report.leaks.perHour = perHour(report.leaks.total, elapsed);

    report.alerts.total = data.alerts.size();
    for (const Alert& alert : data.alerts) {
        report.alerts.bySeverity[severityName(alert.severity)] += 1;
        report.alerts.byType[alert.type] += 1;
    }
    report.alerts.perHour = perHour(report.alerts.total, elapsed);

    report.completeness = assessCompleteness(data, session);
    report.grade = computeGrade(report.memory, report.performance, report.health, report.alerts);
    report.recommendations = buildRecommendations(data, report);

    qCInfo(soakmonReport) << "Report for" << session.sessionId << "grade" << report.grade.grade
                          << "score" << report.grade.score;
    if (report.completeness.incompleteData) {
        qCWarning(soakmonReport) << "Session" << session.sessionId << "has incomplete data:"
                                 << report.completeness.observedSnapshots << "of"
                                 << report.completeness.expectedSnapshots << "snapshots";
    }
    return report;
}

}  // namespace soakmon
