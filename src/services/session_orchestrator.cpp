#include "soakmon/session_orchestrator.hpp"

#include <QDateTime>
#include <QUuid>

#include <exception>
#include <utility>

#include "soakmon/logging.hpp"

namespace soakmon {

QJsonObject SessionHandle::toJson() const {
    return {
        {"session_id", sessionId},
        {"started_epoch_ms", static_cast<double>(startedAtMs)},
        {"duration_ms", static_cast<double>(durationMs)},
        {"estimated_end_epoch_ms", static_cast<double>(estimatedEndMs)},
    };
}

QJsonObject StartResult::toJson() const {
    if (!success()) {
        return {
            {"success", false},
            {"error", error.toJson()},
        };
    }
    return {
        {"success", true},
        {"session", handle->toJson()},
    };
}

QJsonObject StopResult::toJson() const {
    QJsonObject out{
        {"success", success()},
        {"no_active_session", noActiveSession()},
        {"message", message},
    };
    if (error.isError()) {
        out.insert("error", error.toJson());
    }
    if (report) {
        out.insert("report", report->toJson());
    }
    return out;
}

QJsonObject SessionStatusView::toJson() const {
    QJsonObject out = progress.toJson();
    out.insert("status", sessionStatusName(status));
    return out;
}

SessionOrchestrator::SessionOrchestrator(
    std::shared_ptr<MetricsProvider> provider,
    std::shared_ptr<SessionRegistry> registry,
    QObject* parent)
    : QObject(parent),
      provider_(std::move(provider)),
      registry_(std::move(registry)),
      dispatcher_(&telemetry_) {
    deadlineTimer_.setSingleShot(true);
    connect(&snapshotTimer_, &QTimer::timeout, this, [this]() { runSnapshotCycle(); });
    connect(&healthTimer_, &QTimer::timeout, this, [this]() { runHealthCheckCycle(); });
    connect(&reportingTimer_, &QTimer::timeout, this, [this]() { runReportingCycle(); });
    connect(&deadlineTimer_, &QTimer::timeout, this, [this]() {
        if (status_ != SessionStatus::Running) {
            return;
        }
        qCInfo(soakmonSession) << "Session" << sessionId_ << "reached its configured duration";
        const StopResult result = stop();
        if (!result.success()) {
            qCWarning(soakmonSession) << "Automatic stop did not produce a report:" << result.message;
        }
    });
}

SessionOrchestrator::~SessionOrchestrator() {
    stopTimers();
    dispatcher_.attachLog(nullptr);
    releaseRegistry();
}

bool SessionOrchestrator::isActive() const {
    return status_ == SessionStatus::Initializing
        || status_ == SessionStatus::Running
        || status_ == SessionStatus::Stopping;
}

void SessionOrchestrator::stopTimers() {
    snapshotTimer_.stop();
    healthTimer_.stop();
    reportingTimer_.stop();
    deadlineTimer_.stop();
}

void SessionOrchestrator::releaseRegistry() {
    if (registry_ && !sessionId_.isEmpty()) {
        registry_->release(sessionId_);
    }
}

qint64 SessionOrchestrator::elapsedMs(qint64 nowMs) const {
    if (startedAtMs_ == 0) {
        return 0;
    }
    const qint64 end = (status_ == SessionStatus::Completed || status_ == SessionStatus::Error) ? endedAtMs_ : nowMs;
    return qMax<qint64>(0, end - startedAtMs_);
}

StartResult SessionOrchestrator::start(const SessionConfig& config) {
    StartResult result;
    if (isActive()) {
        result.error = {ErrorCode::AlreadyRunning, QString("Session %1 is already running.").arg(sessionId_)};
        return result;
    }
    const QStringList problems = config.validate();
    if (!problems.isEmpty()) {
        result.error = {ErrorCode::Configuration, problems.join(' ')};
        qCWarning(soakmonSession) << "Rejected session config:" << result.error.message;
        return result;
    }

    const QString sessionId = "session-" + QUuid::createUuid().toString(QUuid::WithoutBraces);
    if (registry_ && !registry_->acquire(sessionId)) {
        result.error = {ErrorCode::AlreadyRunning,
            QString("Session %1 is already active in this registry.").arg(registry_->activeSessionId())};
        return result;
    }

    sessionId_ = sessionId;
    config_ = config;
    status_ = SessionStatus::Initializing;
    startedAtMs_ = QDateTime::currentMSecsSinceEpoch();
    endedAtMs_ = 0;
    data_ = SessionData{};
    reportedFindings_.clear();
    pendingRemediation_.reset();
    lastReport_.reset();
    telemetry_.reset();
    telemetry_.setSessionId(sessionId_);

    analyzer_ = LeakAnalyzer(config.memory, config.trendWindow);
    scorer_ = HealthScorer(config);
    reportGenerator_ = ReportGenerator(config);
    collector_ = std::make_unique<SnapshotCollector>(provider_, config.snapshotTimeoutMs, &telemetry_);
    tracker_ = std::make_unique<ComponentLifecycleTracker>(
        provider_,
        config.leakThresholds,
        config.componentCycleThresholdMB,
        config.componentCheckIntervalMs,
        [this](const LeakCandidate& candidate) { recordCandidate(candidate); });

    dispatcher_.attachLog(&data_.alerts);
    dispatcher_.setRemediationEnabled(config.enableAutomaticRemediation);

    const SnapshotResult baseline = collector_->establishBaseline(startedAtMs_);
    if (!baseline.success()) {
        status_ = SessionStatus::Error;
        endedAtMs_ = QDateTime::currentMSecsSinceEpoch();
        dispatcher_.attachLog(nullptr);
        releaseRegistry();
        result.error = {ErrorCode::SnapshotCollection,
            QString("Failed to establish baseline: %1").arg(baseline.error.message)};
        qCWarning(soakmonSession) << result.error.message;
        return result;
    }
    data_.snapshots.append(baseline.snapshot);

    snapshotTimer_.setInterval(timerIntervalMs(config.snapshotIntervalMs));
    healthTimer_.setInterval(timerIntervalMs(config.healthCheckIntervalMs));
    reportingTimer_.setInterval(timerIntervalMs(config.reportingIntervalMs));
    deadlineTimer_.setInterval(timerIntervalMs(config.sessionDurationMs));
    snapshotTimer_.start();
    healthTimer_.start();
    reportingTimer_.start();
    deadlineTimer_.start();

    status_ = SessionStatus::Running;
    telemetry_.recordEvent("session_started", QJsonObject{{"session_id", sessionId_}});
    qCInfo(soakmonSession) << "Session" << sessionId_ << "started for" << config.sessionDurationMs << "ms";

    SessionHandle handle;
    handle.sessionId = sessionId_;
    handle.startedAtMs = startedAtMs_;
    handle.durationMs = config.sessionDurationMs;
    handle.estimatedEndMs = startedAtMs_ + config.sessionDurationMs;
    result.handle = handle;
    return result;
}

StopResult SessionOrchestrator::stop() {
    StopResult result;
    if (status_ != SessionStatus::Running) {
        result.error = {ErrorCode::NoActiveSession, "No active session"};
        result.message = result.error.message;
        return result;
    }

    status_ = SessionStatus::Stopping;
    stopTimers();
    qCInfo(soakmonSession) << "Stopping session" << sessionId_;

    // Final delta checks run before the data is frozen.
    const int cleanupLeaks = tracker_->untrackAll();
    if (cleanupLeaks > 0) {
        qCWarning(soakmonSession) << cleanupLeaks << "unit(s) leaked on session stop";
    }
    if (!collectSnapshot()) {
        qCWarning(soakmonSession) << "Final snapshot skipped";
    }
    recordHealthCheck();

    endedAtMs_ = QDateTime::currentMSecsSinceEpoch();
    dispatcher_.attachLog(nullptr);

    SessionInfo info;
    info.sessionId = sessionId_;
    info.startedAtMs = startedAtMs_;
    info.endedAtMs = endedAtMs_;
    info.configuredDurationMs = config_.sessionDurationMs;
    lastReport_ = reportGenerator_.generate(data_, info);

    status_ = SessionStatus::Completed;
    releaseRegistry();
    telemetry_.recordEvent("session_completed",
        QJsonObject{
            {"session_id", sessionId_},
            {"grade", lastReport_->grade.grade},
        });
    qCInfo(soakmonSession) << "Session" << sessionId_ << "completed with grade" << lastReport_->grade.grade;

    result.message = "Session completed";
    result.report = lastReport_;
    emit sessionFinished(sessionId_);
    return result;
}

SessionStatusView SessionOrchestrator::status() const {
    SessionStatusView view;
    view.status = status_;
    view.progress = buildProgress(QDateTime::currentMSecsSinceEpoch());
    return view;
}

ProgressReport SessionOrchestrator::buildProgress(qint64 nowMs) const {
    ProgressReport report;
    report.sessionId = sessionId_;
    report.timestampMs = nowMs;
    report.elapsedMs = elapsedMs(nowMs);
    const qint64 duration = config_.sessionDurationMs;
    report.remainingMs = qMax<qint64>(0, duration - report.elapsedMs);
    report.progressPercent = duration > 0
        ? qMin(100.0, 100.0 * static_cast<double>(report.elapsedMs) / static_cast<double>(duration))
        : 0.0;
    report.snapshotCount = data_.snapshots.size();
    report.healthCheckCount = data_.healthChecks.size();
    report.alertCount = data_.alerts.size();
    report.leakCandidateCount = data_.leakCandidates.size();
    report.operationCount = data_.operations.size();
    report.trackedUnitCount = tracker_ ? tracker_->trackedCount() : 0;
    if (!data_.healthChecks.isEmpty()) {
        report.latestHealthScore = data_.healthChecks.last().score;
    }
    if (!data_.snapshots.isEmpty()) {
        report.latestMemoryMB = data_.snapshots.last().memoryUsedMB;
    }
    return report;
}

bool SessionOrchestrator::track(const QString& unitId, double initialSizeMB) {
    if (status_ != SessionStatus::Running) {
        return false;
    }
    return tracker_->track(unitId, initialSizeMB);
}

std::optional<LeakCandidate> SessionOrchestrator::untrack(const QString& unitId) {
    if (status_ != SessionStatus::Running) {
        return std::nullopt;
    }
    return tracker_->untrack(unitId);
}

bool SessionOrchestrator::recordOperation(OperationEvent event) {
    if (status_ != SessionStatus::Running) {
        return false;
    }
    if (event.timestampMs == 0) {
        event.timestampMs = QDateTime::currentMSecsSinceEpoch();
    }
    data_.operations.append(std::move(event));
    telemetry_.incrementCounter("operations.recorded");
    return true;
}

Unsubscribe SessionOrchestrator::subscribe(NotificationKind kind, Subscriber callback) {
    return dispatcher_.subscribe(kind, std::move(callback));
}

Unsubscribe SessionOrchestrator::subscribeToProgress(std::function<void(const ProgressReport&)> callback) {
    return dispatcher_.subscribe(NotificationKind::Progress, [callback](const Notification& n) {
        callback(std::get<ProgressReport>(n));
    });
}

Unsubscribe SessionOrchestrator::subscribeToAlerts(std::function<void(const Alert&)> callback) {
    return dispatcher_.subscribe(NotificationKind::Alert, [callback](const Notification& n) {
        callback(std::get<Alert>(n));
    });
}

Unsubscribe SessionOrchestrator::subscribeToHealthChecks(std::function<void(const HealthCheck&)> callback) {
    return dispatcher_.subscribe(NotificationKind::HealthCheck, [callback](const Notification& n) {
        callback(std::get<HealthCheck>(n));
    });
}

void SessionOrchestrator::setRemediationHook(RemediationHook hook) {
    dispatcher_.setRemediationHook(std::move(hook));
}

void SessionOrchestrator::runSnapshotCycle() {
    if (status_ != SessionStatus::Running) {
        return;
    }
    telemetry_.incrementCounter("cycles.snapshot");
    if (!collectSnapshot()) {
        telemetry_.incrementCounter("cycles.snapshot.skipped");
    }
    if (elapsedMs(QDateTime::currentMSecsSinceEpoch()) >= config_.sessionDurationMs) {
        qCInfo(soakmonSession) << "Session" << sessionId_ << "reached its configured duration";
        const StopResult result = stop();
        if (!result.success()) {
            qCWarning(soakmonSession) << "Automatic stop did not produce a report:" << result.message;
        }
    }
}

void SessionOrchestrator::runHealthCheckCycle() {
    if (status_ != SessionStatus::Running) {
        return;
    }
    telemetry_.incrementCounter("cycles.health");
    recordHealthCheck();
}

void SessionOrchestrator::runReportingCycle() {
    if (status_ != SessionStatus::Running) {
        return;
    }
    telemetry_.incrementCounter("cycles.reporting");
    const ProgressReport progress = buildProgress(QDateTime::currentMSecsSinceEpoch());
    qCInfo(soakmonSession).noquote()
        << QString("Session %1: %2% complete, %3 snapshots, %4 alerts")
               .arg(sessionId_)
               .arg(progress.progressPercent, 0, 'f', 1)
               .arg(progress.snapshotCount)
               .arg(progress.alertCount);
    dispatcher_.publish(progress);
}

bool SessionOrchestrator::collectSnapshot() {
    const SnapshotResult result = collector_->takeSnapshot(tracker_->trackedCount(), pendingRemediation_);
    if (!result.success()) {
        qCWarning(soakmonSession) << "Snapshot cycle skipped:" << result.error.message;
        return false;
    }
    pendingRemediation_.reset();
    data_.snapshots.append(result.snapshot);
    if (config_.enableLeakDetection) {
        analyzeSnapshot(result.snapshot);
    }
    return true;
}

void SessionOrchestrator::analyzeSnapshot(const Snapshot& snapshot) {
    const std::optional<Snapshot> baseline = collector_->baseline();
    if (!baseline) {
        return;
    }
    QVector<LeakCandidate> candidates;
    QString failure;
    try {
        candidates = analyzer_.analyzeSnapshot(snapshot, *baseline);
        const TrendResult trend = analyzer_.analyzeTrend(data_.snapshots);
        telemetry_.setGauge("trend.slope_mb_per_hour", trend.slopeMBPerHour);
        if (const std::optional<LeakCandidate> fromTrend = analyzer_.trendCandidate(trend, snapshot.timestampMs)) {
            candidates.append(*fromTrend);
        }
    } catch (const std::exception& ex) {
        failure = QString::fromUtf8(ex.what());
    }
    if (!failure.isEmpty()) {
        const Error error{ErrorCode::Analysis, failure};
        telemetry_.incrementCounter("cycles.analysis.failed");
        qCWarning(soakmonSession) << "Analysis skipped:" << error.message;
        return;
    }

    for (const LeakCandidate& candidate : candidates) {
        // Snapshot-level findings persist across cycles; report each once per severity level.
        const QString key = candidate.metrics.value("check").toString();
        const auto seen = reportedFindings_.constFind(key);
        if (seen != reportedFindings_.constEnd() && severityRank(*seen) >= severityRank(candidate.severity)) {
            continue;
        }
        reportedFindings_.insert(key, candidate.severity);
        recordCandidate(candidate);
    }
}

void SessionOrchestrator::recordCandidate(const LeakCandidate& candidate) {
    if (status_ != SessionStatus::Running && status_ != SessionStatus::Stopping) {
        return;
    }
    if (!config_.enableLeakDetection) {
        return;
    }
    data_.leakCandidates.append(candidate);
    telemetry_.incrementCounter("leaks." + leakTypeName(candidate.type));

    Alert alert;
    alert.type = "leak_" + leakTypeName(candidate.type);
    alert.severity = candidate.severity;
    alert.timestampMs = candidate.detectedAtMs;
    alert.details = candidate.toJson();
    alert.recommendations.append(candidate.recommendation);
    raise(std::move(alert));
}

void SessionOrchestrator::recordHealthCheck() {
    const HealthCheck check = scorer_.computeHealthScore(data_, QDateTime::currentMSecsSinceEpoch());
    data_.healthChecks.append(check);
    telemetry_.setGauge("health.score", check.score);
    qCDebug(soakmonSession) << "Health check score" << check.score << check.status;
    dispatcher_.publish(check);

    if (check.score >= config_.performance.minHealthScore) {
        return;
    }
    const Severity severity = check.score < 40 ? Severity::Critical : Severity::High;
    const auto seen = reportedFindings_.constFind("health");
    if (seen != reportedFindings_.constEnd() && severityRank(*seen) >= severityRank(severity)) {
        return;
    }
    reportedFindings_.insert("health", severity);

    Alert alert;
    alert.type = "low_health_score";
    alert.severity = severity;
    alert.timestampMs = check.timestampMs;
    alert.details = check.toJson();
    for (const HealthIssue& issue : check.issues) {
        alert.recommendations.append(issue.message);
    }
    raise(std::move(alert));
}

void SessionOrchestrator::raise(Alert alert) {
    const std::optional<RemediationOutcome> outcome = dispatcher_.raiseAlert(std::move(alert));
    if (!outcome) {
        return;
    }
    data_.remediations.append(*outcome);
    pendingRemediation_ = outcome;
    qCInfo(soakmonSession) << "Remediation" << outcome->action << (outcome->success ? "succeeded" : "failed")
                           << "reclaimed" << outcome->reclaimedMB << "MB";
}

}  // namespace soakmon
