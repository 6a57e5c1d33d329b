#pragma once

#include <QJsonObject>
#include <QMap>
#include <QObject>
#include <QString>
#include <QTimer>

#include <memory>
#include <optional>

#include "soakmon/alert_dispatcher.hpp"
#include "soakmon/errors.hpp"
#include "soakmon/health_scorer.hpp"
#include "soakmon/leak_analyzer.hpp"
#include "soakmon/lifecycle_tracker.hpp"
#include "soakmon/metrics_provider.hpp"
#include "soakmon/report_generator.hpp"
#include "soakmon/session_config.hpp"
#include "soakmon/session_registry.hpp"
#include "soakmon/snapshot_collector.hpp"
#include "soakmon/telemetry.hpp"
#include "soakmon/types.hpp"

namespace soakmon {

struct SessionHandle {
    QString sessionId;
    qint64 startedAtMs = 0;
    qint64 durationMs = 0;
    qint64 estimatedEndMs = 0;

    [[nodiscard]] QJsonObject toJson() const;
};

struct StartResult {
    std::optional<SessionHandle> handle;
    Error error;

    [[nodiscard]] bool success() const { return !error.isError() && handle.has_value(); }
    [[nodiscard]] QJsonObject toJson() const;
};

struct StopResult {
    Error error;
    QString message;
    std::optional<FinalReport> report;

    [[nodiscard]] bool success() const { return !error.isError() && report.has_value(); }
    [[nodiscard]] bool noActiveSession() const { return error.code == ErrorCode::NoActiveSession; }
    [[nodiscard]] QJsonObject toJson() const;
};

struct SessionStatusView {
    SessionStatus status = SessionStatus::Idle;
    ProgressReport progress;

    [[nodiscard]] QJsonObject toJson() const;
};

// Owns one session at a time: schedules the snapshot, health-check and
// reporting cycles, aggregates SessionData and produces the final report.
//
// State machine: Idle -> Initializing -> Running -> Stopping -> Completed,
// with Error when the baseline cannot be taken. A new session may start from
// Idle, Completed or Error.
class SessionOrchestrator final : public QObject {
    Q_OBJECT

public:
    explicit SessionOrchestrator(
        std::shared_ptr<MetricsProvider> provider,
        std::shared_ptr<SessionRegistry> registry = nullptr,
        QObject* parent = nullptr);
    ~SessionOrchestrator() override;

    StartResult start(const SessionConfig& config);
    StopResult stop();

    [[nodiscard]] SessionStatus state() const { return status_; }
    [[nodiscard]] bool isActive() const;
    [[nodiscard]] SessionStatusView status() const;
    [[nodiscard]] SessionData sessionData() const { return data_; }
    [[nodiscard]] std::optional<FinalReport> lastReport() const { return lastReport_; }
    [[nodiscard]] const Telemetry& telemetry() const { return telemetry_; }

    // Workload-facing surface.
    bool track(const QString& unitId, double initialSizeMB);
    std::optional<LeakCandidate> untrack(const QString& unitId);
    bool recordOperation(OperationEvent event);

    Unsubscribe subscribe(NotificationKind kind, Subscriber callback);
    Unsubscribe subscribeToProgress(std::function<void(const ProgressReport&)> callback);
    Unsubscribe subscribeToAlerts(std::function<void(const Alert&)> callback);
    Unsubscribe subscribeToHealthChecks(std::function<void(const HealthCheck&)> callback);
    void setRemediationHook(RemediationHook hook);

    // Cycle bodies; the timers call these and they are no-ops unless Running.
    void runSnapshotCycle();
    void runHealthCheckCycle();
    void runReportingCycle();

signals:
    void sessionFinished(const QString& sessionId);

private:
    void stopTimers();
    void releaseRegistry();
    [[nodiscard]] qint64 elapsedMs(qint64 nowMs) const;
    [[nodiscard]] ProgressReport buildProgress(qint64 nowMs) const;

    bool collectSnapshot();
    void analyzeSnapshot(const Snapshot& snapshot);
    void recordCandidate(const LeakCandidate& candidate);
    void recordHealthCheck();
    void raise(Alert alert);

    std::shared_ptr<MetricsProvider> provider_;
    std::shared_ptr<SessionRegistry> registry_;

    SessionConfig config_;
    Telemetry telemetry_;
    AlertDispatcher dispatcher_;
    LeakAnalyzer analyzer_;
    HealthScorer scorer_;
    ReportGenerator reportGenerator_;
    std::unique_ptr<SnapshotCollector> collector_;
    std::unique_ptr<ComponentLifecycleTracker> tracker_;

    QTimer snapshotTimer_;
    QTimer healthTimer_;
    QTimer reportingTimer_;
    QTimer deadlineTimer_;

    SessionStatus status_ = SessionStatus::Idle;
    QString sessionId_;
    qint64 startedAtMs_ = 0;
    qint64 endedAtMs_ = 0;
    SessionData data_;
    // Highest severity already reported per snapshot-level finding.
    QMap<QString, Severity> reportedFindings_;
    std::optional<RemediationOutcome> pendingRemediation_;
    std::optional<FinalReport> lastReport_;
};

}  // namespace soakmon
