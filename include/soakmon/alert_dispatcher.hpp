#pragma once

#include <QString>
#include <QVector>

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <variant>

#include "soakmon/types.hpp"

namespace soakmon {

class Telemetry;

enum class NotificationKind {
    Progress,
    Alert,
    HealthCheck,
};

QString notificationKindName(NotificationKind kind);

using Notification = std::variant<ProgressReport, Alert, HealthCheck>;

NotificationKind notificationKind(const Notification& notification);

using Subscriber = std::function<void(const Notification&)>;
using Unsubscribe = std::function<void()>;
using RemediationHook = std::function<std::optional<RemediationOutcome>(const Alert&)>;

// Appends alerts to the attached log and fans notifications out to
// subscribers in registration order. A throwing subscriber is logged and
// skipped; it never reaches the caller or the other subscribers.
class AlertDispatcher final {
public:
    explicit AlertDispatcher(Telemetry* telemetry = nullptr);

    AlertDispatcher(const AlertDispatcher&) = delete;
    AlertDispatcher& operator=(const AlertDispatcher&) = delete;

    // Alerts are dropped while no log is attached.
    void attachLog(QVector<Alert>* log) { log_ = log; }

    Unsubscribe subscribe(NotificationKind kind, Subscriber callback);

    // Returns the remediation outcome when the hook ran.
    std::optional<RemediationOutcome> raiseAlert(Alert alert);
    void publish(const Notification& notification);

    void setRemediationHook(RemediationHook hook) { remediationHook_ = std::move(hook); }
    void setRemediationEnabled(bool enabled) { remediationEnabled_ = enabled; }

    [[nodiscard]] int subscriberCount(NotificationKind kind) const;
    [[nodiscard]] int subscriberFailures() const { return subscriberFailures_; }

private:
    struct Registration {
        quint64 id = 0;
        NotificationKind kind = NotificationKind::Progress;
        Subscriber callback;
    };

    struct State {
        QVector<Registration> registrations;
        quint64 nextId = 1;
    };

    void deliver(const Notification& notification);
    std::optional<RemediationOutcome> runRemediation(const Alert& alert);

    std::shared_ptr<State> state_;
    QVector<Alert>* log_ = nullptr;
    Telemetry* telemetry_;
    RemediationHook remediationHook_;
    bool remediationEnabled_ = false;
    quint64 alertSequence_ = 0;
    int subscriberFailures_ = 0;
};

}  // namespace soakmon
