#include "soakmon/alert_dispatcher.hpp"

#include <QDateTime>

#include <exception>
#include <utility>

#include "soakmon/errors.hpp"
#include "soakmon/logging.hpp"
#include "soakmon/telemetry.hpp"

namespace soakmon {

QString notificationKindName(NotificationKind kind) {
    switch (kind) {
    case NotificationKind::Progress:
        return "progress";
    case NotificationKind::Alert:
        return "alert";
    case NotificationKind::HealthCheck:
        return "health_check";
    }
    return "unknown";
}

NotificationKind notificationKind(const Notification& notification) {
    switch (notification.index()) {
    case 0:
        return NotificationKind::Progress;
    case 1:
        return NotificationKind::Alert;
    default:
        return NotificationKind::HealthCheck;
    }
}

AlertDispatcher::AlertDispatcher(Telemetry* telemetry)
    : state_(std::make_shared<State>()),
      telemetry_(telemetry) {}

Unsubscribe AlertDispatcher::subscribe(NotificationKind kind, Subscriber callback) {
    const quint64 id = state_->nextId++;
    state_->registrations.append(Registration{id, kind, std::move(callback)});

    std::weak_ptr<State> weak = state_;
    return [weak, id]() {
        const std::shared_ptr<State> state = weak.lock();
        if (!state) {
            return;
        }
        for (int i = 0; i < state->registrations.size(); ++i) {
            if (state->registrations[i].id == id) {
                state->registrations.removeAt(i);
                return;
            }
        }
    };
}

int AlertDispatcher::subscriberCount(NotificationKind kind) const {
    int count = 0;
    for (const Registration& reg : state_->registrations) {
        if (reg.kind == kind) {
            ++count;
        }
    }
    return count;
}

void AlertDispatcher::deliver(const Notification& notification) {
    const NotificationKind kind = notificationKind(notification);
    // Callbacks may unsubscribe while we iterate.
    const QVector<Registration> targets = state_->registrations;
    for (const Registration& reg : targets) {
        if (reg.kind != kind || !reg.callback) {
            continue;
        }
        QString failure;
        try {
            reg.callback(notification);
        } catch (const std::exception& ex) {
            failure = QString::fromUtf8(ex.what());
        } catch (...) {
            failure = "unknown exception";
        }
        if (failure.isEmpty()) {
            continue;
        }
        ++subscriberFailures_;
        qCWarning(soakmonAlerts) << "Subscriber" << reg.id << "for" << notificationKindName(kind)
                                 << "failed:" << failure;
        if (telemetry_ != nullptr) {
            telemetry_->incrementCounter("subscriber.failures");
            const Error error{ErrorCode::Subscriber, failure};
            telemetry_->recordEvent("subscriber_error",
                QJsonObject{
                    {"kind", notificationKindName(kind)},
                    {"subscriber", static_cast<double>(reg.id)},
                    {"error", error.toJson()},
                });
        }
    }
}

void AlertDispatcher::publish(const Notification& notification) {
    deliver(notification);
}

std::optional<RemediationOutcome> AlertDispatcher::raiseAlert(Alert alert) {
    if (log_ == nullptr) {
        qCDebug(soakmonAlerts) << "Dropping alert" << alert.type << "with no attached log";
        return std::nullopt;
    }
    if (alert.id.isEmpty()) {
        alert.id = QString("alert-%1").arg(++alertSequence_);
    }
    if (alert.timestampMs == 0) {
        alert.timestampMs = QDateTime::currentMSecsSinceEpoch();
    }
    log_->append(alert);

    qCInfo(soakmonAlerts) << "Alert" << alert.id << alert.type << severityName(alert.severity);
    if (telemetry_ != nullptr) {
        telemetry_->incrementCounter("alerts." + severityName(alert.severity));
        telemetry_->recordEvent("alert",
            QJsonObject{
                {"id", alert.id},
                {"alert_type", alert.type},
                {"severity", severityName(alert.severity)},
            });
    }

    deliver(alert);
    return runRemediation(alert);
}

std::optional<RemediationOutcome> AlertDispatcher::runRemediation(const Alert& alert) {
    if (!remediationEnabled_ || !remediationHook_ || severityRank(alert.severity) < severityRank(Severity::High)) {
        return std::nullopt;
    }

    std::optional<RemediationOutcome> outcome;
    QString failure;
    try {
        outcome = remediationHook_(alert);
    } catch (const std::exception& ex) {
        failure = QString::fromUtf8(ex.what());
    } catch (...) {
        failure = "unknown exception";
    }
    if (!failure.isEmpty()) {
        qCWarning(soakmonAlerts) << "Remediation hook failed for" << alert.id << ":" << failure;
        if (telemetry_ != nullptr) {
            telemetry_->incrementCounter("remediation.failures");
        }
        RemediationOutcome failed;
        failed.success = false;
        failed.action = "hook_error: " + failure;
        failed.alertId = alert.id;
        failed.timestampMs = QDateTime::currentMSecsSinceEpoch();
        return failed;
    }
    if (!outcome) {
        return std::nullopt;
    }
    outcome->alertId = alert.id;
    if (outcome->timestampMs == 0) {
        outcome->timestampMs = QDateTime::currentMSecsSinceEpoch();
    }
    if (telemetry_ != nullptr) {
        telemetry_->incrementCounter("remediation.runs");
    }
    return outcome;
}

}  // namespace soakmon
