#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonObject>

#include <stdexcept>
#include <string>

#include "soakmon/alert_dispatcher.hpp"
#include "soakmon/telemetry.hpp"

using soakmon::Alert;
using soakmon::AlertDispatcher;
using soakmon::HealthCheck;
using soakmon::Notification;
using soakmon::NotificationKind;
using soakmon::ProgressReport;
using soakmon::RemediationOutcome;
using soakmon::Severity;
using soakmon::Telemetry;
using soakmon::Unsubscribe;

namespace {

Alert makeAlert(Severity severity, const QString& type = "leak_trend_growth") {
    Alert alert;
    alert.type = type;
    alert.severity = severity;
    return alert;
}

}  // namespace

class AlertDispatcherTest : public ::testing::Test {
protected:
    AlertDispatcherTest() : dispatcher(&telemetry) { dispatcher.attachLog(&log); }

    Telemetry telemetry;
    QVector<Alert> log;
    AlertDispatcher dispatcher;
};

TEST_F(AlertDispatcherTest, AppendsThenNotifiesInRegistrationOrder) {
    std::string order;
    const Unsubscribe a = dispatcher.subscribe(NotificationKind::Alert, [&](const Notification& n) {
        EXPECT_EQ(log.size(), 1);
        EXPECT_EQ(std::get<Alert>(n).severity, Severity::High);
        order += "a";
    });
    const Unsubscribe b = dispatcher.subscribe(NotificationKind::Alert, [&](const Notification&) { order += "b"; });

    dispatcher.raiseAlert(makeAlert(Severity::High));
    EXPECT_EQ(order, "ab");
    ASSERT_EQ(log.size(), 1);
    EXPECT_FALSE(log.first().id.isEmpty());
    EXPECT_GT(log.first().timestampMs, 0);
}

TEST_F(AlertDispatcherTest, ThrowingSubscriberDoesNotStopOthers) {
    int delivered = 0;
    const Unsubscribe bad = dispatcher.subscribe(NotificationKind::Alert, [](const Notification&) {
        throw std::runtime_error("subscriber failure");
    });
    const Unsubscribe good = dispatcher.subscribe(NotificationKind::Alert, [&](const Notification&) { ++delivered; });

    EXPECT_NO_THROW(dispatcher.raiseAlert(makeAlert(Severity::Low)));
    EXPECT_EQ(delivered, 1);
    EXPECT_EQ(dispatcher.subscriberFailures(), 1);
    EXPECT_EQ(telemetry.counter("subscriber.failures"), 1);
    EXPECT_EQ(log.size(), 1);
    const QJsonArray events = telemetry.snapshot().value("events").toArray();
    ASSERT_FALSE(events.isEmpty());
    const QJsonObject failure = events.last().toObject();
    EXPECT_EQ(failure.value("type").toString(), "subscriber_error");
    EXPECT_EQ(failure.value("error").toObject().value("code").toString(), "subscriber_error");
    EXPECT_EQ(failure.value("error").toObject().value("message").toString(), "subscriber failure");
}

TEST_F(AlertDispatcherTest, UnsubscribeIsIdempotent) {
    int calls = 0;
    const Unsubscribe unsubscribe =
        dispatcher.subscribe(NotificationKind::Alert, [&](const Notification&) { ++calls; });
    dispatcher.raiseAlert(makeAlert(Severity::Low));
    unsubscribe();
    unsubscribe();
    dispatcher.raiseAlert(makeAlert(Severity::Low));
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(dispatcher.subscriberCount(NotificationKind::Alert), 0);
}

TEST(AlertDispatcherLifetimeTest, UnsubscribeAfterDispatcherIsGone) {
    Unsubscribe unsubscribe;
    {
        AlertDispatcher dispatcher;
        unsubscribe = dispatcher.subscribe(NotificationKind::Progress, [](const Notification&) {});
    }
    EXPECT_NO_THROW(unsubscribe());
}

TEST_F(AlertDispatcherTest, KindsAreRoutedSeparately) {
    int progress = 0;
    int health = 0;
    int alerts = 0;
    const Unsubscribe p = dispatcher.subscribe(NotificationKind::Progress, [&](const Notification&) { ++progress; });
    const Unsubscribe h = dispatcher.subscribe(NotificationKind::HealthCheck, [&](const Notification&) { ++health; });
    const Unsubscribe a = dispatcher.subscribe(NotificationKind::Alert, [&](const Notification&) { ++alerts; });

    dispatcher.publish(ProgressReport{});
    dispatcher.publish(HealthCheck{});
    dispatcher.publish(HealthCheck{});
    EXPECT_EQ(progress, 1);
    EXPECT_EQ(health, 2);
    EXPECT_EQ(alerts, 0);
}

TEST_F(AlertDispatcherTest, DetachedLogDropsAlerts) {
    int calls = 0;
    const Unsubscribe a = dispatcher.subscribe(NotificationKind::Alert, [&](const Notification&) { ++calls; });
    dispatcher.attachLog(nullptr);
    dispatcher.raiseAlert(makeAlert(Severity::Critical));
    EXPECT_TRUE(log.isEmpty());
    EXPECT_EQ(calls, 0);
}

TEST_F(AlertDispatcherTest, RemediationRunsOnlyForHighSeverityWhenEnabled) {
    int hookCalls = 0;
    dispatcher.setRemediationHook([&](const Alert&) {
        ++hookCalls;
        RemediationOutcome outcome;
        outcome.success = true;
        outcome.reclaimedMB = 12.5;
        outcome.action = "trim_caches";
        return std::optional<RemediationOutcome>(outcome);
    });

    EXPECT_FALSE(dispatcher.raiseAlert(makeAlert(Severity::Critical)).has_value());
    dispatcher.setRemediationEnabled(true);
    EXPECT_FALSE(dispatcher.raiseAlert(makeAlert(Severity::Medium)).has_value());

    const auto outcome = dispatcher.raiseAlert(makeAlert(Severity::High));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_TRUE(outcome->success);
    EXPECT_DOUBLE_EQ(outcome->reclaimedMB, 12.5);
    EXPECT_EQ(outcome->alertId, log.last().id);
    EXPECT_EQ(hookCalls, 1);
}

TEST_F(AlertDispatcherTest, ThrowingRemediationHookIsContained) {
    dispatcher.setRemediationEnabled(true);
    dispatcher.setRemediationHook([](const Alert&) -> std::optional<RemediationOutcome> {
        throw std::runtime_error("gc unavailable");
    });
    std::optional<RemediationOutcome> outcome;
    EXPECT_NO_THROW(outcome = dispatcher.raiseAlert(makeAlert(Severity::Critical)));
    ASSERT_TRUE(outcome.has_value());
    EXPECT_FALSE(outcome->success);
    EXPECT_EQ(telemetry.counter("remediation.failures"), 1);
}
