#include "soakmon/telemetry.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>

namespace soakmon {

namespace {

QJsonObject exportFailure(const QString& error, const QString& path) {
    return {
        {"success", false},
        {"error", error},
        {"path", path},
    };
}

}  // namespace

Telemetry::Telemetry(int maxEvents)
    : maxEvents_(qMax(1, maxEvents)) {}

void Telemetry::setSessionId(const QString& sessionId) {
    QMutexLocker lock(&mutex_);
    sessionId_ = sessionId;
}

void Telemetry::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    counters_[key] += delta;
}

void Telemetry::setGauge(const QString& key, double value) {
    QMutexLocker lock(&mutex_);
    gauges_.insert(key, value);
}

void Telemetry::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    DurationStats& stats = durations_[key];
    stats.minMs = stats.count == 0 ? durationMs : qMin(stats.minMs, durationMs);
    stats.maxMs = qMax(stats.maxMs, durationMs);
    stats.totalMs += durationMs;
    ++stats.count;
}

void Telemetry::recordEvent(const QString& type, const QJsonObject& payload) {
    QMutexLocker lock(&mutex_);
    QJsonObject row = payload;
    row.insert("type", type);
    row.insert("epoch_ms", static_cast<double>(QDateTime::currentMSecsSinceEpoch()));
    events_.append(row);
    if (events_.size() > maxEvents_) {
        events_.erase(events_.begin(), events_.begin() + (events_.size() - maxEvents_));
    }
}

void Telemetry::reset() {
    QMutexLocker lock(&mutex_);
    sessionId_.clear();
    counters_.clear();
    gauges_.clear();
    durations_.clear();
    events_.clear();
}

qint64 Telemetry::counter(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return counters_.value(key, 0);
}

int Telemetry::eventCount() const {
    QMutexLocker lock(&mutex_);
    return static_cast<int>(events_.size());
}

QJsonObject Telemetry::snapshot() const {
    QMutexLocker lock(&mutex_);
    QJsonObject counters;
    for (auto it = counters_.constBegin(); it != counters_.constEnd(); ++it) {
        counters.insert(it.key(), static_cast<double>(it.value()));
    }
    QJsonObject gauges;
    for (auto it = gauges_.constBegin(); it != gauges_.constEnd(); ++it) {
        gauges.insert(it.key(), it.value());
    }
    QJsonObject durations;
    for (auto it = durations_.constBegin(); it != durations_.constEnd(); ++it) {
        const DurationStats& stats = it.value();
        durations.insert(it.key(),
            QJsonObject{
                {"count", static_cast<double>(stats.count)},
                {"min_ms", static_cast<double>(stats.minMs)},
                {"max_ms", static_cast<double>(stats.maxMs)},
                {"avg_ms", stats.count > 0 ? static_cast<double>(stats.totalMs) / stats.count : 0.0},
            });
    }
    QJsonArray events;
    for (const QJsonObject& row : events_) {
        events.append(row);
    }
    return {
        {"session_id", sessionId_},
        {"counters", counters},
        {"gauges", gauges},
        {"durations", durations},
        {"events", events},
        {"timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate)},
    };
}

QJsonObject Telemetry::exportToFile(const QString& filePath) const {
    const QByteArray bytes = QJsonDocument(snapshot()).toJson(QJsonDocument::Indented);

    const QDir dir = QFileInfo(filePath).absoluteDir();
    if (!dir.exists() && !QDir().mkpath(dir.absolutePath())) {
        return exportFailure("Failed to create telemetry export directory.", filePath);
    }
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return exportFailure("Failed to open telemetry export path.", filePath);
    }
    if (file.write(bytes) != bytes.size()) {
        return exportFailure("Failed to write telemetry export.", filePath);
    }
    file.close();
    return {
        {"success", true},
        {"path", filePath},
        {"bytes", static_cast<double>(bytes.size())},
    };
}

}  // namespace soakmon
