#pragma once

#include <QJsonObject>
#include <QMap>
#include <QMutex>
#include <QString>
#include <QVector>

namespace soakmon {

// Counters, gauges, duration stats and a bounded event ring for one session.
// Thread-safe; snapshot reads run on pool threads and record here.
class Telemetry final {
public:
    explicit Telemetry(int maxEvents = 1500);

    void setSessionId(const QString& sessionId);
    void incrementCounter(const QString& key, qint64 delta = 1);
    void setGauge(const QString& key, double value);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});
    void reset();

    [[nodiscard]] qint64 counter(const QString& key) const;
    [[nodiscard]] int eventCount() const;
    [[nodiscard]] QJsonObject snapshot() const;
    QJsonObject exportToFile(const QString& filePath) const;

private:
    struct DurationStats {
        qint64 count = 0;
        qint64 totalMs = 0;
        qint64 minMs = 0;
        qint64 maxMs = 0;
    };

    mutable QMutex mutex_;
    QString sessionId_;
    QMap<QString, qint64> counters_;
    QMap<QString, double> gauges_;
    QMap<QString, DurationStats> durations_;
    QVector<QJsonObject> events_;
    int maxEvents_;
};

}  // namespace soakmon
