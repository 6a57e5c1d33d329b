#pragma once

#include <QJsonObject>
#include <QString>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include "soakmon/errors.hpp"
#include "soakmon/metrics_provider.hpp"
#include "soakmon/types.hpp"

namespace soakmon {

class Telemetry;

struct SnapshotResult {
    Snapshot snapshot;
    Error error;

    [[nodiscard]] bool success() const { return !error.isError(); }
    [[nodiscard]] QJsonObject toJson() const;
};

// Turns provider reads into Snapshots relative to a baseline. Reads run on the
// global thread pool and are abandoned after `timeoutMs`.
class SnapshotCollector final {
public:
    using Clock = std::function<qint64()>;

    SnapshotCollector(
        std::shared_ptr<MetricsProvider> provider,
        qint64 timeoutMs,
        Telemetry* telemetry = nullptr,
        Clock clock = {});

    SnapshotResult establishBaseline(qint64 sessionStartMs, int trackedUnitCount = 0);
    SnapshotResult takeSnapshot(
        int trackedUnitCount,
        const std::optional<RemediationOutcome>& remediation = std::nullopt);

    [[nodiscard]] bool hasBaseline() const { return baseline_.has_value(); }
    [[nodiscard]] std::optional<Snapshot> baseline() const { return baseline_; }
    [[nodiscard]] bool readInFlight() const { return inFlight_->load(); }

    void reset();

private:
    struct Reading {
        std::optional<MemorySample> memory;
        std::optional<StructuralCounts> structure;
        PerformanceSample performance;
        std::optional<int> connections;
        QString failure;
    };

    SnapshotResult collect(bool isBaseline, int trackedUnitCount);
    std::optional<Reading> readProvider(QString* error);

    std::shared_ptr<MetricsProvider> provider_;
    qint64 timeoutMs_;
    Telemetry* telemetry_;
    Clock clock_;

    std::shared_ptr<std::atomic_bool> inFlight_;
    std::optional<Snapshot> baseline_;
    qint64 sessionStartMs_ = 0;
    qint64 lastTimestampMs_ = 0;
};

}  // namespace soakmon
