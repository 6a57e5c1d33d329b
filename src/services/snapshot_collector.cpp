#include "soakmon/snapshot_collector.hpp"

#include <QDateTime>
#include <QElapsedTimer>
#include <QThreadPool>

#include <chrono>
#include <exception>
#include <future>
#include <utility>

#include "soakmon/logging.hpp"
#include "soakmon/telemetry.hpp"

namespace soakmon {

QJsonObject SnapshotResult::toJson() const {
    if (!success()) {
        return {
            {"success", false},
            {"error", error.toJson()},
        };
    }
    return {
        {"success", true},
        {"snapshot", snapshot.toJson()},
    };
}

SnapshotCollector::SnapshotCollector(
    std::shared_ptr<MetricsProvider> provider,
    qint64 timeoutMs,
    Telemetry* telemetry,
    Clock clock)
    : provider_(std::move(provider)),
      timeoutMs_(timeoutMs),
      telemetry_(telemetry),
      clock_(clock ? std::move(clock) : Clock([] { return QDateTime::currentMSecsSinceEpoch(); })),
      inFlight_(std::make_shared<std::atomic_bool>(false)) {}

void SnapshotCollector::reset() {
    baseline_.reset();
    sessionStartMs_ = 0;
    lastTimestampMs_ = 0;
}

std::optional<SnapshotCollector::Reading> SnapshotCollector::readProvider(QString* error) {
    if (!provider_) {
        *error = "No metrics provider configured.";
        return std::nullopt;
    }
    bool expected = false;
    if (!inFlight_->compare_exchange_strong(expected, true)) {
        *error = "Previous snapshot read is still in flight.";
        return std::nullopt;
    }

    auto promise = std::make_shared<std::promise<Reading>>();
    std::future<Reading> future = promise->get_future();
    std::shared_ptr<MetricsProvider> provider = provider_;
    std::shared_ptr<std::atomic_bool> inFlight = inFlight_;

    QThreadPool::globalInstance()->start([provider, promise, inFlight]() {
        Reading reading;
        try {
            reading.memory = provider->sampleMemory();
            reading.structure = provider->sampleStructuralCounts();
            reading.performance = provider->samplePerformance();
            reading.connections = provider->probeConnectionCount();
        } catch (const std::exception& ex) {
            reading.failure = QString("Metrics provider threw: %1").arg(QString::fromUtf8(ex.what()));
        } catch (...) {
            reading.failure = "Metrics provider threw an unknown exception.";
        }
        promise->set_value(std::move(reading));
        inFlight->store(false);
    });

    if (future.wait_for(std::chrono::milliseconds(timeoutMs_)) != std::future_status::ready) {
        *error = QString("Snapshot read timed out after %1 ms.").arg(timeoutMs_);
        return std::nullopt;
    }
    Reading reading = future.get();
    if (!reading.failure.isEmpty()) {
        *error = reading.failure;
        return std::nullopt;
    }
    if (!reading.memory) {
        *error = "Metrics provider returned no memory sample.";
        return std::nullopt;
    }
    return reading;
}

SnapshotResult SnapshotCollector::establishBaseline(qint64 sessionStartMs, int trackedUnitCount) {
    reset();
    sessionStartMs_ = sessionStartMs;
    lastTimestampMs_ = sessionStartMs;
    SnapshotResult result = collect(true, trackedUnitCount);
    if (result.success()) {
        baseline_ = result.snapshot;
        qCInfo(soakmonCollector) << "Baseline established at"
                                 << result.snapshot.memoryUsedMB << "MB";
    }
    return result;
}

SnapshotResult SnapshotCollector::takeSnapshot(
    int trackedUnitCount,
    const std::optional<RemediationOutcome>& remediation) {
    if (!baseline_) {
        SnapshotResult result;
        result.error = {ErrorCode::SnapshotCollection, "Baseline has not been established."};
        return result;
    }
    SnapshotResult result = collect(false, trackedUnitCount);
    if (result.success()) {
        result.snapshot.remediation = remediation;
    }
    return result;
}

SnapshotResult SnapshotCollector::collect(bool isBaseline, int trackedUnitCount) {
    SnapshotResult result;
    QElapsedTimer timer;
    timer.start();

    QString error;
    const std::optional<Reading> reading = readProvider(&error);
    if (telemetry_ != nullptr) {
        telemetry_->recordDurationMs("snapshot.read", timer.elapsed());
    }
    if (!reading) {
        result.error = {ErrorCode::SnapshotCollection, error};
        if (telemetry_ != nullptr) {
            telemetry_->incrementCounter("snapshot.failures");
        }
        qCWarning(soakmonCollector) << "Snapshot collection failed:" << error;
        return result;
    }

    // Wall clocks can step backwards; the series must not.
    const qint64 now = qMax(clock_(), lastTimestampMs_);
    lastTimestampMs_ = now;

    Snapshot& snap = result.snapshot;
    snap.timestampMs = now;
    snap.elapsedMs = now - sessionStartMs_;
    snap.isBaseline = isBaseline;
    snap.memoryUsedMB = reading->memory->usedMB;
    snap.memoryTotalMB = reading->memory->totalMB;
    snap.memoryCapacityMB = reading->memory->capacityMB;
    snap.utilizationPercent = snap.memoryCapacityMB > 0.0
        ? 100.0 * snap.memoryUsedMB / snap.memoryCapacityMB
        : 0.0;
    snap.trackedUnitCount = trackedUnitCount;
    if (reading->structure) {
        snap.structuralCounts = reading->structure->counts;
        snap.structuralTotal = reading->structure->total();
    }
    snap.growthFromBaselineMB = baseline_ ? snap.memoryUsedMB - baseline_->memoryUsedMB : 0.0;
    snap.frameRate = reading->performance.frameRate;
    snap.responseTimeMs = reading->performance.responseTimeMs;
    snap.connectionCount = reading->connections;

    if (telemetry_ != nullptr) {
        telemetry_->incrementCounter("snapshot.collected");
        telemetry_->setGauge("memory.used_mb", snap.memoryUsedMB);
        telemetry_->setGauge("memory.utilization_percent", snap.utilizationPercent);
    }
    qCDebug(soakmonCollector) << "Snapshot" << snap.memoryUsedMB << "MB, growth"
                              << snap.growthFromBaselineMB << "MB";
    return result;
}

}  // namespace soakmon
