#pragma once

#include <QString>
#include <QTimer>

#include <functional>
#include <map>
#include <memory>
#include <optional>

#include "soakmon/metrics_provider.hpp"
#include "soakmon/session_config.hpp"
#include "soakmon/types.hpp"

namespace soakmon {

// Follows the footprint of application-defined units from creation to
// destruction. Each tracked unit owns a periodic re-measurement timer; every
// removal path runs one final delta check against the initial estimate.
class ComponentLifecycleTracker final {
public:
    using CandidateSink = std::function<void(const LeakCandidate&)>;
    using Clock = std::function<qint64()>;

    ComponentLifecycleTracker(
        std::shared_ptr<MetricsProvider> provider,
        LeakThresholds thresholds,
        double cycleThresholdMB,
        qint64 checkIntervalMs,
        CandidateSink sink,
        Clock clock = {});
    ~ComponentLifecycleTracker();

    ComponentLifecycleTracker(const ComponentLifecycleTracker&) = delete;
    ComponentLifecycleTracker& operator=(const ComponentLifecycleTracker&) = delete;

    bool track(const QString& unitId, double initialSizeMB);
    std::optional<LeakCandidate> untrack(const QString& unitId);
    int untrackAll();

    // Invoked by the unit's timer; public so callers can force a cycle.
    std::optional<LeakCandidate> remeasure(const QString& unitId);

    [[nodiscard]] int trackedCount() const { return static_cast<int>(records_.size()); }
    [[nodiscard]] bool isTracked(const QString& unitId) const;
    [[nodiscard]] int activeMonitorCount() const;
    [[nodiscard]] std::optional<double> lastSizeEstimate(const QString& unitId) const;

private:
    struct ComponentRecord {
        QString unitId;
        qint64 createdAtMs = 0;
        double initialSizeMB = 0.0;
        double lastSizeEstimateMB = 0.0;
        qint64 lastMeasuredAtMs = 0;
        std::unique_ptr<QTimer> monitor;
    };

    LeakCandidate finalCheck(ComponentRecord& record, bool* leaked);
    void emitCandidate(const LeakCandidate& candidate) const;

    std::shared_ptr<MetricsProvider> provider_;
    LeakThresholds thresholds_;
    double cycleThresholdMB_;
    qint64 checkIntervalMs_;
    CandidateSink sink_;
    Clock clock_;
    std::map<QString, ComponentRecord> records_;
};

}  // namespace soakmon
