#include "soakmon/lifecycle_tracker.hpp"

#include <QDateTime>

#include <utility>

#include "soakmon/leak_analyzer.hpp"
#include "soakmon/logging.hpp"

namespace soakmon {

ComponentLifecycleTracker::ComponentLifecycleTracker(
    std::shared_ptr<MetricsProvider> provider,
    LeakThresholds thresholds,
    double cycleThresholdMB,
    qint64 checkIntervalMs,
    CandidateSink sink,
    Clock clock)
    : provider_(std::move(provider)),
      thresholds_(thresholds),
      cycleThresholdMB_(cycleThresholdMB),
      checkIntervalMs_(checkIntervalMs),
      sink_(std::move(sink)),
      clock_(clock ? std::move(clock) : Clock([] { return QDateTime::currentMSecsSinceEpoch(); })) {}

ComponentLifecycleTracker::~ComponentLifecycleTracker() {
    for (auto& entry : records_) {
        if (entry.second.monitor) {
            entry.second.monitor->stop();
        }
    }
}

bool ComponentLifecycleTracker::track(const QString& unitId, double initialSizeMB) {
    if (unitId.isEmpty() || records_.count(unitId) > 0) {
        qCWarning(soakmonTracker) << "Refusing to track unit" << unitId;
        return false;
    }

    ComponentRecord record;
    record.unitId = unitId;
    record.createdAtMs = clock_();
    record.initialSizeMB = initialSizeMB;
    record.lastSizeEstimateMB = initialSizeMB;
    record.lastMeasuredAtMs = record.createdAtMs;
    record.monitor = std::make_unique<QTimer>();
    record.monitor->setInterval(timerIntervalMs(checkIntervalMs_));

    QTimer* timer = record.monitor.get();
    QObject::connect(timer, &QTimer::timeout, timer, [this, unitId]() {
        remeasure(unitId);
    });
    timer->start();

    records_.emplace(unitId, std::move(record));
    qCDebug(soakmonTracker) << "Tracking unit" << unitId << "at" << initialSizeMB << "MB";
    return true;
}

std::optional<LeakCandidate> ComponentLifecycleTracker::remeasure(const QString& unitId) {
    auto it = records_.find(unitId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    ComponentRecord& record = it->second;

    const std::optional<double> current = provider_ ? provider_->sampleUnitSizeMB(unitId) : std::nullopt;
    if (!current) {
        return std::nullopt;
    }

    const qint64 now = clock_();
    const double growth = *current - record.lastSizeEstimateMB;
    const double previous = record.lastSizeEstimateMB;
    const qint64 sinceLastMs = now - record.lastMeasuredAtMs;
    record.lastSizeEstimateMB = *current;
    record.lastMeasuredAtMs = now;

    if (growth <= cycleThresholdMB_) {
        return std::nullopt;
    }

    LeakCandidate candidate;
    candidate.type = LeakType::ComponentLeak;
    candidate.severity = thresholds_.classify(growth).value_or(Severity::Low);
    candidate.detectedAtMs = now;
    candidate.recommendation = leakRecommendation(LeakType::ComponentLeak);
    candidate.severityScore = severityScore(candidate.severity);
    candidate.metrics = QJsonObject{
        {"phase", "runtime"},
        {"unit_id", unitId},
        {"growth_mb", growth},
        {"previous_size_mb", previous},
        {"current_size_mb", *current},
        {"growth_rate_mb_per_s", sinceLastMs > 0 ? growth / (static_cast<double>(sinceLastMs) / 1000.0) : 0.0},
        {"age_ms", static_cast<double>(now - record.createdAtMs)},
    };
    qCWarning(soakmonTracker) << "Unit" << unitId << "grew" << growth << "MB in one cycle";
    emitCandidate(candidate);
    return candidate;
}

LeakCandidate ComponentLifecycleTracker::finalCheck(ComponentRecord& record, bool* leaked) {
    if (record.monitor) {
        record.monitor->stop();
    }

    const std::optional<double> sample = provider_ ? provider_->sampleUnitSizeMB(record.unitId) : std::nullopt;
    const double finalSize = sample.value_or(record.lastSizeEstimateMB);
    const double delta = finalSize - record.initialSizeMB;
    const qint64 now = clock_();

    double efficiency = 100.0;
    if (delta > 0.0 && record.initialSizeMB > 0.0) {
        efficiency = qMax(0.0, 100.0 - (delta / record.initialSizeMB) * 100.0);
    } else if (delta > 0.0) {
        efficiency = 0.0;
    }

    LeakCandidate candidate;
    candidate.type = LeakType::ComponentLeak;
    candidate.detectedAtMs = now;
    candidate.recommendation = leakRecommendation(LeakType::ComponentLeak);
    candidate.metrics = QJsonObject{
        {"phase", "cleanup"},
        {"unit_id", record.unitId},
        {"initial_size_mb", record.initialSizeMB},
        {"final_size_mb", finalSize},
        {"delta_mb", delta},
        {"cleanup_efficiency_percent", efficiency},
        {"final_size_measured", sample.has_value()},
        {"lifetime_ms", static_cast<double>(now - record.createdAtMs)},
    };

    *leaked = delta > thresholds_.mediumMB;
    if (*leaked) {
        candidate.severity = thresholds_.classify(delta).value_or(Severity::Medium);
        candidate.severityScore = severityScore(candidate.severity);
    }
    return candidate;
}

std::optional<LeakCandidate> ComponentLifecycleTracker::untrack(const QString& unitId) {
    auto it = records_.find(unitId);
    if (it == records_.end()) {
        qCDebug(soakmonTracker) << "Untrack of unknown unit" << unitId;
        return std::nullopt;
    }

    bool leaked = false;
    const LeakCandidate candidate = finalCheck(it->second, &leaked);
    records_.erase(it);

    if (!leaked) {
        return std::nullopt;
    }
    qCWarning(soakmonTracker) << "Unit" << unitId << "retained"
                              << candidate.metrics.value("delta_mb").toDouble() << "MB after cleanup";
    emitCandidate(candidate);
    return candidate;
}

int ComponentLifecycleTracker::untrackAll() {
    int leaks = 0;
    while (!records_.empty()) {
        const QString unitId = records_.begin()->first;
        if (untrack(unitId)) {
            ++leaks;
        }
    }
    return leaks;
}

bool ComponentLifecycleTracker::isTracked(const QString& unitId) const {
    return records_.count(unitId) > 0;
}

int ComponentLifecycleTracker::activeMonitorCount() const {
    int active = 0;
    for (const auto& entry : records_) {
        if (entry.second.monitor && entry.second.monitor->isActive()) {
            ++active;
        }
    }
    return active;
}

std::optional<double> ComponentLifecycleTracker::lastSizeEstimate(const QString& unitId) const {
    const auto it = records_.find(unitId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.lastSizeEstimateMB;
}

void ComponentLifecycleTracker::emitCandidate(const LeakCandidate& candidate) const {
    if (sink_) {
        sink_(candidate);
    }
}

}  // namespace soakmon
