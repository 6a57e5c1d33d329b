#pragma once

#include <QString>

#include <optional>

#include "soakmon/types.hpp"

namespace soakmon {

// Host capability the collector and tracker read from. Implementations must be
// thread-safe: a timed-out snapshot read can still be running on a pool thread
// while the tracker probes unit sizes from the owning thread.
//
// Only memory and structural counts are required. The remaining probes are
// best effort: an empty optional means "not measured", never zero.
class MetricsProvider {
public:
    virtual ~MetricsProvider() = default;

    virtual std::optional<MemorySample> sampleMemory() = 0;
    virtual std::optional<StructuralCounts> sampleStructuralCounts() = 0;

    virtual PerformanceSample samplePerformance() { return {}; }
    virtual std::optional<int> probeConnectionCount() { return std::nullopt; }
    virtual std::optional<double> sampleUnitSizeMB(const QString& unitId) {
        Q_UNUSED(unitId);
        return std::nullopt;
    }
};

}  // namespace soakmon
