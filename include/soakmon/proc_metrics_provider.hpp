#pragma once

#include <QMap>
#include <QString>

#include "soakmon/metrics_provider.hpp"

namespace soakmon {

// Reads process metrics from procfs and the cgroup v2 hierarchy.
class ProcMetricsProvider final : public MetricsProvider {
public:
    // `pid` of -1 samples the calling process. `procRoot` and `cgroupRoot`
    // are overridable so tests can point at a fixture tree.
    explicit ProcMetricsProvider(
        qint64 pid = -1,
        QString procRoot = "/proc",
        QString cgroupRoot = "/sys/fs/cgroup");

    std::optional<MemorySample> sampleMemory() override;
    std::optional<StructuralCounts> sampleStructuralCounts() override;
    std::optional<int> probeConnectionCount() override;

    static QMap<QString, QString> parseStatusFields(const QString& text);
    static qint64 parseKbField(const QString& value);

private:
    [[nodiscard]] QString processDir() const;
    [[nodiscard]] double capacityMB() const;
    [[nodiscard]] int openFdCount() const;

    QString pidPart_;
    QString procRoot_;
    QString cgroupRoot_;
};

}  // namespace soakmon
