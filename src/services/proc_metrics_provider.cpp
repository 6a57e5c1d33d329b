#include "soakmon/proc_metrics_provider.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>

#include <utility>

#include "soakmon/logging.hpp"

namespace {

QString readTextFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return QString::fromUtf8(file.readAll());
}

double kbToMB(qint64 kb) {
    return static_cast<double>(kb) / 1024.0;
}

}  // namespace

namespace soakmon {

ProcMetricsProvider::ProcMetricsProvider(qint64 pid, QString procRoot, QString cgroupRoot)
    : pidPart_(pid < 0 ? QString("self") : QString::number(pid)),
      procRoot_(std::move(procRoot)),
      cgroupRoot_(std::move(cgroupRoot)) {}

QMap<QString, QString> ProcMetricsProvider::parseStatusFields(const QString& text) {
    QMap<QString, QString> values;
    for (const QString& line : text.split('\n', Qt::SkipEmptyParts)) {
        const int idx = line.indexOf(':');
        if (idx <= 0) {
            continue;
        }
        values.insert(line.left(idx).trimmed(), line.mid(idx + 1).trimmed());
    }
    return values;
}

qint64 ProcMetricsProvider::parseKbField(const QString& value) {
    bool ok = false;
    const qint64 kb = value.split(' ', Qt::SkipEmptyParts).value(0).toLongLong(&ok);
    return ok ? kb : -1;
}

QString ProcMetricsProvider::processDir() const {
    return procRoot_ + "/" + pidPart_;
}

double ProcMetricsProvider::capacityMB() const {
    const QString limit = readTextFile(cgroupRoot_ + "/memory.max").trimmed();
    bool ok = false;
    const qulonglong bytes = limit.toULongLong(&ok);
    if (ok && bytes > 0) {
        return static_cast<double>(bytes) / (1024.0 * 1024.0);
    }
    // "max" or no cgroup v2 mount: fall back to physical memory.
    const QMap<QString, QString> memInfo = parseStatusFields(readTextFile(procRoot_ + "/meminfo"));
    const qint64 totalKb = parseKbField(memInfo.value("MemTotal"));
    return totalKb > 0 ? kbToMB(totalKb) : 0.0;
}

int ProcMetricsProvider::openFdCount() const {
    const QDir fdDir(processDir() + "/fd");
    if (!fdDir.exists()) {
        return -1;
    }
    return static_cast<int>(fdDir.entryList(QDir::AllEntries | QDir::System | QDir::NoDotAndDotDot).size());
}

std::optional<MemorySample> ProcMetricsProvider::sampleMemory() {
    const QString statusText = readTextFile(processDir() + "/status");
    if (statusText.isEmpty()) {
        qCWarning(soakmonCollector) << "Unable to read process status from" << processDir();
        return std::nullopt;
    }
    const QMap<QString, QString> fields = parseStatusFields(statusText);
    const qint64 rssKb = parseKbField(fields.value("VmRSS"));
    if (rssKb < 0) {
        return std::nullopt;
    }
    const qint64 vmKb = parseKbField(fields.value("VmSize"));

    MemorySample sample;
    sample.usedMB = kbToMB(rssKb);
    sample.totalMB = vmKb > 0 ? kbToMB(vmKb) : sample.usedMB;
    sample.capacityMB = capacityMB();
    return sample;
}

std::optional<StructuralCounts> ProcMetricsProvider::sampleStructuralCounts() {
    const QMap<QString, QString> fields = parseStatusFields(readTextFile(processDir() + "/status"));
    if (fields.isEmpty()) {
        return std::nullopt;
    }
    StructuralCounts counts;
    bool ok = false;
    const qint64 threads = fields.value("Threads").toLongLong(&ok);
    if (ok) {
        counts.counts.insert("threads", threads);
    }
    const int fds = openFdCount();
    if (fds >= 0) {
        counts.counts.insert("open_fds", fds);
    }
    return counts;
}

std::optional<int> ProcMetricsProvider::probeConnectionCount() {
    const QDir fdDir(processDir() + "/fd");
    if (!fdDir.exists() || !fdDir.isReadable()) {
        return std::nullopt;
    }
    int sockets = 0;
    const QStringList entries = fdDir.entryList(QDir::AllEntries | QDir::System | QDir::NoDotAndDotDot);
    for (const QString& entry : entries) {
        const QString target = QFileInfo(fdDir.filePath(entry)).symLinkTarget();
        if (target.contains("socket:")) {
            ++sockets;
        }
    }
    return sockets;
}

}  // namespace soakmon
