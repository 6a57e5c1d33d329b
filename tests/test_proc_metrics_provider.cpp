#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "soakmon/proc_metrics_provider.hpp"

using soakmon::MemorySample;
using soakmon::ProcMetricsProvider;

namespace {

bool writeFile(const QString& path, const QByteArray& contents) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(contents) == contents.size();
}

const QByteArray kStatus =
    "Name:\tworkload\n"
    "State:\tS (sleeping)\n"
    "VmSize:\t  409600 kB\n"
    "VmRSS:\t  102400 kB\n"
    "Threads:\t7\n";

const QByteArray kMemInfo =
    "MemTotal:        8388608 kB\n"
    "MemFree:         1048576 kB\n";

}  // namespace

class ProcMetricsProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        procRoot = dir.filePath("proc");
        cgroupRoot = dir.filePath("cgroup");
        ASSERT_TRUE(QDir().mkpath(procRoot + "/123"));
        ASSERT_TRUE(QDir().mkpath(cgroupRoot));
        ASSERT_TRUE(writeFile(procRoot + "/123/status", kStatus));
        ASSERT_TRUE(writeFile(procRoot + "/meminfo", kMemInfo));
    }

    QTemporaryDir dir;
    QString procRoot;
    QString cgroupRoot;
};

TEST_F(ProcMetricsProviderTest, ReadsResidentAndVirtualMemory) {
    ASSERT_TRUE(writeFile(cgroupRoot + "/memory.max", "max\n"));
    ProcMetricsProvider provider(123, procRoot, cgroupRoot);

    const auto sample = provider.sampleMemory();
    ASSERT_TRUE(sample.has_value());
    EXPECT_DOUBLE_EQ(sample->usedMB, 100.0);
    EXPECT_DOUBLE_EQ(sample->totalMB, 400.0);
    EXPECT_DOUBLE_EQ(sample->capacityMB, 8192.0);
}

TEST_F(ProcMetricsProviderTest, CgroupLimitWinsOverPhysicalMemory) {
    ASSERT_TRUE(writeFile(cgroupRoot + "/memory.max", "536870912\n"));
    ProcMetricsProvider provider(123, procRoot, cgroupRoot);

    const auto sample = provider.sampleMemory();
    ASSERT_TRUE(sample.has_value());
    EXPECT_DOUBLE_EQ(sample->capacityMB, 512.0);
}

TEST_F(ProcMetricsProviderTest, StructuralCountsIncludeThreads) {
    ProcMetricsProvider provider(123, procRoot, cgroupRoot);
    const auto counts = provider.sampleStructuralCounts();
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts->counts.value("threads"), 7);
    EXPECT_FALSE(counts->counts.contains("open_fds"));
}

TEST_F(ProcMetricsProviderTest, OpenDescriptorsAreCounted) {
    ASSERT_TRUE(QDir().mkpath(procRoot + "/123/fd"));
    ASSERT_TRUE(writeFile(procRoot + "/123/fd/0", ""));
    ASSERT_TRUE(writeFile(procRoot + "/123/fd/1", ""));
    ProcMetricsProvider provider(123, procRoot, cgroupRoot);

    const auto counts = provider.sampleStructuralCounts();
    ASSERT_TRUE(counts.has_value());
    EXPECT_EQ(counts->counts.value("open_fds"), 2);
    EXPECT_EQ(counts->total(), 9);

    const auto sockets = provider.probeConnectionCount();
    ASSERT_TRUE(sockets.has_value());
    EXPECT_EQ(*sockets, 0);
}

TEST_F(ProcMetricsProviderTest, MissingProcessIsAbsent) {
    ProcMetricsProvider provider(999, procRoot, cgroupRoot);
    EXPECT_FALSE(provider.sampleMemory().has_value());
    EXPECT_FALSE(provider.sampleStructuralCounts().has_value());
    EXPECT_FALSE(provider.probeConnectionCount().has_value());
    EXPECT_FALSE(provider.sampleUnitSizeMB("anything").has_value());
}

TEST(ProcMetricsParsingTest, ParsesKilobyteFields) {
    EXPECT_EQ(ProcMetricsProvider::parseKbField("  102400 kB"), 102400);
    EXPECT_EQ(ProcMetricsProvider::parseKbField("12"), 12);
    EXPECT_EQ(ProcMetricsProvider::parseKbField(""), -1);
    EXPECT_EQ(ProcMetricsProvider::parseKbField("n/a"), -1);

    const auto fields = ProcMetricsProvider::parseStatusFields(QString::fromUtf8(kStatus));
    EXPECT_EQ(fields.value("Name"), "workload");
    EXPECT_EQ(fields.value("VmRSS"), "102400 kB");
}

TEST(ProcMetricsSelfTest, SamplesTheCallingProcess) {
    if (!QFile::exists("/proc/self/status")) {
        GTEST_SKIP() << "procfs not available";
    }
    ProcMetricsProvider provider;
    const auto sample = provider.sampleMemory();
    ASSERT_TRUE(sample.has_value());
    EXPECT_GT(sample->usedMB, 0.0);
}
