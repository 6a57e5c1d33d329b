#include "soakmon/leak_analyzer.hpp"

#include <QtGlobal>

#include <cmath>
#include <utility>

namespace soakmon {

namespace {

constexpr double kMsPerHour = 3600.0 * 1000.0;

LeakCandidate makeCandidate(LeakType type, Severity severity, qint64 detectedAtMs, QJsonObject metrics) {
    LeakCandidate candidate;
    candidate.type = type;
    candidate.severity = severity;
    candidate.detectedAtMs = detectedAtMs;
    candidate.metrics = std::move(metrics);
    candidate.recommendation = leakRecommendation(type);
    candidate.severityScore = severityScore(severity);
    return candidate;
}

QString rate(double slope) {
    return QString::number(std::abs(slope), 'f', 1);
}

}  // namespace

QString trendDirectionName(TrendDirection direction) {
    switch (direction) {
    case TrendDirection::InsufficientData:
        return "insufficient_data";
    case TrendDirection::Stable:
        return "stable";
    case TrendDirection::IncreasingModerate:
        return "increasing_moderate";
    case TrendDirection::IncreasingRapid:
        return "increasing_rapid";
    case TrendDirection::DecreasingModerate:
        return "decreasing_moderate";
    case TrendDirection::DecreasingRapid:
        return "decreasing_rapid";
    }
    return "unknown";
}

QJsonObject TrendResult::toJson() const {
    return {
        {"direction", trendDirectionName(direction)},
        {"slope_mb_per_hour", slopeMBPerHour},
        {"confidence", confidence},
        {"samples", sampleCount},
        {"description", description},
    };
}

QString leakRecommendation(LeakType type) {
    switch (type) {
    case LeakType::TrendGrowth:
        return "Investigate steadily growing allocations; compare heap profiles taken at the start "
               "and end of the trend window.";
    case LeakType::MemoryPressure:
        return "Reduce resident memory or raise the memory limit; the process is close to its capacity.";
    case LeakType::ComponentLeak:
        return "Review unit teardown: release caches, listeners and timers owned by the unit before it "
               "is destroyed.";
    case LeakType::StructuralGrowth:
        return "Check for accumulating objects such as threads, descriptors or child elements that are "
               "created but never released.";
    }
    return {};
}

int severityScore(Severity severity) {
    switch (severity) {
    case Severity::Low:
        return 25;
    case Severity::Medium:
        return 50;
    case Severity::High:
        return 75;
    case Severity::Critical:
        return 100;
    }
    return 0;
}

LeakAnalyzer::LeakAnalyzer(MemoryThresholds thresholds, int trendWindow)
    : thresholds_(thresholds),
      trendWindow_(trendWindow) {}

TrendResult LeakAnalyzer::fitTrend(const QVector<Snapshot>& series, int first) {
    TrendResult result;
    const int n = series.size() - first;
    result.sampleCount = qMax(0, n);
    if (n < 3) {
        result.description = "Insufficient data for trend analysis";
        return result;
    }

    const qint64 originMs = series[first].timestampMs;
    double meanX = 0.0;
    double meanY = 0.0;
    for (int i = first; i < series.size(); ++i) {
        meanX += static_cast<double>(series[i].timestampMs - originMs) / kMsPerHour;
        meanY += series[i].memoryUsedMB;
    }
    meanX /= n;
    meanY /= n;

    double sxx = 0.0;
    double sxy = 0.0;
    double syy = 0.0;
    for (int i = first; i < series.size(); ++i) {
        const double dx = static_cast<double>(series[i].timestampMs - originMs) / kMsPerHour - meanX;
        const double dy = series[i].memoryUsedMB - meanY;
        sxx += dx * dx;
        sxy += dx * dy;
        syy += dy * dy;
    }
    if (sxx < 1e-15) {
        result.description = "Insufficient data for trend analysis";
        return result;
    }

    const double slope = sxy / sxx;
    double r2 = 1.0;
    if (syy > 1e-12) {
        const double intercept = meanY - slope * meanX;
        double ssRes = 0.0;
        for (int i = first; i < series.size(); ++i) {
            const double x = static_cast<double>(series[i].timestampMs - originMs) / kMsPerHour;
            const double residual = series[i].memoryUsedMB - (intercept + slope * x);
            ssRes += residual * residual;
        }
        r2 = 1.0 - ssRes / syy;
    }

    result.slopeMBPerHour = slope;
    result.confidence = qBound(0.0, r2, 1.0);
    if (slope > kRapidSlopeMBPerHour) {
        result.direction = TrendDirection::IncreasingRapid;
        result.description = QString("Memory usage increasing rapidly (%1 MB/hr)").arg(rate(slope));
    } else if (slope > kModerateSlopeMBPerHour) {
        result.direction = TrendDirection::IncreasingModerate;
        result.description = QString("Memory usage increasing moderately (%1 MB/hr)").arg(rate(slope));
    } else if (slope < -kRapidSlopeMBPerHour) {
        result.direction = TrendDirection::DecreasingRapid;
        result.description = QString("Memory usage decreasing rapidly (%1 MB/hr)").arg(rate(slope));
    } else if (slope < -kModerateSlopeMBPerHour) {
        result.direction = TrendDirection::DecreasingModerate;
        result.description = QString("Memory usage decreasing (%1 MB/hr)").arg(rate(slope));
    } else {
        result.direction = TrendDirection::Stable;
        result.description = QString("Memory usage stable (%1 MB/hr)").arg(rate(slope));
    }
    return result;
}

TrendResult LeakAnalyzer::analyzeTrend(const QVector<Snapshot>& series) const {
    const int first = trendWindow_ > 0 ? qMax(0, series.size() - trendWindow_) : 0;
    return fitTrend(series, first);
}

TrendResult LeakAnalyzer::analyzeSeriesTrend(const QVector<Snapshot>& series) const {
    return fitTrend(series, 0);
}

QVector<LeakCandidate> LeakAnalyzer::analyzeSnapshot(const Snapshot& snapshot, const Snapshot& baseline) const {
    QVector<LeakCandidate> out;

    const double growth = snapshot.memoryUsedMB - baseline.memoryUsedMB;
    if (growth > thresholds_.maxMemoryGrowthMB) {
        const Severity severity = growth > 2.0 * thresholds_.maxMemoryGrowthMB ? Severity::Critical : Severity::High;
        out.append(makeCandidate(LeakType::TrendGrowth, severity, snapshot.timestampMs,
            QJsonObject{
                {"check", "overall_growth"},
                {"growth_mb", growth},
                {"threshold_mb", thresholds_.maxMemoryGrowthMB},
                {"baseline_mb", baseline.memoryUsedMB},
                {"current_mb", snapshot.memoryUsedMB},
            }));
    }

    if (snapshot.memoryCapacityMB > 0.0) {
        const double utilization = snapshot.utilizationPercent;
        std::optional<Severity> pressure;
        if (utilization > thresholds_.pressureCriticalPercent) {
            pressure = Severity::Critical;
        } else if (utilization > thresholds_.pressureHighPercent) {
            pressure = Severity::High;
        }
        if (pressure) {
            out.append(makeCandidate(LeakType::MemoryPressure, *pressure, snapshot.timestampMs,
                QJsonObject{
                    {"check", "memory_pressure"},
                    {"utilization_percent", utilization},
                    {"used_mb", snapshot.memoryUsedMB},
                    {"capacity_mb", snapshot.memoryCapacityMB},
                }));
        }
    }

    if (!snapshot.structuralTotal || !baseline.structuralTotal) {
        return out;
    }
    const qint64 structuralGrowth = *snapshot.structuralTotal - *baseline.structuralTotal;
    if (structuralGrowth > thresholds_.structuralGrowthThreshold) {
        const Severity severity = structuralGrowth > thresholds_.structuralCriticalGrowth
            ? Severity::High
            : Severity::Medium;
        out.append(makeCandidate(LeakType::StructuralGrowth, severity, snapshot.timestampMs,
            QJsonObject{
                {"check", "structural_growth"},
                {"growth", static_cast<double>(structuralGrowth)},
                {"baseline_total", static_cast<double>(*baseline.structuralTotal)},
                {"current_total", static_cast<double>(*snapshot.structuralTotal)},
                {"tracked_units", snapshot.trackedUnitCount},
            }));
    }
    return out;
}

std::optional<LeakCandidate> LeakAnalyzer::trendCandidate(const TrendResult& trend, qint64 detectedAtMs) const {
    if (!trend.isIncreasing()
        || trend.slopeMBPerHour <= thresholds_.maxMemoryLeakRateMBPerHour
        || trend.confidence < thresholds_.trendConfidenceThreshold) {
        return std::nullopt;
    }
    const Severity severity = trend.slopeMBPerHour > 2.0 * thresholds_.maxMemoryLeakRateMBPerHour
        ? Severity::Critical
        : Severity::High;
    return makeCandidate(LeakType::TrendGrowth, severity, detectedAtMs,
        QJsonObject{
            {"check", "trend"},
            {"slope_mb_per_hour", trend.slopeMBPerHour},
            {"confidence", trend.confidence},
            {"samples", trend.sampleCount},
            {"description", trend.description},
        });
}

}  // namespace soakmon
