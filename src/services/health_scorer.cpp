#include "soakmon/health_scorer.hpp"

#include <QtGlobal>

#include <algorithm>
#include <cmath>

namespace soakmon {

namespace {

HealthIssue issue(const QString& type, const QString& category, const QString& message) {
    HealthIssue out;
    out.type = type;
    out.category = category;
    out.message = message;
    return out;
}

int clampScore(double value) {
    return static_cast<int>(std::lround(qBound(0.0, value, 100.0)));
}

}  // namespace

HealthScorer::HealthScorer(const SessionConfig& config)
    : memory_(config.memory),
      performance_(config.performance),
      scoring_(config.scoring) {}

QString HealthScorer::statusForScore(int score) {
    if (score >= 90) {
        return "excellent";
    }
    if (score >= 80) {
        return "healthy";
    }
    if (score >= 60) {
        return "degraded";
    }
    if (score >= 40) {
        return "unhealthy";
    }
    return "critical";
}

int HealthScorer::frameRateScore(double average, double minimum, double target) {
    if (target <= 0.0) {
        target = 55.0;
    }
    const double fair = target * 45.0 / 55.0;
    const double poor = target * 30.0 / 55.0;
    int score = 100;
    if (average < poor) {
        score = 0;
    } else if (average < fair) {
        score = 40;
    } else if (average < target) {
        score = 70;
    }
    if (minimum < poor) {
        score -= 20;
    } else if (minimum < fair) {
        score -= 10;
    }
    return qBound(0, score, 100);
}

int HealthScorer::alertPenalty(const QVector<Alert>& alerts) const {
    int penalty = 0;
    for (const Alert& alert : alerts) {
        if (alert.severity == Severity::Critical) {
            penalty += scoring_.criticalAlertPenalty;
        } else if (alert.severity == Severity::High) {
            penalty += scoring_.highAlertPenalty;
        }
    }
    return qMin(penalty, scoring_.maxAlertPenalty);
}

double HealthScorer::memoryDeduction(const SessionData& data, QVector<HealthIssue>* issues) const {
    if (data.snapshots.size() < 2) {
        issues->append(issue("insufficient_data", "memory", "Insufficient memory data for comprehensive analysis"));
        return 0.0;
    }

    const int first = qMax(0, data.snapshots.size() - kRecentWindow);
    const Snapshot& oldest = data.snapshots[first];
    const Snapshot& latest = data.snapshots.last();
    const double growthMB = latest.memoryUsedMB - oldest.memoryUsedMB;
    const double hours = static_cast<double>(latest.timestampMs - oldest.timestampMs) / 3600000.0;
    const double growthRate = hours > 0.0 ? growthMB / hours : 0.0;

    double deduction = 0.0;
    if (growthMB > memory_.maxMemoryGrowthMB) {
        deduction += qMin(40.0, growthMB / memory_.maxMemoryGrowthMB * 40.0);
        issues->append(issue("memory_growth", "memory",
            QString("Memory growth of %1 MB exceeds threshold by %2x")
                .arg(growthMB, 0, 'f', 1)
                .arg(growthMB / memory_.maxMemoryGrowthMB, 0, 'f', 1)));
    }
    if (growthRate > memory_.maxMemoryLeakRateMBPerHour) {
        deduction += qMin(30.0, growthRate / memory_.maxMemoryLeakRateMBPerHour * 30.0);
        issues->append(issue("memory_leak_rate", "memory",
            QString("High memory growth rate: %1 MB/hr").arg(growthRate, 0, 'f', 1)));
    }
    const double utilization = latest.utilizationPercent / 100.0;
    const double pressureLine = memory_.pressureHighPercent / 100.0;
    if (latest.memoryCapacityMB > 0.0 && utilization > pressureLine) {
        deduction += qMin(20.0, (utilization - pressureLine) * 100.0);
        issues->append(issue("memory_utilization", "memory",
            QString("High memory utilization: %1%").arg(latest.utilizationPercent, 0, 'f', 1)));
    }
    if (!data.leakCandidates.isEmpty()) {
        deduction += qMin(50.0, data.leakCandidates.size() * 10.0);
        issues->append(issue("memory_leaks_detected", "memory",
            QString("%1 leak candidate(s) detected").arg(data.leakCandidates.size())));
    }
    return deduction;
}

double HealthScorer::performanceDeduction(const SessionData& data, QVector<HealthIssue>* issues) const {
    QVector<double> frameRates;
    QVector<double> responseTimes;
    const int first = qMax(0, data.snapshots.size() - kRecentWindow);
    for (int i = first; i < data.snapshots.size(); ++i) {
        const Snapshot& snap = data.snapshots[i];
        if (snap.frameRate) {
            frameRates.append(*snap.frameRate);
        }
        if (snap.responseTimeMs) {
            responseTimes.append(*snap.responseTimeMs);
        }
    }
    if (frameRates.isEmpty() && responseTimes.isEmpty()) {
        issues->append(issue("insufficient_data", "performance", "No performance metrics available"));
        return 0.0;
    }

    double deduction = 0.0;
    if (!frameRates.isEmpty()) {
        double sum = 0.0;
        for (double fps : frameRates) {
            sum += fps;
        }
        const double average = sum / frameRates.size();
        const double minimum = *std::min_element(frameRates.cbegin(), frameRates.cend());
        const int score = frameRateScore(average, minimum, performance_.targetFrameRate);
        if (score < 100) {
            deduction += 100 - score;
            issues->append(issue("low_frame_rate", "performance",
                QString("Low frame rate: %1 FPS").arg(average, 0, 'f', 1)));
        }
    }
    if (!responseTimes.isEmpty()) {
        double sum = 0.0;
        for (double ms : responseTimes) {
            sum += ms;
        }
        const double average = sum / responseTimes.size();
        if (average > performance_.maxResponseTimeMs) {
            deduction += qMin(30.0, (average / performance_.maxResponseTimeMs - 1.0) * 30.0);
            issues->append(issue("slow_response", "performance",
                QString("Slow response time: %1 ms").arg(average, 0, 'f', 1)));
        }
    }
    return deduction;
}

HealthCheck HealthScorer::computeHealthScore(const SessionData& data, qint64 nowMs) const {
    HealthCheck check;
    check.timestampMs = nowMs;

    const double memory = memoryDeduction(data, &check.issues);
    const double performance = performanceDeduction(data, &check.issues);
    const int alerts = alertPenalty(data.alerts);
    if (alerts > 0) {
        check.issues.append(issue("alerts", "alerts",
            QString("%1 alert(s) raised, penalty %2").arg(data.alerts.size()).arg(alerts)));
    }

    check.memoryScore = clampScore(100.0 - memory);
    check.performanceScore = clampScore(100.0 - performance);
    check.alertScore = clampScore(100.0 - alerts);
    check.score = clampScore(100.0 - memory - performance - alerts);
    check.status = statusForScore(check.score);
    return check;
}

}  // namespace soakmon
