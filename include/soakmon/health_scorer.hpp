#pragma once

#include <QString>
#include <QVector>

#include "soakmon/session_config.hpp"
#include "soakmon/types.hpp"

namespace soakmon {

// Composite 0-100 score over memory, performance and alert signals.
class HealthScorer final {
public:
    static constexpr int kRecentWindow = 10;

    explicit HealthScorer(const SessionConfig& config = {});

    [[nodiscard]] HealthCheck computeHealthScore(const SessionData& data, qint64 nowMs) const;

    [[nodiscard]] int alertPenalty(const QVector<Alert>& alerts) const;
    // Bands sit at the target and at 45/55 and 30/55 of it.
    static int frameRateScore(double average, double minimum, double target = 55.0);
    static QString statusForScore(int score);

private:
    double memoryDeduction(const SessionData& data, QVector<HealthIssue>* issues) const;
    double performanceDeduction(const SessionData& data, QVector<HealthIssue>* issues) const;

    MemoryThresholds memory_;
    PerformanceThresholds performance_;
    ScoringConstants scoring_;
};

}  // namespace soakmon
