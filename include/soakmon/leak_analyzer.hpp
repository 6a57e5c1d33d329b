#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>

#include <optional>

#include "soakmon/session_config.hpp"
#include "soakmon/types.hpp"

namespace soakmon {

enum class TrendDirection {
    InsufficientData,
    Stable,
    IncreasingModerate,
    IncreasingRapid,
    DecreasingModerate,
    DecreasingRapid,
};

QString trendDirectionName(TrendDirection direction);

struct TrendResult {
    TrendDirection direction = TrendDirection::InsufficientData;
    double slopeMBPerHour = 0.0;
    double confidence = 0.0;
    int sampleCount = 0;
    QString description;

    [[nodiscard]] bool isIncreasing() const {
        return direction == TrendDirection::IncreasingModerate
            || direction == TrendDirection::IncreasingRapid;
    }
    [[nodiscard]] QJsonObject toJson() const;
};

QString leakRecommendation(LeakType type);
int severityScore(Severity severity);

// Stateless checks over snapshots. Same inputs always give the same output.
class LeakAnalyzer final {
public:
    static constexpr double kRapidSlopeMBPerHour = 10.0;
    static constexpr double kModerateSlopeMBPerHour = 5.0;

    explicit LeakAnalyzer(MemoryThresholds thresholds = {}, int trendWindow = 10);

    // Regression over the most recent `trendWindow` snapshots.
    [[nodiscard]] TrendResult analyzeTrend(const QVector<Snapshot>& series) const;
    // Regression over the whole series.
    [[nodiscard]] TrendResult analyzeSeriesTrend(const QVector<Snapshot>& series) const;

    [[nodiscard]] QVector<LeakCandidate> analyzeSnapshot(
        const Snapshot& snapshot,
        const Snapshot& baseline) const;

    [[nodiscard]] std::optional<LeakCandidate> trendCandidate(
        const TrendResult& trend,
        qint64 detectedAtMs) const;

private:
    static TrendResult fitTrend(const QVector<Snapshot>& series, int first);

    MemoryThresholds thresholds_;
    int trendWindow_;
};

}  // namespace soakmon
