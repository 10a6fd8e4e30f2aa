#pragma once

/// @file trend_engine.h
/// @brief Time bucketing, moving averages and z-score anomaly detection

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/time/civil_time.h>

#include "analysis/types.h"

namespace reviewscope::trends {

/// @brief Width of a trend period
enum class Granularity {
    kDay,    ///< Label YYYY-MM-DD
    kWeek,   ///< Monday-start weeks, labelled with the Monday (YYYY-MM-DD)
    kMonth,  ///< Label YYYY-MM
};

std::string_view GranularityToString(Granularity granularity);

/// @brief Parse "day", "week" or "month"
absl::StatusOr<Granularity> ParseGranularity(std::string_view name);

/// @brief Trend configuration
struct TrendConfig {
    Granularity granularity = Granularity::kDay;

    /// Trailing periods averaged by the moving average
    size_t moving_average_window = 3;

    /// |z| above this flags a period as an anomaly
    double anomaly_z_threshold = 2.0;
};

/// @brief Aggregates of one time period; all calendar math is UTC
///
/// Periods without reviews keep `volume == 0` and no sentiment so gaps stay
/// visible.
struct PeriodBucket {
    std::string label;
    absl::CivilDay start;
    size_t volume = 0;
    std::optional<double> sentiment_avg;         ///< 3 decimals
    std::optional<double> moving_avg;            ///< 3 decimals
    std::optional<double> positive_pct;          ///< 1 decimal
    std::optional<double> change_from_previous;  ///< vs. last non-empty period
};

enum class AnomalyType {
    kPositiveSpike,
    kNegativeSpike,
};

/// @brief "positive_spike" or "negative_spike"
std::string_view AnomalyTypeToString(AnomalyType type);

struct Anomaly {
    std::string period;
    AnomalyType type = AnomalyType::kNegativeSpike;
    double z_score = 0.0;  ///< 2 decimals
    double sentiment_avg = 0.0;
};

struct TrendResult {
    Granularity granularity = Granularity::kDay;
    std::vector<PeriodBucket> periods;  ///< Chronological, gaps included
    std::vector<Anomaly> anomalies;     ///< Chronological
    size_t excluded_reviews = 0;        ///< Reviews without a timestamp

    bool Empty() const { return periods.empty(); }
};

/// @brief Inclusive calendar range used by ComparePeriods
struct DateRange {
    absl::CivilDay start;
    absl::CivilDay end;
};

struct PeriodSummary {
    std::string date_range;
    size_t review_count = 0;
    double avg_sentiment = 0.0;
    double positive_pct = 0.0;
};

/// @brief Second period measured against the first
struct PeriodComparison {
    PeriodSummary first;
    PeriodSummary second;
    double sentiment_change = 0.0;
    double sentiment_change_pct = 0.0;
    double positive_pct_change = 0.0;
    std::string trend;  ///< "improving", "declining" or "stable"
};

/// @brief Buckets timestamped reviews and flags unusual periods
///
/// Anomalies are z-scores of each non-empty period's mean sentiment against
/// the mean and sample standard deviation of all non-empty periods. Fewer
/// than two non-empty periods, or a constant series, yield no anomalies.
class TrendEngine {
public:
    explicit TrendEngine(TrendConfig config = {});

    /// @brief Trends at the configured granularity
    TrendResult ComputeTrends(const std::vector<ScoredReview>& reviews) const;

    TrendResult ComputeTrends(const std::vector<ScoredReview>& reviews,
                              Granularity granularity) const;

    std::vector<Anomaly> DetectAnomalies(const std::vector<PeriodBucket>& periods) const;

    /// @brief Compare sentiment between two inclusive date ranges
    /// @return Failed precondition when either range contains no reviews
    absl::StatusOr<PeriodComparison> ComparePeriods(const std::vector<ScoredReview>& reviews,
                                                    const DateRange& first,
                                                    const DateRange& second) const;

    const TrendConfig& config() const { return config_; }

private:
    TrendConfig config_;
};

/// @brief Start day of the period containing `day`
absl::CivilDay PeriodStart(absl::CivilDay day, Granularity granularity);

/// @brief Start day of the period following the one starting at `start`
absl::CivilDay NextPeriodStart(absl::CivilDay start, Granularity granularity);

std::string PeriodLabel(absl::CivilDay start, Granularity granularity);

}  // namespace reviewscope::trends
