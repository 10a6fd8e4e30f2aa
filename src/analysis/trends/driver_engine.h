#pragma once

/// @file driver_engine.h
/// @brief Key-driver prioritization and NPS proxy

#include <string>
#include <string_view>
#include <vector>

#include "analysis/aspects/aspect_attributor.h"
#include "analysis/types.h"

namespace reviewscope::trends {

/// @brief Action quadrant of a key driver
enum class DriverPriority {
    kFixNow,        ///< High impact, low sentiment
    kMaintain,      ///< High impact, high sentiment
    kMonitor,       ///< Low impact, low sentiment
    kDeprioritize,  ///< Low impact, high sentiment
};

std::string_view DriverPriorityToString(DriverPriority priority);

/// @brief How the impact and sentiment axes are split into quadrants
enum class QuadrantSplit {
    kFixed,   ///< Use the configured thresholds
    kMedian,  ///< Split at the medians of the qualifying drivers
};

struct DriverConfig {
    /// Aspects with fewer mentions are not ranked
    size_t min_mentions = 5;

    QuadrantSplit split = QuadrantSplit::kFixed;

    /// Impact at or above this is "high" (fixed split)
    double impact_threshold = 0.1;

    /// Average sentiment at or above this is "high" (fixed split)
    double sentiment_threshold = 0.05;
};

struct KeyDriver {
    std::string aspect;
    std::string label;
    double avg_sentiment = 0.0;  ///< 3 decimals
    size_t mention_count = 0;
    double impact_score = 0.0;   ///< In [0, 1], 3 decimals
    DriverPriority priority = DriverPriority::kMonitor;
};

/// @brief Thresholds separating promoters, passives and detractors
struct NpsConfig {
    /// Compound strictly above this is a promoter
    double promoter_threshold = 0.5;

    /// Compound strictly below this is a detractor
    double detractor_threshold = -0.3;
};

struct NpsResult {
    double nps_proxy = 0.0;  ///< promoters_pct - detractors_pct, in [-100, 100]
    size_t promoters = 0;
    size_t passives = 0;
    size_t detractors = 0;
    double promoters_pct = 0.0;
    double passives_pct = 0.0;
    double detractors_pct = 0.0;
    size_t total = 0;
};

/// @brief Rank aspects by how far they move overall sentiment
///
/// Impact is half the absolute gap between the mean compound of reviews that
/// mention the aspect and of those that do not, which keeps it in [0, 1].
/// An aspect mentioned by every review has impact 0. Result is sorted by
/// impact, highest first.
std::vector<KeyDriver> ComputeDrivers(const std::vector<aspects::DriverInput>& inputs,
                                      const aspects::OverallSentiment& overall,
                                      const DriverConfig& config = {});

/// @brief Net-promoter style score derived from compound sentiment
///
/// An empty corpus scores 0 with all counts zero.
NpsResult ComputeNpsProxy(const std::vector<ScoredReview>& reviews, const NpsConfig& config = {});

}  // namespace reviewscope::trends
