#pragma once

/// @file segment_analyzer.h
/// @brief Sentiment broken down by rating and category, plus the executive summary

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "analysis/types.h"

namespace reviewscope::trends {

struct RatingSegment {
    double rating = 0.0;
    std::string label;  ///< e.g. "4_star"
    size_t count = 0;
    double avg_sentiment = 0.0;  ///< 3 decimals
    double positive_pct = 0.0;   ///< 1 decimal
    double negative_pct = 0.0;   ///< 1 decimal
};

struct CategorySegment {
    std::string category;
    size_t review_count = 0;
    double avg_sentiment = 0.0;  ///< 3 decimals

    /// Sample standard deviation; missing for single-review categories
    std::optional<double> std_sentiment;

    double positive_pct = 0.0;  ///< 3 decimals
};

struct RecentTrend {
    size_t review_count = 0;
    double avg_sentiment = 0.0;  ///< 3 decimals
    double positive_pct = 0.0;   ///< 1 decimal
};

struct ExecutiveSummary {
    /// Pearson correlation of rating and compound, 3 decimals
    std::optional<double> rating_correlation;

    /// Latest timestamped reviews; missing when no review has a timestamp
    std::optional<RecentTrend> recent_trend;
};

/// @brief Mean compound per (category, week) cell
struct HeatmapCell {
    std::string category;
    std::string week;  ///< Monday of the week, YYYY-MM-DD
    size_t count = 0;
    double avg_sentiment = 0.0;  ///< 3 decimals
};

struct SegmentConfig {
    /// Reviews considered by the recent trend
    size_t recent_window = 100;
};

class SegmentAnalyzer {
public:
    explicit SegmentAnalyzer(SegmentConfig config = {});

    /// @brief One row per distinct rating, ascending; unrated reviews are ignored
    std::vector<RatingSegment> SegmentByRating(const std::vector<ScoredReview>& reviews) const;

    /// @brief One row per category, highest average sentiment first
    std::vector<CategorySegment> SegmentByCategory(const std::vector<ScoredReview>& reviews) const;

    ExecutiveSummary Summarize(const std::vector<ScoredReview>& reviews) const;

    /// @brief Category x week grid over reviews that carry both fields
    std::vector<HeatmapCell> BuildHeatmap(const std::vector<ScoredReview>& reviews) const;

private:
    SegmentConfig config_;
};

/// @brief Pearson correlation; missing for fewer than two pairs or zero variance
std::optional<double> PearsonCorrelation(const std::vector<double>& x,
                                         const std::vector<double>& y);

}  // namespace reviewscope::trends
