#pragma once

/// @file analysis_pipeline.h
/// @brief Orchestrates sentiment, topics, aspects and trends into one report
///
/// A run is a pure function of its input batch and the pipeline's immutable
/// configuration: identical input yields an identical report. The pipeline
/// holds no locks; concurrent runs on separate batches are independent.

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "analysis/aspects/aspect_attributor.h"
#include "analysis/aspects/aspect_catalog.h"
#include "analysis/pipeline/analysis_config.h"
#include "analysis/sentiment/lexicon.h"
#include "analysis/sentiment/sentiment_scorer.h"
#include "analysis/topics/topic_extractor.h"
#include "analysis/trends/alert_rules.h"
#include "analysis/trends/driver_engine.h"
#include "analysis/trends/segment_analyzer.h"
#include "analysis/trends/trend_engine.h"
#include "analysis/types.h"

namespace reviewscope::pipeline {

/// @brief Optional stages of a run; sentiment always runs
struct AnalysisOptions {
    bool include_topics = true;
    bool include_aspects = true;
    bool include_trends = true;

    static AnalysisOptions SentimentOnly() { return {false, false, false}; }
};

/// @brief Everything a run produces
///
/// Sections whose stage was disabled, or whose input was degenerate, are
/// left empty.
struct AnalysisReport {
    std::string industry;
    size_t review_count = 0;
    size_t skipped_records = 0;

    sentiment::SentimentDistribution overview;
    trends::NpsResult nps;

    /// Scored reviews in input order, with their aspect attributions
    std::vector<ScoredReview> reviews;

    topics::TopicResult topics;
    std::vector<topics::WordFrequency> word_frequencies;

    std::vector<aspects::AspectStats> aspects;
    std::vector<aspects::PainPoint> pain_points;
    std::vector<trends::KeyDriver> key_drivers;

    trends::TrendResult trends;  ///< Anomalies live in trends.anomalies
    std::vector<trends::Alert> alerts;

    sentiment::ExtremeReviews sample_reviews;

    std::vector<trends::RatingSegment> rating_segments;
    std::vector<trends::CategorySegment> category_segments;
    std::vector<trends::HeatmapCell> heatmap;
    trends::ExecutiveSummary summary;

    bool Empty() const { return review_count == 0; }
};

/// @brief Full review analysis
///
/// Example:
/// @code
///   auto pipeline = CreateAnalysisPipeline(config);
///   if (!pipeline.ok()) { ... }
///   auto report = (*pipeline)->RunFullAnalysis(records, aspects::Industry::kFashion);
/// @endcode
class AnalysisPipeline {
public:
    AnalysisPipeline(AnalysisConfig config,
                     std::shared_ptr<const sentiment::Lexicon> lexicon,
                     aspects::AspectCatalog catalog);

    // Disable copy
    AnalysisPipeline(const AnalysisPipeline&) = delete;
    AnalysisPipeline& operator=(const AnalysisPipeline&) = delete;

    /// @brief Analyze a batch of raw records
    ///
    /// Records without text are skipped and counted. An empty batch yields an
    /// empty report.
    /// @return Configuration error when `industry` has no aspects; nothing is
    ///         processed in that case
    absl::StatusOr<AnalysisReport> RunFullAnalysis(const std::vector<ReviewRecord>& records,
                                                   aspects::Industry industry,
                                                   const AnalysisOptions& options = {}) const;

    /// @brief Same as above with the industry given by key, e.g. "beauty"
    absl::StatusOr<AnalysisReport> RunFullAnalysis(const std::vector<ReviewRecord>& records,
                                                   std::string_view industry,
                                                   const AnalysisOptions& options = {}) const;

    /// @brief Same as above with the configured default industry
    absl::StatusOr<AnalysisReport> RunFullAnalysis(const std::vector<ReviewRecord>& records,
                                                   const AnalysisOptions& options = {}) const;

    const AnalysisConfig& config() const { return config_; }
    const sentiment::SentimentScorer& scorer() const { return scorer_; }

private:
    void RunTopics(const std::vector<ScoredReview>& scored, AnalysisReport& report) const;
    void RunAspects(const std::vector<aspects::AspectDefinition>& definitions,
                    std::vector<ScoredReview>& scored,
                    AnalysisReport& report) const;
    void RunTrends(const std::vector<ScoredReview>& scored, AnalysisReport& report) const;
    void RunSegments(const std::vector<ScoredReview>& scored,
                     const AnalysisOptions& options,
                     AnalysisReport& report) const;
    void RecordMetrics(const AnalysisReport& report) const;

    AnalysisConfig config_;
    aspects::AspectCatalog catalog_;
    sentiment::SentimentScorer scorer_;
    topics::TopicExtractor topic_extractor_;
    trends::TrendEngine trend_engine_;
    trends::SegmentAnalyzer segment_analyzer_;
};

/// @brief Validate `config`, load its lexicon and build a pipeline
/// @return Configuration error for invalid settings; NotFound or parse
///         errors when the lexicon file cannot be loaded
absl::StatusOr<std::unique_ptr<AnalysisPipeline>> CreateAnalysisPipeline(
    AnalysisConfig config = {});

}  // namespace reviewscope::pipeline
