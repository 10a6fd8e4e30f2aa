/// @file analysis_pipeline.cpp
/// @brief Analysis pipeline implementation

#include "analysis/pipeline/analysis_pipeline.h"

#include <chrono>

#include <spdlog/spdlog.h>

#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace reviewscope::pipeline {

namespace {

constexpr char kRunsMetric[] = "reviewscope_analysis_runs_total";
constexpr char kReviewsMetric[] = "reviewscope_reviews_scored_total";
constexpr char kSkippedMetric[] = "reviewscope_records_skipped_total";
constexpr char kDurationMetric[] = "reviewscope_analysis_duration_seconds";
constexpr char kLastRunMetric[] = "reviewscope_last_run_reviews";

/// Change of the latest non-empty period from the one before it.
std::optional<double> LatestChange(const trends::TrendResult& result) {
    for (auto it = result.periods.rbegin(); it != result.periods.rend(); ++it) {
        if (it->sentiment_avg) {
            return it->change_from_previous;
        }
    }
    return std::nullopt;
}

}  // namespace

AnalysisPipeline::AnalysisPipeline(AnalysisConfig config,
                                   std::shared_ptr<const sentiment::Lexicon> lexicon,
                                   aspects::AspectCatalog catalog)
    : config_(std::move(config)),
      catalog_(std::move(catalog)),
      scorer_(std::move(lexicon), config_.sentiment),
      topic_extractor_(config_.topics),
      trend_engine_(config_.trends),
      segment_analyzer_(config_.segments) {}

absl::StatusOr<AnalysisReport> AnalysisPipeline::RunFullAnalysis(
    const std::vector<ReviewRecord>& records,
    const AnalysisOptions& options) const {
    return RunFullAnalysis(records, config_.industry, options);
}

absl::StatusOr<AnalysisReport> AnalysisPipeline::RunFullAnalysis(
    const std::vector<ReviewRecord>& records,
    std::string_view industry,
    const AnalysisOptions& options) const {
    REVIEWSCOPE_ASSIGN_OR_RETURN(auto parsed, aspects::ParseIndustry(industry));
    return RunFullAnalysis(records, parsed, options);
}

absl::StatusOr<AnalysisReport> AnalysisPipeline::RunFullAnalysis(
    const std::vector<ReviewRecord>& records,
    aspects::Industry industry,
    const AnalysisOptions& options) const {
    // Resolve the aspect vocabulary before touching any review.
    REVIEWSCOPE_ASSIGN_OR_RETURN(auto definitions, catalog_.DefinitionsFor(industry));

    ScopedTimer timer(REVIEWSCOPE_HISTOGRAM(kDurationMetric));
    auto start_time = std::chrono::steady_clock::now();

    AnalysisReport report;
    report.industry = std::string(aspects::IndustryToString(industry));

    auto batch = NormalizeRecords(records);
    report.skipped_records = batch.skipped_records;
    report.review_count = batch.reviews.size();
    if (batch.skipped_records > 0) {
        REVIEWSCOPE_LOG_WARN("Skipped {} records without review text", batch.skipped_records);
    }

    if (batch.reviews.empty()) {
        REVIEWSCOPE_LOG_INFO("No reviews to analyze, returning empty report");
        RecordMetrics(report);
        return report;
    }

    // =========================================================================
    // Sentiment
    // =========================================================================

    auto scored = scorer_.AnalyzeCorpus(batch.reviews);
    report.overview = sentiment::ComputeDistribution(scored);
    report.nps = trends::ComputeNpsProxy(scored, config_.nps);
    report.sample_reviews = sentiment::SelectExtremeReviews(
        scored, config_.sentiment.extreme_threshold, config_.sentiment.sample_count);

    // =========================================================================
    // Optional stages
    // =========================================================================

    if (options.include_topics) {
        RunTopics(scored, report);
    }

    if (options.include_aspects) {
        RunAspects(definitions, scored, report);
    }

    if (options.include_trends) {
        RunTrends(scored, report);
    }

    RunSegments(scored, options, report);

    trends::AlertInputs alert_inputs;
    alert_inputs.avg_sentiment = report.overview.average_compound;
    alert_inputs.negative_pct = report.overview.negative_pct;
    if (options.include_trends) {
        alert_inputs.recent_change = LatestChange(report.trends);
    }
    report.alerts = trends::EvaluateAlerts(alert_inputs, config_.alerts);

    report.reviews = std::move(scored);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    REVIEWSCOPE_LOG_INFO("Analyzed {} reviews for industry '{}' in {} ms: avg={} alerts={}",
                         report.review_count, report.industry, elapsed.count(),
                         report.overview.average_compound, report.alerts.size());

    RecordMetrics(report);
    return report;
}

void AnalysisPipeline::RunTopics(const std::vector<ScoredReview>& scored,
                                 AnalysisReport& report) const {
    std::vector<std::string> corpus;
    corpus.reserve(scored.size());
    for (const auto& r : scored) {
        corpus.push_back(r.review.text);
    }

    report.topics = topic_extractor_.Extract(corpus);
    report.word_frequencies = topic_extractor_.WordFrequencies(corpus);
    spdlog::debug("Topics: {} keywords, {} bigrams, {} clusters",
                  report.topics.keywords.size(), report.topics.bigrams.size(),
                  report.topics.clusters.size());
}

void AnalysisPipeline::RunAspects(const std::vector<aspects::AspectDefinition>& definitions,
                                  std::vector<ScoredReview>& scored,
                                  AnalysisReport& report) const {
    aspects::AspectAttributor attributor(definitions, config_.aspects);
    auto analysis = attributor.Attribute(scored);

    report.aspects = std::move(analysis.aspects);
    report.pain_points = std::move(analysis.pain_points);
    report.key_drivers =
        trends::ComputeDrivers(analysis.driver_inputs, analysis.overall, config_.drivers);
    scored = std::move(analysis.tagged_reviews);

    spdlog::debug("Aspects: {} matched, {} pain points, {} drivers", report.aspects.size(),
                  report.pain_points.size(), report.key_drivers.size());
}

void AnalysisPipeline::RunTrends(const std::vector<ScoredReview>& scored,
                                 AnalysisReport& report) const {
    report.trends = trend_engine_.ComputeTrends(scored);
    report.heatmap = segment_analyzer_.BuildHeatmap(scored);

    if (report.trends.excluded_reviews > 0) {
        spdlog::debug("{} reviews without timestamp excluded from trends",
                      report.trends.excluded_reviews);
    }
}

void AnalysisPipeline::RunSegments(const std::vector<ScoredReview>& scored,
                                   const AnalysisOptions& options,
                                   AnalysisReport& report) const {
    report.rating_segments = segment_analyzer_.SegmentByRating(scored);
    report.category_segments = segment_analyzer_.SegmentByCategory(scored);
    report.summary = segment_analyzer_.Summarize(scored);
    if (!options.include_trends) {
        report.summary.recent_trend.reset();
    }
}

void AnalysisPipeline::RecordMetrics(const AnalysisReport& report) const {
    REVIEWSCOPE_COUNTER(kRunsMetric).Increment();
    REVIEWSCOPE_COUNTER(kReviewsMetric).Add(static_cast<int64_t>(report.review_count));
    REVIEWSCOPE_COUNTER(kSkippedMetric).Add(static_cast<int64_t>(report.skipped_records));
    REVIEWSCOPE_GAUGE(kLastRunMetric).Set(static_cast<double>(report.review_count));
}

absl::StatusOr<std::unique_ptr<AnalysisPipeline>> CreateAnalysisPipeline(AnalysisConfig config) {
    REVIEWSCOPE_RETURN_IF_ERROR(config.Validate());
    REVIEWSCOPE_ASSIGN_OR_RETURN(auto lexicon, sentiment::BuildLexicon(config.sentiment));
    REVIEWSCOPE_ASSIGN_OR_RETURN(auto catalog, config.BuildCatalog());

    spdlog::debug("Lexicon ready with {} entries", lexicon->Size());
    return std::make_unique<AnalysisPipeline>(std::move(config), std::move(lexicon),
                                              std::move(catalog));
}

}  // namespace reviewscope::pipeline
