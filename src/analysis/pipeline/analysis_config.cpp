/// @file analysis_config.cpp
/// @brief AnalysisConfig YAML mapping and validation

#include "analysis/pipeline/analysis_config.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace reviewscope::pipeline {

namespace {

/// Reads a non-negative integer, keeping `current` when the key is absent.
absl::Status ReadCount(const Config& config, std::string_view key, size_t& current) {
    if (!config.HasKey(key)) {
        return absl::OkStatus();
    }
    const int64_t value = config.GetInt(key, static_cast<int64_t>(current));
    if (value < 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat(key, " must not be negative, got ", value));
    }
    current = static_cast<size_t>(value);
    return absl::OkStatus();
}

void ReadDouble(const Config& config, std::string_view key, double& current) {
    current = config.GetDouble(key, current);
}

absl::Status ReadSentiment(const Config& config, sentiment::SentimentConfig& s) {
    ReadDouble(config, "sentiment.positive_threshold", s.positive_threshold);
    ReadDouble(config, "sentiment.negative_threshold", s.negative_threshold);
    ReadDouble(config, "sentiment.extreme_threshold", s.extreme_threshold);
    s.lexicon_path = config.GetString("sentiment.lexicon_path", s.lexicon_path);
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "sentiment.sample_count", s.sample_count));

    for (const auto& term : config.GetKeys("sentiment.overrides")) {
        s.extra_overrides.push_back(
            {term, config.GetDouble(absl::StrCat("sentiment.overrides.", term), 0.0)});
    }
    return absl::OkStatus();
}

absl::Status ReadTopics(const Config& config, topics::TopicConfig& t) {
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "topics.min_documents", t.min_documents));
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "topics.n_topics", t.n_topics));
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "topics.top_keywords", t.top_keywords));
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "topics.top_bigrams", t.top_bigrams));
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "topics.words_per_topic", t.words_per_topic));
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "topics.max_iter", t.max_iter));
    ReadDouble(config, "topics.tol", t.tol);

    size_t seed = t.random_seed;
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "topics.random_seed", seed));
    t.random_seed = static_cast<uint32_t>(seed);

    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "topics.min_df", t.tfidf.min_df));
    ReadDouble(config, "topics.max_df", t.tfidf.max_df);
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "topics.max_features", t.tfidf.max_features));
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "topics.max_ngram", t.tfidf.max_ngram));
    return absl::OkStatus();
}

absl::Status ReadAspects(const Config& config, AnalysisConfig& out) {
    if (config.HasKey("aspects.industry")) {
        REVIEWSCOPE_ASSIGN_OR_RETURN(out.industry,
                                     aspects::ParseIndustry(config.GetString("aspects.industry")));
    }

    auto& a = out.aspects;
    REVIEWSCOPE_RETURN_IF_ERROR(
        ReadCount(config, "aspects.min_negative_mentions", a.min_negative_mentions));
    ReadDouble(config, "aspects.min_negative_pct", a.min_negative_pct);
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "aspects.max_examples", a.max_examples));
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "aspects.max_pain_points", a.max_pain_points));

    for (const auto& key : config.GetKeys("aspects.custom")) {
        const std::string prefix = absl::StrCat("aspects.custom.", key);
        CustomAspect custom;
        custom.definition.key = key;
        custom.definition.display_label =
            config.GetString(absl::StrCat(prefix, ".label"), key);
        custom.definition.trigger_terms = config.GetStringList(absl::StrCat(prefix, ".terms"));
        for (const auto& name : config.GetStringList(absl::StrCat(prefix, ".industries"))) {
            REVIEWSCOPE_ASSIGN_OR_RETURN(auto industry, aspects::ParseIndustry(name));
            custom.industries.push_back(industry);
        }
        out.custom_aspects.push_back(std::move(custom));
    }

    out.disabled_aspects = config.GetStringList("aspects.disabled");
    return absl::OkStatus();
}

absl::Status ReadTrends(const Config& config, AnalysisConfig& out) {
    if (config.HasKey("trends.granularity")) {
        REVIEWSCOPE_ASSIGN_OR_RETURN(
            out.trends.granularity,
            trends::ParseGranularity(config.GetString("trends.granularity")));
    }
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "trends.moving_average_window",
                                          out.trends.moving_average_window));
    ReadDouble(config, "trends.anomaly_z_threshold", out.trends.anomaly_z_threshold);
    REVIEWSCOPE_RETURN_IF_ERROR(
        ReadCount(config, "trends.recent_window", out.segments.recent_window));

    ReadDouble(config, "alerts.sentiment_critical", out.alerts.sentiment_critical);
    ReadDouble(config, "alerts.sentiment_warning", out.alerts.sentiment_warning);
    ReadDouble(config, "alerts.negative_pct_critical", out.alerts.negative_pct_critical);
    ReadDouble(config, "alerts.negative_pct_warning", out.alerts.negative_pct_warning);
    ReadDouble(config, "alerts.recent_change_warning", out.alerts.recent_change_warning);

    REVIEWSCOPE_RETURN_IF_ERROR(
        ReadCount(config, "drivers.min_mentions", out.drivers.min_mentions));
    ReadDouble(config, "drivers.impact_threshold", out.drivers.impact_threshold);
    ReadDouble(config, "drivers.sentiment_threshold", out.drivers.sentiment_threshold);
    if (config.HasKey("drivers.split")) {
        const std::string split = config.GetString("drivers.split");
        if (split == "fixed") {
            out.drivers.split = trends::QuadrantSplit::kFixed;
        } else if (split == "median") {
            out.drivers.split = trends::QuadrantSplit::kMedian;
        } else {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("drivers.split must be fixed or median, got '", split, "'"));
        }
    }

    ReadDouble(config, "nps.promoter_threshold", out.nps.promoter_threshold);
    ReadDouble(config, "nps.detractor_threshold", out.nps.detractor_threshold);
    return absl::OkStatus();
}

}  // namespace

absl::StatusOr<AnalysisConfig> AnalysisConfig::FromConfig(const Config& config) {
    AnalysisConfig out;

    out.logging.level = LogLevelFromString(config.GetString("logging.level", "info"));
    out.logging.pattern = config.GetString("logging.pattern", out.logging.pattern);
    if (config.HasKey("logging.file")) {
        out.logging.file_path = config.GetString("logging.file");
        out.logging.enable_file = !out.logging.file_path.empty();
    }
    REVIEWSCOPE_RETURN_IF_ERROR(ReadCount(config, "logging.max_files", out.logging.max_files));

    REVIEWSCOPE_RETURN_IF_ERROR(ReadSentiment(config, out.sentiment));
    REVIEWSCOPE_RETURN_IF_ERROR(ReadTopics(config, out.topics));
    REVIEWSCOPE_RETURN_IF_ERROR(ReadAspects(config, out));
    REVIEWSCOPE_RETURN_IF_ERROR(ReadTrends(config, out));
    REVIEWSCOPE_RETURN_IF_ERROR(
        ReadCount(config, "pipeline.worker_threads", out.worker_threads));

    return out;
}

absl::Status AnalysisConfig::Validate() const {
    REVIEWSCOPE_CHECK_OR_RETURN(
        sentiment.negative_threshold < sentiment.positive_threshold,
        MakeError(ErrorCode::kConfigurationError,
                  "sentiment.negative_threshold must be below sentiment.positive_threshold"));
    REVIEWSCOPE_CHECK_OR_RETURN(
        topics.n_topics > 0,
        MakeError(ErrorCode::kConfigurationError, "topics.n_topics must be positive"));
    REVIEWSCOPE_CHECK_OR_RETURN(
        topics.tfidf.max_ngram >= 1,
        MakeError(ErrorCode::kConfigurationError, "topics.max_ngram must be at least 1"));
    REVIEWSCOPE_CHECK_OR_RETURN(
        topics.tfidf.max_df > 0.0 && topics.tfidf.max_df <= 1.0,
        MakeError(ErrorCode::kConfigurationError, "topics.max_df must be in (0, 1]"));
    REVIEWSCOPE_CHECK_OR_RETURN(
        topics.tol > 0.0,
        MakeError(ErrorCode::kConfigurationError, "topics.tol must be positive"));
    REVIEWSCOPE_CHECK_OR_RETURN(
        trends.moving_average_window >= 1,
        MakeError(ErrorCode::kConfigurationError,
                  "trends.moving_average_window must be at least 1"));
    REVIEWSCOPE_CHECK_OR_RETURN(
        trends.anomaly_z_threshold > 0.0,
        MakeError(ErrorCode::kConfigurationError, "trends.anomaly_z_threshold must be positive"));
    REVIEWSCOPE_CHECK_OR_RETURN(
        nps.detractor_threshold < nps.promoter_threshold,
        MakeError(ErrorCode::kConfigurationError,
                  "nps.detractor_threshold must be below nps.promoter_threshold"));
    REVIEWSCOPE_CHECK_OR_RETURN(
        aspects.min_negative_pct >= 0.0 && aspects.min_negative_pct <= 100.0,
        MakeError(ErrorCode::kConfigurationError, "aspects.min_negative_pct must be in [0, 100]"));

    // Catches empty custom aspects and an industry left without aspects.
    REVIEWSCOPE_ASSIGN_OR_RETURN(auto catalog, BuildCatalog());
    return catalog.DefinitionsFor(industry).status();
}

absl::StatusOr<aspects::AspectCatalog> AnalysisConfig::BuildCatalog() const {
    auto catalog = aspects::AspectCatalog::Default();
    for (const auto& custom : custom_aspects) {
        REVIEWSCOPE_RETURN_IF_ERROR(catalog.AddAspect(custom.definition, custom.industries));
    }
    for (const auto& key : disabled_aspects) {
        catalog.DisableAspect(key);
    }
    return catalog;
}

}  // namespace reviewscope::pipeline
