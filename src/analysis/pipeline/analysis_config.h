#pragma once

/// @file analysis_config.h
/// @brief Typed settings for a full analysis run

#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "analysis/aspects/aspect_attributor.h"
#include "analysis/aspects/aspect_catalog.h"
#include "analysis/sentiment/sentiment_scorer.h"
#include "analysis/topics/topic_extractor.h"
#include "analysis/trends/alert_rules.h"
#include "analysis/trends/driver_engine.h"
#include "analysis/trends/segment_analyzer.h"
#include "analysis/trends/trend_engine.h"
#include "common/config.h"
#include "common/logging.h"

namespace reviewscope::pipeline {

/// @brief Aspect supplied through configuration
struct CustomAspect {
    aspects::AspectDefinition definition;

    /// Industries that get the aspect; empty means all of them
    std::vector<aspects::Industry> industries;
};

/// @brief Every tunable of the analysis, grouped by stage
///
/// Defaults reproduce the built-in behaviour, so an empty YAML document is a
/// valid configuration.
struct AnalysisConfig {
    LogConfig logging;

    /// Industry used when the caller does not name one
    aspects::Industry industry = aspects::Industry::kGeneral;

    sentiment::SentimentConfig sentiment;
    topics::TopicConfig topics;
    aspects::AspectConfig aspects;
    std::vector<CustomAspect> custom_aspects;
    std::vector<std::string> disabled_aspects;

    trends::TrendConfig trends;
    trends::AlertConfig alerts;
    trends::DriverConfig drivers;
    trends::NpsConfig nps;
    trends::SegmentConfig segments;

    /// Threads of the AnalysisService pool; 0 uses the hardware concurrency
    size_t worker_threads = 0;

    /// @brief Read settings from the YAML tree
    ///
    /// Missing keys keep their defaults. Unknown industries or granularities
    /// and negative counts are configuration errors.
    static absl::StatusOr<AnalysisConfig> FromConfig(const Config& config);

    /// @brief Check cross-field constraints
    absl::Status Validate() const;

    /// @brief Built-in catalog with custom and disabled aspects applied
    absl::StatusOr<aspects::AspectCatalog> BuildCatalog() const;
};

}  // namespace reviewscope::pipeline
