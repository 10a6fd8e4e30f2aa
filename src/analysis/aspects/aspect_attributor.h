#pragma once

/// @file aspect_attributor.h
/// @brief Attribute review sentiment to the aspects each review mentions

#include <string>
#include <string_view>
#include <vector>

#include "analysis/aspects/aspect_catalog.h"
#include "analysis/types.h"

namespace reviewscope::aspects {

/// @brief Pain-point thresholds and output limits
struct AspectConfig {
    /// Negative mentions needed before an aspect can be a pain point
    size_t min_negative_mentions = 5;

    /// Share of negative mentions (percent) an aspect must exceed
    double min_negative_pct = 30.0;

    /// Example reviews attached to each pain point
    size_t max_examples = 3;

    /// Pain points reported
    size_t max_pain_points = 5;
};

/// @brief Aggregate sentiment of one aspect
struct AspectStats {
    std::string key;
    std::string label;
    size_t mentions = 0;
    size_t positive_count = 0;
    size_t neutral_count = 0;
    size_t negative_count = 0;
    double positive_pct = 0.0;
    double neutral_pct = 0.0;
    double negative_pct = 0.0;
    double avg_sentiment = 0.0;
};

struct PainPointExample {
    std::string review_id;
    std::string text;
    double compound = 0.0;
};

/// @brief An aspect with a high concentration of negative mentions
struct PainPoint {
    std::string key;
    std::string label;
    size_t negative_mentions = 0;
    size_t mentions = 0;
    double negative_pct = 0.0;
    double avg_negative_score = 0.0;
    std::vector<PainPointExample> examples;  ///< Most negative first
};

/// @brief Unrounded per-aspect totals consumed by the driver model
struct DriverInput {
    std::string key;
    std::string label;
    size_t mention_count = 0;
    double sentiment_sum = 0.0;
};

/// @brief Corpus-wide sentiment totals consumed by the driver model
struct OverallSentiment {
    size_t review_count = 0;
    double sentiment_sum = 0.0;

    double Mean() const {
        return review_count == 0 ? 0.0 : sentiment_sum / static_cast<double>(review_count);
    }
};

struct AspectAnalysis {
    /// Aspects with at least one mention; most mentioned first
    std::vector<AspectStats> aspects;

    /// Largest negative count first
    std::vector<PainPoint> pain_points;

    /// Same order as `aspects`
    std::vector<DriverInput> driver_inputs;

    OverallSentiment overall;

    /// Copies of the input reviews with `aspect_sentiment` filled in
    std::vector<ScoredReview> tagged_reviews;
};

/// @brief Keyword-driven aspect attribution
///
/// Trigger terms match case-insensitively on word boundaries, so "rep"
/// matches "the rep was rude" but not "report". Each mentioning review
/// contributes its own compound score to the aspect; sub-sentences are not
/// re-scored.
class AspectAttributor {
public:
    AspectAttributor(std::vector<AspectDefinition> definitions, AspectConfig config = {});

    AspectAnalysis Attribute(const std::vector<ScoredReview>& reviews) const;

    /// @brief Keys of the aspects `text` mentions, in definition order
    std::vector<std::string> MatchAspects(std::string_view text) const;

    const std::vector<AspectDefinition>& definitions() const { return definitions_; }

private:
    std::vector<AspectDefinition> definitions_;
    AspectConfig config_;
};

}  // namespace reviewscope::aspects
