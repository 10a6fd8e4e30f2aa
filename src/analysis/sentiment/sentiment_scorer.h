#pragma once

/// @file sentiment_scorer.h
/// @brief Lexicon-based review sentiment scoring (VADER heuristics)

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "analysis/sentiment/lexicon.h"
#include "analysis/types.h"

namespace reviewscope::sentiment {

/// @brief Sentiment scorer configuration
struct SentimentConfig {
    /// Compound at or above this is labelled positive
    double positive_threshold = 0.05;

    /// Compound at or below this is labelled negative
    double negative_threshold = -0.05;

    /// Optional VADER-format lexicon replacing the built-in table
    std::string lexicon_path;

    /// Extra domain terms applied on top of the e-commerce overrides
    std::vector<TermValence> extra_overrides;

    /// Minimum |compound| for a review to be sampled as extreme
    double extreme_threshold = 0.7;

    /// Reviews sampled per polarity
    size_t sample_count = 3;
};

/// @brief Label counts of a scored corpus
struct SentimentDistribution {
    size_t total = 0;
    size_t positive_count = 0;
    size_t neutral_count = 0;
    size_t negative_count = 0;
    double positive_pct = 0.0;
    double neutral_pct = 0.0;
    double negative_pct = 0.0;
    double average_compound = 0.0;
};

/// @brief Strongest reviews of each polarity
struct ExtremeReviews {
    std::vector<ScoredReview> most_positive;  ///< Descending compound
    std::vector<ScoredReview> most_negative;  ///< Ascending compound
};

/// @brief Scores review texts against an immutable lexicon
///
/// The scorer holds no mutable state, so one instance can be shared across
/// threads. Text is lowercased before scoring, so capitalization carries no
/// emphasis.
///
/// Example:
/// @code
///   SentimentScorer scorer(std::make_shared<const Lexicon>(Lexicon::BuiltIn()));
///   auto score = scorer.Score("Fast shipping, loved it!");
///   // score.label == SentimentLabel::kPositive
/// @endcode
class SentimentScorer {
public:
    explicit SentimentScorer(std::shared_ptr<const Lexicon> lexicon,
                             SentimentConfig config = {});

    /// @brief Score a single text
    ///
    /// Empty or whitespace-only text scores compound 0 and label neutral.
    SentimentScore Score(std::string_view text) const;

    /// @brief Score every review independently
    std::vector<ScoredReview> AnalyzeCorpus(const std::vector<Review>& reviews) const;

    SentimentLabel Classify(double compound) const;

    /// @brief Label confidence in [0, 1], rounded to 3 decimals
    double Confidence(double compound) const;

    const SentimentConfig& config() const { return config_; }
    const Lexicon& lexicon() const { return *lexicon_; }

private:
    /// Whitespace tokens with outer punctuation stripped and lexicon
    /// phrases merged into single tokens
    std::vector<std::string> Tokenize(std::string_view normalized) const;

    double TokenValence(const std::vector<std::string>& words, size_t i) const;

    std::shared_ptr<const Lexicon> lexicon_;
    SentimentConfig config_;
};

/// @brief Build the lexicon described by `config`
///
/// Uses the built-in table unless `lexicon_path` is set, then applies the
/// e-commerce overrides and `extra_overrides`.
absl::StatusOr<std::shared_ptr<const Lexicon>> BuildLexicon(const SentimentConfig& config);

SentimentDistribution ComputeDistribution(const std::vector<ScoredReview>& reviews);

/// @brief Pick up to `limit` reviews with compound >= threshold and up to
/// `limit` with compound <= -threshold
ExtremeReviews SelectExtremeReviews(const std::vector<ScoredReview>& reviews,
                                    double threshold,
                                    size_t limit);

}  // namespace reviewscope::sentiment
