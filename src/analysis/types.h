#pragma once

/// @file types.h
/// @brief Review data model shared by every analysis stage

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/time/time.h>

namespace reviewscope {

/// @brief Raw record as handed over by the ingestion side
///
/// Any field may be missing. Records are normalized into Review before
/// analysis; a record without text cannot be analyzed.
struct ReviewRecord {
    std::optional<std::string> id;
    std::optional<std::string> text;
    std::optional<absl::Time> timestamp;
    std::optional<double> rating;
    std::optional<std::string> category;
};

/// @brief A review accepted for analysis. Treated as immutable.
struct Review {
    std::string id;
    std::string text;
    std::optional<absl::Time> timestamp;
    std::optional<double> rating;
    std::optional<std::string> category;
};

enum class SentimentLabel {
    kPositive,
    kNeutral,
    kNegative,
};

/// @brief "positive", "neutral" or "negative"
std::string_view SentimentLabelToString(SentimentLabel label);

/// @brief Lexicon score of one text
struct SentimentScore {
    double compound = 0.0;  ///< Normalized to [-1, 1]
    double pos = 0.0;
    double neu = 0.0;
    double neg = 0.0;
    SentimentLabel label = SentimentLabel::kNeutral;
    double confidence = 0.0;
};

/// @brief A review together with its sentiment and the aspects it mentions
struct ScoredReview {
    Review review;
    SentimentScore sentiment;

    /// Aspect key -> sentiment attributed to that aspect. Filled by the
    /// aspect attributor; empty straight out of the scorer.
    std::map<std::string, double> aspect_sentiment;
};

/// @brief Outcome of turning raw records into reviews
struct NormalizedBatch {
    std::vector<Review> reviews;
    size_t skipped_records = 0;
};

/// @brief Drop records without text and assign ids to anonymous ones
///
/// A missing id becomes "review-<index>", where index is the record's
/// position in `records`.
NormalizedBatch NormalizeRecords(const std::vector<ReviewRecord>& records);

/// @brief Round half away from zero to `decimals` places
double RoundTo(double value, int decimals);

}  // namespace reviewscope
