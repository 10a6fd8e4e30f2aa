#include "analysis/types.h"

#include <cmath>

#include <absl/strings/str_cat.h>

namespace reviewscope {

std::string_view SentimentLabelToString(SentimentLabel label) {
    switch (label) {
        case SentimentLabel::kPositive:
            return "positive";
        case SentimentLabel::kNegative:
            return "negative";
        case SentimentLabel::kNeutral:
        default:
            return "neutral";
    }
}

NormalizedBatch NormalizeRecords(const std::vector<ReviewRecord>& records) {
    NormalizedBatch batch;
    batch.reviews.reserve(records.size());

    for (size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        if (!record.text.has_value()) {
            ++batch.skipped_records;
            continue;
        }

        Review review;
        review.id = (record.id.has_value() && !record.id->empty())
                        ? *record.id
                        : absl::StrCat("review-", i);
        review.text = *record.text;
        review.timestamp = record.timestamp;
        review.rating = record.rating;
        review.category = record.category;
        batch.reviews.push_back(std::move(review));
    }

    return batch;
}

double RoundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

}  // namespace reviewscope
