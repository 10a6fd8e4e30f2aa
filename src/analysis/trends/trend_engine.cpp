#include "analysis/trends/trend_engine.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <spdlog/spdlog.h>

#include "common/error.h"

namespace reviewscope::trends {

namespace {

struct PeriodTotals {
    size_t volume = 0;
    size_t positive = 0;
    double sum = 0.0;
};

absl::CivilDay DayOf(absl::Time t) {
    return absl::ToCivilDay(t, absl::UTCTimeZone());
}

PeriodSummary Summarize(const std::vector<const ScoredReview*>& reviews, const DateRange& range) {
    PeriodSummary summary;
    summary.date_range = absl::StrCat(absl::FormatCivilTime(range.start), " to ",
                                      absl::FormatCivilTime(range.end));
    summary.review_count = reviews.size();
    if (reviews.empty()) {
        return summary;
    }

    double sum = 0.0;
    size_t positive = 0;
    for (const auto* r : reviews) {
        sum += r->sentiment.compound;
        if (r->sentiment.label == SentimentLabel::kPositive) {
            ++positive;
        }
    }
    const double n = static_cast<double>(reviews.size());
    summary.avg_sentiment = RoundTo(sum / n, 3);
    summary.positive_pct = RoundTo(positive / n * 100.0, 1);
    return summary;
}

}  // namespace

std::string_view GranularityToString(Granularity granularity) {
    switch (granularity) {
        case Granularity::kWeek: return "week";
        case Granularity::kMonth: return "month";
        case Granularity::kDay:
        default:
            return "day";
    }
}

absl::StatusOr<Granularity> ParseGranularity(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(name);
    if (lowered == "day" || lowered == "d" || lowered == "daily") return Granularity::kDay;
    if (lowered == "week" || lowered == "w" || lowered == "weekly") return Granularity::kWeek;
    if (lowered == "month" || lowered == "m" || lowered == "monthly") return Granularity::kMonth;
    return MakeError(ErrorCode::kConfigurationError,
                     absl::StrCat("unknown trend granularity '", name, "'"));
}

std::string_view AnomalyTypeToString(AnomalyType type) {
    return type == AnomalyType::kPositiveSpike ? "positive_spike" : "negative_spike";
}

absl::CivilDay PeriodStart(absl::CivilDay day, Granularity granularity) {
    switch (granularity) {
        case Granularity::kWeek:
            return absl::PrevWeekday(day + 1, absl::Weekday::monday);
        case Granularity::kMonth:
            return absl::CivilDay(absl::CivilMonth(day));
        case Granularity::kDay:
        default:
            return day;
    }
}

absl::CivilDay NextPeriodStart(absl::CivilDay start, Granularity granularity) {
    switch (granularity) {
        case Granularity::kWeek:
            return start + 7;
        case Granularity::kMonth:
            return absl::CivilDay(absl::CivilMonth(start) + 1);
        case Granularity::kDay:
        default:
            return start + 1;
    }
}

std::string PeriodLabel(absl::CivilDay start, Granularity granularity) {
    if (granularity == Granularity::kMonth) {
        return absl::FormatCivilTime(absl::CivilMonth(start));
    }
    return absl::FormatCivilTime(start);
}

// =============================================================================
// TrendEngine
// =============================================================================

TrendEngine::TrendEngine(TrendConfig config) : config_(config) {}

TrendResult TrendEngine::ComputeTrends(const std::vector<ScoredReview>& reviews) const {
    return ComputeTrends(reviews, config_.granularity);
}

TrendResult TrendEngine::ComputeTrends(const std::vector<ScoredReview>& reviews,
                                       Granularity granularity) const {
    TrendResult result;
    result.granularity = granularity;

    std::map<absl::CivilDay, PeriodTotals> totals;
    for (const auto& r : reviews) {
        if (!r.review.timestamp.has_value()) {
            ++result.excluded_reviews;
            continue;
        }
        auto& bucket = totals[PeriodStart(DayOf(*r.review.timestamp), granularity)];
        bucket.volume++;
        bucket.sum += r.sentiment.compound;
        if (r.sentiment.label == SentimentLabel::kPositive) {
            bucket.positive++;
        }
    }

    if (totals.empty()) {
        return result;
    }

    // Walk every period between the first and last so gaps appear
    const absl::CivilDay last = totals.rbegin()->first;
    std::vector<std::optional<double>> raw_avg;
    for (absl::CivilDay start = totals.begin()->first; start <= last;
         start = NextPeriodStart(start, granularity)) {
        PeriodBucket bucket;
        bucket.start = start;
        bucket.label = PeriodLabel(start, granularity);

        auto it = totals.find(start);
        if (it != totals.end()) {
            const double volume = static_cast<double>(it->second.volume);
            bucket.volume = it->second.volume;
            bucket.sentiment_avg = RoundTo(it->second.sum / volume, 3);
            bucket.positive_pct = RoundTo(it->second.positive / volume * 100.0, 1);
            raw_avg.push_back(it->second.sum / volume);
        } else {
            raw_avg.push_back(std::nullopt);
        }
        result.periods.push_back(std::move(bucket));
    }

    const size_t window = std::max<size_t>(1, config_.moving_average_window);
    std::optional<double> previous;
    for (size_t i = 0; i < result.periods.size(); ++i) {
        double sum = 0.0;
        size_t count = 0;
        for (size_t j = (i + 1 >= window ? i + 1 - window : 0); j <= i; ++j) {
            if (raw_avg[j].has_value()) {
                sum += *raw_avg[j];
                ++count;
            }
        }
        if (count > 0) {
            result.periods[i].moving_avg = RoundTo(sum / static_cast<double>(count), 3);
        }

        if (raw_avg[i].has_value()) {
            if (previous.has_value()) {
                result.periods[i].change_from_previous = RoundTo(*raw_avg[i] - *previous, 3);
            }
            previous = raw_avg[i];
        }
    }

    result.anomalies = DetectAnomalies(result.periods);

    spdlog::debug("Trends: {} {} periods, {} anomalies, {} reviews without timestamp",
                  result.periods.size(), GranularityToString(granularity),
                  result.anomalies.size(), result.excluded_reviews);
    return result;
}

std::vector<Anomaly> TrendEngine::DetectAnomalies(const std::vector<PeriodBucket>& periods) const {
    std::vector<Anomaly> anomalies;

    std::vector<double> series;
    for (const auto& p : periods) {
        if (p.sentiment_avg.has_value()) {
            series.push_back(*p.sentiment_avg);
        }
    }
    if (series.size() < 2) {
        return anomalies;
    }

    const double mean = std::accumulate(series.begin(), series.end(), 0.0) / series.size();
    double sq_sum = 0.0;
    for (double v : series) {
        sq_sum += (v - mean) * (v - mean);
    }
    const double std_dev = std::sqrt(sq_sum / static_cast<double>(series.size() - 1));
    if (std_dev < 1e-10) {
        return anomalies;
    }

    for (const auto& p : periods) {
        if (!p.sentiment_avg.has_value()) {
            continue;
        }
        const double z = (*p.sentiment_avg - mean) / std_dev;
        if (std::fabs(z) <= config_.anomaly_z_threshold) {
            continue;
        }
        Anomaly anomaly;
        anomaly.period = p.label;
        anomaly.type = z > 0 ? AnomalyType::kPositiveSpike : AnomalyType::kNegativeSpike;
        anomaly.z_score = RoundTo(z, 2);
        anomaly.sentiment_avg = *p.sentiment_avg;
        anomalies.push_back(std::move(anomaly));
    }
    return anomalies;
}

absl::StatusOr<PeriodComparison> TrendEngine::ComparePeriods(
    const std::vector<ScoredReview>& reviews,
    const DateRange& first,
    const DateRange& second) const {
    std::vector<const ScoredReview*> in_first;
    std::vector<const ScoredReview*> in_second;
    for (const auto& r : reviews) {
        if (!r.review.timestamp.has_value()) {
            continue;
        }
        const absl::CivilDay day = DayOf(*r.review.timestamp);
        if (day >= first.start && day <= first.end) {
            in_first.push_back(&r);
        }
        if (day >= second.start && day <= second.end) {
            in_second.push_back(&r);
        }
    }

    if (in_first.empty() || in_second.empty()) {
        return MakeError(ErrorCode::kEmptyInput, "insufficient data for period comparison");
    }

    PeriodComparison comparison;
    comparison.first = Summarize(in_first, first);
    comparison.second = Summarize(in_second, second);

    const double change = comparison.second.avg_sentiment - comparison.first.avg_sentiment;
    comparison.sentiment_change = RoundTo(change, 3);
    comparison.sentiment_change_pct =
        comparison.first.avg_sentiment != 0.0
            ? RoundTo(change / std::fabs(comparison.first.avg_sentiment) * 100.0, 1)
            : 0.0;
    comparison.positive_pct_change =
        RoundTo(comparison.second.positive_pct - comparison.first.positive_pct, 1);
    if (change > 0.05) {
        comparison.trend = "improving";
    } else if (change < -0.05) {
        comparison.trend = "declining";
    } else {
        comparison.trend = "stable";
    }
    return comparison;
}

}  // namespace reviewscope::trends
