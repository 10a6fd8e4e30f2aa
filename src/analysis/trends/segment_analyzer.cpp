#include "analysis/trends/segment_analyzer.h"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_cat.h>
#include <absl/time/civil_time.h>
#include <spdlog/spdlog.h>

#include "analysis/trends/trend_engine.h"

namespace reviewscope::trends {

namespace {

struct Accumulator {
    size_t count = 0;
    size_t positive = 0;
    size_t negative = 0;
    double sum = 0.0;
    std::vector<double> values;

    void Add(const ScoredReview& r) {
        ++count;
        sum += r.sentiment.compound;
        values.push_back(r.sentiment.compound);
        if (r.sentiment.label == SentimentLabel::kPositive) ++positive;
        if (r.sentiment.label == SentimentLabel::kNegative) ++negative;
    }

    double Mean() const { return count == 0 ? 0.0 : sum / static_cast<double>(count); }

    double Pct(size_t n) const {
        return count == 0 ? 0.0 : static_cast<double>(n) / static_cast<double>(count) * 100.0;
    }

    std::optional<double> SampleStd() const {
        if (count < 2) {
            return std::nullopt;
        }
        const double mean = Mean();
        double sq_sum = 0.0;
        for (double v : values) {
            sq_sum += (v - mean) * (v - mean);
        }
        return std::sqrt(sq_sum / static_cast<double>(count - 1));
    }
};

}  // namespace

SegmentAnalyzer::SegmentAnalyzer(SegmentConfig config) : config_(config) {}

std::vector<RatingSegment> SegmentAnalyzer::SegmentByRating(
    const std::vector<ScoredReview>& reviews) const {
    std::map<double, Accumulator> groups;
    for (const auto& r : reviews) {
        if (r.review.rating) {
            groups[*r.review.rating].Add(r);
        }
    }

    std::vector<RatingSegment> segments;
    segments.reserve(groups.size());
    for (const auto& [rating, acc] : groups) {
        RatingSegment seg;
        seg.rating = rating;
        seg.label = absl::StrCat(rating, "_star");
        seg.count = acc.count;
        seg.avg_sentiment = RoundTo(acc.Mean(), 3);
        seg.positive_pct = RoundTo(acc.Pct(acc.positive), 1);
        seg.negative_pct = RoundTo(acc.Pct(acc.negative), 1);
        segments.push_back(std::move(seg));
    }
    return segments;
}

std::vector<CategorySegment> SegmentAnalyzer::SegmentByCategory(
    const std::vector<ScoredReview>& reviews) const {
    std::map<std::string, Accumulator> groups;
    for (const auto& r : reviews) {
        if (r.review.category) {
            groups[*r.review.category].Add(r);
        }
    }

    std::vector<CategorySegment> segments;
    segments.reserve(groups.size());
    for (const auto& [category, acc] : groups) {
        CategorySegment seg;
        seg.category = category;
        seg.review_count = acc.count;
        seg.avg_sentiment = RoundTo(acc.Mean(), 3);
        if (auto sd = acc.SampleStd()) {
            seg.std_sentiment = RoundTo(*sd, 3);
        }
        seg.positive_pct = RoundTo(acc.Pct(acc.positive), 3);
        segments.push_back(std::move(seg));
    }

    // Groups come out of the map in category order, which breaks ties.
    std::stable_sort(segments.begin(), segments.end(),
                     [](const CategorySegment& a, const CategorySegment& b) {
                         return a.avg_sentiment > b.avg_sentiment;
                     });
    return segments;
}

ExecutiveSummary SegmentAnalyzer::Summarize(const std::vector<ScoredReview>& reviews) const {
    ExecutiveSummary summary;

    std::vector<double> ratings;
    std::vector<double> compounds;
    for (const auto& r : reviews) {
        if (r.review.rating) {
            ratings.push_back(*r.review.rating);
            compounds.push_back(r.sentiment.compound);
        }
    }
    if (auto corr = PearsonCorrelation(ratings, compounds)) {
        summary.rating_correlation = RoundTo(*corr, 3);
    }

    std::vector<const ScoredReview*> dated;
    for (const auto& r : reviews) {
        if (r.review.timestamp) {
            dated.push_back(&r);
        }
    }
    if (!dated.empty()) {
        std::stable_sort(dated.begin(), dated.end(),
                         [](const ScoredReview* a, const ScoredReview* b) {
                             return *a->review.timestamp < *b->review.timestamp;
                         });
        const size_t window = std::min(config_.recent_window, dated.size());
        Accumulator acc;
        for (size_t i = dated.size() - window; i < dated.size(); ++i) {
            acc.Add(*dated[i]);
        }
        RecentTrend recent;
        recent.review_count = acc.count;
        recent.avg_sentiment = RoundTo(acc.Mean(), 3);
        recent.positive_pct = RoundTo(acc.Pct(acc.positive), 1);
        summary.recent_trend = recent;
    }

    return summary;
}

std::vector<HeatmapCell> SegmentAnalyzer::BuildHeatmap(
    const std::vector<ScoredReview>& reviews) const {
    std::map<std::pair<std::string, absl::CivilDay>, Accumulator> cells;
    for (const auto& r : reviews) {
        if (!r.review.category || !r.review.timestamp) {
            continue;
        }
        const auto day = absl::ToCivilDay(*r.review.timestamp, absl::UTCTimeZone());
        cells[{*r.review.category, PeriodStart(day, Granularity::kWeek)}].Add(r);
    }

    std::vector<HeatmapCell> heatmap;
    heatmap.reserve(cells.size());
    for (const auto& [key, acc] : cells) {
        HeatmapCell cell;
        cell.category = key.first;
        cell.week = PeriodLabel(key.second, Granularity::kWeek);
        cell.count = acc.count;
        cell.avg_sentiment = RoundTo(acc.Mean(), 3);
        heatmap.push_back(std::move(cell));
    }

    spdlog::debug("Heatmap has {} cells", heatmap.size());
    return heatmap;
}

std::optional<double> PearsonCorrelation(const std::vector<double>& x,
                                         const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) {
        return std::nullopt;
    }

    double mean_x = 0.0;
    double mean_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mean_x += x[i];
        mean_y += y[i];
    }
    mean_x /= static_cast<double>(n);
    mean_y /= static_cast<double>(n);

    double cov = 0.0;
    double var_x = 0.0;
    double var_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = x[i] - mean_x;
        const double dy = y[i] - mean_y;
        cov += dx * dy;
        var_x += dx * dx;
        var_y += dy * dy;
    }

    if (var_x < 1e-12 || var_y < 1e-12) {
        return std::nullopt;
    }
    return std::clamp(cov / std::sqrt(var_x * var_y), -1.0, 1.0);
}

}  // namespace reviewscope::trends
