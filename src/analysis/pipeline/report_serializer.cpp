/// @file report_serializer.cpp
/// @brief JSON mapping of records and reports

#include "analysis/pipeline/report_serializer.h"

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/time/civil_time.h>
#include <absl/time/time.h>
#include <spdlog/spdlog.h>

#include "common/error.h"

namespace reviewscope::pipeline {

using json = nlohmann::json;

namespace {

template <typename T>
json Optional(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

std::string FormatTimestamp(absl::Time t) {
    return absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", t, absl::UTCTimeZone());
}

json ScoreToJson(const SentimentScore& s) {
    return {
        {"compound", s.compound},
        {"pos", s.pos},
        {"neu", s.neu},
        {"neg", s.neg},
        {"label", std::string(SentimentLabelToString(s.label))},
        {"confidence", s.confidence},
    };
}

json ReviewToJson(const ScoredReview& r) {
    json j = {
        {"id", r.review.id},
        {"text", r.review.text},
        {"sentiment", ScoreToJson(r.sentiment)},
        {"rating", Optional(r.review.rating)},
        {"category", Optional(r.review.category)},
        {"aspects", r.aspect_sentiment},
    };
    j["timestamp"] = r.review.timestamp ? json(FormatTimestamp(*r.review.timestamp))
                                        : json(nullptr);
    return j;
}

json SampleToJson(const ScoredReview& r) {
    return {
        {"id", r.review.id},
        {"text", r.review.text},
        {"compound", r.sentiment.compound},
    };
}

json OverviewToJson(const sentiment::SentimentDistribution& d) {
    return {
        {"total", d.total},
        {"average_compound", d.average_compound},
        {"counts", {{"positive", d.positive_count},
                    {"neutral", d.neutral_count},
                    {"negative", d.negative_count}}},
        {"pct", {{"positive", d.positive_pct},
                 {"neutral", d.neutral_pct},
                 {"negative", d.negative_pct}}},
    };
}

json NpsToJson(const trends::NpsResult& n) {
    return {
        {"nps_proxy", n.nps_proxy},
        {"promoters", n.promoters},
        {"passives", n.passives},
        {"detractors", n.detractors},
        {"promoters_pct", n.promoters_pct},
        {"passives_pct", n.passives_pct},
        {"detractors_pct", n.detractors_pct},
        {"total", n.total},
    };
}

json TopicsToJson(const AnalysisReport& report) {
    json keywords = json::array();
    for (const auto& k : report.topics.keywords) {
        keywords.push_back({{"term", k.term}, {"score", k.score}});
    }

    json bigrams = json::array();
    for (const auto& b : report.topics.bigrams) {
        bigrams.push_back({{"phrase", b.phrase}, {"score", b.score}, {"count", b.count}});
    }

    json clusters = json::array();
    for (const auto& c : report.topics.clusters) {
        json words = json::array();
        for (const auto& w : c.words) {
            words.push_back({{"word", w.word}, {"weight", w.weight}});
        }
        clusters.push_back({{"id", c.id},
                            {"name", c.name},
                            {"words", std::move(words)},
                            {"document_count", c.document_count}});
    }

    json frequencies = json::array();
    for (const auto& f : report.word_frequencies) {
        frequencies.push_back({{"word", f.word}, {"count", f.count}});
    }

    return {
        {"keywords", std::move(keywords)},
        {"bigrams", std::move(bigrams)},
        {"clusters", std::move(clusters)},
        {"document_topics", report.topics.document_topics},
        {"documents_used", report.topics.documents_used},
        {"word_frequencies", std::move(frequencies)},
    };
}

json AspectsToJson(const std::vector<aspects::AspectStats>& rows) {
    json out = json::array();
    for (const auto& a : rows) {
        out.push_back({
            {"key", a.key},
            {"label", a.label},
            {"mentions", a.mentions},
            {"positive_count", a.positive_count},
            {"neutral_count", a.neutral_count},
            {"negative_count", a.negative_count},
            {"positive_pct", a.positive_pct},
            {"neutral_pct", a.neutral_pct},
            {"negative_pct", a.negative_pct},
            {"avg_sentiment", a.avg_sentiment},
        });
    }
    return out;
}

json PainPointsToJson(const std::vector<aspects::PainPoint>& rows) {
    json out = json::array();
    for (const auto& p : rows) {
        json examples = json::array();
        for (const auto& e : p.examples) {
            examples.push_back({{"id", e.review_id}, {"text", e.text}, {"compound", e.compound}});
        }
        out.push_back({
            {"key", p.key},
            {"label", p.label},
            {"negative_mentions", p.negative_mentions},
            {"mentions", p.mentions},
            {"negative_pct", p.negative_pct},
            {"avg_negative_score", p.avg_negative_score},
            {"examples", std::move(examples)},
        });
    }
    return out;
}

json DriversToJson(const std::vector<trends::KeyDriver>& rows) {
    json out = json::array();
    for (const auto& d : rows) {
        out.push_back({
            {"aspect", d.aspect},
            {"label", d.label},
            {"avg_sentiment", d.avg_sentiment},
            {"mention_count", d.mention_count},
            {"impact_score", d.impact_score},
            {"priority", std::string(trends::DriverPriorityToString(d.priority))},
        });
    }
    return out;
}

json TrendsToJson(const trends::TrendResult& t) {
    json periods = json::array();
    for (const auto& p : t.periods) {
        periods.push_back({
            {"period", p.label},
            {"volume", p.volume},
            {"sentiment_avg", Optional(p.sentiment_avg)},
            {"moving_avg", Optional(p.moving_avg)},
            {"positive_pct", Optional(p.positive_pct)},
            {"change_from_previous", Optional(p.change_from_previous)},
        });
    }
    return {
        {"granularity", std::string(trends::GranularityToString(t.granularity))},
        {"periods", std::move(periods)},
        {"excluded_reviews", t.excluded_reviews},
    };
}

json AnomaliesToJson(const std::vector<trends::Anomaly>& rows) {
    json out = json::array();
    for (const auto& a : rows) {
        out.push_back({
            {"period", a.period},
            {"type", std::string(trends::AnomalyTypeToString(a.type))},
            {"z_score", a.z_score},
            {"sentiment_avg", a.sentiment_avg},
        });
    }
    return out;
}

json AlertsToJson(const std::vector<trends::Alert>& rows) {
    json out = json::array();
    for (const auto& a : rows) {
        out.push_back({
            {"severity", std::string(trends::AlertSeverityToString(a.severity))},
            {"metric", std::string(trends::AlertMetricToString(a.metric))},
            {"message", a.message},
            {"value", a.value},
            {"threshold", a.threshold},
        });
    }
    return out;
}

json SegmentsToJson(const AnalysisReport& report) {
    json by_rating = json::array();
    for (const auto& s : report.rating_segments) {
        by_rating.push_back({
            {"rating", s.rating},
            {"label", s.label},
            {"count", s.count},
            {"avg_sentiment", s.avg_sentiment},
            {"positive_pct", s.positive_pct},
            {"negative_pct", s.negative_pct},
        });
    }

    json by_category = json::array();
    for (const auto& s : report.category_segments) {
        by_category.push_back({
            {"category", s.category},
            {"review_count", s.review_count},
            {"avg_sentiment", s.avg_sentiment},
            {"std_sentiment", Optional(s.std_sentiment)},
            {"positive_pct", s.positive_pct},
        });
    }

    json heatmap = json::array();
    for (const auto& c : report.heatmap) {
        heatmap.push_back({
            {"category", c.category},
            {"week", c.week},
            {"count", c.count},
            {"avg_sentiment", c.avg_sentiment},
        });
    }

    return {
        {"by_rating", std::move(by_rating)},
        {"by_category", std::move(by_category)},
        {"heatmap", std::move(heatmap)},
    };
}

json SummaryToJson(const trends::ExecutiveSummary& s) {
    json recent = nullptr;
    if (s.recent_trend) {
        recent = {
            {"review_count", s.recent_trend->review_count},
            {"avg_sentiment", s.recent_trend->avg_sentiment},
            {"positive_pct", s.recent_trend->positive_pct},
        };
    }
    return {
        {"rating_correlation", Optional(s.rating_correlation)},
        {"recent_trend", std::move(recent)},
    };
}

std::optional<std::string> ReadString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) {
        return absl::StrCat(it->get<int64_t>());
    }
    return std::nullopt;
}

std::optional<double> ReadNumber(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    double value = 0.0;
    if (it->is_string() && absl::SimpleAtod(it->get<std::string>(), &value)) {
        return value;
    }
    return std::nullopt;
}

}  // namespace

std::optional<absl::Time> ParseTimestamp(std::string_view text) {
    absl::Time t;
    std::string err;
    if (absl::ParseTime(absl::RFC3339_full, text, &t, &err)) {
        return t;
    }
    absl::CivilSecond second;
    if (absl::ParseCivilTime(text, &second)) {
        return absl::FromCivil(second, absl::UTCTimeZone());
    }
    absl::CivilDay day;
    if (absl::ParseCivilTime(text, &day)) {
        return absl::FromCivil(day, absl::UTCTimeZone());
    }
    return std::nullopt;
}

json ReportToJson(const AnalysisReport& report) {
    json reviews = json::array();
    for (const auto& r : report.reviews) {
        reviews.push_back(ReviewToJson(r));
    }

    json most_positive = json::array();
    for (const auto& r : report.sample_reviews.most_positive) {
        most_positive.push_back(SampleToJson(r));
    }
    json most_negative = json::array();
    for (const auto& r : report.sample_reviews.most_negative) {
        most_negative.push_back(SampleToJson(r));
    }

    return {
        {"industry", report.industry},
        {"review_count", report.review_count},
        {"skipped_records", report.skipped_records},
        {"overview", OverviewToJson(report.overview)},
        {"nps", NpsToJson(report.nps)},
        {"reviews", std::move(reviews)},
        {"topics", TopicsToJson(report)},
        {"aspects", AspectsToJson(report.aspects)},
        {"pain_points", PainPointsToJson(report.pain_points)},
        {"key_drivers", DriversToJson(report.key_drivers)},
        {"trends", TrendsToJson(report.trends)},
        {"anomalies", AnomaliesToJson(report.trends.anomalies)},
        {"alerts", AlertsToJson(report.alerts)},
        {"sample_reviews", {{"most_positive", std::move(most_positive)},
                            {"most_negative", std::move(most_negative)}}},
        {"segments", SegmentsToJson(report)},
        {"summary", SummaryToJson(report.summary)},
    };
}

std::string SerializeReport(const AnalysisReport& report, int indent) {
    // Review text is caller data; invalid UTF-8 becomes U+FFFD instead of throwing
    return ReportToJson(report).dump(indent, ' ', false, json::error_handler_t::replace);
}

absl::StatusOr<std::vector<ReviewRecord>> ParseReviewRecords(std::string_view json_text) {
    json doc;
    try {
        doc = json::parse(json_text.begin(), json_text.end());
    } catch (const json::parse_error& e) {
        return MakeError(ErrorCode::kParseError, absl::StrCat("Invalid review JSON: ", e.what()));
    }

    const json* items = &doc;
    if (doc.is_object()) {
        auto it = doc.find("reviews");
        if (it == doc.end()) {
            return MakeError(ErrorCode::kParseError, "Expected a \"reviews\" array");
        }
        items = &*it;
    }
    if (!items->is_array()) {
        return MakeError(ErrorCode::kParseError, "Expected an array of review objects");
    }

    std::vector<ReviewRecord> records;
    records.reserve(items->size());
    for (size_t i = 0; i < items->size(); ++i) {
        const json& item = (*items)[i];
        if (!item.is_object()) {
            return MakeError(ErrorCode::kParseError,
                             absl::StrCat("Review entry ", i, " is not an object"));
        }

        ReviewRecord record;
        record.id = ReadString(item, "id");
        record.text = ReadString(item, "text");
        if (!record.text) {
            record.text = ReadString(item, "review_text");
        }
        record.category = ReadString(item, "category");
        record.rating = ReadNumber(item, "rating");

        auto raw_time = ReadString(item, "timestamp");
        if (!raw_time) {
            raw_time = ReadString(item, "date");
        }
        if (raw_time) {
            record.timestamp = ParseTimestamp(*raw_time);
            if (!record.timestamp) {
                spdlog::warn("Review entry {} has unreadable timestamp '{}'", i, *raw_time);
            }
        }

        records.push_back(std::move(record));
    }

    spdlog::debug("Parsed {} review records", records.size());
    return records;
}

}  // namespace reviewscope::pipeline
