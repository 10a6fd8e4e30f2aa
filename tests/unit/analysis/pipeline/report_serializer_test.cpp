/// @file report_serializer_test.cpp
/// @brief Tests for JSON review input and report output

#include <gtest/gtest.h>

#include "analysis/pipeline/report_serializer.h"
#include "common/error.h"

namespace reviewscope::pipeline {
namespace {

using json = nlohmann::json;

TEST(ParseReviewRecordsTest, ArrayOfObjects) {
    auto records = ParseReviewRecords(R"([
        {"id": "a1", "text": "Love it", "rating": 5, "category": "shoes",
         "timestamp": "2024-03-01T10:30:00Z"},
        {"id": 42, "review_text": "Meh", "rating": "3", "date": "2024-03-02"},
        {"text": "No metadata"}
    ])");
    ASSERT_TRUE(records.ok()) << records.status();
    ASSERT_EQ(records->size(), 3u);

    const auto& first = (*records)[0];
    EXPECT_EQ(*first.id, "a1");
    EXPECT_EQ(*first.text, "Love it");
    EXPECT_DOUBLE_EQ(*first.rating, 5.0);
    EXPECT_EQ(*first.category, "shoes");
    ASSERT_TRUE(first.timestamp.has_value());
    EXPECT_EQ(*first.timestamp,
              absl::FromCivil(absl::CivilSecond(2024, 3, 1, 10, 30, 0), absl::UTCTimeZone()));

    const auto& second = (*records)[1];
    EXPECT_EQ(*second.id, "42");
    EXPECT_EQ(*second.text, "Meh");
    EXPECT_DOUBLE_EQ(*second.rating, 3.0);
    EXPECT_EQ(*second.timestamp,
              absl::FromCivil(absl::CivilDay(2024, 3, 2), absl::UTCTimeZone()));

    const auto& third = (*records)[2];
    EXPECT_FALSE(third.id.has_value());
    EXPECT_FALSE(third.rating.has_value());
    EXPECT_FALSE(third.timestamp.has_value());
}

TEST(ParseReviewRecordsTest, WrappedInReviewsObject) {
    auto records = ParseReviewRecords(R"({"reviews": [{"text": "Fine"}]})");
    ASSERT_TRUE(records.ok());
    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ(*(*records)[0].text, "Fine");
}

TEST(ParseReviewRecordsTest, MissingTextIsKept) {
    auto records = ParseReviewRecords(R"([{"id": "x", "text": null}])");
    ASSERT_TRUE(records.ok());
    ASSERT_EQ(records->size(), 1u);
    EXPECT_FALSE((*records)[0].text.has_value());
}

TEST(ParseReviewRecordsTest, UnreadableTimestampLeftEmpty) {
    auto records = ParseReviewRecords(R"([{"text": "ok", "timestamp": "last tuesday"}])");
    ASSERT_TRUE(records.ok());
    EXPECT_FALSE((*records)[0].timestamp.has_value());
}

TEST(ParseReviewRecordsTest, Errors) {
    auto malformed = ParseReviewRecords("[{\"text\": ");
    ASSERT_FALSE(malformed.ok());
    EXPECT_TRUE(absl::IsInvalidArgument(malformed.status()));

    EXPECT_FALSE(ParseReviewRecords(R"({"items": []})").ok());
    EXPECT_FALSE(ParseReviewRecords(R"("just a string")").ok());
    EXPECT_FALSE(ParseReviewRecords(R"([{"text": "ok"}, 7])").ok());

    auto empty = ParseReviewRecords("[]");
    ASSERT_TRUE(empty.ok());
    EXPECT_TRUE(empty->empty());
}

TEST(ParseTimestampTest, Formats) {
    const auto utc = absl::UTCTimeZone();
    EXPECT_EQ(*ParseTimestamp("2024-03-01"), absl::FromCivil(absl::CivilDay(2024, 3, 1), utc));
    EXPECT_EQ(*ParseTimestamp("2024-03-01T08:00:00"),
              absl::FromCivil(absl::CivilSecond(2024, 3, 1, 8, 0, 0), utc));
    EXPECT_EQ(*ParseTimestamp("2024-03-01T10:00:00+02:00"),
              absl::FromCivil(absl::CivilSecond(2024, 3, 1, 8, 0, 0), utc));
    EXPECT_FALSE(ParseTimestamp("03/01/2024").has_value());
    EXPECT_FALSE(ParseTimestamp("").has_value());
}

AnalysisReport SmallReport() {
    AnalysisReport report;
    report.industry = "general";
    report.review_count = 1;
    report.overview.total = 1;
    report.overview.positive_count = 1;
    report.overview.positive_pct = 100.0;
    report.overview.average_compound = 0.8268;

    ScoredReview review;
    review.review.id = "r1";
    review.review.text = "Fast shipping, loved it!";
    review.review.timestamp =
        absl::FromCivil(absl::CivilSecond(2024, 3, 1, 9, 5, 0), absl::UTCTimeZone());
    review.sentiment.compound = 0.8268;
    review.sentiment.label = SentimentLabel::kPositive;
    review.aspect_sentiment["shipping"] = 0.8268;
    report.reviews.push_back(review);

    trends::KeyDriver driver;
    driver.aspect = "shipping";
    driver.priority = trends::DriverPriority::kFixNow;
    report.key_drivers.push_back(driver);

    trends::Alert alert;
    alert.severity = trends::AlertSeverity::kCritical;
    alert.metric = trends::AlertMetric::kNegativePct;
    report.alerts.push_back(alert);
    return report;
}

TEST(ReportToJsonTest, TopLevelSections) {
    json j = ReportToJson(SmallReport());

    for (const char* key : {"industry", "review_count", "skipped_records", "overview", "nps",
                            "reviews", "topics", "aspects", "pain_points", "key_drivers",
                            "trends", "anomalies", "alerts", "sample_reviews", "segments",
                            "summary"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_EQ(j["industry"], "general");
    EXPECT_EQ(j["overview"]["counts"]["positive"], 1);
}

TEST(ReportToJsonTest, ReviewFields) {
    json review = ReportToJson(SmallReport())["reviews"][0];

    EXPECT_EQ(review["id"], "r1");
    EXPECT_EQ(review["sentiment"]["label"], "positive");
    EXPECT_DOUBLE_EQ(review["sentiment"]["compound"].get<double>(), 0.8268);
    EXPECT_EQ(review["timestamp"], "2024-03-01T09:05:00Z");
    EXPECT_TRUE(review["rating"].is_null());
    EXPECT_TRUE(review["category"].is_null());
    EXPECT_DOUBLE_EQ(review["aspects"]["shipping"].get<double>(), 0.8268);
}

TEST(ReportToJsonTest, EnumsAsStrings) {
    json j = ReportToJson(SmallReport());
    EXPECT_EQ(j["key_drivers"][0]["priority"], "fix_now");
    EXPECT_EQ(j["alerts"][0]["severity"], "critical");
    EXPECT_EQ(j["alerts"][0]["metric"], "negative_pct");
    EXPECT_EQ(j["trends"]["granularity"], "day");
}

TEST(ReportToJsonTest, EmptyReport) {
    json j = ReportToJson(AnalysisReport{});
    EXPECT_EQ(j["review_count"], 0);
    EXPECT_TRUE(j["reviews"].empty());
    EXPECT_TRUE(j["summary"]["rating_correlation"].is_null());
    EXPECT_TRUE(j["summary"]["recent_trend"].is_null());
}

TEST(SerializeReportTest, DeterministicAndSorted) {
    const auto report = SmallReport();
    const std::string first = SerializeReport(report);
    EXPECT_EQ(first, SerializeReport(report));

    // Keys are emitted alphabetically
    EXPECT_LT(first.find("\"alerts\""), first.find("\"industry\""));
    EXPECT_LT(first.find("\"industry\""), first.find("\"summary\""));

    const std::string compact = SerializeReport(report, -1);
    EXPECT_EQ(compact.find('\n'), std::string::npos);
    EXPECT_EQ(json::parse(compact), json::parse(first));
}

TEST(SerializeReportTest, InvalidUtf8IsReplaced) {
    auto report = SmallReport();
    report.reviews[0].review.text = "Caf\xe9 was great, fast shipping";
    report.reviews[0].review.category = std::string("\xffshoes");

    std::string out;
    ASSERT_NO_THROW(out = SerializeReport(report));

    json parsed = json::parse(out);
    const std::string text = parsed["reviews"][0]["text"].get<std::string>();
    EXPECT_EQ(text.rfind("Caf\xEF\xBF\xBD", 0), 0u);
    EXPECT_NE(text.find(" was great, fast shipping"), std::string::npos);
    EXPECT_NE(parsed["reviews"][0]["category"].get<std::string>().find("shoes"),
              std::string::npos);

    ASSERT_NO_THROW(SerializeReport(report, -1));
}

}  // namespace
}  // namespace reviewscope::pipeline
