/// @file trend_engine_test.cpp
/// @brief Tests for period bucketing, moving averages and anomaly detection

#include <absl/strings/str_cat.h>
#include <gtest/gtest.h>

#include "analysis/trends/trend_engine.h"

namespace reviewscope::trends {
namespace {

ScoredReview At(absl::CivilDay day, double compound) {
    ScoredReview r;
    r.review.id = absl::StrCat("review-", absl::FormatCivilTime(day), "-", compound);
    r.review.text = "text";
    r.review.timestamp =
        absl::FromCivil(absl::CivilSecond(day.year(), day.month(), day.day(), 12, 0, 0),
                        absl::UTCTimeZone());
    r.sentiment.compound = compound;
    if (compound >= 0.05) {
        r.sentiment.label = SentimentLabel::kPositive;
    } else if (compound <= -0.05) {
        r.sentiment.label = SentimentLabel::kNegative;
    }
    return r;
}

TEST(GranularityTest, Parse) {
    EXPECT_EQ(*ParseGranularity("day"), Granularity::kDay);
    EXPECT_EQ(*ParseGranularity("Weekly"), Granularity::kWeek);
    EXPECT_EQ(*ParseGranularity("M"), Granularity::kMonth);
    EXPECT_FALSE(ParseGranularity("quarter").ok());
    EXPECT_EQ(GranularityToString(Granularity::kWeek), "week");
}

TEST(GranularityTest, PeriodStarts) {
    // 2024-03-06 is a Wednesday
    EXPECT_EQ(PeriodStart(absl::CivilDay(2024, 3, 6), Granularity::kWeek),
              absl::CivilDay(2024, 3, 4));
    EXPECT_EQ(PeriodStart(absl::CivilDay(2024, 3, 4), Granularity::kWeek),
              absl::CivilDay(2024, 3, 4));
    EXPECT_EQ(PeriodStart(absl::CivilDay(2024, 3, 10), Granularity::kWeek),
              absl::CivilDay(2024, 3, 4));
    EXPECT_EQ(PeriodStart(absl::CivilDay(2024, 3, 31), Granularity::kMonth),
              absl::CivilDay(2024, 3, 1));
    EXPECT_EQ(NextPeriodStart(absl::CivilDay(2024, 12, 1), Granularity::kMonth),
              absl::CivilDay(2025, 1, 1));
    EXPECT_EQ(PeriodLabel(absl::CivilDay(2024, 3, 1), Granularity::kMonth), "2024-03");
    EXPECT_EQ(PeriodLabel(absl::CivilDay(2024, 3, 1), Granularity::kDay), "2024-03-01");
}

TEST(TrendEngineTest, DailyBucketsWithGaps) {
    TrendEngine engine;
    auto result = engine.ComputeTrends({
        At(absl::CivilDay(2024, 3, 4), 0.2),
        At(absl::CivilDay(2024, 3, 1), 0.6),
        At(absl::CivilDay(2024, 3, 1), -0.4),
    });

    ASSERT_EQ(result.periods.size(), 4u);
    EXPECT_EQ(result.periods[0].label, "2024-03-01");
    EXPECT_EQ(result.periods[0].volume, 2u);
    EXPECT_NEAR(*result.periods[0].sentiment_avg, 0.1, 1e-9);
    EXPECT_DOUBLE_EQ(*result.periods[0].positive_pct, 50.0);
    EXPECT_FALSE(result.periods[0].change_from_previous.has_value());

    EXPECT_EQ(result.periods[1].volume, 0u);
    EXPECT_FALSE(result.periods[1].sentiment_avg.has_value());
    EXPECT_FALSE(result.periods[2].sentiment_avg.has_value());

    EXPECT_EQ(result.periods[3].label, "2024-03-04");
    EXPECT_NEAR(*result.periods[3].change_from_previous, 0.1, 1e-9);
}

TEST(TrendEngineTest, WeeklyAndMonthlyLabels) {
    TrendEngine engine;
    std::vector<ScoredReview> reviews = {
        At(absl::CivilDay(2024, 1, 17), 0.5),
        At(absl::CivilDay(2024, 3, 6), 0.3),
        At(absl::CivilDay(2024, 3, 12), 0.1),
    };

    auto weekly = engine.ComputeTrends(reviews, Granularity::kWeek);
    EXPECT_EQ(weekly.granularity, Granularity::kWeek);
    EXPECT_EQ(weekly.periods.front().label, "2024-01-15");
    EXPECT_EQ(weekly.periods.back().label, "2024-03-11");

    auto monthly = engine.ComputeTrends(reviews, Granularity::kMonth);
    ASSERT_EQ(monthly.periods.size(), 3u);
    EXPECT_EQ(monthly.periods[0].label, "2024-01");
    EXPECT_EQ(monthly.periods[1].label, "2024-02");
    EXPECT_EQ(monthly.periods[1].volume, 0u);
    EXPECT_EQ(monthly.periods[2].label, "2024-03");
    EXPECT_EQ(monthly.periods[2].volume, 2u);
    EXPECT_NEAR(*monthly.periods[2].sentiment_avg, 0.2, 1e-9);
}

TEST(TrendEngineTest, MovingAverage) {
    TrendEngine engine;
    auto result = engine.ComputeTrends({
        At(absl::CivilDay(2024, 3, 1), 0.1),
        At(absl::CivilDay(2024, 3, 2), 0.2),
        At(absl::CivilDay(2024, 3, 3), 0.6),
        At(absl::CivilDay(2024, 3, 4), 0.7),
    });

    ASSERT_EQ(result.periods.size(), 4u);
    EXPECT_NEAR(*result.periods[0].moving_avg, 0.1, 1e-9);
    EXPECT_NEAR(*result.periods[1].moving_avg, 0.15, 1e-9);
    EXPECT_NEAR(*result.periods[2].moving_avg, 0.3, 1e-9);
    EXPECT_NEAR(*result.periods[3].moving_avg, 0.5, 1e-9);
}

TEST(TrendEngineTest, ReviewsWithoutTimestampExcluded) {
    ScoredReview undated;
    undated.review.id = "undated";
    undated.sentiment.compound = 0.9;

    TrendEngine engine;
    auto result = engine.ComputeTrends({undated, At(absl::CivilDay(2024, 3, 1), 0.2)});
    EXPECT_EQ(result.excluded_reviews, 1u);
    ASSERT_EQ(result.periods.size(), 1u);
    EXPECT_NEAR(*result.periods[0].sentiment_avg, 0.2, 1e-9);

    auto none = engine.ComputeTrends({undated});
    EXPECT_TRUE(none.Empty());
    EXPECT_TRUE(none.anomalies.empty());
}

TEST(TrendEngineTest, NegativeSpikeIsAnomaly) {
    std::vector<ScoredReview> reviews;
    for (int day = 1; day <= 9; ++day) {
        for (int i = 0; i < 20; ++i) {
            reviews.push_back(At(absl::CivilDay(2024, 3, day), 0.4));
        }
    }
    for (int i = 0; i < 20; ++i) {
        reviews.push_back(At(absl::CivilDay(2024, 3, 10), -0.9));
    }

    TrendEngine engine;
    auto result = engine.ComputeTrends(reviews);

    ASSERT_EQ(result.anomalies.size(), 1u);
    const auto& anomaly = result.anomalies[0];
    EXPECT_EQ(anomaly.period, "2024-03-10");
    EXPECT_EQ(anomaly.type, AnomalyType::kNegativeSpike);
    EXPECT_EQ(AnomalyTypeToString(anomaly.type), "negative_spike");
    EXPECT_LE(anomaly.z_score, -2.0);
    EXPECT_NEAR(anomaly.z_score, -2.85, 1e-9);
    EXPECT_DOUBLE_EQ(anomaly.sentiment_avg, -0.9);
}

TEST(TrendEngineTest, ConstantSeriesHasNoAnomalies) {
    std::vector<ScoredReview> reviews;
    for (int day = 1; day <= 10; ++day) {
        reviews.push_back(At(absl::CivilDay(2024, 3, day), 0.3));
    }

    TrendEngine engine;
    EXPECT_TRUE(engine.ComputeTrends(reviews).anomalies.empty());
}

TEST(TrendEngineTest, ThresholdIsConfigurable) {
    std::vector<ScoredReview> reviews;
    for (int day = 1; day <= 5; ++day) {
        reviews.push_back(At(absl::CivilDay(2024, 3, day), day == 5 ? -0.2 : 0.3));
    }

    TrendEngine strict;
    EXPECT_TRUE(strict.ComputeTrends(reviews).anomalies.empty());

    TrendConfig config;
    config.anomaly_z_threshold = 1.5;
    TrendEngine loose(config);
    ASSERT_EQ(loose.ComputeTrends(reviews).anomalies.size(), 1u);
}

TEST(TrendEngineTest, ComparePeriods) {
    TrendEngine engine;
    std::vector<ScoredReview> reviews = {
        At(absl::CivilDay(2024, 3, 1), 0.2),
        At(absl::CivilDay(2024, 3, 2), -0.2),
        At(absl::CivilDay(2024, 3, 8), 0.4),
        At(absl::CivilDay(2024, 3, 9), 0.6),
    };

    auto comparison = engine.ComparePeriods(
        reviews, {absl::CivilDay(2024, 3, 1), absl::CivilDay(2024, 3, 7)},
        {absl::CivilDay(2024, 3, 8), absl::CivilDay(2024, 3, 14)});
    ASSERT_TRUE(comparison.ok()) << comparison.status();
    EXPECT_EQ(comparison->first.date_range, "2024-03-01 to 2024-03-07");
    EXPECT_EQ(comparison->first.review_count, 2u);
    EXPECT_NEAR(comparison->first.avg_sentiment, 0.0, 1e-9);
    EXPECT_NEAR(comparison->second.avg_sentiment, 0.5, 1e-9);
    EXPECT_NEAR(comparison->sentiment_change, 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(comparison->sentiment_change_pct, 0.0);
    EXPECT_NEAR(comparison->positive_pct_change, 50.0, 1e-9);
    EXPECT_EQ(comparison->trend, "improving");
}

TEST(TrendEngineTest, ComparePeriodsNeedsData) {
    TrendEngine engine;
    auto comparison = engine.ComparePeriods(
        {At(absl::CivilDay(2024, 3, 1), 0.2)},
        {absl::CivilDay(2024, 3, 1), absl::CivilDay(2024, 3, 7)},
        {absl::CivilDay(2024, 4, 1), absl::CivilDay(2024, 4, 7)});
    ASSERT_FALSE(comparison.ok());
    EXPECT_TRUE(absl::IsFailedPrecondition(comparison.status()));
}

}  // namespace
}  // namespace reviewscope::trends
