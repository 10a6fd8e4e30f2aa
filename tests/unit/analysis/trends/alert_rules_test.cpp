/// @file alert_rules_test.cpp
/// @brief Tests for threshold alert evaluation

#include <gtest/gtest.h>

#include "analysis/trends/alert_rules.h"

namespace reviewscope::trends {
namespace {

AlertInputs Inputs(double avg, double negative_pct,
                   std::optional<double> recent_change = std::nullopt) {
    AlertInputs inputs;
    inputs.avg_sentiment = avg;
    inputs.negative_pct = negative_pct;
    inputs.recent_change = recent_change;
    return inputs;
}

TEST(AlertRulesTest, HealthyMetricsRaiseNothing) {
    EXPECT_TRUE(EvaluateAlerts(Inputs(0.45, 10.0, 0.02)).empty());
}

TEST(AlertRulesTest, WarningLevel) {
    auto alerts = EvaluateAlerts(Inputs(0.15, 25.0));

    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_EQ(alerts[0].metric, AlertMetric::kAverageSentiment);
    EXPECT_EQ(alerts[0].severity, AlertSeverity::kWarning);
    EXPECT_DOUBLE_EQ(alerts[0].value, 0.15);
    EXPECT_DOUBLE_EQ(alerts[0].threshold, 0.2);
    EXPECT_EQ(alerts[1].metric, AlertMetric::kNegativePct);
    EXPECT_EQ(alerts[1].severity, AlertSeverity::kWarning);
}

TEST(AlertRulesTest, CriticalSupersedesWarning) {
    auto alerts = EvaluateAlerts(Inputs(-0.1, 45.0));

    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_EQ(alerts[0].severity, AlertSeverity::kCritical);
    EXPECT_DOUBLE_EQ(alerts[0].threshold, 0.0);
    EXPECT_EQ(alerts[1].severity, AlertSeverity::kCritical);
    EXPECT_DOUBLE_EQ(alerts[1].threshold, 30.0);
    EXPECT_EQ(AlertSeverityToString(alerts[1].severity), "critical");
    EXPECT_EQ(AlertMetricToString(alerts[1].metric), "negative_pct");
}

TEST(AlertRulesTest, ThresholdsAreStrict) {
    EXPECT_TRUE(EvaluateAlerts(Inputs(0.2, 20.0)).empty());
}

TEST(AlertRulesTest, RecentChange) {
    auto alerts = EvaluateAlerts(Inputs(0.5, 5.0, -0.3));
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].metric, AlertMetric::kRecentChange);
    EXPECT_EQ(AlertMetricToString(alerts[0].metric), "recent_change");
    EXPECT_DOUBLE_EQ(alerts[0].value, -0.3);

    // Without a trend there is nothing to compare
    EXPECT_TRUE(EvaluateAlerts(Inputs(0.5, 5.0)).empty());
}

TEST(AlertRulesTest, CustomConfig) {
    AlertConfig config;
    config.sentiment_warning = 0.6;
    config.negative_pct_warning = 5.0;

    auto alerts = EvaluateAlerts(Inputs(0.5, 8.0), config);
    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_EQ(alerts[0].severity, AlertSeverity::kWarning);
    EXPECT_EQ(alerts[1].severity, AlertSeverity::kWarning);
}

TEST(AlertRulesTest, CustomRules) {
    std::vector<ThresholdRule> rules = {
        {AlertMetric::kNegativePct, ComparisonOp::kGreaterThan, 1.0, AlertSeverity::kWarning,
         "any negativity"},
        {AlertMetric::kNegativePct, ComparisonOp::kGreaterThan, 50.0, AlertSeverity::kCritical,
         "listed second, never reached"},
    };

    auto alerts = EvaluateAlerts(Inputs(0.5, 60.0), rules);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].message, "any negativity");
    EXPECT_EQ(alerts[0].severity, AlertSeverity::kWarning);
}

TEST(AlertRulesTest, DefaultRuleOrder) {
    auto rules = DefaultAlertRules();
    ASSERT_EQ(rules.size(), 5u);
    EXPECT_EQ(rules[0].severity, AlertSeverity::kCritical);
    EXPECT_EQ(rules[1].severity, AlertSeverity::kWarning);
    EXPECT_EQ(rules[2].severity, AlertSeverity::kCritical);
    EXPECT_EQ(rules[4].metric, AlertMetric::kRecentChange);
}

}  // namespace
}  // namespace reviewscope::trends
