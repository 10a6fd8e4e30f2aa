#pragma once

/// @file alert_rules.h
/// @brief Threshold alerts over the headline metrics of a report

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reviewscope::trends {

/// @brief Alert severity levels
enum class AlertSeverity {
    kWarning,
    kCritical,
};

std::string_view AlertSeverityToString(AlertSeverity severity);

/// @brief Threshold comparison operators
enum class ComparisonOp {
    kGreaterThan,
    kLessThan,
};

/// @brief Metrics a rule can watch
enum class AlertMetric {
    kAverageSentiment,  ///< Mean compound over the corpus
    kNegativePct,       ///< Share of negative reviews, 0-100
    kRecentChange,      ///< Change of the last trend period from the previous one
};

std::string_view AlertMetricToString(AlertMetric metric);

/// @brief One threshold rule
struct ThresholdRule {
    AlertMetric metric = AlertMetric::kAverageSentiment;
    ComparisonOp comparison = ComparisonOp::kLessThan;
    double threshold = 0.0;
    AlertSeverity severity = AlertSeverity::kWarning;
    std::string message;
};

/// @brief Thresholds behind the default rule set
struct AlertConfig {
    double sentiment_critical = 0.0;
    double sentiment_warning = 0.2;
    double negative_pct_critical = 30.0;
    double negative_pct_warning = 20.0;
    double recent_change_warning = -0.15;
};

/// @brief Metric values observed for one report
struct AlertInputs {
    double avg_sentiment = 0.0;
    double negative_pct = 0.0;

    /// Missing when the trend has fewer than two non-empty periods
    std::optional<double> recent_change;
};

/// @brief Alert raised by a rule
struct Alert {
    AlertSeverity severity = AlertSeverity::kWarning;
    AlertMetric metric = AlertMetric::kAverageSentiment;
    std::string message;
    double value = 0.0;
    double threshold = 0.0;
};

/// @brief Default rules, critical before warning for each metric
std::vector<ThresholdRule> DefaultAlertRules(const AlertConfig& config = {});

/// @brief Evaluate rules against the observed metrics
///
/// At most one alert is raised per metric: the first rule that fires for a
/// metric wins, so rules should list the most severe threshold first.
/// Metrics without a value are skipped.
std::vector<Alert> EvaluateAlerts(const AlertInputs& inputs,
                                  const std::vector<ThresholdRule>& rules);

/// @brief EvaluateAlerts with DefaultAlertRules(config)
std::vector<Alert> EvaluateAlerts(const AlertInputs& inputs, const AlertConfig& config = {});

}  // namespace reviewscope::trends
