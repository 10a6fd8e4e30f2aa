#include "analysis/trends/alert_rules.h"

#include <set>

#include <spdlog/spdlog.h>

namespace reviewscope::trends {

namespace {

bool CompareValues(double value, ComparisonOp op, double threshold) {
    switch (op) {
        case ComparisonOp::kGreaterThan:
            return value > threshold;
        case ComparisonOp::kLessThan:
            return value < threshold;
    }
    return false;
}

std::optional<double> MetricValue(const AlertInputs& inputs, AlertMetric metric) {
    switch (metric) {
        case AlertMetric::kAverageSentiment:
            return inputs.avg_sentiment;
        case AlertMetric::kNegativePct:
            return inputs.negative_pct;
        case AlertMetric::kRecentChange:
            return inputs.recent_change;
    }
    return std::nullopt;
}

}  // namespace

std::string_view AlertSeverityToString(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::kWarning: return "warning";
        case AlertSeverity::kCritical: return "critical";
    }
    return "unknown";
}

std::string_view AlertMetricToString(AlertMetric metric) {
    switch (metric) {
        case AlertMetric::kAverageSentiment: return "avg_sentiment";
        case AlertMetric::kNegativePct: return "negative_pct";
        case AlertMetric::kRecentChange: return "recent_change";
    }
    return "unknown";
}

std::vector<ThresholdRule> DefaultAlertRules(const AlertConfig& config) {
    return {
        {AlertMetric::kAverageSentiment, ComparisonOp::kLessThan, config.sentiment_critical,
         AlertSeverity::kCritical, "Overall sentiment is negative"},
        {AlertMetric::kAverageSentiment, ComparisonOp::kLessThan, config.sentiment_warning,
         AlertSeverity::kWarning, "Overall sentiment is weak"},
        {AlertMetric::kNegativePct, ComparisonOp::kGreaterThan, config.negative_pct_critical,
         AlertSeverity::kCritical, "Share of negative reviews is high"},
        {AlertMetric::kNegativePct, ComparisonOp::kGreaterThan, config.negative_pct_warning,
         AlertSeverity::kWarning, "Share of negative reviews is elevated"},
        {AlertMetric::kRecentChange, ComparisonOp::kLessThan, config.recent_change_warning,
         AlertSeverity::kWarning, "Sentiment dropped in the latest period"},
    };
}

std::vector<Alert> EvaluateAlerts(const AlertInputs& inputs,
                                  const std::vector<ThresholdRule>& rules) {
    std::vector<Alert> alerts;
    std::set<AlertMetric> fired;

    for (const auto& rule : rules) {
        if (fired.count(rule.metric) > 0) {
            continue;
        }
        auto value = MetricValue(inputs, rule.metric);
        if (!value || !CompareValues(*value, rule.comparison, rule.threshold)) {
            continue;
        }

        Alert alert;
        alert.severity = rule.severity;
        alert.metric = rule.metric;
        alert.message = rule.message;
        alert.value = *value;
        alert.threshold = rule.threshold;
        alerts.push_back(std::move(alert));
        fired.insert(rule.metric);

        spdlog::debug("Alert {} on {}: value={} threshold={}",
                      AlertSeverityToString(rule.severity),
                      AlertMetricToString(rule.metric), *value, rule.threshold);
    }

    return alerts;
}

std::vector<Alert> EvaluateAlerts(const AlertInputs& inputs, const AlertConfig& config) {
    return EvaluateAlerts(inputs, DefaultAlertRules(config));
}

}  // namespace reviewscope::trends
