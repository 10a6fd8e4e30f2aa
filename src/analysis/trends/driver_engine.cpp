#include "analysis/trends/driver_engine.h"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace reviewscope::trends {

namespace {

double Median(std::vector<double> values) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return (values[mid - 1] + values[mid]) / 2.0;
}

DriverPriority Quadrant(double impact, double sentiment,
                        double impact_cut, double sentiment_cut) {
    const bool high_impact = impact >= impact_cut;
    const bool high_sentiment = sentiment >= sentiment_cut;
    if (high_impact) {
        return high_sentiment ? DriverPriority::kMaintain : DriverPriority::kFixNow;
    }
    return high_sentiment ? DriverPriority::kDeprioritize : DriverPriority::kMonitor;
}

}  // namespace

std::string_view DriverPriorityToString(DriverPriority priority) {
    switch (priority) {
        case DriverPriority::kFixNow: return "fix_now";
        case DriverPriority::kMaintain: return "maintain";
        case DriverPriority::kDeprioritize: return "deprioritize";
        case DriverPriority::kMonitor:
        default:
            return "monitor";
    }
}

std::vector<KeyDriver> ComputeDrivers(const std::vector<aspects::DriverInput>& inputs,
                                      const aspects::OverallSentiment& overall,
                                      const DriverConfig& config) {
    std::vector<KeyDriver> drivers;
    std::vector<double> raw_impacts;
    std::vector<double> raw_sentiments;

    for (const auto& input : inputs) {
        if (input.mention_count == 0 || input.mention_count < config.min_mentions) {
            continue;
        }

        const double present_mean = input.sentiment_sum / static_cast<double>(input.mention_count);
        double impact = 0.0;
        if (overall.review_count > input.mention_count) {
            const double absent_mean =
                (overall.sentiment_sum - input.sentiment_sum) /
                static_cast<double>(overall.review_count - input.mention_count);
            impact = std::fabs(present_mean - absent_mean) / 2.0;
        }

        KeyDriver driver;
        driver.aspect = input.key;
        driver.label = input.label;
        driver.mention_count = input.mention_count;
        driver.avg_sentiment = RoundTo(present_mean, 3);
        driver.impact_score = RoundTo(std::clamp(impact, 0.0, 1.0), 3);
        drivers.push_back(std::move(driver));
        raw_impacts.push_back(impact);
        raw_sentiments.push_back(present_mean);
    }

    double impact_cut = config.impact_threshold;
    double sentiment_cut = config.sentiment_threshold;
    if (config.split == QuadrantSplit::kMedian && !drivers.empty()) {
        impact_cut = Median(raw_impacts);
        sentiment_cut = Median(raw_sentiments);
    }

    for (size_t i = 0; i < drivers.size(); ++i) {
        drivers[i].priority = Quadrant(raw_impacts[i], raw_sentiments[i], impact_cut, sentiment_cut);
    }

    std::sort(drivers.begin(), drivers.end(), [](const KeyDriver& a, const KeyDriver& b) {
        if (a.impact_score != b.impact_score) return a.impact_score > b.impact_score;
        return a.aspect < b.aspect;
    });

    spdlog::debug("Ranked {} key drivers from {} aspects", drivers.size(), inputs.size());
    return drivers;
}

NpsResult ComputeNpsProxy(const std::vector<ScoredReview>& reviews, const NpsConfig& config) {
    NpsResult nps;
    nps.total = reviews.size();
    if (reviews.empty()) {
        return nps;
    }

    for (const auto& r : reviews) {
        const double c = r.sentiment.compound;
        if (c > config.promoter_threshold) {
            ++nps.promoters;
        } else if (c < config.detractor_threshold) {
            ++nps.detractors;
        } else {
            ++nps.passives;
        }
    }

    const double total = static_cast<double>(nps.total);
    const double promoters_pct = nps.promoters / total * 100.0;
    const double detractors_pct = nps.detractors / total * 100.0;
    nps.promoters_pct = RoundTo(promoters_pct, 1);
    nps.passives_pct = RoundTo(nps.passives / total * 100.0, 1);
    nps.detractors_pct = RoundTo(detractors_pct, 1);
    nps.nps_proxy = RoundTo(std::clamp(promoters_pct - detractors_pct, -100.0, 100.0), 1);
    return nps;
}

}  // namespace reviewscope::trends
