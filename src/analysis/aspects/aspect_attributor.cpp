#include "analysis/aspects/aspect_attributor.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <spdlog/spdlog.h>

#include "analysis/text_utils.h"

namespace reviewscope::aspects {

namespace {

struct Accumulator {
    size_t mentions = 0;
    size_t positive = 0;
    size_t neutral = 0;
    size_t negative = 0;
    double sum = 0.0;
    double negative_sum = 0.0;
    std::vector<const ScoredReview*> negative_reviews;
};

double Percent(size_t part, size_t whole) {
    return whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

}  // namespace

AspectAttributor::AspectAttributor(std::vector<AspectDefinition> definitions, AspectConfig config)
    : definitions_(std::move(definitions)), config_(config) {
    for (auto& definition : definitions_) {
        for (auto& term : definition.trigger_terms) {
            term = absl::AsciiStrToLower(term);
        }
    }
}

std::vector<std::string> AspectAttributor::MatchAspects(std::string_view text) const {
    std::vector<std::string> matched;
    const std::string lowered = absl::AsciiStrToLower(text);
    for (const auto& definition : definitions_) {
        for (const auto& term : definition.trigger_terms) {
            if (ContainsTerm(lowered, term)) {
                matched.push_back(definition.key);
                break;
            }
        }
    }
    return matched;
}

AspectAnalysis AspectAttributor::Attribute(const std::vector<ScoredReview>& reviews) const {
    AspectAnalysis analysis;
    std::vector<Accumulator> acc(definitions_.size());

    analysis.tagged_reviews.reserve(reviews.size());
    for (const auto& review : reviews) {
        analysis.overall.review_count++;
        analysis.overall.sentiment_sum += review.sentiment.compound;

        ScoredReview tagged = review;
        const std::string lowered = absl::AsciiStrToLower(review.review.text);
        for (size_t a = 0; a < definitions_.size(); ++a) {
            const auto& terms = definitions_[a].trigger_terms;
            const bool mentioned = std::any_of(terms.begin(), terms.end(), [&](const std::string& t) {
                return ContainsTerm(lowered, t);
            });
            if (!mentioned) {
                continue;
            }

            tagged.aspect_sentiment[definitions_[a].key] = review.sentiment.compound;

            Accumulator& stats = acc[a];
            stats.mentions++;
            stats.sum += review.sentiment.compound;
            switch (review.sentiment.label) {
                case SentimentLabel::kPositive:
                    stats.positive++;
                    break;
                case SentimentLabel::kNegative:
                    stats.negative++;
                    stats.negative_sum += review.sentiment.compound;
                    stats.negative_reviews.push_back(&review);
                    break;
                case SentimentLabel::kNeutral:
                    stats.neutral++;
                    break;
            }
        }
        analysis.tagged_reviews.push_back(std::move(tagged));
    }

    for (size_t a = 0; a < definitions_.size(); ++a) {
        Accumulator& stats = acc[a];
        if (stats.mentions == 0) {
            continue;
        }
        const auto& definition = definitions_[a];

        AspectStats row;
        row.key = definition.key;
        row.label = definition.display_label;
        row.mentions = stats.mentions;
        row.positive_count = stats.positive;
        row.neutral_count = stats.neutral;
        row.negative_count = stats.negative;
        row.positive_pct = RoundTo(Percent(stats.positive, stats.mentions), 1);
        row.neutral_pct = RoundTo(Percent(stats.neutral, stats.mentions), 1);
        row.negative_pct = RoundTo(Percent(stats.negative, stats.mentions), 1);
        row.avg_sentiment = RoundTo(stats.sum / static_cast<double>(stats.mentions), 3);
        analysis.aspects.push_back(row);

        const double negative_pct = Percent(stats.negative, stats.mentions);
        if (stats.negative >= config_.min_negative_mentions &&
            negative_pct > config_.min_negative_pct) {
            PainPoint pain;
            pain.key = definition.key;
            pain.label = definition.display_label;
            pain.negative_mentions = stats.negative;
            pain.mentions = stats.mentions;
            pain.negative_pct = RoundTo(negative_pct, 1);
            pain.avg_negative_score =
                RoundTo(stats.negative_sum / static_cast<double>(stats.negative), 3);

            std::stable_sort(stats.negative_reviews.begin(), stats.negative_reviews.end(),
                             [](const ScoredReview* x, const ScoredReview* y) {
                                 return x->sentiment.compound < y->sentiment.compound;
                             });
            const size_t n = std::min(config_.max_examples, stats.negative_reviews.size());
            for (size_t i = 0; i < n; ++i) {
                const ScoredReview* r = stats.negative_reviews[i];
                pain.examples.push_back({r->review.id, r->review.text, r->sentiment.compound});
            }
            analysis.pain_points.push_back(std::move(pain));
        }
    }

    std::sort(analysis.aspects.begin(), analysis.aspects.end(),
              [](const AspectStats& x, const AspectStats& y) {
                  if (x.mentions != y.mentions) return x.mentions > y.mentions;
                  return x.key < y.key;
              });

    std::sort(analysis.pain_points.begin(), analysis.pain_points.end(),
              [](const PainPoint& x, const PainPoint& y) {
                  if (x.negative_mentions != y.negative_mentions) {
                      return x.negative_mentions > y.negative_mentions;
                  }
                  return x.key < y.key;
              });
    if (analysis.pain_points.size() > config_.max_pain_points) {
        analysis.pain_points.resize(config_.max_pain_points);
    }

    for (const auto& row : analysis.aspects) {
        auto it = std::find_if(definitions_.begin(), definitions_.end(),
                               [&](const AspectDefinition& d) { return d.key == row.key; });
        const auto& stats = acc[static_cast<size_t>(it - definitions_.begin())];
        analysis.driver_inputs.push_back({row.key, row.label, stats.mentions, stats.sum});
    }

    spdlog::debug("Attributed {} reviews to {} aspects ({} pain points)",
                  reviews.size(), analysis.aspects.size(), analysis.pain_points.size());
    return analysis;
}

}  // namespace reviewscope::aspects
