#include "analysis/sentiment/sentiment_scorer.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

#include <absl/strings/ascii.h>
#include <absl/strings/str_join.h>
#include <spdlog/spdlog.h>

#include "analysis/text_utils.h"

namespace reviewscope::sentiment {

namespace {

// Empirically derived VADER constants
constexpr double kNegationScalar = -0.74;
constexpr double kNormalizationAlpha = 15.0;
constexpr double kExclamationBoost = 0.292;
constexpr int kMaxExclamations = 4;
constexpr double kQuestionBoost = 0.18;
constexpr double kMaxQuestionBoost = 0.96;

std::string StripOuterPunctuation(const std::string& token) {
    size_t start = 0;
    size_t end = token.size();
    while (start < end && absl::ascii_ispunct(static_cast<unsigned char>(token[start]))) {
        ++start;
    }
    while (end > start && absl::ascii_ispunct(static_cast<unsigned char>(token[end - 1]))) {
        --end;
    }
    // Keep short tokens intact so emoticons survive
    if (end - start <= 2) {
        return token;
    }
    return token.substr(start, end - start);
}

double Normalize(double score) {
    const double norm = score / std::sqrt(score * score + kNormalizationAlpha);
    return std::clamp(norm, -1.0, 1.0);
}

double PunctuationEmphasis(std::string_view text) {
    const auto exclamations = std::min<long>(
        std::count(text.begin(), text.end(), '!'), kMaxExclamations);
    const auto questions = std::count(text.begin(), text.end(), '?');

    double emphasis = static_cast<double>(exclamations) * kExclamationBoost;
    if (questions > 1) {
        emphasis += questions <= 3 ? static_cast<double>(questions) * kQuestionBoost
                                   : kMaxQuestionBoost;
    }
    return emphasis;
}

double ScalarIncDec(const std::string& word, double valence) {
    auto booster = BoosterValue(word);
    if (!booster.has_value()) {
        return 0.0;
    }
    return valence < 0.0 ? -*booster : *booster;
}

// Negations up to three tokens back flip the valence. "never so/this" and
// "without doubt" intensify instead.
double NegationCheck(double valence, const std::vector<std::string>& words,
                     size_t distance, size_t i) {
    if (distance == 0) {
        if (IsNegation(words[i - 1])) {
            valence *= kNegationScalar;
        }
    } else if (distance == 1) {
        if (words[i - 2] == "never" &&
            (words[i - 1] == "so" || words[i - 1] == "this")) {
            valence *= 1.25;
        } else if (words[i - 2] == "without" && words[i - 1] == "doubt") {
        } else if (IsNegation(words[i - 2])) {
            valence *= kNegationScalar;
        }
    } else if (distance == 2) {
        if (words[i - 3] == "never" &&
            (words[i - 2] == "so" || words[i - 2] == "this" ||
             words[i - 1] == "so" || words[i - 1] == "this")) {
            valence *= 1.25;
        } else if (words[i - 3] == "without" &&
                   (words[i - 2] == "doubt" || words[i - 1] == "doubt")) {
        } else if (IsNegation(words[i - 3])) {
            valence *= kNegationScalar;
        }
    }
    return valence;
}

double SpecialIdiomsCheck(double valence, const std::vector<std::string>& words, size_t i) {
    static const std::unordered_map<std::string, double> kIdioms = {
        {"the bomb", 3.0},      {"bad ass", 1.5},       {"yeah right", -2.0},
        {"kiss of death", -1.5}, {"to die for", 3.0},   {"broken heart", -2.9},
        {"hand to mouth", -2.0}, {"cut corners", -1.5}, {"the real deal", 2.5},
    };

    auto lookup = [](const std::string& seq) -> double {
        auto it = kIdioms.find(seq);
        return it == kIdioms.end() ? 0.0 : it->second;
    };

    std::vector<std::string> candidates;
    candidates.push_back(words[i - 1] + " " + words[i]);
    candidates.push_back(words[i - 2] + " " + words[i - 1] + " " + words[i]);
    candidates.push_back(words[i - 2] + " " + words[i - 1]);
    if (i >= 3) {
        candidates.push_back(words[i - 3] + " " + words[i - 2] + " " + words[i - 1]);
        candidates.push_back(words[i - 3] + " " + words[i - 2]);
    }
    if (i + 1 < words.size()) {
        candidates.push_back(words[i] + " " + words[i + 1]);
    }
    if (i + 2 < words.size()) {
        candidates.push_back(words[i] + " " + words[i + 1] + " " + words[i + 2]);
    }

    for (const auto& candidate : candidates) {
        const double idiom = lookup(candidate);
        if (idiom != 0.0) {
            return idiom;
        }
    }

    // Two-word dampeners such as "kind of" right behind the token
    if (auto booster = BoosterValue(words[i - 2] + " " + words[i - 1])) {
        valence += *booster;
    }
    return valence;
}

// "least happy" is negated, "at least happy" and "very least happy" are not
double LeastCheck(double valence, const std::vector<std::string>& words, size_t i) {
    if (i == 0 || words[i - 1] != "least") {
        return valence;
    }
    if (i == 1 || (words[i - 2] != "at" && words[i - 2] != "very")) {
        valence *= kNegationScalar;
    }
    return valence;
}

// Soften sentiment before "but", emphasize it after
void ButCheck(const std::vector<std::string>& words, std::vector<double>& sentiments) {
    auto it = std::find(words.begin(), words.end(), "but");
    if (it == words.end()) {
        return;
    }
    const auto but_index = static_cast<size_t>(it - words.begin());
    for (size_t i = 0; i < sentiments.size(); ++i) {
        if (i < but_index) {
            sentiments[i] *= 0.5;
        } else if (i > but_index) {
            sentiments[i] *= 1.5;
        }
    }
}

}  // namespace

// =============================================================================
// SentimentScorer
// =============================================================================

SentimentScorer::SentimentScorer(std::shared_ptr<const Lexicon> lexicon, SentimentConfig config)
    : lexicon_(std::move(lexicon)), config_(std::move(config)) {}

std::vector<std::string> SentimentScorer::Tokenize(std::string_view normalized) const {
    std::vector<std::string> raw;
    for (const auto& word : SplitWords(normalized)) {
        raw.push_back(StripOuterPunctuation(word));
    }

    // Greedy longest-match merge of multi-word lexicon entries
    std::vector<std::string> tokens;
    tokens.reserve(raw.size());
    const size_t max_words = lexicon_->MaxPhraseWords();
    size_t i = 0;
    while (i < raw.size()) {
        size_t merged = 1;
        for (size_t n = std::min(max_words, raw.size() - i); n >= 2; --n) {
            std::string candidate = absl::StrJoin(raw.begin() + i, raw.begin() + i + n, " ");
            if (lexicon_->IsPhrase(candidate)) {
                tokens.push_back(std::move(candidate));
                merged = n;
                break;
            }
        }
        if (merged == 1) {
            tokens.push_back(raw[i]);
        }
        i += merged;
    }
    return tokens;
}

double SentimentScorer::TokenValence(const std::vector<std::string>& words, size_t i) const {
    const std::string& word = words[i];

    if (BoosterValue(word).has_value()) {
        return 0.0;
    }
    if (word == "kind" && i + 1 < words.size() && words[i + 1] == "of") {
        return 0.0;
    }

    auto base = lexicon_->Valence(word);
    if (!base.has_value()) {
        return 0.0;
    }
    double valence = *base;

    // "no" directly before a sentiment word is a negator, not a sentiment
    if (word == "no" && i + 1 < words.size() && lexicon_->Contains(words[i + 1])) {
        valence = 0.0;
    }
    if ((i > 0 && words[i - 1] == "no") ||
        (i > 1 && words[i - 2] == "no") ||
        (i > 2 && words[i - 3] == "no" && (words[i - 1] == "or" || words[i - 1] == "nor"))) {
        valence = *base * kNegationScalar;
    }

    for (size_t distance = 0; distance < 3; ++distance) {
        if (i <= distance) {
            break;
        }
        const std::string& previous = words[i - distance - 1];
        if (lexicon_->Contains(previous)) {
            continue;
        }

        double scalar = ScalarIncDec(previous, valence);
        if (distance == 1) {
            scalar *= 0.95;
        } else if (distance == 2) {
            scalar *= 0.90;
        }
        valence += scalar;
        valence = NegationCheck(valence, words, distance, i);
        if (distance == 2) {
            valence = SpecialIdiomsCheck(valence, words, i);
        }
    }

    return LeastCheck(valence, words, i);
}

SentimentScore SentimentScorer::Score(std::string_view text) const {
    SentimentScore score;
    score.label = SentimentLabel::kNeutral;
    score.confidence = Confidence(0.0);

    const std::string normalized = NormalizeText(text);
    if (normalized.empty() || lexicon_->Empty()) {
        return score;
    }

    const std::vector<std::string> words = Tokenize(normalized);
    std::vector<double> sentiments;
    sentiments.reserve(words.size());
    for (size_t i = 0; i < words.size(); ++i) {
        sentiments.push_back(TokenValence(words, i));
    }
    ButCheck(words, sentiments);

    double sum = 0.0;
    double pos_sum = 0.0;
    double neg_sum = 0.0;
    int neutral_count = 0;
    for (double s : sentiments) {
        sum += s;
        if (s > 0.0) {
            pos_sum += s + 1.0;
        } else if (s < 0.0) {
            neg_sum += s - 1.0;
        } else {
            ++neutral_count;
        }
    }

    const double emphasis = PunctuationEmphasis(normalized);
    if (sum > 0.0) {
        sum += emphasis;
    } else if (sum < 0.0) {
        sum -= emphasis;
    }
    const double compound = Normalize(sum);

    if (pos_sum > std::fabs(neg_sum)) {
        pos_sum += emphasis;
    } else if (pos_sum < std::fabs(neg_sum)) {
        neg_sum -= emphasis;
    }

    const double total = pos_sum + std::fabs(neg_sum) + neutral_count;
    if (total > 0.0) {
        score.pos = RoundTo(std::fabs(pos_sum / total), 3);
        score.neg = RoundTo(std::fabs(neg_sum / total), 3);
        score.neu = RoundTo(std::fabs(neutral_count / total), 3);
    }
    score.compound = RoundTo(compound, 4);
    score.label = Classify(score.compound);
    score.confidence = Confidence(score.compound);
    return score;
}

std::vector<ScoredReview> SentimentScorer::AnalyzeCorpus(const std::vector<Review>& reviews) const {
    std::vector<ScoredReview> scored;
    scored.reserve(reviews.size());
    for (const auto& review : reviews) {
        ScoredReview item;
        item.review = review;
        item.sentiment = Score(review.text);
        scored.push_back(std::move(item));
    }
    spdlog::debug("Scored {} reviews", scored.size());
    return scored;
}

SentimentLabel SentimentScorer::Classify(double compound) const {
    if (compound >= config_.positive_threshold) {
        return SentimentLabel::kPositive;
    }
    if (compound <= config_.negative_threshold) {
        return SentimentLabel::kNegative;
    }
    return SentimentLabel::kNeutral;
}

double SentimentScorer::Confidence(double compound) const {
    double confidence = 0.0;
    switch (Classify(compound)) {
        case SentimentLabel::kPositive: {
            const double t = config_.positive_threshold;
            confidence = std::min(1.0, (compound - t) / (1.0 - t) * 0.5 + 0.5);
            break;
        }
        case SentimentLabel::kNegative: {
            const double t = std::fabs(config_.negative_threshold);
            confidence = std::min(1.0, (std::fabs(compound) - t) / (1.0 - t) * 0.5 + 0.5);
            break;
        }
        case SentimentLabel::kNeutral:
            confidence = 0.5 - std::fabs(compound) * 5.0;
            break;
    }
    return RoundTo(std::clamp(confidence, 0.0, 1.0), 3);
}

// =============================================================================
// Corpus helpers
// =============================================================================

absl::StatusOr<std::shared_ptr<const Lexicon>> BuildLexicon(const SentimentConfig& config) {
    Lexicon lexicon;
    if (config.lexicon_path.empty()) {
        lexicon = Lexicon::BuiltIn();
    } else {
        auto loaded = Lexicon::LoadFromFile(config.lexicon_path);
        if (!loaded.ok()) {
            return loaded.status();
        }
        lexicon = std::move(*loaded);
        lexicon.ApplyOverrides(EcommerceOverrides());
    }
    lexicon.ApplyOverrides(config.extra_overrides);
    return std::make_shared<const Lexicon>(std::move(lexicon));
}

SentimentDistribution ComputeDistribution(const std::vector<ScoredReview>& reviews) {
    SentimentDistribution dist;
    dist.total = reviews.size();
    if (reviews.empty()) {
        return dist;
    }

    double sum = 0.0;
    for (const auto& r : reviews) {
        sum += r.sentiment.compound;
        switch (r.sentiment.label) {
            case SentimentLabel::kPositive: ++dist.positive_count; break;
            case SentimentLabel::kNegative: ++dist.negative_count; break;
            case SentimentLabel::kNeutral: ++dist.neutral_count; break;
        }
    }

    const double total = static_cast<double>(dist.total);
    dist.positive_pct = RoundTo(dist.positive_count / total * 100.0, 2);
    dist.neutral_pct = RoundTo(dist.neutral_count / total * 100.0, 2);
    dist.negative_pct = RoundTo(dist.negative_count / total * 100.0, 2);
    dist.average_compound = RoundTo(sum / total, 3);
    return dist;
}

ExtremeReviews SelectExtremeReviews(const std::vector<ScoredReview>& reviews,
                                    double threshold,
                                    size_t limit) {
    ExtremeReviews result;
    for (const auto& r : reviews) {
        if (r.sentiment.compound >= threshold) {
            result.most_positive.push_back(r);
        } else if (r.sentiment.compound <= -threshold) {
            result.most_negative.push_back(r);
        }
    }

    std::stable_sort(result.most_positive.begin(), result.most_positive.end(),
                     [](const ScoredReview& a, const ScoredReview& b) {
                         return a.sentiment.compound > b.sentiment.compound;
                     });
    std::stable_sort(result.most_negative.begin(), result.most_negative.end(),
                     [](const ScoredReview& a, const ScoredReview& b) {
                         return a.sentiment.compound < b.sentiment.compound;
                     });

    if (result.most_positive.size() > limit) {
        result.most_positive.resize(limit);
    }
    if (result.most_negative.size() > limit) {
        result.most_negative.resize(limit);
    }
    return result;
}

}  // namespace reviewscope::sentiment
