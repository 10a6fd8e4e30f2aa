#include "analysis/topics/topic_extractor.h"

#include <algorithm>
#include <map>

#include <absl/strings/str_cat.h>
#include <spdlog/spdlog.h>

#include "analysis/text_utils.h"
#include "analysis/topics/text_preprocessor.h"
#include "analysis/types.h"

namespace reviewscope::topics {

namespace {

std::vector<double> ColumnMeans(const TfidfMatrix& m) {
    std::vector<double> means(m.cols, 0.0);
    if (m.rows == 0) {
        return means;
    }
    for (size_t i = 0; i < m.rows; ++i) {
        for (size_t j = 0; j < m.cols; ++j) {
            means[j] += m.At(i, j);
        }
    }
    for (double& v : means) {
        v /= static_cast<double>(m.rows);
    }
    return means;
}

bool IsBigram(const std::string& term) {
    return term.find(' ') != std::string::npos;
}

}  // namespace

TopicExtractor::TopicExtractor(TopicConfig config) : config_(std::move(config)) {}

TopicResult TopicExtractor::Extract(const std::vector<std::string>& corpus) const {
    TopicResult result;
    result.document_topics.assign(corpus.size(), -1);

    std::vector<size_t> source_index;
    std::vector<std::vector<std::string>> documents;
    for (size_t i = 0; i < corpus.size(); ++i) {
        std::string processed = PreprocessForTopics(corpus[i]);
        if (processed.empty()) {
            continue;
        }
        source_index.push_back(i);
        documents.push_back(TokenizeForTopics(processed));
    }
    result.documents_used = documents.size();

    if (documents.size() < config_.min_documents) {
        spdlog::debug("Topic extraction skipped: {} documents, need {}",
                      documents.size(), config_.min_documents);
        return result;
    }

    TfidfVectorizer vectorizer(config_.tfidf);
    const TfidfResult tfidf = vectorizer.FitTransform(documents);
    if (tfidf.Empty()) {
        return result;
    }

    // ---- Keywords and bigrams ----
    const std::vector<double> means = ColumnMeans(tfidf.weights);
    for (size_t j = 0; j < tfidf.vocabulary.size(); ++j) {
        const auto& term = tfidf.vocabulary[j];
        const double score = RoundTo(means[j], 4);
        if (IsBigram(term)) {
            result.bigrams.push_back({term, score, tfidf.term_counts[j]});
        } else {
            result.keywords.push_back({term, score});
        }
    }

    std::sort(result.keywords.begin(), result.keywords.end(),
              [](const Keyword& a, const Keyword& b) {
                  if (a.score != b.score) return a.score > b.score;
                  return a.term < b.term;
              });
    if (result.keywords.size() > config_.top_keywords) {
        result.keywords.resize(config_.top_keywords);
    }

    std::sort(result.bigrams.begin(), result.bigrams.end(),
              [](const Bigram& a, const Bigram& b) {
                  if (a.score != b.score) return a.score > b.score;
                  if (a.count != b.count) return a.count > b.count;
                  return a.phrase < b.phrase;
              });
    if (result.bigrams.size() > config_.top_bigrams) {
        result.bigrams.resize(config_.top_bigrams);
    }

    // ---- Topic clusters ----
    if (documents.size() < config_.n_topics || config_.n_topics == 0) {
        spdlog::debug("Topic clustering skipped: {} documents for {} topics",
                      documents.size(), config_.n_topics);
        return result;
    }

    NmfConfig nmf_config;
    nmf_config.n_components = std::min(config_.n_topics, tfidf.vocabulary.size());
    nmf_config.max_iter = config_.max_iter;
    nmf_config.tol = config_.tol;
    nmf_config.random_seed = config_.random_seed;

    auto factors = FactorizeNmf(tfidf.weights, nmf_config);
    if (!factors.ok()) {
        spdlog::warn("Topic clustering failed: {}", factors.status().ToString());
        return result;
    }
    if (!factors->converged) {
        // Clusters from a non-converged factorization are not reported
        return result;
    }

    const NmfResult& nmf = *factors;
    result.clusters.resize(nmf.components);
    for (size_t k = 0; k < nmf.components; ++k) {
        TopicCluster& cluster = result.clusters[k];
        cluster.id = static_cast<int>(k);
        cluster.name = absl::StrCat("Topic ", k + 1);

        std::vector<size_t> order(nmf.cols);
        for (size_t j = 0; j < nmf.cols; ++j) {
            order[j] = j;
        }
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            if (nmf.H(k, a) != nmf.H(k, b)) return nmf.H(k, a) > nmf.H(k, b);
            return tfidf.vocabulary[a] < tfidf.vocabulary[b];
        });

        const size_t n_words = std::min(config_.words_per_topic, order.size());
        for (size_t w = 0; w < n_words; ++w) {
            cluster.words.push_back(
                {tfidf.vocabulary[order[w]], RoundTo(nmf.H(k, order[w]), 4)});
        }
    }

    for (size_t d = 0; d < nmf.rows; ++d) {
        int best = -1;
        double best_weight = 0.0;
        for (size_t k = 0; k < nmf.components; ++k) {
            if (nmf.W(d, k) > best_weight) {
                best_weight = nmf.W(d, k);
                best = static_cast<int>(k);
            }
        }
        result.document_topics[source_index[d]] = best;
        if (best >= 0) {
            ++result.clusters[static_cast<size_t>(best)].document_count;
        }
    }

    spdlog::debug("Extracted {} keywords, {} bigrams, {} topics after {} NMF iterations",
                  result.keywords.size(), result.bigrams.size(), result.clusters.size(),
                  nmf.iterations);
    return result;
}

std::vector<WordFrequency> TopicExtractor::WordFrequencies(
    const std::vector<std::string>& corpus) const {
    std::map<std::string, size_t> counts;
    for (const auto& text : corpus) {
        for (const auto& word : SplitWords(PreprocessForTopics(text))) {
            if (!IsEnglishStopWord(word)) {
                ++counts[word];
            }
        }
    }

    std::vector<WordFrequency> result;
    result.reserve(counts.size());
    for (const auto& [word, count] : counts) {
        result.push_back({word, count});
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const WordFrequency& a, const WordFrequency& b) {
                         return a.count > b.count;
                     });
    if (result.size() > config_.word_frequency_limit) {
        result.resize(config_.word_frequency_limit);
    }
    return result;
}

}  // namespace reviewscope::topics
