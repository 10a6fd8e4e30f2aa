#include "analysis/topics/tfidf.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <unordered_map>

#include <absl/strings/str_join.h>
#include <spdlog/spdlog.h>

namespace reviewscope::topics {

std::vector<std::string> BuildNgrams(const std::vector<std::string>& tokens, size_t max_ngram) {
    std::vector<std::string> grams;
    for (size_t n = 1; n <= max_ngram; ++n) {
        if (tokens.size() < n) {
            break;
        }
        for (size_t i = 0; i + n <= tokens.size(); ++i) {
            grams.push_back(absl::StrJoin(tokens.begin() + i, tokens.begin() + i + n, " "));
        }
    }
    return grams;
}

TfidfVectorizer::TfidfVectorizer(TfidfConfig config) : config_(config) {}

TfidfResult TfidfVectorizer::FitTransform(
    const std::vector<std::vector<std::string>>& documents) const {
    TfidfResult result;
    const size_t n_docs = documents.size();
    if (n_docs == 0) {
        return result;
    }

    // Per-document term counts, ordered for reproducible iteration
    std::vector<std::map<std::string, size_t>> doc_counts(n_docs);
    std::map<std::string, size_t> corpus_counts;
    std::map<std::string, size_t> doc_freq;

    for (size_t d = 0; d < n_docs; ++d) {
        for (auto& gram : BuildNgrams(documents[d], config_.max_ngram)) {
            ++doc_counts[d][gram];
        }
        for (const auto& [term, count] : doc_counts[d]) {
            corpus_counts[term] += count;
            ++doc_freq[term];
        }
    }

    const double max_doc_count = config_.max_df * static_cast<double>(n_docs);
    std::vector<std::string> candidates;
    for (const auto& [term, df] : doc_freq) {
        if (df >= config_.min_df && static_cast<double>(df) <= max_doc_count) {
            candidates.push_back(term);
        }
    }

    if (candidates.size() > config_.max_features) {
        std::stable_sort(candidates.begin(), candidates.end(),
                         [&](const std::string& a, const std::string& b) {
                             return corpus_counts[a] > corpus_counts[b];
                         });
        candidates.resize(config_.max_features);
        std::sort(candidates.begin(), candidates.end());
    }

    if (candidates.empty()) {
        spdlog::debug("TF-IDF: no terms survive min_df={} max_df={} over {} documents",
                      config_.min_df, config_.max_df, n_docs);
        return result;
    }

    const size_t n_terms = candidates.size();
    std::unordered_map<std::string, size_t> column;
    column.reserve(n_terms);
    for (size_t j = 0; j < n_terms; ++j) {
        column.emplace(candidates[j], j);
    }

    result.vocabulary = std::move(candidates);
    result.term_counts.resize(n_terms);
    result.document_frequency.resize(n_terms);

    std::vector<double> idf(n_terms);
    for (size_t j = 0; j < n_terms; ++j) {
        const auto& term = result.vocabulary[j];
        result.term_counts[j] = corpus_counts[term];
        result.document_frequency[j] = doc_freq[term];
        idf[j] = std::log((1.0 + n_docs) / (1.0 + doc_freq[term])) + 1.0;
    }

    TfidfMatrix& matrix = result.weights;
    matrix.rows = n_docs;
    matrix.cols = n_terms;
    matrix.values.assign(n_docs * n_terms, 0.0);

    for (size_t d = 0; d < n_docs; ++d) {
        double norm_sq = 0.0;
        for (const auto& [term, count] : doc_counts[d]) {
            auto it = column.find(term);
            if (it == column.end()) {
                continue;
            }
            const double weight = static_cast<double>(count) * idf[it->second];
            matrix.values[d * n_terms + it->second] = weight;
            norm_sq += weight * weight;
        }
        if (norm_sq > 0.0) {
            const double norm = std::sqrt(norm_sq);
            for (size_t j = 0; j < n_terms; ++j) {
                matrix.values[d * n_terms + j] /= norm;
            }
        }
    }

    return result;
}

}  // namespace reviewscope::topics
