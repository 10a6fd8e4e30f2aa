#pragma once

/// @file tfidf.h
/// @brief TF-IDF document-term weighting over unigrams and bigrams

#include <cstddef>
#include <string>
#include <vector>

namespace reviewscope::topics {

/// @brief Vectorizer settings
struct TfidfConfig {
    /// Terms must occur in at least this many documents
    size_t min_df = 2;

    /// Terms occurring in more than this fraction of documents are dropped
    double max_df = 0.95;

    /// Vocabulary cap, keeping the terms with the highest corpus counts
    size_t max_features = 1000;

    /// Longest n-gram; 1 for unigrams only, 2 adds bigrams
    size_t max_ngram = 2;
};

/// @brief Dense row-major document-term matrix
struct TfidfMatrix {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<double> values;  ///< rows * cols, L2-normalized per row

    double At(size_t row, size_t col) const { return values[row * cols + col]; }
};

/// @brief Result of fitting the vectorizer on a corpus
struct TfidfResult {
    /// Alphabetically sorted terms; column j of the matrices is vocabulary[j]
    std::vector<std::string> vocabulary;

    TfidfMatrix weights;

    /// Raw corpus count of each vocabulary term
    std::vector<size_t> term_counts;

    /// Number of documents containing each term
    std::vector<size_t> document_frequency;

    bool Empty() const { return vocabulary.empty(); }
};

/// @brief Fits a vocabulary and IDF weights to a corpus
///
/// IDF is smoothed, `ln((1 + n) / (1 + df)) + 1`, and term frequencies are
/// raw counts.
class TfidfVectorizer {
public:
    explicit TfidfVectorizer(TfidfConfig config = {});

    /// @brief Fit on and transform already tokenized documents
    ///
    /// Returns an empty result when no term survives the document-frequency
    /// filters.
    TfidfResult FitTransform(const std::vector<std::vector<std::string>>& documents) const;

    const TfidfConfig& config() const { return config_; }

private:
    TfidfConfig config_;
};

/// @brief Unigrams followed by n-grams up to `max_ngram`, words joined by ' '
std::vector<std::string> BuildNgrams(const std::vector<std::string>& tokens, size_t max_ngram);

}  // namespace reviewscope::topics
