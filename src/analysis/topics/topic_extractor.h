#pragma once

/// @file topic_extractor.h
/// @brief Keyword, bigram and latent topic discovery over a review corpus

#include <cstdint>
#include <string>
#include <vector>

#include "analysis/topics/nmf.h"
#include "analysis/topics/tfidf.h"

namespace reviewscope::topics {

/// @brief Topic extraction configuration
struct TopicConfig {
    /// Corpora with fewer non-empty documents yield an empty result
    size_t min_documents = 5;

    /// Latent topics to discover
    size_t n_topics = 6;

    size_t top_keywords = 20;
    size_t top_bigrams = 15;

    /// Label words per topic cluster
    size_t words_per_topic = 5;

    /// Entries returned by WordFrequencies()
    size_t word_frequency_limit = 50;

    size_t max_iter = 200;
    double tol = 1e-4;
    uint32_t random_seed = 42;

    TfidfConfig tfidf;
};

struct Keyword {
    std::string term;
    double score = 0.0;  ///< Mean TF-IDF weight over documents
};

struct Bigram {
    std::string phrase;
    double score = 0.0;  ///< Mean TF-IDF weight over documents
    size_t count = 0;    ///< Occurrences in the corpus
};

struct TopicWord {
    std::string word;
    double weight = 0.0;
};

/// @brief One latent topic found by NMF
struct TopicCluster {
    int id = 0;  ///< Zero based
    std::string name;  ///< "Topic <id + 1>"
    std::vector<TopicWord> words;
    size_t document_count = 0;
};

struct WordFrequency {
    std::string word;
    size_t count = 0;
};

/// @brief Output of TopicExtractor::Extract
struct TopicResult {
    std::vector<Keyword> keywords;
    std::vector<Bigram> bigrams;
    std::vector<TopicCluster> clusters;

    /// Topic id for each input document; -1 when the document was empty
    /// after preprocessing, had no topic weight, or no clusters exist
    std::vector<int> document_topics;

    /// Documents that survived preprocessing
    size_t documents_used = 0;

    bool Empty() const { return keywords.empty() && bigrams.empty() && clusters.empty(); }
};

/// @brief TF-IDF keyword ranking plus NMF topic clustering
///
/// Extraction is deterministic: NMF is seeded from `random_seed`, and every
/// ranking breaks ties on the term itself.
class TopicExtractor {
public:
    explicit TopicExtractor(TopicConfig config = {});

    /// @brief Extract keywords, bigrams and clusters from `corpus`
    ///
    /// When NMF does not converge the clusters are left empty while keywords
    /// and bigrams are still returned.
    TopicResult Extract(const std::vector<std::string>& corpus) const;

    /// @brief Most frequent preprocessed words, for word clouds
    std::vector<WordFrequency> WordFrequencies(const std::vector<std::string>& corpus) const;

    const TopicConfig& config() const { return config_; }

private:
    TopicConfig config_;
};

}  // namespace reviewscope::topics
