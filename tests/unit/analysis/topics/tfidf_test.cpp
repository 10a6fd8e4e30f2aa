/// @file tfidf_test.cpp
/// @brief Tests for TF-IDF vectorization

#include <cmath>

#include <gtest/gtest.h>

#include "analysis/topics/tfidf.h"

namespace reviewscope::topics {
namespace {

std::vector<std::vector<std::string>> SmallCorpus() {
    return {
        {"battery", "life"},
        {"battery", "dies"},
        {"screen", "bright"},
    };
}

TfidfConfig UnigramsOnly() {
    TfidfConfig config;
    config.min_df = 1;
    config.max_df = 1.0;
    config.max_ngram = 1;
    return config;
}

TEST(BuildNgramsTest, UnigramsThenBigrams) {
    auto grams = BuildNgrams({"fast", "shipping", "box"}, 2);
    std::vector<std::string> expected = {"fast", "shipping", "box", "fast shipping",
                                         "shipping box"};
    EXPECT_EQ(grams, expected);
}

TEST(BuildNgramsTest, ShortInput) {
    EXPECT_EQ(BuildNgrams({"solo"}, 2), std::vector<std::string>{"solo"});
    EXPECT_TRUE(BuildNgrams({}, 2).empty());
}

TEST(TfidfVectorizerTest, VocabularyIsSorted) {
    TfidfVectorizer vectorizer(UnigramsOnly());
    auto result = vectorizer.FitTransform(SmallCorpus());

    std::vector<std::string> expected = {"battery", "bright", "dies", "life", "screen"};
    EXPECT_EQ(result.vocabulary, expected);
    EXPECT_EQ(result.weights.rows, 3u);
    EXPECT_EQ(result.weights.cols, 5u);
    EXPECT_EQ(result.document_frequency[0], 2u);
    EXPECT_EQ(result.term_counts[0], 2u);
}

TEST(TfidfVectorizerTest, RowsAreUnitLength) {
    TfidfVectorizer vectorizer(UnigramsOnly());
    auto result = vectorizer.FitTransform(SmallCorpus());

    for (size_t i = 0; i < result.weights.rows; ++i) {
        double norm_sq = 0.0;
        for (size_t j = 0; j < result.weights.cols; ++j) {
            norm_sq += result.weights.At(i, j) * result.weights.At(i, j);
        }
        EXPECT_NEAR(norm_sq, 1.0, 1e-9);
    }
}

TEST(TfidfVectorizerTest, SmoothedIdfWeighting) {
    TfidfVectorizer vectorizer(UnigramsOnly());
    auto result = vectorizer.FitTransform(SmallCorpus());

    // Row 0 holds "battery" (df 2) and "life" (df 1) once each
    const double idf_battery = std::log(4.0 / 3.0) + 1.0;
    const double idf_life = std::log(4.0 / 2.0) + 1.0;
    const double ratio = result.weights.At(0, 0) / result.weights.At(0, 3);
    EXPECT_NEAR(ratio, idf_battery / idf_life, 1e-9);
    EXPECT_DOUBLE_EQ(result.weights.At(0, 4), 0.0);
}

TEST(TfidfVectorizerTest, MinDfFilter) {
    auto config = UnigramsOnly();
    config.min_df = 2;
    TfidfVectorizer vectorizer(config);
    auto result = vectorizer.FitTransform(SmallCorpus());

    ASSERT_EQ(result.vocabulary, std::vector<std::string>{"battery"});
    EXPECT_DOUBLE_EQ(result.weights.At(0, 0), 1.0);
    // A document without vocabulary terms stays an all-zero row
    EXPECT_DOUBLE_EQ(result.weights.At(2, 0), 0.0);
}

TEST(TfidfVectorizerTest, MaxDfFilter) {
    auto config = UnigramsOnly();
    config.max_df = 0.5;
    TfidfVectorizer vectorizer(config);
    auto result = vectorizer.FitTransform(SmallCorpus());

    for (const auto& term : result.vocabulary) {
        EXPECT_NE(term, "battery");
    }
    EXPECT_EQ(result.vocabulary.size(), 4u);
}

TEST(TfidfVectorizerTest, MaxFeaturesKeepsMostFrequent) {
    auto config = UnigramsOnly();
    config.max_features = 1;
    TfidfVectorizer vectorizer(config);
    auto result = vectorizer.FitTransform(SmallCorpus());

    EXPECT_EQ(result.vocabulary, std::vector<std::string>{"battery"});
}

TEST(TfidfVectorizerTest, Bigrams) {
    TfidfConfig config;
    config.min_df = 2;
    config.max_df = 1.0;
    TfidfVectorizer vectorizer(config);
    auto result = vectorizer.FitTransform({
        {"battery", "life", "short"},
        {"battery", "life", "long"},
        {"screen"},
    });

    std::vector<std::string> expected = {"battery", "battery life", "life"};
    EXPECT_EQ(result.vocabulary, expected);
    EXPECT_EQ(result.term_counts[1], 2u);
}

TEST(TfidfVectorizerTest, NothingSurvives) {
    TfidfConfig config;
    config.min_df = 5;
    TfidfVectorizer vectorizer(config);

    EXPECT_TRUE(vectorizer.FitTransform(SmallCorpus()).Empty());
    EXPECT_TRUE(vectorizer.FitTransform({}).Empty());
}

}  // namespace
}  // namespace reviewscope::topics
