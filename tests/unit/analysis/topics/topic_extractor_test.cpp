/// @file topic_extractor_test.cpp
/// @brief Tests for keyword, bigram and topic cluster extraction

#include <gtest/gtest.h>

#include "analysis/topics/text_preprocessor.h"
#include "analysis/topics/topic_extractor.h"

namespace reviewscope::topics {
namespace {

std::vector<std::string> GadgetCorpus() {
    return {
        "Battery drains fast, battery life is poor",
        "Battery life lasts two days",
        "The battery charges slowly",
        "",
        "Screen is bright and the screen colors pop",
        "Screen resolution is sharp",
        "Bright screen, sharp colors",
        "Battery and screen both fine",
    };
}

TopicConfig TwoTopics() {
    TopicConfig config;
    config.n_topics = 2;
    config.max_iter = 2000;
    return config;
}

TEST(TextPreprocessorTest, DropsFillerWords) {
    EXPECT_EQ(PreprocessForTopics("I bought 2 GREAT chargers at https://shop.example.com!!"),
              "chargers");
    EXPECT_EQ(PreprocessForTopics("Loved it, so good"), "");
}

TEST(TextPreprocessorTest, KeepsHyphenatedWords) {
    EXPECT_EQ(PreprocessForTopics("Long-lasting zipper."), "long-lasting zipper");

    std::vector<std::string> expected = {"long", "lasting", "zipper"};
    EXPECT_EQ(TokenizeForTopics("long-lasting zipper"), expected);
}

TEST(TextPreprocessorTest, TokenizerRemovesStopWords) {
    std::vector<std::string> expected = {"zipper", "broke"};
    EXPECT_EQ(TokenizeForTopics("the zipper broke after the"), expected);
    EXPECT_TRUE(IsEnglishStopWord("nothing"));
    EXPECT_TRUE(IsEcommerceStopWord("purchased"));
    EXPECT_FALSE(IsEcommerceStopWord("zipper"));
}

TEST(TopicExtractorTest, TooFewDocuments) {
    TopicExtractor extractor;
    auto result = extractor.Extract({"Battery died", "Screen cracked", "Battery great"});

    EXPECT_TRUE(result.Empty());
    EXPECT_EQ(result.documents_used, 3u);
    EXPECT_EQ(result.document_topics, std::vector<int>(3, -1));
}

TEST(TopicExtractorTest, KeywordsRankedByScore) {
    TopicExtractor extractor(TwoTopics());
    auto result = extractor.Extract(GadgetCorpus());

    EXPECT_EQ(result.documents_used, 7u);
    ASSERT_FALSE(result.keywords.empty());
    for (size_t i = 1; i < result.keywords.size(); ++i) {
        EXPECT_GE(result.keywords[i - 1].score, result.keywords[i].score);
    }

    bool has_battery = false;
    for (const auto& kw : result.keywords) {
        EXPECT_EQ(kw.term.find(' '), std::string::npos);
        has_battery = has_battery || kw.term == "battery";
    }
    EXPECT_TRUE(has_battery);
}

TEST(TopicExtractorTest, Bigrams) {
    TopicExtractor extractor(TwoTopics());
    auto result = extractor.Extract(GadgetCorpus());

    bool found = false;
    for (const auto& bigram : result.bigrams) {
        EXPECT_NE(bigram.phrase.find(' '), std::string::npos);
        if (bigram.phrase == "battery life") {
            found = true;
            EXPECT_EQ(bigram.count, 2u);
            EXPECT_GT(bigram.score, 0.0);
        }
    }
    EXPECT_TRUE(found);
}

TEST(TopicExtractorTest, Clusters) {
    TopicExtractor extractor(TwoTopics());
    auto result = extractor.Extract(GadgetCorpus());

    ASSERT_EQ(result.clusters.size(), 2u);
    EXPECT_EQ(result.clusters[0].name, "Topic 1");
    EXPECT_EQ(result.clusters[1].name, "Topic 2");

    size_t assigned = 0;
    for (const auto& cluster : result.clusters) {
        EXPECT_FALSE(cluster.words.empty());
        EXPECT_LE(cluster.words.size(), 5u);
        assigned += cluster.document_count;
    }
    EXPECT_LE(assigned, 7u);

    ASSERT_EQ(result.document_topics.size(), 8u);
    EXPECT_EQ(result.document_topics[3], -1);
}

TEST(TopicExtractorTest, NoClustersWithoutConvergence) {
    auto config = TwoTopics();
    config.max_iter = 3;
    TopicExtractor extractor(config);
    auto result = extractor.Extract(GadgetCorpus());

    EXPECT_TRUE(result.clusters.empty());
    EXPECT_FALSE(result.keywords.empty());
    EXPECT_FALSE(result.bigrams.empty());
    ASSERT_EQ(result.document_topics.size(), 8u);
    for (int topic : result.document_topics) {
        EXPECT_EQ(topic, -1);
    }
}

TEST(TopicExtractorTest, FewerDocumentsThanTopics) {
    TopicConfig config;
    config.n_topics = 10;
    TopicExtractor extractor(config);
    auto result = extractor.Extract(GadgetCorpus());

    EXPECT_FALSE(result.keywords.empty());
    EXPECT_TRUE(result.clusters.empty());
}

TEST(TopicExtractorTest, Deterministic) {
    TopicExtractor extractor(TwoTopics());
    auto first = extractor.Extract(GadgetCorpus());
    auto second = extractor.Extract(GadgetCorpus());

    EXPECT_EQ(first.document_topics, second.document_topics);
    ASSERT_EQ(first.keywords.size(), second.keywords.size());
    for (size_t i = 0; i < first.keywords.size(); ++i) {
        EXPECT_EQ(first.keywords[i].term, second.keywords[i].term);
    }
}

TEST(TopicExtractorTest, WordFrequencies) {
    TopicExtractor extractor;
    auto freqs = extractor.WordFrequencies({"Battery battery and the screen", "battery", "loved"});

    ASSERT_EQ(freqs.size(), 2u);
    EXPECT_EQ(freqs[0].word, "battery");
    EXPECT_EQ(freqs[0].count, 3u);
    EXPECT_EQ(freqs[1].word, "screen");
    EXPECT_EQ(freqs[1].count, 1u);
}

TEST(TopicExtractorTest, WordFrequencyLimitAndTies) {
    TopicConfig config;
    config.word_frequency_limit = 2;
    TopicExtractor extractor(config);
    auto freqs = extractor.WordFrequencies({"zipper apple mango"});

    ASSERT_EQ(freqs.size(), 2u);
    EXPECT_EQ(freqs[0].word, "apple");
    EXPECT_EQ(freqs[1].word, "mango");
}

}  // namespace
}  // namespace reviewscope::topics
