#pragma once

/// @file text_preprocessor.h
/// @brief Text cleanup and tokenization for topic modelling

#include <string>
#include <string_view>
#include <vector>

namespace reviewscope::topics {

/// @brief Clean a review for topic extraction
///
/// Lowercases, strips URLs, replaces characters other than word characters,
/// '-' and whitespace with spaces, drops purely numeric words, words of two
/// characters or fewer and e-commerce filler words ("product", "bought",
/// ...). Returns an empty string when nothing remains.
std::string PreprocessForTopics(std::string_view text);

/// @brief Split preprocessed text into vectorizer tokens
///
/// Tokens are runs of two or more word characters; English stop words are
/// removed.
std::vector<std::string> TokenizeForTopics(std::string_view preprocessed);

bool IsEnglishStopWord(std::string_view word);
bool IsEcommerceStopWord(std::string_view word);

}  // namespace reviewscope::topics
