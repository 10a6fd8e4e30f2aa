#pragma once

/// @file text_utils.h
/// @brief Text normalization helpers shared by the analysis stages

#include <string>
#include <string_view>
#include <vector>

namespace reviewscope {

/// @brief Remove `http...` and `www....` runs up to the next whitespace
std::string StripUrls(std::string_view text);

/// @brief Collapse whitespace runs into single spaces and trim both ends
std::string CollapseWhitespace(std::string_view text);

/// @brief Lowercase, strip URLs and collapse whitespace
std::string NormalizeText(std::string_view text);

/// @brief Split on ASCII whitespace, dropping empty pieces
std::vector<std::string> SplitWords(std::string_view text);

/// @brief Case-sensitive search for `term` delimited by non-alphanumeric
/// characters (or the string ends) on both sides
///
/// Both arguments are expected to be lowercase already.
bool ContainsTerm(std::string_view text, std::string_view term);

}  // namespace reviewscope
