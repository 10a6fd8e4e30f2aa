#include "analysis/text_utils.h"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

namespace reviewscope {

namespace {

constexpr char kWhitespace[] = " \t\n\r\f\v";

bool IsWordChar(char c) {
    return absl::ascii_isalnum(static_cast<unsigned char>(c));
}

bool StartsUrl(std::string_view rest) {
    return absl::StartsWith(rest, "http") || absl::StartsWith(rest, "www.");
}

}  // namespace

std::string StripUrls(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (StartsUrl(text.substr(i))) {
            while (i < text.size() &&
                   !absl::ascii_isspace(static_cast<unsigned char>(text[i]))) {
                ++i;
            }
            continue;
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::vector<std::string> SplitWords(std::string_view text) {
    return absl::StrSplit(text, absl::ByAnyChar(kWhitespace), absl::SkipEmpty());
}

std::string CollapseWhitespace(std::string_view text) {
    return absl::StrJoin(SplitWords(text), " ");
}

std::string NormalizeText(std::string_view text) {
    return CollapseWhitespace(StripUrls(absl::AsciiStrToLower(text)));
}

bool ContainsTerm(std::string_view text, std::string_view term) {
    if (term.empty() || term.size() > text.size()) {
        return false;
    }

    size_t pos = text.find(term);
    while (pos != std::string_view::npos) {
        const bool left_ok = pos == 0 || !IsWordChar(text[pos - 1]);
        const size_t end = pos + term.size();
        const bool right_ok = end == text.size() || !IsWordChar(text[end]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = text.find(term, pos + 1);
    }
    return false;
}

}  // namespace reviewscope
