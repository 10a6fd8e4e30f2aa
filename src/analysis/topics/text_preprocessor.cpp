#include "analysis/topics/text_preprocessor.h"

#include <algorithm>
#include <unordered_set>

#include <absl/strings/ascii.h>
#include <absl/strings/str_join.h>

#include "analysis/text_utils.h"

namespace reviewscope::topics {

namespace {

bool IsWordChar(char c) {
    return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsNumeric(std::string_view word) {
    return !word.empty() &&
           std::all_of(word.begin(), word.end(), [](char c) {
               return absl::ascii_isdigit(static_cast<unsigned char>(c));
           });
}

const std::unordered_set<std::string>& EnglishStopWords() {
    static const std::unordered_set<std::string> kWords = {
        "a", "about", "above", "across", "after", "afterwards", "again",
        "against", "all", "almost", "alone", "along", "already", "also",
        "although", "always", "am", "among", "amongst", "an", "and", "another",
        "any", "anyhow", "anyone", "anything", "anyway", "anywhere", "are",
        "around", "as", "at", "back", "be", "became", "because", "become",
        "becomes", "been", "before", "beforehand", "behind", "being", "below",
        "beside", "besides", "between", "beyond", "both", "but", "by", "can",
        "cannot", "could", "did", "do", "does", "done", "down", "due", "during",
        "each", "eg", "either", "else", "elsewhere", "enough", "etc", "even",
        "ever", "every", "everyone", "everything", "everywhere", "except",
        "few", "first", "for", "former", "formerly", "from", "further", "get",
        "give", "go", "had", "has", "hasnt", "have", "he", "hence", "her",
        "here", "hereafter", "hereby", "herein", "hers", "herself", "him",
        "himself", "his", "how", "however", "ie", "if", "in", "indeed", "into",
        "is", "it", "its", "itself", "just", "keep", "last", "latter", "least",
        "less", "made", "many", "may", "me", "meanwhile", "might", "mine",
        "more", "moreover", "most", "mostly", "much", "must", "my", "myself",
        "namely", "neither", "never", "nevertheless", "next", "no", "nobody",
        "none", "nor", "not", "nothing", "now", "nowhere", "of", "off", "often",
        "on", "once", "one", "only", "onto", "or", "other", "others",
        "otherwise", "our", "ours", "ourselves", "out", "over", "own", "part",
        "per", "perhaps", "please", "put", "rather", "re", "same", "see",
        "seem", "seemed", "seeming", "seems", "several", "she", "should",
        "since", "so", "some", "somehow", "someone", "something", "sometime",
        "sometimes", "somewhere", "still", "such", "than", "that", "the",
        "their", "them", "themselves", "then", "thence", "there", "thereafter",
        "thereby", "therefore", "therein", "thereupon", "these", "they",
        "this", "those", "though", "through", "throughout", "thru", "thus",
        "to", "together", "too", "toward", "towards", "under", "until", "up",
        "upon", "us", "very", "via", "was", "we", "well", "were", "what",
        "whatever", "when", "whence", "whenever", "where", "whereafter",
        "whereas", "whereby", "wherein", "whereupon", "wherever", "whether",
        "which", "while", "whither", "who", "whoever", "whole", "whom",
        "whose", "why", "will", "with", "within", "without", "would", "yet",
        "you", "your", "yours", "yourself", "yourselves",
    };
    return kWords;
}

const std::unordered_set<std::string>& EcommerceStopWords() {
    static const std::unordered_set<std::string> kWords = {
        "product", "item", "order", "ordered", "buy", "bought", "purchase",
        "purchased", "get", "got", "use", "used", "using", "would", "could",
        "one", "also", "really", "just", "like", "even", "still", "much",
        "well", "good", "great", "nice", "love", "loved", "best", "better",
        "amazon", "seller", "review", "star", "stars", "rating", "recommend",
    };
    return kWords;
}

}  // namespace

bool IsEnglishStopWord(std::string_view word) {
    return EnglishStopWords().count(std::string(word)) > 0;
}

bool IsEcommerceStopWord(std::string_view word) {
    return EcommerceStopWords().count(std::string(word)) > 0;
}

std::string PreprocessForTopics(std::string_view text) {
    std::string cleaned = StripUrls(absl::AsciiStrToLower(text));
    for (char& c : cleaned) {
        if (!IsWordChar(c) && c != '-' && !absl::ascii_isspace(static_cast<unsigned char>(c))) {
            c = ' ';
        }
    }

    std::vector<std::string> kept;
    for (auto& word : SplitWords(cleaned)) {
        if (IsNumeric(word) || word.size() <= 2 || IsEcommerceStopWord(word)) {
            continue;
        }
        kept.push_back(std::move(word));
    }
    return absl::StrJoin(kept, " ");
}

std::vector<std::string> TokenizeForTopics(std::string_view preprocessed) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < preprocessed.size()) {
        if (!IsWordChar(preprocessed[i])) {
            ++i;
            continue;
        }
        size_t end = i;
        while (end < preprocessed.size() && IsWordChar(preprocessed[end])) {
            ++end;
        }
        std::string_view token = preprocessed.substr(i, end - i);
        if (token.size() >= 2 && !IsEnglishStopWord(token)) {
            tokens.emplace_back(token);
        }
        i = end;
    }
    return tokens;
}

}  // namespace reviewscope::topics
