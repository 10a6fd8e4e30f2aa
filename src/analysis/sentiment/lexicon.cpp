#include "analysis/sentiment/lexicon.h"

#include <algorithm>
#include <fstream>
#include <string>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <spdlog/spdlog.h>

#include "common/error.h"

namespace reviewscope::sentiment {

namespace {

constexpr double kBoosterIncrement = 0.293;
constexpr double kBoosterDecrement = -0.293;

struct StaticEntry {
    const char* term;
    double valence;
};

// Subset of the VADER lexicon covering common review vocabulary. Deploy the
// full vader_lexicon.txt through `sentiment.lexicon_path` for broad coverage.
constexpr StaticEntry kBaseEntries[] = {
    // positive
    {"good", 1.9}, {"great", 3.1}, {"excellent", 2.7}, {"amazing", 2.8},
    {"awesome", 3.1}, {"fantastic", 2.6}, {"wonderful", 2.7}, {"perfect", 2.7},
    {"love", 3.2}, {"loved", 2.9}, {"loves", 2.7}, {"lovely", 2.8},
    {"like", 2.0}, {"liked", 1.8}, {"likes", 1.8}, {"nice", 1.8},
    {"happy", 2.7}, {"glad", 2.0}, {"pleased", 1.9}, {"satisfied", 1.8},
    {"best", 3.2}, {"better", 1.9}, {"beautiful", 2.9}, {"pretty", 2.2},
    {"comfortable", 1.5}, {"cool", 1.3}, {"fine", 0.8}, {"fun", 2.3},
    {"enjoy", 2.2}, {"enjoyed", 2.3}, {"recommend", 1.5}, {"recommended", 0.8},
    {"helpful", 1.8}, {"friendly", 2.2}, {"easy", 1.9}, {"impressive", 2.3},
    {"impressed", 2.1}, {"worth", 0.9}, {"thanks", 1.9}, {"thank", 1.5},
    {"super", 2.9}, {"superb", 3.1}, {"brilliant", 2.8}, {"outstanding", 3.0},
    {"delight", 2.9}, {"delighted", 2.8}, {"favorite", 2.0}, {"gorgeous", 3.0},
    {"elegant", 2.1}, {"fresh", 1.3}, {"delicious", 2.7}, {"tasty", 2.2},
    {"yummy", 2.4}, {"clean", 1.7}, {"safe", 1.9}, {"secure", 1.4},
    {"win", 2.8}, {"smile", 1.5}, {"wow", 2.8}, {"yes", 1.7},
    {"ok", 1.2}, {"okay", 0.9}, {"positive", 2.6}, {"success", 2.7},
    {"successful", 2.8}, {"improve", 1.9}, {"improved", 2.1}, {"joy", 2.8},
    {"grateful", 2.0}, {"appreciate", 1.7}, {"appreciated", 2.3}, {"kind", 2.4},
    {"honest", 2.3}, {"trust", 2.3}, {"strong", 2.3}, {"free", 2.3},
    {"soft", 1.0}, {"solid", 0.6}, {"reliable", 0.9}, {"gift", 1.9},
    {"perfectly", 3.2}, {"flawless", 2.3}, {"stunning", 3.2}, {"charming", 2.8},

    // negative
    {"bad", -2.5}, {"worse", -2.1}, {"worst", -3.1}, {"terrible", -2.1},
    {"horrible", -2.5}, {"awful", -2.0}, {"poor", -2.1}, {"hate", -2.7},
    {"hated", -3.2}, {"dislike", -1.6}, {"disappointed", -1.9},
    {"disappointing", -2.2}, {"disappointment", -2.3}, {"sad", -2.1},
    {"angry", -2.3}, {"annoyed", -1.6}, {"annoying", -1.7}, {"frustrated", -2.4},
    {"frustrating", -1.9}, {"useless", -1.8}, {"broken", -1.8}, {"fail", -2.5},
    {"failed", -2.3}, {"failure", -2.3}, {"problem", -1.7}, {"problems", -1.7},
    {"wrong", -2.1}, {"missing", -1.2}, {"lost", -1.3}, {"waste", -1.8},
    {"wasted", -2.2}, {"rude", -2.0}, {"ugly", -2.3}, {"uncomfortable", -1.6},
    {"hurt", -2.4}, {"hurts", -2.1}, {"pain", -2.3}, {"irritation", -2.3},
    {"sick", -2.3}, {"stupid", -2.4}, {"ridiculous", -2.1}, {"mess", -1.5},
    {"dirty", -1.9}, {"gross", -2.1}, {"disgusting", -2.4}, {"nasty", -2.6},
    {"weak", -1.9}, {"sorry", -0.3}, {"no", -1.2}, {"cancel", -1.0},
    {"cancelled", -1.0}, {"complaint", -1.5}, {"delay", -1.3}, {"delayed", -0.9},
    {"avoid", -1.2}, {"crap", -1.6}, {"sucks", -1.5}, {"suck", -1.9},
    {"worried", -1.2}, {"worry", -1.9}, {"unhappy", -1.8}, {"upset", -1.6},
    {"mad", -2.2}, {"error", -1.7}, {"crash", -1.7}, {"misleading", -1.7},
    {"fraud", -2.8}, {"lie", -1.6}, {"ignored", -1.3}, {"unacceptable", -2.0},
    {"pathetic", -2.5}, {"rash", -1.1}, {"itchy", -1.0}, {"stale", -1.2},
};

constexpr StaticEntry kEcommerceEntries[] = {
    // positive
    {"love", 3.0}, {"perfect", 3.0}, {"excellent", 3.0}, {"amazing", 3.0},
    {"worth", 2.0}, {"recommend", 2.5}, {"fast shipping", 2.5},
    {"great quality", 3.0}, {"true to size", 2.0}, {"fits perfectly", 3.0},
    {"exceeded expectations", 3.5}, {"best purchase", 3.0},
    {"highly recommend", 3.0}, {"great value", 2.5}, {"beautiful", 2.5},
    {"sturdy", 2.0}, {"durable", 2.0},

    // negative
    {"cheap", -2.0}, {"flimsy", -2.5}, {"poor quality", -3.0},
    {"never arrived", -3.5}, {"wrong size", -2.5}, {"runs small", -1.5},
    {"runs large", -1.5}, {"not as described", -3.0},
    {"false advertising", -3.5}, {"waste of money", -3.5},
    {"disappointed", -2.5}, {"returned", -1.5}, {"refund", -1.5},
    {"defective", -3.0}, {"broken", -3.0}, {"damaged", -2.5},
    {"late delivery", -2.0}, {"late", -1.5}, {"terrible", -3.0},
    {"horrible", -3.0}, {"awful", -3.0}, {"overpriced", -2.0},
    {"scam", -3.5}, {"fake", -3.0},
};

const std::unordered_map<std::string, double>& BoosterTable() {
    static const std::unordered_map<std::string, double> kBoosters = {
        {"absolutely", kBoosterIncrement}, {"amazingly", kBoosterIncrement},
        {"awfully", kBoosterIncrement}, {"completely", kBoosterIncrement},
        {"decidedly", kBoosterIncrement}, {"deeply", kBoosterIncrement},
        {"enormously", kBoosterIncrement}, {"entirely", kBoosterIncrement},
        {"especially", kBoosterIncrement}, {"extremely", kBoosterIncrement},
        {"fabulously", kBoosterIncrement}, {"highly", kBoosterIncrement},
        {"incredibly", kBoosterIncrement}, {"intensely", kBoosterIncrement},
        {"really", kBoosterIncrement}, {"remarkably", kBoosterIncrement},
        {"so", kBoosterIncrement},
        {"thoroughly", kBoosterIncrement}, {"totally", kBoosterIncrement},
        {"tremendously", kBoosterIncrement}, {"unbelievably", kBoosterIncrement},
        {"utterly", kBoosterIncrement}, {"very", kBoosterIncrement},

        {"almost", kBoosterDecrement}, {"barely", kBoosterDecrement},
        {"hardly", kBoosterDecrement}, {"just enough", kBoosterDecrement},
        {"kind of", kBoosterDecrement}, {"kinda", kBoosterDecrement},
        {"less", kBoosterDecrement}, {"little", kBoosterDecrement},
        {"marginally", kBoosterDecrement}, {"occasionally", kBoosterDecrement},
        {"partly", kBoosterDecrement}, {"scarcely", kBoosterDecrement},
        {"slightly", kBoosterDecrement}, {"somewhat", kBoosterDecrement},
        {"sort of", kBoosterDecrement},
    };
    return kBoosters;
}

const std::unordered_set<std::string>& NegationWords() {
    static const std::unordered_set<std::string> kNegations = {
        "aint", "arent", "cannot", "cant", "couldnt", "darent", "didnt",
        "doesnt", "ain't", "aren't", "can't", "couldn't", "daren't", "didn't",
        "doesn't", "dont", "hadnt", "hasnt", "havent", "isnt", "mightnt",
        "mustnt", "neither", "don't", "hadn't", "hasn't", "haven't", "isn't",
        "mightn't", "mustn't", "neednt", "needn't", "never", "none", "nope",
        "nor", "not", "nothing", "nowhere", "oughtnt", "shant", "shouldnt",
        "uhuh", "wasnt", "werent", "oughtn't", "shan't", "shouldn't", "uh-uh",
        "wasn't", "weren't", "without", "wont", "wouldnt", "won't", "wouldn't",
        "rarely", "seldom", "despite",
    };
    return kNegations;
}

size_t WordCount(std::string_view term) {
    return static_cast<size_t>(std::count(term.begin(), term.end(), ' ')) + 1;
}

}  // namespace

Lexicon Lexicon::BuiltIn() {
    Lexicon lexicon;
    for (const auto& entry : kBaseEntries) {
        lexicon.SetValence(entry.term, entry.valence);
    }
    lexicon.ApplyOverrides(EcommerceOverrides());
    return lexicon;
}

absl::StatusOr<Lexicon> Lexicon::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return MakeError(ErrorCode::kNotFound,
                         absl::StrCat("cannot open lexicon file: ", path.string()));
    }
    return LoadFromStream(input, path.string());
}

absl::StatusOr<Lexicon> Lexicon::LoadFromStream(std::istream& input,
                                                std::string_view source_name) {
    Lexicon lexicon;
    size_t malformed = 0;
    std::string line;

    while (std::getline(input, line)) {
        if (absl::StripAsciiWhitespace(line).empty()) {
            continue;
        }

        // VADER files are tab separated: token, mean, std, raw ratings
        std::vector<std::string_view> fields =
            absl::StrSplit(line, absl::ByAnyChar(" \t"), absl::SkipEmpty());
        double valence = 0.0;
        if (fields.size() < 2 || !absl::SimpleAtod(fields[1], &valence)) {
            ++malformed;
            continue;
        }
        lexicon.SetValence(fields[0], valence);
    }

    if (lexicon.Empty()) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("no lexicon entries found in ", source_name));
    }
    if (malformed > 0) {
        spdlog::debug("Lexicon {}: skipped {} malformed lines", source_name, malformed);
    }
    spdlog::debug("Loaded {} lexicon entries from {}", lexicon.Size(), source_name);
    return lexicon;
}

void Lexicon::SetValence(std::string_view term, double valence) {
    std::string key = absl::AsciiStrToLower(absl::StripAsciiWhitespace(term));
    if (key.empty()) {
        return;
    }
    const size_t words = WordCount(key);
    if (words > 1) {
        phrases_.insert(key);
        max_phrase_words_ = std::max(max_phrase_words_, words);
    }
    entries_[std::move(key)] = valence;
}

void Lexicon::ApplyOverrides(const std::vector<TermValence>& overrides) {
    for (const auto& entry : overrides) {
        SetValence(entry.term, entry.valence);
    }
}

std::optional<double> Lexicon::Valence(std::string_view token) const {
    auto it = entries_.find(std::string(token));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::vector<TermValence>& EcommerceOverrides() {
    static const std::vector<TermValence> kOverrides = [] {
        std::vector<TermValence> result;
        for (const auto& entry : kEcommerceEntries) {
            result.push_back({entry.term, entry.valence});
        }
        return result;
    }();
    return kOverrides;
}

std::optional<double> BoosterValue(std::string_view token) {
    const auto& boosters = BoosterTable();
    auto it = boosters.find(std::string(token));
    if (it == boosters.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool IsNegation(std::string_view token) {
    if (NegationWords().count(std::string(token)) > 0) {
        return true;
    }
    return token.find("n't") != std::string_view::npos;
}

}  // namespace reviewscope::sentiment
