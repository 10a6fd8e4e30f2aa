#pragma once

/// @file lexicon.h
/// @brief Sentiment valence lexicon with e-commerce domain overrides

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <absl/status/statusor.h>

namespace reviewscope::sentiment {

/// @brief A term (single word or short phrase) and its valence on the
/// VADER scale of roughly [-4, 4]
struct TermValence {
    std::string term;
    double valence = 0.0;
};

/// @brief Lowercase token -> valence table
///
/// Multi-word entries ("fast shipping", "waste of money") are indexed as
/// phrases so the scorer can merge consecutive tokens before lookup.
/// A Lexicon is built once and then shared read-only between scorers.
class Lexicon {
public:
    Lexicon() = default;

    /// @brief The compact built-in English table plus EcommerceOverrides()
    static Lexicon BuiltIn();

    /// @brief Load a VADER-format file (`token<TAB>mean[<TAB>...]`)
    ///
    /// Domain overrides are not applied; call ApplyOverrides() afterwards.
    static absl::StatusOr<Lexicon> LoadFromFile(const std::filesystem::path& path);

    /// @brief Parse VADER-format lines from a stream
    /// @param source_name Used in error messages only
    static absl::StatusOr<Lexicon> LoadFromStream(std::istream& input,
                                                  std::string_view source_name);

    /// @brief Insert or overwrite a single entry (term is lowercased)
    void SetValence(std::string_view term, double valence);

    /// @brief Overwrite entries with domain-specific values
    void ApplyOverrides(const std::vector<TermValence>& overrides);

    std::optional<double> Valence(std::string_view token) const;

    bool Contains(std::string_view token) const {
        return entries_.count(std::string(token)) > 0;
    }

    /// @brief True if `phrase` is a multi-word entry
    bool IsPhrase(std::string_view phrase) const {
        return phrases_.count(std::string(phrase)) > 0;
    }

    /// @brief Word count of the longest multi-word entry (1 if none)
    size_t MaxPhraseWords() const { return max_phrase_words_; }

    size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }

private:
    std::unordered_map<std::string, double> entries_;
    std::unordered_set<std::string> phrases_;
    size_t max_phrase_words_ = 1;
};

/// @brief Valence adjustments for e-commerce review vocabulary
const std::vector<TermValence>& EcommerceOverrides();

/// @brief Intensity shift of a booster ("very", +0.293) or dampener
/// ("barely", -0.293), or nullopt for other tokens
std::optional<double> BoosterValue(std::string_view token);

/// @brief True for negation words ("not", "never", "without", ...) and
/// tokens containing "n't"
bool IsNegation(std::string_view token);

}  // namespace reviewscope::sentiment
