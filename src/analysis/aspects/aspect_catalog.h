#pragma once

/// @file aspect_catalog.h
/// @brief Industry-specific aspect vocabularies

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace reviewscope::aspects {

/// @brief Supported industry vocabularies
enum class Industry {
    kGeneral,
    kFashion,
    kBeauty,
    kElectronics,
    kFood,
};

/// @brief "general", "fashion", "beauty", "electronics" or "food"
std::string_view IndustryToString(Industry industry);

/// @brief Parse an industry key (case-insensitive)
/// @return Configuration error for unknown keys
absl::StatusOr<Industry> ParseIndustry(std::string_view name);

std::vector<Industry> AllIndustries();

/// @brief A product or service dimension tracked across reviews
struct AspectDefinition {
    std::string key;            ///< Stable identifier, e.g. "shipping"
    std::string display_label;  ///< e.g. "Shipping & Delivery"
    std::vector<std::string> trigger_terms;  ///< Lowercase words or phrases
};

/// @brief Aspect definitions per industry
///
/// Every industry gets the five base aspects followed by its own. The catalog
/// is assembled from configuration at startup and read-only afterwards.
class AspectCatalog {
public:
    /// @brief Base plus built-in industry aspects
    static AspectCatalog Default();

    /// @brief Add an aspect to one industry, or to every industry when
    /// `industries` is empty
    ///
    /// An existing aspect with the same key is replaced.
    /// @return Configuration error for an empty key or trigger list
    absl::Status AddAspect(AspectDefinition definition, const std::vector<Industry>& industries = {});

    /// @brief Exclude an aspect key from every industry
    void DisableAspect(std::string_view key);

    /// @brief Definitions for `industry`, base aspects first
    /// @return Configuration error when no aspect remains
    absl::StatusOr<std::vector<AspectDefinition>> DefinitionsFor(Industry industry) const;

private:
    std::map<Industry, std::vector<AspectDefinition>> industries_;
    std::set<std::string> disabled_;
};

}  // namespace reviewscope::aspects
