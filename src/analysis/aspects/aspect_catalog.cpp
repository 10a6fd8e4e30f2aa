#include "analysis/aspects/aspect_catalog.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace reviewscope::aspects {

namespace {

std::vector<AspectDefinition> BaseAspects() {
    return {
        {"product_quality", "Product Quality",
         {"quality", "material", "made", "construction", "build", "craftsmanship",
          "durable", "durability", "sturdy", "flimsy", "cheap", "premium",
          "well-made", "poorly made", "authentic", "genuine", "fake", "real", "solid"}},
        {"shipping", "Shipping & Delivery",
         {"shipping", "delivery", "arrived", "package", "packaging", "shipped",
          "deliver", "courier", "carrier", "tracking", "fast", "slow", "late",
          "early", "on time", "delayed", "lost", "damaged in transit", "box", "wrapped"}},
        {"customer_service", "Customer Service",
         {"customer service", "support", "response", "help", "helpful",
          "representative", "rep", "contact", "refund", "return", "exchange",
          "warranty", "replacement", "resolved", "issue", "problem", "complaint",
          "responsive", "rude", "friendly"}},
        {"value", "Value for Money",
         {"price", "value", "worth", "money", "expensive", "cheap", "affordable",
          "overpriced", "bargain", "deal", "discount", "cost", "pay", "paid",
          "budget", "premium price"}},
        {"description_accuracy", "Description Accuracy",
         {"description", "described", "picture", "photo", "image", "expected",
          "expect", "advertised", "shown", "looks like", "different", "same as",
          "accurate", "misleading", "false"}},
    };
}

std::vector<AspectDefinition> IndustryAspects(Industry industry) {
    switch (industry) {
        case Industry::kFashion:
            return {
                {"fit_sizing", "Fit & Sizing",
                 {"fit", "fits", "size", "sizing", "small", "large", "big", "tight",
                  "loose", "comfortable", "uncomfortable", "true to size", "runs small",
                  "runs large", "length", "width", "waist", "measurements", "petite",
                  "plus size"}},
                {"appearance", "Appearance & Style",
                 {"color", "colour", "looks", "style", "design", "pattern", "beautiful",
                  "ugly", "cute", "gorgeous", "stunning", "flattering", "fashionable",
                  "trendy", "classic"}},
                {"fabric", "Fabric & Material",
                 {"fabric", "material", "cotton", "polyester", "silk", "linen", "soft",
                  "scratchy", "itchy", "breathable", "stretchy", "texture", "feel",
                  "lightweight", "heavy"}},
            };
        case Industry::kBeauty:
            return {
                {"efficacy", "Efficacy & Results",
                 {"works", "effective", "results", "improvement", "difference",
                  "before after", "visible", "noticeable", "miracle", "amazing results"}},
                {"skin_reaction", "Skin Compatibility",
                 {"skin", "reaction", "irritation", "breakout", "sensitive", "allergy",
                  "allergic", "rash", "redness", "burning", "gentle", "harsh",
                  "moisturizing", "drying"}},
                {"application", "Application & Texture",
                 {"apply", "application", "blend", "blends", "smooth", "streaky",
                  "coverage", "pigment", "buildable", "easy to use"}},
            };
        case Industry::kElectronics:
            return {
                {"performance", "Performance",
                 {"performance", "fast", "slow", "speed", "powerful", "lag", "laggy",
                  "smooth", "responsive", "efficient", "battery", "battery life",
                  "processor", "memory"}},
                {"ease_of_use", "Ease of Use",
                 {"easy", "difficult", "intuitive", "complicated", "setup", "install",
                  "user-friendly", "confusing", "simple", "instructions", "manual",
                  "learning curve"}},
                {"connectivity", "Connectivity",
                 {"connect", "connection", "bluetooth", "wifi", "wireless", "pair",
                  "pairing", "compatible", "compatibility", "sync"}},
            };
        case Industry::kFood:
            return {
                {"taste", "Taste & Flavor",
                 {"taste", "flavor", "delicious", "tasty", "yummy", "disgusting",
                  "bland", "sweet", "salty", "spicy", "fresh", "stale", "rich", "light"}},
                {"freshness", "Freshness",
                 {"fresh", "freshness", "expired", "shelf life", "stale", "mold",
                  "spoiled", "rotten", "preservatives"}},
                {"packaging_food", "Food Packaging",
                 {"sealed", "leak", "leaking", "spill", "crushed", "intact", "damaged",
                  "broken seal", "vacuum sealed"}},
            };
        case Industry::kGeneral:
        default:
            return {};
    }
}

void Upsert(std::vector<AspectDefinition>& aspects, AspectDefinition definition) {
    auto it = std::find_if(aspects.begin(), aspects.end(),
                           [&](const AspectDefinition& a) { return a.key == definition.key; });
    if (it != aspects.end()) {
        *it = std::move(definition);
    } else {
        aspects.push_back(std::move(definition));
    }
}

}  // namespace

std::string_view IndustryToString(Industry industry) {
    switch (industry) {
        case Industry::kFashion: return "fashion";
        case Industry::kBeauty: return "beauty";
        case Industry::kElectronics: return "electronics";
        case Industry::kFood: return "food";
        case Industry::kGeneral:
        default:
            return "general";
    }
}

absl::StatusOr<Industry> ParseIndustry(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::StripAsciiWhitespace(name));
    for (Industry industry : AllIndustries()) {
        if (lowered == IndustryToString(industry)) {
            return industry;
        }
    }
    return MakeError(ErrorCode::kConfigurationError,
                     absl::StrCat("unknown industry '", name,
                                  "' (expected general, fashion, beauty, electronics or food)"));
}

std::vector<Industry> AllIndustries() {
    return {Industry::kGeneral, Industry::kFashion, Industry::kBeauty,
            Industry::kElectronics, Industry::kFood};
}

AspectCatalog AspectCatalog::Default() {
    AspectCatalog catalog;
    for (Industry industry : AllIndustries()) {
        auto& aspects = catalog.industries_[industry];
        aspects = BaseAspects();
        for (auto& definition : IndustryAspects(industry)) {
            Upsert(aspects, std::move(definition));
        }
    }
    return catalog;
}

absl::Status AspectCatalog::AddAspect(AspectDefinition definition,
                                      const std::vector<Industry>& industries) {
    if (definition.key.empty()) {
        return MakeError(ErrorCode::kConfigurationError, "aspect key must not be empty");
    }

    std::vector<std::string> terms;
    for (const auto& term : definition.trigger_terms) {
        std::string normalized = absl::AsciiStrToLower(absl::StripAsciiWhitespace(term));
        if (!normalized.empty()) {
            terms.push_back(std::move(normalized));
        }
    }
    if (terms.empty()) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("aspect '", definition.key, "' has no trigger terms"));
    }
    definition.trigger_terms = std::move(terms);
    if (definition.display_label.empty()) {
        definition.display_label = definition.key;
    }

    const std::vector<Industry> targets = industries.empty() ? AllIndustries() : industries;
    for (Industry industry : targets) {
        Upsert(industries_[industry], definition);
    }
    return absl::OkStatus();
}

void AspectCatalog::DisableAspect(std::string_view key) {
    disabled_.insert(std::string(key));
}

absl::StatusOr<std::vector<AspectDefinition>> AspectCatalog::DefinitionsFor(Industry industry) const {
    std::vector<AspectDefinition> result;
    auto it = industries_.find(industry);
    if (it != industries_.end()) {
        for (const auto& definition : it->second) {
            if (disabled_.count(definition.key) == 0) {
                result.push_back(definition);
            }
        }
    }

    if (result.empty()) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("aspect vocabulary for industry '",
                                      IndustryToString(industry), "' is empty"));
    }
    return result;
}

}  // namespace reviewscope::aspects
