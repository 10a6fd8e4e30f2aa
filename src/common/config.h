#pragma once

/// @file config.h
/// @brief YAML-backed configuration tree with environment overrides

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <yaml-cpp/yaml.h>

namespace reviewscope {

/// @brief Scalar or list value accepted by Config::Set
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief Hierarchical configuration addressed with dot-separated keys
///
/// Values are read leniently: a missing key or a value of the wrong type
/// yields the supplied default. Typed consumers (for example
/// AnalysisConfig) are responsible for validating ranges.
class Config {
public:
    Config() = default;

    /// @brief Load a YAML document from disk
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Parse a YAML document held in memory
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Collect the recognised `<prefix>*` environment variables
    ///
    /// Supported: LOG_LEVEL, INDUSTRY, LEXICON_PATH, RANDOM_SEED,
    /// WORKER_THREADS, N_TOPICS.
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "REVIEWSCOPE_");

    /// @brief Deep-merge `other` into this tree; `other` wins on conflicts
    void Merge(const Config& other);

    std::string GetString(std::string_view key, std::string_view default_value = "") const;
    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;
    double GetDouble(std::string_view key, double default_value = 0.0) const;
    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Read a sequence of scalars; empty when absent
    std::vector<std::string> GetStringList(std::string_view key) const;

    /// @brief Keys of the map stored at `key`, in document order
    std::vector<std::string> GetKeys(std::string_view key) const;

    bool HasKey(std::string_view key) const;

    void Set(std::string_view key, ConfigValue value);

    const YAML::Node& GetNode() const { return root_; }

private:
    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;

    YAML::Node root_;
};

}  // namespace reviewscope
