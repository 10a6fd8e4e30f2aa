#include "config.h"

#include <cstdlib>
#include <functional>
#include <type_traits>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "common/error.h"

namespace reviewscope {

namespace {

std::optional<std::string> GetEnv(std::string_view prefix, std::string_view suffix) {
    const std::string key = absl::StrCat(prefix, suffix);
    const char* value = std::getenv(key.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return MakeError(ErrorCode::kNotFound,
                         absl::StrCat("configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("failed to parse ", path.string(), ": ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kParseError,
                         absl::StrCat("failed to parse YAML content: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto set_int = [&](std::string_view suffix, std::string_view key) -> absl::Status {
        if (auto val = GetEnv(prefix, suffix)) {
            int64_t parsed = 0;
            if (!absl::SimpleAtoi(*val, &parsed)) {
                return MakeError(ErrorCode::kConfigurationError,
                                 absl::StrCat(prefix, suffix, " is not an integer: ", *val));
            }
            config.Set(key, parsed);
        }
        return absl::OkStatus();
    };

    if (auto val = GetEnv(prefix, "LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }
    if (auto val = GetEnv(prefix, "INDUSTRY")) {
        config.Set("aspects.industry", *val);
    }
    if (auto val = GetEnv(prefix, "LEXICON_PATH")) {
        config.Set("sentiment.lexicon_path", *val);
    }
    REVIEWSCOPE_RETURN_IF_ERROR(set_int("RANDOM_SEED", "topics.random_seed"));
    REVIEWSCOPE_RETURN_IF_ERROR(set_int("N_TOPICS", "topics.n_topics"));
    REVIEWSCOPE_RETURN_IF_ERROR(set_int("WORKER_THREADS", "pipeline.worker_threads"));

    return config;
}

void Config::Merge(const Config& other) {
    if (!other.root_ || !other.root_.IsMap()) {
        return;
    }
    if (!root_ || !root_.IsMap()) {
        root_ = YAML::Clone(other.root_);
        return;
    }

    std::function<void(YAML::Node, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node base, const YAML::Node& overlay) {
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            YAML::Node child = base[key];
            if (child && child.IsMap() && kv.second.IsMap()) {
                merge_nodes(child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');
    YAML::Node current = root_;

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->Scalar();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    int64_t value = 0;
    if (node && node->IsScalar() && absl::SimpleAtoi(node->Scalar(), &value)) {
        return value;
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    double value = 0.0;
    if (node && node->IsScalar() && absl::SimpleAtod(node->Scalar(), &value)) {
        return value;
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    bool value = false;
    if (node && node->IsScalar() && absl::SimpleAtob(node->Scalar(), &value)) {
        return value;
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.Scalar());
            }
        }
    }
    return result;
}

std::vector<std::string> Config::GetKeys(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsMap()) {
        for (const auto& kv : *node) {
            result.push_back(kv.first.Scalar());
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(key, '.');
    if (!root_ || !root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node current = root_;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]] || !current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        YAML::Node child = current[parts[i]];
        current.reset(child);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

}  // namespace reviewscope
