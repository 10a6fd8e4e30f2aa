/// @file main.cpp
/// @brief ReviewScope command-line entry point

#include <fstream>
#include <iostream>
#include <sstream>

#include <CLI/CLI.hpp>
#include <absl/strings/str_cat.h>

#include "analysis/pipeline/analysis_config.h"
#include "analysis/pipeline/analysis_service.h"
#include "analysis/pipeline/report_serializer.h"
#include "common/config.h"
#include "common/error.h"
#include "common/logging.h"
#include "common/metrics.h"

namespace {

constexpr char kVersion[] = "1.0.0";

absl::StatusOr<std::string> ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return reviewscope::MakeError(reviewscope::ErrorCode::kNotFound,
                                      absl::StrCat("cannot open ", path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

/// File settings first, then REVIEWSCOPE_* environment variables on top.
absl::StatusOr<reviewscope::Config> LoadConfig(const std::string& config_path) {
    reviewscope::Config config;
    if (!config_path.empty()) {
        auto file_config = reviewscope::Config::LoadFromFile(config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config = *std::move(file_config);
    }

    auto env_config = reviewscope::Config::LoadFromEnvironment();
    if (!env_config.ok()) {
        return env_config.status();
    }
    config.Merge(*env_config);
    return config;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"ReviewScope - sentiment, topic and aspect analytics for customer reviews"};

    std::string input_path;
    std::string config_path;
    std::string output_path;
    std::string industry;
    std::string log_level;
    size_t workers = 0;
    bool sentiment_only = false;
    bool print_metrics = false;
    bool version_flag = false;

    app.add_option("-i,--input", input_path, "JSON file with review records");
    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--industry", industry,
                   "Aspect vocabulary (general, fashion, beauty, electronics, food)");
    app.add_option("-o,--output", output_path, "Write the report here instead of stdout");
    app.add_flag("--sentiment-only", sentiment_only, "Skip topics, aspects and trends");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("--workers", workers, "Worker threads (0 = hardware concurrency)");
    app.add_flag("--print-metrics", print_metrics, "Print run metrics to stderr");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "ReviewScope v" << kVersion << std::endl;
        return 0;
    }
    if (input_path.empty()) {
        std::cerr << "--input is required" << std::endl << app.help();
        return 2;
    }

    auto config = LoadConfig(config_path);
    if (!config.ok()) {
        std::cerr << "Failed to load config: " << config.status().message() << std::endl;
        return 1;
    }

    auto analysis_config = reviewscope::pipeline::AnalysisConfig::FromConfig(*config);
    if (!analysis_config.ok()) {
        std::cerr << "Invalid configuration: " << analysis_config.status().message() << std::endl;
        return 1;
    }

    // Apply CLI overrides
    if (!log_level.empty()) {
        analysis_config->logging.level = reviewscope::LogLevelFromString(log_level);
    }
    if (workers > 0) {
        analysis_config->worker_threads = workers;
    }
    if (!industry.empty()) {
        auto parsed = reviewscope::aspects::ParseIndustry(industry);
        if (!parsed.ok()) {
            std::cerr << parsed.status().message() << std::endl;
            return 1;
        }
        analysis_config->industry = *parsed;
    }

    reviewscope::InitLogging(analysis_config->logging);
    REVIEWSCOPE_LOG_INFO("ReviewScope v{} starting", kVersion);

    auto contents = ReadFile(input_path);
    if (!contents.ok()) {
        REVIEWSCOPE_LOG_ERROR("{}", contents.status().message());
        return 1;
    }
    auto records = reviewscope::pipeline::ParseReviewRecords(*contents);
    if (!records.ok()) {
        REVIEWSCOPE_LOG_ERROR("Failed to read {}: {}", input_path, records.status().message());
        return 1;
    }
    REVIEWSCOPE_LOG_INFO("Loaded {} records from {}", records->size(), input_path);

    const auto selected_industry = analysis_config->industry;
    auto service = reviewscope::pipeline::AnalysisService::Create(*std::move(analysis_config));
    if (!service.ok()) {
        REVIEWSCOPE_LOG_ERROR("Failed to create pipeline: {}", service.status().message());
        return 1;
    }

    reviewscope::pipeline::AnalysisOptions options;
    if (sentiment_only) {
        options = reviewscope::pipeline::AnalysisOptions::SentimentOnly();
    }

    auto report = (*service)->Submit(*std::move(records), selected_industry, options).get();
    if (!report.ok()) {
        REVIEWSCOPE_LOG_ERROR("Analysis failed: {}", report.status().message());
        return 1;
    }

    const std::string json = reviewscope::pipeline::SerializeReport(*report);
    if (output_path.empty()) {
        std::cout << json << std::endl;
    } else {
        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            REVIEWSCOPE_LOG_ERROR("Cannot write {}", output_path);
            return 1;
        }
        out << json << '\n';
        REVIEWSCOPE_LOG_INFO("Report written to {}", output_path);
    }

    if (print_metrics) {
        std::cerr << reviewscope::MetricsRegistry::Instance().ExportText();
    }

    reviewscope::ShutdownLogging();
    return 0;
}
