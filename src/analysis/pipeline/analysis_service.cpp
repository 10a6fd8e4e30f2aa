/// @file analysis_service.cpp
/// @brief AnalysisService implementation

#include "analysis/pipeline/analysis_service.h"

#include "common/error.h"
#include "common/logging.h"

namespace reviewscope::pipeline {

AnalysisService::AnalysisService(std::shared_ptr<const AnalysisPipeline> pipeline,
                                 size_t worker_threads)
    : pipeline_(std::move(pipeline)), pool_(worker_threads) {
    REVIEWSCOPE_LOG_DEBUG("Analysis service started with {} workers", pool_.Size());
}

absl::StatusOr<std::unique_ptr<AnalysisService>> AnalysisService::Create(AnalysisConfig config) {
    const size_t workers = config.worker_threads;
    REVIEWSCOPE_ASSIGN_OR_RETURN(auto pipeline, CreateAnalysisPipeline(std::move(config)));
    return std::make_unique<AnalysisService>(
        std::shared_ptr<const AnalysisPipeline>(std::move(pipeline)), workers);
}

std::future<absl::StatusOr<AnalysisReport>> AnalysisService::Submit(
    std::vector<ReviewRecord> records,
    aspects::Industry industry,
    AnalysisOptions options) {
    return pool_.Submit([pipeline = pipeline_, records = std::move(records), industry, options]() {
        return pipeline->RunFullAnalysis(records, industry, options);
    });
}

std::future<absl::StatusOr<AnalysisReport>> AnalysisService::Submit(
    std::vector<ReviewRecord> records,
    std::string industry,
    AnalysisOptions options) {
    return pool_.Submit([pipeline = pipeline_, records = std::move(records),
                         industry = std::move(industry), options]() {
        return pipeline->RunFullAnalysis(records, std::string_view(industry), options);
    });
}

}  // namespace reviewscope::pipeline
