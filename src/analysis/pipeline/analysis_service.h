#pragma once

/// @file analysis_service.h
/// @brief Runs analyses on a worker pool

#include <future>
#include <memory>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "analysis/pipeline/analysis_pipeline.h"
#include "common/thread_pool.h"

namespace reviewscope::pipeline {

/// @brief Dispatches independent analysis runs to a ThreadPool
///
/// The pipeline is shared read-only by every worker. Destroying the service
/// waits for queued runs to finish.
class AnalysisService {
public:
    AnalysisService(std::shared_ptr<const AnalysisPipeline> pipeline, size_t worker_threads = 0);

    AnalysisService(const AnalysisService&) = delete;
    AnalysisService& operator=(const AnalysisService&) = delete;

    /// @brief Build the pipeline from `config` and size the pool from
    /// `config.worker_threads`
    static absl::StatusOr<std::unique_ptr<AnalysisService>> Create(AnalysisConfig config);

    std::future<absl::StatusOr<AnalysisReport>> Submit(std::vector<ReviewRecord> records,
                                                       aspects::Industry industry,
                                                       AnalysisOptions options = {});

    std::future<absl::StatusOr<AnalysisReport>> Submit(std::vector<ReviewRecord> records,
                                                       std::string industry,
                                                       AnalysisOptions options = {});

    /// @brief Block until every submitted run has finished
    void Wait() { pool_.Wait(); }

    size_t WorkerCount() const { return pool_.Size(); }

    const AnalysisPipeline& pipeline() const { return *pipeline_; }

private:
    std::shared_ptr<const AnalysisPipeline> pipeline_;
    ThreadPool pool_;
};

}  // namespace reviewscope::pipeline
