#pragma once

/// @file metrics.h
/// @brief In-process counters, gauges and histograms for pipeline runs

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace reviewscope {

/// @brief Monotonic counter
class Counter {
public:
    explicit Counter(std::string name, std::string description = "");

    /// @brief Add one
    void Increment();

    /// @brief Add `delta`; negative values are ignored
    void Add(int64_t delta);

    /// @brief Current total
    int64_t Value() const;

    /// @brief Metric name as exported
    const std::string& Name() const { return name_; }

    /// @brief Help text shown in the export
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<int64_t> value_{0};
};

/// @brief Last-written value
class Gauge {
public:
    explicit Gauge(std::string name, std::string description = "");

    /// @brief Overwrite the stored value
    void Set(double value);

    /// @brief Most recently set value, 0 before the first Set()
    double Value() const;

    /// @brief Metric name as exported
    const std::string& Name() const { return name_; }

    /// @brief Help text shown in the export
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<double> value_{0.0};
};

/// @brief Cumulative-bucket histogram
class Histogram {
public:
    /// @brief Buckets tuned for run durations in seconds
    explicit Histogram(std::string name, std::string description = "");

    /// @brief Custom bucket upper bounds, sorted on construction
    Histogram(std::string name, std::vector<double> buckets, std::string description = "");

    /// @brief Record one observation
    void Observe(double value);

    /// @brief Number of observations
    int64_t Count() const;

    /// @brief Sum of all observed values
    double Sum() const;

    /// @brief (upper bound, cumulative count) pairs ending with +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    /// @brief Metric name as exported
    const std::string& Name() const { return name_; }

    /// @brief Help text shown in the export
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::vector<double> bounds_;
    std::unique_ptr<std::atomic<int64_t>[]> counts_;  // bounds_.size() + 1 slots
    std::atomic<int64_t> count_{0};
    std::atomic<double> sum_{0.0};
};

/// @brief Observes the elapsed wall time in seconds on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Process-wide metric store
///
/// Metrics live until Reset(); references returned by the getters stay valid
/// until then.
class MetricsRegistry {
public:
    /// @brief The process-wide registry
    static MetricsRegistry& Instance();

    /// @brief Counter registered under `name`, created on first use
    Counter& GetCounter(const std::string& name, const std::string& description = "");

    /// @brief Gauge registered under `name`, created on first use
    Gauge& GetGauge(const std::string& name, const std::string& description = "");

    /// @brief Histogram registered under `name`, created on first use with default buckets
    Histogram& GetHistogram(const std::string& name, const std::string& description = "");

    /// @brief Prometheus text exposition, metrics sorted by name
    std::string ExportText() const;

    /// @brief Drop every metric; intended for tests
    void Reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<Histogram>> histograms_;
};

#define REVIEWSCOPE_COUNTER(name) \
    ::reviewscope::MetricsRegistry::Instance().GetCounter(name)

#define REVIEWSCOPE_GAUGE(name) \
    ::reviewscope::MetricsRegistry::Instance().GetGauge(name)

#define REVIEWSCOPE_HISTOGRAM(name) \
    ::reviewscope::MetricsRegistry::Instance().GetHistogram(name)

}  // namespace reviewscope
