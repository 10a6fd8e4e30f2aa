/// @file metrics_test.cpp
/// @brief Tests for ReviewScope metrics collection

#include <gtest/gtest.h>

#include "common/metrics.h"

namespace reviewscope {
namespace {

class MetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::Instance().Reset();
    }
};

TEST_F(MetricsTest, CounterIncrement) {
    auto& counter = MetricsRegistry::Instance().GetCounter("test_counter");

    EXPECT_EQ(counter.Value(), 0);

    counter.Increment();
    EXPECT_EQ(counter.Value(), 1);

    counter.Add(5);
    EXPECT_EQ(counter.Value(), 6);
}

TEST_F(MetricsTest, CounterNonPositiveIgnored) {
    auto& counter = MetricsRegistry::Instance().GetCounter("test_counter");

    counter.Add(10);
    counter.Add(-5);
    counter.Add(0);

    EXPECT_EQ(counter.Value(), 10);
}

TEST_F(MetricsTest, GaugeSet) {
    auto& gauge = REVIEWSCOPE_GAUGE("test_gauge");

    gauge.Set(100.0);
    EXPECT_EQ(gauge.Value(), 100.0);

    gauge.Set(3.0);
    EXPECT_EQ(gauge.Value(), 3.0);
}

TEST_F(MetricsTest, HistogramObservations) {
    auto& histogram = MetricsRegistry::Instance().GetHistogram("test_histogram");

    histogram.Observe(0.005);
    histogram.Observe(0.050);
    histogram.Observe(1.000);

    EXPECT_EQ(histogram.Count(), 3);
    EXPECT_NEAR(histogram.Sum(), 1.055, 0.001);
}

TEST_F(MetricsTest, HistogramBuckets) {
    std::vector<double> buckets = {0.01, 0.1, 1.0, 10.0};
    Histogram histogram("test", buckets);

    histogram.Observe(0.005);
    histogram.Observe(0.1);   // Upper bounds are inclusive
    histogram.Observe(0.5);
    histogram.Observe(5.0);
    histogram.Observe(50.0);

    auto bucket_counts = histogram.Buckets();
    ASSERT_EQ(bucket_counts.size(), 5u);

    EXPECT_EQ(bucket_counts[0].second, 1);  // <= 0.01
    EXPECT_EQ(bucket_counts[1].second, 2);  // <= 0.1
    EXPECT_EQ(bucket_counts[2].second, 3);  // <= 1.0
    EXPECT_EQ(bucket_counts[3].second, 4);  // <= 10.0
    EXPECT_EQ(bucket_counts[4].second, 5);  // +Inf
}

TEST_F(MetricsTest, HistogramSortsCustomBuckets) {
    Histogram histogram("unsorted", {1.0, 0.01, 0.1}, "run seconds");
    histogram.Observe(0.05);

    auto bucket_counts = histogram.Buckets();
    ASSERT_EQ(bucket_counts.size(), 4u);
    EXPECT_EQ(bucket_counts[0].first, 0.01);
    EXPECT_EQ(bucket_counts[1].first, 0.1);
    EXPECT_EQ(bucket_counts[2].first, 1.0);
    EXPECT_EQ(bucket_counts[0].second, 0);
    EXPECT_EQ(bucket_counts[1].second, 1);
    EXPECT_EQ(histogram.Name(), "unsorted");
    EXPECT_EQ(histogram.Description(), "run seconds");
}

TEST_F(MetricsTest, ScopedTimer) {
    auto& histogram = REVIEWSCOPE_HISTOGRAM("timer_test");

    {
        ScopedTimer timer(histogram);
    }

    EXPECT_EQ(histogram.Count(), 1);
    EXPECT_GE(histogram.Sum(), 0.0);
}

TEST_F(MetricsTest, RegistryReturnsSameInstance) {
    auto& counter1 = REVIEWSCOPE_COUNTER("same_counter");
    auto& counter2 = REVIEWSCOPE_COUNTER("same_counter");

    counter1.Increment();
    EXPECT_EQ(counter2.Value(), 1);
    EXPECT_EQ(&counter1, &counter2);
}

TEST_F(MetricsTest, ExportTextIsSortedByName) {
    MetricsRegistry::Instance().GetCounter("zeta_total", "Last counter").Add(42);
    MetricsRegistry::Instance().GetCounter("alpha_total", "First counter").Add(7);
    MetricsRegistry::Instance().GetGauge("my_gauge", "A test gauge").Set(3.5);
    MetricsRegistry::Instance().GetHistogram("run_seconds").Observe(0.2);

    std::string output = MetricsRegistry::Instance().ExportText();

    EXPECT_NE(output.find("# TYPE alpha_total counter"), std::string::npos);
    EXPECT_NE(output.find("zeta_total 42"), std::string::npos);
    EXPECT_NE(output.find("my_gauge 3.5"), std::string::npos);
    EXPECT_NE(output.find("run_seconds_bucket{le=\"+Inf\"} 1"), std::string::npos);
    EXPECT_NE(output.find("run_seconds_count 1"), std::string::npos);
    EXPECT_LT(output.find("alpha_total"), output.find("zeta_total"));
}

}  // namespace
}  // namespace reviewscope
