#include <gtest/gtest.h>
#include "utilities/metrics.h"

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
    std::map<std::string,std::string> labels{{"k","v"},{"a","b"}};
    std::string formatted = MetricsRegistry::labelsToString(labels);
    // Map iteration is ordered, so "a" should come before "k".
    EXPECT_EQ(formatted, "{a=\"b\",k=\"v\"}");
}

/**
 * @brief Validate gauge, counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
    MetricsRegistry::instance().reset();
    // Record a gauge with a label
    MetricsRegistry::instance().setGauge("gauge", 2.5, {{"host","localhost"}});
    // Increment a counter
    MetricsRegistry::instance().incrementCounter("requests_total", 3);
    // Record a histogram observation
    MetricsRegistry::instance().observe("latency_seconds", 1.2);
    std::string metrics = MetricsRegistry::instance().toPrometheus();
    EXPECT_NE(metrics.find("gauge{host=\"localhost\"} 2.5"), std::string::npos);
    EXPECT_NE(metrics.find("requests_total 3"), std::string::npos);
    EXPECT_NE(metrics.find("latency_seconds_sum 1.2"), std::string::npos);
    EXPECT_NE(metrics.find("latency_seconds_count 1"), std::string::npos);
    MetricsRegistry::instance().reset();
    EXPECT_TRUE(MetricsRegistry::instance().toPrometheus().empty());
}

/**
 * @brief Counters are readable back, separately per label set.
 */
TEST(MetricsRegistry, CounterValue) {
    MetricsRegistry registry;
    EXPECT_EQ(registry.counterValue("mosaic_tree_writes_total"), 0);
    registry.incrementCounter("mosaic_tree_writes_total");
    registry.incrementCounter("mosaic_tree_writes_total", 2);
    registry.incrementCounter("mosaic_tree_writes_total", 1, {{"store","file"}});
    EXPECT_EQ(registry.counterValue("mosaic_tree_writes_total"), 3);
    EXPECT_EQ(registry.counterValue("mosaic_tree_writes_total", {{"store","file"}}), 1);
    // Separate registries do not share state.
    EXPECT_EQ(MetricsRegistry::instance().counterValue("mosaic_tree_writes_total"), 0);
}

TEST(MetricsRegistryTest, HistogramCountTracksObservations) {
    MetricsRegistry registry;
    EXPECT_EQ(registry.histogramCount(mosaic::metric_names::SAVE_SECONDS), 0u);
    registry.observe(mosaic::metric_names::SAVE_SECONDS, 0.25);
    registry.observe(mosaic::metric_names::SAVE_SECONDS, 0.5);
    EXPECT_EQ(registry.histogramCount(mosaic::metric_names::SAVE_SECONDS), 2u);
}

TEST(MetricsRegistryTest, ManifestCountersExportAtZero) {
    MetricsRegistry registry;
    mosaic::registerManifestMetrics(registry);
    std::string text = registry.toPrometheus();
    EXPECT_NE(text.find("mosaic_manifest_loads_total 0"), std::string::npos);
    EXPECT_NE(text.find("mosaic_conflict_coercions_total 0"), std::string::npos);
    EXPECT_EQ(registry.counterValue(mosaic::metric_names::TREE_WRITES), 0);
}
