#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * @brief Metrics registry that exports Prometheus text format.
 *
 * Components receive a registry pointer from their caller; instance() is the
 * process-wide one used by mosaic_ctl.
 */
class MetricsRegistry {
public:
    MetricsRegistry() = default;
    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    /** Get the process-wide instance. */
    static MetricsRegistry& instance();

    /** Set gauge value with optional labels. */
    void setGauge(const std::string& name, double value,
                  const std::map<std::string, std::string>& labels = {});

    /** Increment counter by value (default 1). */
    void incrementCounter(const std::string& name, double value = 1.0,
                          const std::map<std::string, std::string>& labels = {});

    /** Record observation for a histogram. */
    void observe(const std::string& name, double value,
                 const std::map<std::string, std::string>& labels = {});

    /** Current value of a counter, 0 if never incremented. */
    double counterValue(const std::string& name,
                        const std::map<std::string, std::string>& labels = {}) const;

    /** Number of observations recorded for a histogram. */
    unsigned long histogramCount(const std::string& name,
                                 const std::map<std::string, std::string>& labels = {}) const;

    /** Serialize all metrics in Prometheus text format. */
    std::string toPrometheus() const;

    /**
     * @brief Clear all stored metrics.
     *
     * Primarily used by unit tests to ensure a clean registry state.
     */
    void reset();

    /** Convert labels map to Prometheus label string. */
    static std::string labelsToString(const std::map<std::string,std::string>& labels);

private:
    struct Histogram { double sum{0}; unsigned long count{0}; };

    mutable std::mutex mtx_;
    std::unordered_map<std::string, double> gauges_;
    std::unordered_map<std::string, double> counters_;
    std::unordered_map<std::string, Histogram> histograms_;
};

namespace mosaic::metric_names {

inline constexpr const char* MANIFEST_LOADS = "mosaic_manifest_loads_total";
inline constexpr const char* MANIFEST_LOOKUPS = "mosaic_manifest_lookups_total";
inline constexpr const char* TREE_WRITES = "mosaic_tree_writes_total";
inline constexpr const char* MERGE_CONFLICTS = "mosaic_merge_conflicts_total";
inline constexpr const char* CONFLICT_COERCIONS = "mosaic_conflict_coercions_total";
inline constexpr const char* SAVE_SECONDS = "mosaic_save_seconds";

} // namespace mosaic::metric_names

namespace mosaic {

/**
 * @brief Create every manifest counter at zero so an export lists them
 * before the first event.
 */
void registerManifestMetrics(MetricsRegistry& registry);

} // namespace mosaic
