#pragma once

#include "metrics/quality_gate.hpp"
#include <map>
#include <string>
#include <vector>

namespace voicegate {
namespace metrics {

/**
 * Latency metric statistics
 */
struct LatencyStats {
    size_t count;
    double min;
    double max;
    double mean;
    double p50;
    double p90;
    double p99;
    double latest;

    LatencyStats() : count(0), min(0), max(0), mean(0), p50(0), p90(0), p99(0), latest(0) {}
};

/**
 * Per-metric latency sample collection.
 *
 * Samples are kept sorted on insertion; statistics are computed on every
 * call to getStats() so they never go stale. Expected volumes are tens to
 * low hundreds of samples per metric.
 */
class LatencyHistogram {
public:
    /**
     * Record a latency sample
     * @param metric Metric name
     * @param valueMs Latency in milliseconds, must be finite and >= 0
     * @return false if the sample was rejected
     */
    bool addSample(const std::string& metric, double valueMs);

    /**
     * Get statistics for a metric
     * @param metric Metric name
     * @return statistics; count == 0 when nothing was recorded
     */
    LatencyStats getStats(const std::string& metric) const;

    /**
     * Compare a metric against upper-bound targets
     * @param metric Metric name
     * @param targets Map of statistic name to maximum acceptable value
     * @return structured verdict, never throws
     */
    TargetResult assertTargets(const std::string& metric, const LatencyTargets& targets) const;

    size_t getSampleCount(const std::string& metric) const;
    std::vector<double> getSamples(const std::string& metric) const;

    /**
     * @return metric names in sorted order
     */
    std::vector<std::string> getMetricNames() const;

    std::string exportJson() const;

    void clear();

    /**
     * Nearest-rank percentile over an ascending sequence.
     * index = ceil(p/100 * n) - 1, clamped into [0, n-1]
     */
    static double percentile(const std::vector<double>& sorted, double p);

private:
    struct Series {
        std::vector<double> sorted;
        double latest = 0.0;
    };

    std::map<std::string, Series> series_;
};

// Metric names recorded by the engine
extern const char* const METRIC_RESPONSE_LATENCY;
extern const char* const METRIC_TURN_LATENCY;
extern const char* const METRIC_BARGE_IN_LATENCY;
extern const char* const METRIC_DETECTION_TO_FADE;
extern const char* const METRIC_FADE_TO_SILENCE;
extern const char* const METRIC_E2E_LATENCY;

std::string formatMs(double valueMs);

} // namespace metrics
} // namespace voicegate
