#include "metrics/latency_histogram.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace voicegate {
namespace metrics {

const char* const METRIC_RESPONSE_LATENCY = "responseLatency";
const char* const METRIC_TURN_LATENCY = "turnLatency";
const char* const METRIC_BARGE_IN_LATENCY = "bargeIn";
const char* const METRIC_DETECTION_TO_FADE = "detectionToFade";
const char* const METRIC_FADE_TO_SILENCE = "fadeToSilence";
const char* const METRIC_E2E_LATENCY = "e2eLatency";

std::string formatMs(double valueMs) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << valueMs << "ms";
    return oss.str();
}

bool LatencyHistogram::addSample(const std::string& metric, double valueMs) {
    if (!std::isfinite(valueMs) || valueMs < 0.0) {
        utils::Logger::warn("Rejected latency sample for " + metric + ": " + std::to_string(valueMs));
        return false;
    }

    Series& series = series_[metric];
    auto pos = std::upper_bound(series.sorted.begin(), series.sorted.end(), valueMs);
    series.sorted.insert(pos, valueMs);
    series.latest = valueMs;
    return true;
}

double LatencyHistogram::percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }

    const size_t n = sorted.size();
    long idx = static_cast<long>(std::ceil(p / 100.0 * static_cast<double>(n))) - 1;
    idx = std::max(0L, std::min(idx, static_cast<long>(n) - 1));
    return sorted[static_cast<size_t>(idx)];
}

LatencyStats LatencyHistogram::getStats(const std::string& metric) const {
    LatencyStats stats;

    auto it = series_.find(metric);
    if (it == series_.end() || it->second.sorted.empty()) {
        return stats;
    }

    const auto& values = it->second.sorted;
    stats.count = values.size();
    stats.min = values.front();
    stats.max = values.back();
    stats.mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    stats.p50 = percentile(values, 50.0);
    stats.p90 = percentile(values, 90.0);
    stats.p99 = percentile(values, 99.0);
    stats.latest = it->second.latest;

    return stats;
}

TargetResult LatencyHistogram::assertTargets(const std::string& metric, const LatencyTargets& targets) const {
    TargetResult result;
    result.metric = metric;

    LatencyStats stats = getStats(metric);
    result.sampleCount = stats.count;

    if (stats.count == 0) {
        result.noData = true;
        result.note = metric + ": no samples collected (0 samples); targets not evaluated";
        return result;
    }

    for (const auto& target : targets) {
        const std::string& key = target.first;
        double limit = target.second;

        double actual = 0.0;
        if (key == "p50") {
            actual = stats.p50;
        } else if (key == "p90") {
            actual = stats.p90;
        } else if (key == "p99") {
            actual = stats.p99;
        } else if (key == "mean") {
            actual = stats.mean;
        } else if (key == "max") {
            actual = stats.max;
        } else if (key == "min") {
            actual = stats.min;
        } else {
            result.failures.push_back(metric + ": unknown target statistic '" + key + "'");
            continue;
        }

        if (actual > limit) {
            result.failures.push_back(metric + " " + key + " " + formatMs(actual) +
                                      " exceeds target " + formatMs(limit));
        }

        // The median target also bounds the most recent measurement.
        if (key == "p50" && stats.latest > limit) {
            result.failures.push_back(metric + " latest sample " + formatMs(stats.latest) +
                                      " exceeds p50 target " + formatMs(limit) +
                                      " (p50 " + formatMs(stats.p50) + ")");
        }
    }

    result.pass = result.failures.empty();
    result.note = metric + ": " + std::to_string(stats.count) + " samples";
    return result;
}

size_t LatencyHistogram::getSampleCount(const std::string& metric) const {
    auto it = series_.find(metric);
    return it != series_.end() ? it->second.sorted.size() : 0;
}

std::vector<double> LatencyHistogram::getSamples(const std::string& metric) const {
    auto it = series_.find(metric);
    return it != series_.end() ? it->second.sorted : std::vector<double>{};
}

std::vector<std::string> LatencyHistogram::getMetricNames() const {
    std::vector<std::string> names;
    names.reserve(series_.size());
    for (const auto& entry : series_) {
        names.push_back(entry.first);
    }
    return names;
}

std::string LatencyHistogram::exportJson() const {
    nlohmann::json j = nlohmann::json::object();

    for (const auto& entry : series_) {
        LatencyStats stats = getStats(entry.first);
        j[entry.first] = {
            {"count", stats.count},
            {"min", stats.min},
            {"max", stats.max},
            {"mean", stats.mean},
            {"p50", stats.p50},
            {"p90", stats.p90},
            {"p99", stats.p99},
            {"latest", stats.latest}
        };
    }

    return j.dump(2);
}

void LatencyHistogram::clear() {
    series_.clear();
}

} // namespace metrics
} // namespace voicegate
