#pragma once

#include <map>
#include <string>
#include <vector>

namespace voicegate {
namespace metrics {

/**
 * Upper-bound latency targets keyed by statistic name
 * ("p50", "p90", "p99", "mean", "min", "max").
 */
using LatencyTargets = std::map<std::string, double>;

/**
 * Outcome of comparing one metric's histogram against its targets.
 *
 * pass is true when no target was breached. When no samples were
 * collected pass stays true but noData is set, so a caller can tell
 * "untested" apart from "met the target".
 */
struct TargetResult {
    std::string metric;
    bool pass = true;
    std::vector<std::string> failures;
    size_t sampleCount = 0;
    bool noData = false;
    std::string note;
};

enum class BoundKind {
    MAX,
    MIN
};

struct ThresholdBound {
    BoundKind kind = BoundKind::MAX;
    double value = 0.0;

    static ThresholdBound atMost(double v) { return ThresholdBound{BoundKind::MAX, v}; }
    static ThresholdBound atLeast(double v) { return ThresholdBound{BoundKind::MIN, v}; }
};

/**
 * Caller-supplied policy. Names not present are unconstrained.
 */
class QualityThresholds {
public:
    QualityThresholds& setMax(const std::string& name, double value);
    QualityThresholds& setMin(const std::string& name, double value);
    QualityThresholds& set(const std::string& name, const ThresholdBound& bound);

    bool has(const std::string& name) const;
    bool empty() const { return bounds_.empty(); }
    size_t size() const { return bounds_.size(); }
    const std::map<std::string, ThresholdBound>& bounds() const { return bounds_; }

private:
    std::map<std::string, ThresholdBound> bounds_;
};

/**
 * Outcome of a quality gate evaluation. notes lists constraints that
 * could not be evaluated for lack of data; they do not fail the gate.
 */
struct GateResult {
    bool pass = true;
    std::vector<std::string> failures;
    std::vector<std::string> notes;
};

std::string boundKindToString(BoundKind kind);

} // namespace metrics
} // namespace voicegate
