#include "metrics/quality_gate.hpp"

namespace voicegate {
namespace metrics {

QualityThresholds& QualityThresholds::setMax(const std::string& name, double value) {
    return set(name, ThresholdBound::atMost(value));
}

QualityThresholds& QualityThresholds::setMin(const std::string& name, double value) {
    return set(name, ThresholdBound::atLeast(value));
}

QualityThresholds& QualityThresholds::set(const std::string& name, const ThresholdBound& bound) {
    bounds_[name] = bound;
    return *this;
}

bool QualityThresholds::has(const std::string& name) const {
    return bounds_.find(name) != bounds_.end();
}

std::string boundKindToString(BoundKind kind) {
    return kind == BoundKind::MIN ? "min" : "max";
}

} // namespace metrics
} // namespace voicegate
