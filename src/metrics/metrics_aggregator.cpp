#include "metrics/metrics_aggregator.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace voicegate {
namespace metrics {

using telemetry::EventKind;

namespace {

const char* const AVG_RESPONSE_LATENCY = "averageResponseLatencyMs";
const char* const AVG_BARGE_IN_LATENCY = "averageBargeInLatencyMs";
const char* const AVG_TURN_LATENCY = "averageTurnLatencyMs";

std::string formatValue(const std::string& name, double value) {
    if (MetricsAggregator::isDerivedMetric(name)) {
        return formatMs(value);
    }
    std::ostringstream oss;
    // Whole values print as integers while they stay exact in a double
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        oss << static_cast<long long>(value);
    } else {
        oss << std::fixed << std::setprecision(2) << value;
    }
    return oss.str();
}

} // namespace

void MetricsAggregator::onRecordClassified(size_t eventCount, bool malformed) {
    counters_.recordsProcessed++;
    if (malformed) {
        counters_.malformedMessages++;
    } else if (eventCount == 0) {
        counters_.unclassifiedRecords++;
    }
}

void MetricsAggregator::onEvent(const telemetry::DomainEvent& event) {
    switch (event.kind) {
        case EventKind::ERROR:
            counters_.errors++;
            break;
        case EventKind::QUEUE_OVERFLOW:
            counters_.queueOverflows++;
            break;
        case EventKind::SCHEDULE_RESET:
            counters_.scheduleResets++;
            break;
        case EventKind::BARGE_IN_CANCELLED:
            counters_.falseBargeIns++;
            break;
        case EventKind::PLAYBACK_INTERRUPTED:
            counters_.audioInterruptions++;
            break;
        default:
            break;
    }
}

void MetricsAggregator::onTurnUpdate(const core::TurnUpdate& update) {
    if (update.transcriptOpened) {
        counters_.userUtterances++;
    }
    if (update.responseOpened) {
        counters_.aiResponses++;
    }
    if (update.sealed && update.sealedTurn) {
        counters_.totalTurns++;

        const core::Turn& turn = *update.sealedTurn;
        if (auto turnLatency = turn.turnLatencyMs()) {
            addLatencySample(METRIC_TURN_LATENCY, *turnLatency);
        }
        // A backfilled start is not a measured response start
        if (!turn.responseStartBackfilled) {
            if (auto responseLatency = turn.responseLatencyMs()) {
                addLatencySample(METRIC_RESPONSE_LATENCY, *responseLatency);
            }
            if (auto endToEnd = turn.endToEndLatencyMs()) {
                addLatencySample(METRIC_E2E_LATENCY, *endToEnd);
            }
        }
    }
}

void MetricsAggregator::onBargeInUpdate(const core::BargeInUpdate& update) {
    if (update.attemptOpened) {
        counters_.bargeInAttempts++;
    }
    if (update.confirmed) {
        counters_.successfulBargeIns++;
    }
    if (update.latencyMs) {
        addLatencySample(METRIC_BARGE_IN_LATENCY, *update.latencyMs);
    }
    if (update.detectionToFadeMs) {
        addLatencySample(METRIC_DETECTION_TO_FADE, *update.detectionToFadeMs);
    }
    if (update.fadeToSilenceMs) {
        addLatencySample(METRIC_FADE_TO_SILENCE, *update.fadeToSilenceMs);
    }
}

bool MetricsAggregator::addLatencySample(const std::string& metric, double valueMs) {
    return histogram_.addSample(metric, valueMs);
}

std::optional<double> MetricsAggregator::averageOf(const std::string& metric) const {
    LatencyStats stats = histogram_.getStats(metric);
    if (stats.count == 0) {
        return std::nullopt;
    }
    return stats.mean;
}

ConversationMetrics MetricsAggregator::getMetrics() const {
    ConversationMetrics metrics = counters_;
    metrics.averageResponseLatencyMs = averageOf(METRIC_RESPONSE_LATENCY);
    metrics.averageBargeInLatencyMs = averageOf(METRIC_BARGE_IN_LATENCY);
    metrics.averageTurnLatencyMs = averageOf(METRIC_TURN_LATENCY);
    return metrics;
}

TargetResult MetricsAggregator::assertTargets(const std::string& metric, const LatencyTargets& targets) const {
    return histogram_.assertTargets(metric, targets);
}

const std::vector<std::string>& MetricsAggregator::counterNames() {
    static const std::vector<std::string> names = {
        "errors", "queueOverflows", "scheduleResets", "falseBargeIns",
        "audioInterruptions", "bargeInAttempts", "successfulBargeIns", "userUtterances", "aiResponses",
        "totalTurns", "malformedMessages", "unclassifiedRecords", "recordsProcessed"
    };
    return names;
}

const std::vector<std::string>& MetricsAggregator::derivedNames() {
    static const std::vector<std::string> names = {
        AVG_RESPONSE_LATENCY, AVG_BARGE_IN_LATENCY, AVG_TURN_LATENCY
    };
    return names;
}

bool MetricsAggregator::isDerivedMetric(const std::string& name) {
    const auto& names = derivedNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

bool MetricsAggregator::isKnownMetric(const std::string& name) {
    const auto& names = counterNames();
    return isDerivedMetric(name) || std::find(names.begin(), names.end(), name) != names.end();
}

std::optional<double> MetricsAggregator::getValue(const std::string& name) const {
    ConversationMetrics m = getMetrics();

    if (name == "errors") return static_cast<double>(m.errors);
    if (name == "queueOverflows") return static_cast<double>(m.queueOverflows);
    if (name == "scheduleResets") return static_cast<double>(m.scheduleResets);
    if (name == "falseBargeIns") return static_cast<double>(m.falseBargeIns);
    if (name == "audioInterruptions") return static_cast<double>(m.audioInterruptions);
    if (name == "bargeInAttempts") return static_cast<double>(m.bargeInAttempts);
    if (name == "successfulBargeIns") return static_cast<double>(m.successfulBargeIns);
    if (name == "userUtterances") return static_cast<double>(m.userUtterances);
    if (name == "aiResponses") return static_cast<double>(m.aiResponses);
    if (name == "totalTurns") return static_cast<double>(m.totalTurns);
    if (name == "malformedMessages") return static_cast<double>(m.malformedMessages);
    if (name == "unclassifiedRecords") return static_cast<double>(m.unclassifiedRecords);
    if (name == "recordsProcessed") return static_cast<double>(m.recordsProcessed);

    if (name == AVG_RESPONSE_LATENCY) return m.averageResponseLatencyMs;
    if (name == AVG_BARGE_IN_LATENCY) return m.averageBargeInLatencyMs;
    if (name == AVG_TURN_LATENCY) return m.averageTurnLatencyMs;

    return std::nullopt;
}

GateResult MetricsAggregator::assertQualityThresholds(const QualityThresholds& thresholds) const {
    GateResult result;

    for (const auto& entry : thresholds.bounds()) {
        const std::string& name = entry.first;
        const ThresholdBound& bound = entry.second;

        if (!isKnownMetric(name)) {
            result.failures.push_back("unknown quality metric '" + name + "'");
            continue;
        }

        std::optional<double> value = getValue(name);
        if (!value) {
            result.notes.push_back(name + ": no samples collected (0 samples); " +
                                   boundKindToString(bound.kind) + " " + formatValue(name, bound.value) +
                                   " not evaluated");
            continue;
        }

        if (bound.kind == BoundKind::MAX && *value > bound.value) {
            result.failures.push_back(name + " " + formatValue(name, *value) +
                                      " exceeds maximum " + formatValue(name, bound.value));
        } else if (bound.kind == BoundKind::MIN && *value < bound.value) {
            result.failures.push_back(name + " " + formatValue(name, *value) +
                                      " is below minimum " + formatValue(name, bound.value));
        }
    }

    result.pass = result.failures.empty();
    if (!result.pass) {
        utils::Logger::warn("Quality gate failed with " + std::to_string(result.failures.size()) + " failure(s)");
    }
    return result;
}

void MetricsAggregator::appendSummary(std::ostream& out) const {
    out << "Counters:\n";
    for (const auto& name : counterNames()) {
        out << "  " << name << ": " << formatValue(name, getValue(name).value_or(0.0)) << "\n";
    }

    out << "Averages:\n";
    for (const auto& name : derivedNames()) {
        std::optional<double> value = getValue(name);
        out << "  " << name << ": " << (value ? formatMs(*value) : std::string("no samples")) << "\n";
    }

    out << "Latency:\n";
    std::vector<std::string> names = histogram_.getMetricNames();
    if (names.empty()) {
        out << "  (no samples collected)\n";
    }
    for (const auto& name : names) {
        LatencyStats stats = histogram_.getStats(name);
        out << "  " << name << ": count=" << stats.count
            << " min=" << formatMs(stats.min)
            << " mean=" << formatMs(stats.mean)
            << " p50=" << formatMs(stats.p50)
            << " p90=" << formatMs(stats.p90)
            << " p99=" << formatMs(stats.p99)
            << " max=" << formatMs(stats.max) << "\n";
    }
}

std::string MetricsAggregator::exportJson() const {
    nlohmann::json j;

    nlohmann::json counters = nlohmann::json::object();
    for (const auto& name : counterNames()) {
        counters[name] = static_cast<uint64_t>(getValue(name).value_or(0.0));
    }
    j["counters"] = counters;

    nlohmann::json averages = nlohmann::json::object();
    for (const auto& name : derivedNames()) {
        std::optional<double> value = getValue(name);
        averages[name] = value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }
    j["averages"] = averages;
    j["latency"] = nlohmann::json::parse(histogram_.exportJson());

    return j.dump(2);
}

void MetricsAggregator::reset() {
    counters_ = ConversationMetrics{};
    histogram_.clear();
}

} // namespace metrics
} // namespace voicegate
