#pragma once

#include "core/barge_in_detector.hpp"
#include "core/turn_state_machine.hpp"
#include "metrics/latency_histogram.hpp"
#include "metrics/quality_gate.hpp"
#include "telemetry/domain_event.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace voicegate {
namespace metrics {

/**
 * Running counters for one conversation plus derived averages.
 * Averages are empty until at least one sample of the metric exists.
 */
struct ConversationMetrics {
    size_t errors = 0;
    size_t queueOverflows = 0;
    size_t scheduleResets = 0;
    size_t falseBargeIns = 0;
    size_t audioInterruptions = 0;
    size_t bargeInAttempts = 0;
    size_t successfulBargeIns = 0;
    size_t userUtterances = 0;
    size_t aiResponses = 0;
    size_t totalTurns = 0;
    size_t malformedMessages = 0;
    size_t unclassifiedRecords = 0;
    size_t recordsProcessed = 0;

    std::optional<double> averageResponseLatencyMs;
    std::optional<double> averageBargeInLatencyMs;
    std::optional<double> averageTurnLatencyMs;
};

/**
 * Owns the counters and the latency histogram for one engine and
 * evaluates quality thresholds against them.
 */
class MetricsAggregator {
public:
    // Counter bookkeeping driven by the engine pipeline
    void onRecordClassified(size_t eventCount, bool malformed);
    void onEvent(const telemetry::DomainEvent& event);
    void onTurnUpdate(const core::TurnUpdate& update);
    void onBargeInUpdate(const core::BargeInUpdate& update);

    bool addLatencySample(const std::string& metric, double valueMs);

    ConversationMetrics getMetrics() const;

    LatencyHistogram& getHistogram() { return histogram_; }
    const LatencyHistogram& getHistogram() const { return histogram_; }

    TargetResult assertTargets(const std::string& metric, const LatencyTargets& targets) const;

    /**
     * Evaluate counters and derived averages against their bounds.
     * Unknown names fail the gate. Derived averages without samples are
     * listed in notes instead of failing.
     */
    GateResult assertQualityThresholds(const QualityThresholds& thresholds) const;

    /**
     * Look up a counter or derived average by name.
     * @return empty when the name is unknown or the average has no samples
     */
    std::optional<double> getValue(const std::string& name) const;

    static bool isKnownMetric(const std::string& name);
    static bool isDerivedMetric(const std::string& name);
    static const std::vector<std::string>& counterNames();
    static const std::vector<std::string>& derivedNames();

    // Counters in fixed order followed by latency statistics in metric order
    void appendSummary(std::ostream& out) const;

    std::string exportJson() const;

    void reset();

private:
    std::optional<double> averageOf(const std::string& metric) const;

    ConversationMetrics counters_;
    LatencyHistogram histogram_;
};

} // namespace metrics
} // namespace voicegate
