#pragma once

#include "core/barge_in_detector.hpp"
#include "core/condition_waiter.hpp"
#include "core/turn_state_machine.hpp"
#include "metrics/metrics_aggregator.hpp"
#include "telemetry/event_classifier.hpp"
#include "telemetry/raw_record.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include <map>
#include <string>
#include <vector>

namespace voicegate {
namespace core {

/**
 * Result of waiting for a number of sealed turns
 */
struct TurnWaitResult {
    WaitResult wait;
    StuckDiagnosis diagnosis;
    size_t completedTurns = 0;

    bool satisfied() const { return wait.satisfied(); }
};

/**
 * Telemetry reconstruction engine for one test execution.
 *
 * Records are classified, timestamp-clamped per source and fed to the
 * turn state machine, the barge-in detector and the metrics aggregator.
 * All state is owned by the instance; engines never share anything, so
 * independent executions can run in parallel with their own engine.
 * Not thread-safe: records must be fed from one thread.
 */
class TelemetryEngine {
public:
    TelemetryEngine();
    explicit TelemetryEngine(const utils::EngineConfig& config);
    TelemetryEngine(const utils::EngineConfig& config, telemetry::EventClassifier classifier);

    // Non-copyable
    TelemetryEngine(const TelemetryEngine&) = delete;
    TelemetryEngine& operator=(const TelemetryEngine&) = delete;

    /**
     * Feed one raw record
     * @return events derived from the record, with clamped timestamps
     */
    std::vector<telemetry::DomainEvent> recordEvent(const telemetry::RawRecord& record);

    /**
     * Feed an already classified event, bypassing the classifier
     */
    void recordDomainEvent(telemetry::DomainEvent event);

    // Conversation state
    const std::vector<Turn>& getTurns() const { return turns_.getCompletedTurns(); }
    const Turn& getCurrentTurn() const { return turns_.getCurrentTurn(); }
    const Session& getSession() const { return turns_.getSession(); }
    StuckDiagnosis diagnose() const { return turns_.diagnose(); }
    StuckDiagnosis diagnose(size_t expectedTurns) const { return turns_.diagnose(expectedTurns); }

    // Barge-in
    BargeInOutcome getBargeInOutcome() const { return bargeIn_.getOutcome(); }
    const BargeInDetector& getBargeInDetector() const { return bargeIn_; }

    // Metrics and reporting
    metrics::ConversationMetrics getMetrics() const { return aggregator_.getMetrics(); }
    const metrics::LatencyHistogram& getHistogram() const { return aggregator_.getHistogram(); }
    bool addLatencySample(const std::string& metric, double valueMs);
    std::string getSummary() const;
    std::string exportJson() const;

    // Verdicts
    metrics::TargetResult assertTargets(const std::string& metric, const metrics::LatencyTargets& targets) const;
    metrics::GateResult assertQualityThresholds(const metrics::QualityThresholds& thresholds) const;
    std::vector<metrics::TargetResult> assertConfiguredTargets() const;
    metrics::GateResult assertConfiguredThresholds() const;

    /**
     * Poll until n turns have sealed, calling pump between checks.
     * A timeout carries the diagnosis of the open turn.
     */
    TurnWaitResult waitForTurns(size_t n, const ConditionWaiter::Pump& pump,
                                int64_t timeoutMs, int64_t pollIntervalMs = 50);

    void setConditionWaiter(const ConditionWaiter& waiter) { waiter_ = waiter; }

    const utils::ErrorHandler& getErrorHandler() const { return errors_; }
    const utils::EngineConfig& getConfig() const { return config_; }
    const telemetry::EventClassifier& getClassifier() const { return classifier_; }

private:
    void dispatch(const telemetry::DomainEvent& event);
    int64_t clampTimestamp(telemetry::RecordSource source, int64_t timestampMs);
    void reportMalformed(const telemetry::RawRecord& record, const std::string& reason);

    utils::EngineConfig config_;
    telemetry::EventClassifier classifier_;
    TurnStateMachine turns_;
    BargeInDetector bargeIn_;
    metrics::MetricsAggregator aggregator_;
    utils::ErrorHandler errors_;
    ConditionWaiter waiter_;
    std::map<telemetry::RecordSource, int64_t> lastSeenMs_;
};

} // namespace core
} // namespace voicegate
