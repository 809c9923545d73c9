#include "core/telemetry_engine.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <sstream>

namespace voicegate {
namespace core {

using telemetry::DomainEvent;
using telemetry::EventKind;
using telemetry::RawRecord;
using telemetry::RecordSource;

namespace {

const size_t MAX_CONTEXT_CHARS = 120;
const size_t SUMMARY_ERROR_COUNT = 10;

std::string abbreviate(const std::string& text) {
    if (text.size() <= MAX_CONTEXT_CHARS) {
        return text;
    }
    return text.substr(0, MAX_CONTEXT_CHARS) + "...";
}

std::string formatTimestamp(const std::optional<int64_t>& ts) {
    return ts ? std::to_string(*ts) + "ms" : std::string("-");
}

} // namespace

TelemetryEngine::TelemetryEngine() : TelemetryEngine(utils::EngineConfig()) {
}

TelemetryEngine::TelemetryEngine(const utils::EngineConfig& config)
    : TelemetryEngine(config, telemetry::EventClassifier()) {
}

TelemetryEngine::TelemetryEngine(const utils::EngineConfig& config, telemetry::EventClassifier classifier)
    : config_(config), classifier_(std::move(classifier)) {
}

std::vector<DomainEvent> TelemetryEngine::recordEvent(const RawRecord& record) {
    telemetry::ClassificationResult result = classifier_.classifyDetailed(record);
    aggregator_.onRecordClassified(result.events.size(), result.malformed);

    if (result.malformed) {
        reportMalformed(record, result.malformedReason);
        return {};
    }

    for (const auto& failure : result.ruleFailures) {
        errors_.reportError(utils::ErrorInfo(utils::ErrorCategory::CLASSIFICATION,
                                             utils::ErrorSeverity::WARNING,
                                             "Classification rule failed",
                                             failure,
                                             abbreviate(record.text),
                                             record.receivedAtMs));
    }

    if (utils::Logger::isEnabled(utils::LogLevel::DEBUG)) {
        std::string matched;
        for (const auto& rule : result.matchedRules) {
            matched += (matched.empty() ? "" : ",") + rule;
        }
        utils::Logger::debug("Classified " + telemetry::sourceToString(record.source) + " record at " +
                             std::to_string(record.receivedAtMs) + "ms: " +
                             std::to_string(result.events.size()) + " event(s)" +
                             (matched.empty() ? "" : " [" + matched + "]"));
    }

    for (auto& event : result.events) {
        event.timestampMs = clampTimestamp(event.source, event.timestampMs);
        dispatch(event);
    }
    return result.events;
}

void TelemetryEngine::recordDomainEvent(DomainEvent event) {
    event.timestampMs = clampTimestamp(event.source, event.timestampMs);
    dispatch(event);
}

int64_t TelemetryEngine::clampTimestamp(RecordSource source, int64_t timestampMs) {
    auto it = lastSeenMs_.find(source);
    if (it == lastSeenMs_.end()) {
        lastSeenMs_[source] = timestampMs;
        return timestampMs;
    }
    if (timestampMs < it->second) {
        utils::Logger::debug("Clamping out-of-order " + telemetry::sourceToString(source) + " timestamp " +
                             std::to_string(timestampMs) + "ms to " + std::to_string(it->second) + "ms");
        return it->second;
    }
    it->second = timestampMs;
    return timestampMs;
}

void TelemetryEngine::dispatch(const DomainEvent& event) {
    if (event.kind == EventKind::ERROR) {
        errors_.reportError(utils::ErrorInfo(utils::ErrorCategory::OBSERVED_SYSTEM,
                                             utils::ErrorSeverity::ERROR,
                                             event.text, "",
                                             telemetry::sourceToString(event.source),
                                             event.timestampMs));
    }

    aggregator_.onEvent(event);

    TurnUpdate turnUpdate = turns_.onEvent(event);
    if (turnUpdate.outOfOrder) {
        errors_.reportError(utils::ErrorInfo(utils::ErrorCategory::STATE_MACHINE,
                                             utils::ErrorSeverity::WARNING,
                                             "Out-of-order turn event ignored",
                                             turnUpdate.ignoredReason,
                                             telemetry::sourceToString(event.source),
                                             event.timestampMs));
    }
    aggregator_.onTurnUpdate(turnUpdate);

    aggregator_.onBargeInUpdate(bargeIn_.onEvent(event));
}

void TelemetryEngine::reportMalformed(const RawRecord& record, const std::string& reason) {
    errors_.reportError(utils::ErrorInfo(utils::ErrorCategory::STRUCTURED_MESSAGE,
                                         utils::ErrorSeverity::WARNING,
                                         "Malformed structured message skipped",
                                         reason,
                                         abbreviate(record.text),
                                         record.receivedAtMs));
}

bool TelemetryEngine::addLatencySample(const std::string& metric, double valueMs) {
    return aggregator_.addLatencySample(metric, valueMs);
}

metrics::TargetResult TelemetryEngine::assertTargets(const std::string& metric,
                                                     const metrics::LatencyTargets& targets) const {
    return aggregator_.assertTargets(metric, targets);
}

metrics::GateResult TelemetryEngine::assertQualityThresholds(const metrics::QualityThresholds& thresholds) const {
    return aggregator_.assertQualityThresholds(thresholds);
}

std::vector<metrics::TargetResult> TelemetryEngine::assertConfiguredTargets() const {
    std::vector<metrics::TargetResult> results;
    for (const auto& entry : config_.getLatencyTargets()) {
        results.push_back(aggregator_.assertTargets(entry.first, entry.second));
    }
    return results;
}

metrics::GateResult TelemetryEngine::assertConfiguredThresholds() const {
    return aggregator_.assertQualityThresholds(config_.getQualityThresholds());
}

TurnWaitResult TelemetryEngine::waitForTurns(size_t n, const ConditionWaiter::Pump& pump,
                                             int64_t timeoutMs, int64_t pollIntervalMs) {
    TurnWaitResult result;
    result.wait = waiter_.waitFor(
        [this, n]() { return turns_.getCompletedTurns().size() >= n; },
        pump, timeoutMs, pollIntervalMs,
        std::to_string(n) + " completed turn(s)");

    result.completedTurns = turns_.getCompletedTurns().size();
    result.diagnosis = turns_.diagnose(n);
    if (!result.satisfied()) {
        result.wait.description += " (" + std::to_string(result.completedTurns) + " completed; " +
                                   result.diagnosis.message + ")";
    }
    return result;
}

std::string TelemetryEngine::getSummary() const {
    std::ostringstream out;
    out << "=== Conversation Summary ===\n";

    aggregator_.appendSummary(out);

    BargeInOutcome outcome = bargeIn_.getOutcome();
    out << "Barge-in:\n";
    out << "  confirmed: " << (outcome.confirmed ? "yes" : "no") << "\n";
    out << "  attempted: " << (outcome.attempted ? "yes" : "no") << "\n";
    out << "  latency: " << (outcome.latencyMs ? metrics::formatMs(*outcome.latencyMs) : std::string("not measured")) << "\n";
    if (outcome.detectionToFadeMs) {
        out << "  detection to fade: " << metrics::formatMs(*outcome.detectionToFadeMs) << "\n";
    }
    if (outcome.fadeToSilenceMs) {
        out << "  fade to silence: " << metrics::formatMs(*outcome.fadeToSilenceMs) << "\n";
    }
    out << "  probes: " << bargeIn_.getProbes().size()
        << " (triggering: " << bargeIn_.getTriggeringProbeCount() << ")\n";

    out << "Turns:\n";
    const auto& turns = turns_.getCompletedTurns();
    if (turns.empty()) {
        out << "  (none)\n";
    }
    for (const auto& turn : turns) {
        out << "  #" << turn.index << " \"" << turn.transcriptText.value_or("") << "\""
            << " speech=" << formatTimestamp(turn.speechStartedAt)
            << " transcript=" << formatTimestamp(turn.transcriptCompleteAt)
            << " response=" << formatTimestamp(turn.responseStartedAt)
            << ".." << formatTimestamp(turn.responseCompleteAt);
        if (auto latency = turn.turnLatencyMs()) {
            out << " turn=" << metrics::formatMs(*latency);
        }
        if (!turn.responseStartBackfilled) {
            if (auto latency = turn.responseLatencyMs()) {
                out << " firstResponse=" << metrics::formatMs(*latency);
            }
        }
        out << " transitions=" << turn.transitions.size() << "\n";
    }

    StuckDiagnosis diagnosis = turns_.diagnose();
    out << "Current turn:\n";
    out << "  #" << diagnosis.turnIndex << " " << turnStateToString(diagnosis.state)
        << ": " << diagnosis.message << "\n";

    out << "Recent errors:\n";
    std::vector<utils::ErrorInfo> recent = errors_.getRecentErrors(SUMMARY_ERROR_COUNT);
    if (recent.empty()) {
        out << "  (none)\n";
    }
    for (const auto& error : recent) {
        out << "  " << error.id << " [" << utils::categoryToString(error.category) << "] "
            << error.timestampMs << "ms " << error.message;
        if (!error.details.empty()) {
            out << " (" << error.details << ")";
        }
        out << "\n";
    }

    return out.str();
}

std::string TelemetryEngine::exportJson() const {
    nlohmann::json j = nlohmann::json::parse(aggregator_.exportJson());

    BargeInOutcome outcome = bargeIn_.getOutcome();
    j["bargeIn"] = {
        {"confirmed", outcome.confirmed},
        {"attempted", outcome.attempted},
        {"latencyMs", outcome.latencyMs ? nlohmann::json(*outcome.latencyMs) : nlohmann::json(nullptr)},
        {"detectionToFadeMs", outcome.detectionToFadeMs ? nlohmann::json(*outcome.detectionToFadeMs)
                                                        : nlohmann::json(nullptr)},
        {"fadeToSilenceMs", outcome.fadeToSilenceMs ? nlohmann::json(*outcome.fadeToSilenceMs)
                                                    : nlohmann::json(nullptr)}
    };

    nlohmann::json turns = nlohmann::json::array();
    for (const auto& turn : turns_.getCompletedTurns()) {
        turns.push_back({
            {"index", turn.index},
            {"transcript", turn.transcriptText.value_or("")},
            {"turnLatencyMs", turn.turnLatencyMs().value_or(0.0)}
        });
    }
    j["turns"] = turns;
    j["diagnosis"] = turns_.diagnose().message;

    return j.dump(2);
}

} // namespace core
} // namespace voicegate
