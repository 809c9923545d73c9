#include "core/barge_in_detector.hpp"
#include "metrics/latency_histogram.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace voicegate {
namespace core {

using telemetry::DomainEvent;
using telemetry::EventKind;

BargeInUpdate BargeInDetector::onEvent(const DomainEvent& event) {
    BargeInUpdate update;

    switch (event.kind) {
        case EventKind::RESPONSE_STARTED:
            response_active_ = true;
            break;

        case EventKind::SPEECH_STARTED:
            if (response_active_) {
                outcome_.attempted = true;
                if (!attempt_open_) {
                    update = openAttempt(event.timestampMs);
                }
                if (!speech_anchor_ms_) {
                    speech_anchor_ms_ = event.timestampMs;
                    detection_ms_ = event.timestampMs;
                }
            }
            break;

        case EventKind::BARGE_IN_PROBE:
            probes_.push_back(ProbeRecord{event.timestampMs, event.probe});
            if (event.probe.willTrigger) {
                outcome_.attempted = true;
                if (!attempt_open_) {
                    update = openAttempt(event.timestampMs);
                }
            }
            break;

        case EventKind::RESPONSE_COMPLETE:
            response_active_ = false;
            if (attempt_open_) {
                update = closeAttempt(event.timestampMs);
            }
            break;

        case EventKind::STATE_TRANSITION: {
            if (attempt_open_) {
                update = closeAttempt(event.timestampMs);
            }
            const auto& transition = event.transition;
            if (transition.reason == REASON_BARGE_IN) {
                outcome_.confirmed = true;
                response_active_ = false;
                confirmed_count_++;
                update.confirmed = true;
                utils::Logger::info("Barge-in confirmed: " + transition.from + " -> " + transition.to +
                                    " at " + std::to_string(event.timestampMs) + "ms");
            }
            break;
        }

        case EventKind::FADE_STARTED:
            if (detection_ms_) {
                double elapsed = static_cast<double>(std::max<int64_t>(0, event.timestampMs - *detection_ms_));
                update.detectionToFadeMs = elapsed;
                outcome_.detectionToFadeMs = elapsed;
                detection_ms_.reset();
            }
            fade_started_ms_ = event.timestampMs;
            break;

        case EventKind::FADE_COMPLETED:
            if (fade_started_ms_) {
                double elapsed = static_cast<double>(std::max<int64_t>(0, event.timestampMs - *fade_started_ms_));
                update.fadeToSilenceMs = elapsed;
                outcome_.fadeToSilenceMs = elapsed;
                fade_started_ms_.reset();
                utils::Logger::debug("Playback silent " + metrics::formatMs(elapsed) + " after fade start");
            }
            break;

        default:
            break;
    }

    return update;
}

BargeInUpdate BargeInDetector::openAttempt(int64_t timestampMs) {
    BargeInUpdate update;
    attempt_open_ = true;
    attempt_count_++;
    update.attemptOpened = true;
    utils::Logger::debug("Barge-in attempt " + std::to_string(attempt_count_) + " opened at " +
                         std::to_string(timestampMs) + "ms");
    return update;
}

BargeInUpdate BargeInDetector::closeAttempt(int64_t timestampMs) {
    BargeInUpdate update;
    update.attemptClosed = true;

    if (speech_anchor_ms_) {
        double latency = static_cast<double>(std::max<int64_t>(0, timestampMs - *speech_anchor_ms_));
        update.latencyMs = latency;
        outcome_.latencyMs = latency;
        utils::Logger::debug("Barge-in attempt " + std::to_string(attempt_count_) + " resolved in " +
                             metrics::formatMs(latency));
    }

    attempt_open_ = false;
    speech_anchor_ms_.reset();
    return update;
}

size_t BargeInDetector::getTriggeringProbeCount() const {
    return static_cast<size_t>(std::count_if(probes_.begin(), probes_.end(),
        [](const ProbeRecord& record) { return record.probe.willTrigger; }));
}

void BargeInDetector::reset() {
    outcome_ = BargeInOutcome{};
    response_active_ = false;
    attempt_open_ = false;
    speech_anchor_ms_.reset();
    detection_ms_.reset();
    fade_started_ms_.reset();
    attempt_count_ = 0;
    confirmed_count_ = 0;
    probes_.clear();
}

} // namespace core
} // namespace voicegate
