#include "telemetry/domain_event.hpp"

namespace voicegate {
namespace telemetry {

std::string sourceToString(RecordSource source) {
    return source == RecordSource::MESSAGE ? "message" : "log";
}

std::string eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::SPEECH_STARTED: return "speech_started";
        case EventKind::TRANSCRIPT_COMPLETE: return "transcript_complete";
        case EventKind::RESPONSE_STARTED: return "response_started";
        case EventKind::RESPONSE_COMPLETE: return "response_complete";
        case EventKind::STATE_TRANSITION: return "state_transition";
        case EventKind::BARGE_IN_PROBE: return "barge_in_probe";
        case EventKind::BARGE_IN_CANCELLED: return "barge_in_cancelled";
        case EventKind::ERROR: return "error";
        case EventKind::QUEUE_OVERFLOW: return "queue_overflow";
        case EventKind::SCHEDULE_RESET: return "schedule_reset";
        case EventKind::PLAYBACK_INTERRUPTED: return "playback_interrupted";
        case EventKind::FADE_STARTED: return "fade_started";
        case EventKind::FADE_COMPLETED: return "fade_completed";
    }
    return "unknown";
}

DomainEvent DomainEvent::speechStarted(int64_t tsMs) {
    return DomainEvent(EventKind::SPEECH_STARTED, tsMs);
}

DomainEvent DomainEvent::transcriptComplete(int64_t tsMs, const std::string& transcript) {
    DomainEvent event(EventKind::TRANSCRIPT_COMPLETE, tsMs);
    event.text = transcript;
    return event;
}

DomainEvent DomainEvent::responseStarted(int64_t tsMs) {
    return DomainEvent(EventKind::RESPONSE_STARTED, tsMs);
}

DomainEvent DomainEvent::responseComplete(int64_t tsMs) {
    return DomainEvent(EventKind::RESPONSE_COMPLETE, tsMs);
}

DomainEvent DomainEvent::stateTransition(int64_t tsMs, const std::string& from,
                                         const std::string& to, const std::string& reason) {
    DomainEvent event(EventKind::STATE_TRANSITION, tsMs);
    event.transition.from = from;
    event.transition.to = to;
    event.transition.reason = reason;
    return event;
}

DomainEvent DomainEvent::bargeInProbe(int64_t tsMs, bool isActiveRef, int activeSourceCount, bool willTrigger) {
    DomainEvent event(EventKind::BARGE_IN_PROBE, tsMs);
    event.probe.isActiveRef = isActiveRef;
    event.probe.activeSourceCount = activeSourceCount;
    event.probe.willTrigger = willTrigger;
    return event;
}

DomainEvent DomainEvent::bargeInCancelled(int64_t tsMs) {
    return DomainEvent(EventKind::BARGE_IN_CANCELLED, tsMs);
}

DomainEvent DomainEvent::error(int64_t tsMs, const std::string& message) {
    DomainEvent event(EventKind::ERROR, tsMs);
    event.text = message;
    return event;
}

DomainEvent DomainEvent::queueOverflow(int64_t tsMs) {
    return DomainEvent(EventKind::QUEUE_OVERFLOW, tsMs);
}

DomainEvent DomainEvent::scheduleReset(int64_t tsMs) {
    return DomainEvent(EventKind::SCHEDULE_RESET, tsMs);
}

DomainEvent DomainEvent::playbackInterrupted(int64_t tsMs) {
    return DomainEvent(EventKind::PLAYBACK_INTERRUPTED, tsMs);
}

DomainEvent DomainEvent::fadeStarted(int64_t tsMs) {
    return DomainEvent(EventKind::FADE_STARTED, tsMs);
}

DomainEvent DomainEvent::fadeCompleted(int64_t tsMs) {
    return DomainEvent(EventKind::FADE_COMPLETED, tsMs);
}

std::string DomainEvent::describe() const {
    std::string out = eventKindToString(kind) + "@" + std::to_string(timestampMs);
    switch (kind) {
        case EventKind::TRANSCRIPT_COMPLETE:
        case EventKind::ERROR:
            out += " \"" + text + "\"";
            break;
        case EventKind::STATE_TRANSITION:
            out += " " + transition.from + " -> " + transition.to;
            if (transition.hasReason()) {
                out += " reason=" + transition.reason;
            }
            break;
        case EventKind::BARGE_IN_PROBE:
            out += std::string(" isActiveRef=") + (probe.isActiveRef ? "true" : "false") +
                   " activeSourceCount=" + std::to_string(probe.activeSourceCount) +
                   " willTrigger=" + (probe.willTrigger ? "true" : "false");
            break;
        default:
            break;
    }
    return out;
}

} // namespace telemetry
} // namespace voicegate
