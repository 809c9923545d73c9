#pragma once

#include "telemetry/raw_record.hpp"
#include <cstdint>
#include <string>

namespace voicegate {
namespace telemetry {

enum class EventKind {
    SPEECH_STARTED,
    TRANSCRIPT_COMPLETE,
    RESPONSE_STARTED,
    RESPONSE_COMPLETE,
    STATE_TRANSITION,
    BARGE_IN_PROBE,
    BARGE_IN_CANCELLED,
    ERROR,
    QUEUE_OVERFLOW,
    SCHEDULE_RESET,
    PLAYBACK_INTERRUPTED,   // playback stopped because the user cut in
    FADE_STARTED,           // output fade-out began
    FADE_COMPLETED          // output is silent
};

struct StateTransition {
    std::string from;
    std::string to;
    std::string reason;     // empty when no explicit reason token was present

    bool hasReason() const { return !reason.empty(); }
};

struct BargeInProbe {
    bool isActiveRef = false;
    int activeSourceCount = 0;
    bool willTrigger = false;
};

/**
 * Classified event. Only the fields that belong to kind are meaningful:
 * text for TRANSCRIPT_COMPLETE and ERROR, transition for STATE_TRANSITION,
 * probe for BARGE_IN_PROBE.
 */
struct DomainEvent {
    EventKind kind;
    int64_t timestampMs;
    RecordSource source;
    std::string text;
    StateTransition transition;
    BargeInProbe probe;

    DomainEvent(EventKind k, int64_t tsMs, RecordSource src = RecordSource::LOG)
        : kind(k), timestampMs(tsMs), source(src) {}

    static DomainEvent speechStarted(int64_t tsMs);
    static DomainEvent transcriptComplete(int64_t tsMs, const std::string& transcript);
    static DomainEvent responseStarted(int64_t tsMs);
    static DomainEvent responseComplete(int64_t tsMs);
    static DomainEvent stateTransition(int64_t tsMs, const std::string& from,
                                       const std::string& to, const std::string& reason = "");
    static DomainEvent bargeInProbe(int64_t tsMs, bool isActiveRef, int activeSourceCount, bool willTrigger);
    static DomainEvent bargeInCancelled(int64_t tsMs);
    static DomainEvent error(int64_t tsMs, const std::string& message);
    static DomainEvent queueOverflow(int64_t tsMs);
    static DomainEvent scheduleReset(int64_t tsMs);
    static DomainEvent playbackInterrupted(int64_t tsMs);
    static DomainEvent fadeStarted(int64_t tsMs);
    static DomainEvent fadeCompleted(int64_t tsMs);

    DomainEvent& from(RecordSource src) {
        source = src;
        return *this;
    }

    std::string describe() const;
};

std::string eventKindToString(EventKind kind);

} // namespace telemetry
} // namespace voicegate
