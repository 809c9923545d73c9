#pragma once

#include "telemetry/domain_event.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace voicegate {
namespace core {

/**
 * Interruption classification for the session so far.
 * confirmed and attempted are independent: a caller must not read an
 * attempt as a confirmed interruption.
 */
struct BargeInOutcome {
    bool confirmed = false;
    bool attempted = false;
    std::optional<double> latencyMs;    // most recently resolved measurement
    std::optional<double> detectionToFadeMs;
    std::optional<double> fadeToSilenceMs;
};

/**
 * What a single event changed in the detector
 */
struct BargeInUpdate {
    bool attemptOpened = false;
    bool attemptClosed = false;
    bool confirmed = false;
    std::optional<double> latencyMs;    // resolved by this event
    std::optional<double> detectionToFadeMs;
    std::optional<double> fadeToSilenceMs;
};

struct ProbeRecord {
    int64_t timestampMs;
    telemetry::BargeInProbe probe;
};

/**
 * Separates confirmed interruptions (explicit reason=barge_in transitions)
 * from attempts inferred from speech during playback or triggering probes.
 *
 * An attempt episode opens on the first attempt signal and closes at the
 * nearest following StateTransition or ResponseComplete. Latency is
 * measured from the qualifying SpeechStarted to that closing event only.
 *
 * Playback fades are timed separately: detection to FadeStarted, and
 * FadeStarted to FadeCompleted. Each measurement is taken once per anchor.
 */
class BargeInDetector {
public:
    static constexpr const char* REASON_BARGE_IN = "barge_in";

    BargeInUpdate onEvent(const telemetry::DomainEvent& event);

    BargeInOutcome getOutcome() const { return outcome_; }

    bool isResponseActive() const { return response_active_; }
    bool isAttemptOpen() const { return attempt_open_; }

    size_t getAttemptCount() const { return attempt_count_; }
    size_t getConfirmedCount() const { return confirmed_count_; }

    const std::vector<ProbeRecord>& getProbes() const { return probes_; }
    size_t getTriggeringProbeCount() const;

    void reset();

private:
    BargeInUpdate openAttempt(int64_t timestampMs);
    BargeInUpdate closeAttempt(int64_t timestampMs);

    BargeInOutcome outcome_;
    bool response_active_ = false;
    bool attempt_open_ = false;
    std::optional<int64_t> speech_anchor_ms_;
    std::optional<int64_t> detection_ms_;      // outlives the attempt episode
    std::optional<int64_t> fade_started_ms_;
    size_t attempt_count_ = 0;
    size_t confirmed_count_ = 0;
    std::vector<ProbeRecord> probes_;
};

} // namespace core
} // namespace voicegate
