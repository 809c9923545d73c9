#pragma once

#include "telemetry/domain_event.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace voicegate {
namespace core {

/**
 * Progress of the turn currently being reconstructed
 */
enum class TurnState {
    WAITING_FOR_SPEECH,     // No user speech yet in this turn
    SPEECH_DETECTED,        // VAD reported speech
    TRANSCRIPT_RECEIVED,    // Final transcript arrived
    RESPONSE_STARTED        // AI response audio started
};

struct TimedTransition {
    int64_t timestampMs;
    telemetry::StateTransition transition;
};

/**
 * One user-utterance-to-AI-response cycle
 */
struct Turn {
    uint32_t index;
    std::optional<int64_t> speechStartedAt;
    std::optional<int64_t> transcriptCompleteAt;
    std::optional<std::string> transcriptText;
    std::optional<int64_t> responseStartedAt;
    std::optional<int64_t> responseCompleteAt;
    bool responseStartBackfilled = false;
    std::vector<TimedTransition> transitions;

    explicit Turn(uint32_t turn_index = 1) : index(turn_index) {}

    TurnState state() const;
    bool isEmpty() const;
    bool isSealed() const { return responseCompleteAt.has_value(); }

    // responseCompleteAt - speechStartedAt
    std::optional<double> turnLatencyMs() const;
    // responseStartedAt - transcriptCompleteAt
    std::optional<double> responseLatencyMs() const;
    // responseStartedAt - speechStartedAt
    std::optional<double> endToEndLatencyMs() const;
};

struct Session {
    std::vector<Turn> completedTurns;
    Turn currentTurn = Turn(1);
    std::optional<int64_t> startedAtMs;
};

enum class MissingField {
    NONE,
    SPEECH_STARTED,
    TRANSCRIPT_COMPLETE,
    RESPONSE_STARTED,
    RESPONSE_COMPLETE
};

/**
 * Describes which event the open turn is still waiting for
 */
struct StuckDiagnosis {
    MissingField missing = MissingField::NONE;
    uint32_t turnIndex = 0;
    TurnState state = TurnState::WAITING_FOR_SPEECH;
    size_t completedTurns = 0;
    std::string message;

    bool isStuck() const { return missing != MissingField::NONE; }
};

/**
 * What a single event did to the session
 */
struct TurnUpdate {
    bool accepted = false;
    bool transcriptOpened = false;  // first transcript of the turn
    bool responseOpened = false;    // responseStartedAt was set (including backfill)
    bool sealed = false;
    std::optional<Turn> sealedTurn;
    std::string ignoredReason;
    bool outOfOrder = false;        // rejected because its timestamp contradicts the turn
};

/**
 * Reconstructs conversation turns from classified events.
 *
 * Response events are only accepted after the open turn has received a
 * transcript, so handshake transitions emitted while the pipeline is set
 * up never seal a turn. Speech detected while a response is playing is
 * carried into the turn that opens when the response completes.
 */
class TurnStateMachine {
public:
    TurnStateMachine();

    TurnUpdate onEvent(const telemetry::DomainEvent& event);

    const Session& getSession() const { return session_; }
    const std::vector<Turn>& getCompletedTurns() const { return session_.completedTurns; }
    const Turn& getCurrentTurn() const { return session_.currentTurn; }
    TurnState getState() const { return session_.currentTurn.state(); }

    /**
     * Diagnose the open turn. Returns NONE while the open turn has not seen
     * any event yet.
     */
    StuckDiagnosis diagnose() const;

    /**
     * Diagnose against an expected number of sealed turns. Returns NONE
     * once that many turns have sealed.
     */
    StuckDiagnosis diagnose(size_t expectedTurns) const;

    void reset();

private:
    TurnUpdate onSpeechStarted(const telemetry::DomainEvent& event);
    TurnUpdate onTranscriptComplete(const telemetry::DomainEvent& event);
    TurnUpdate onResponseStarted(const telemetry::DomainEvent& event);
    TurnUpdate onResponseComplete(const telemetry::DomainEvent& event);
    TurnUpdate onStateTransition(const telemetry::DomainEvent& event);

    StuckDiagnosis buildDiagnosis() const;

    Session session_;
    std::optional<int64_t> pending_speech_ms_;
};

std::string turnStateToString(TurnState state);
std::string missingFieldToString(MissingField field);

} // namespace core
} // namespace voicegate
