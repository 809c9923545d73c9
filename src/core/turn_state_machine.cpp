#include "core/turn_state_machine.hpp"
#include "metrics/latency_histogram.hpp"
#include "utils/logging.hpp"

namespace voicegate {
namespace core {

using telemetry::DomainEvent;
using telemetry::EventKind;

TurnState Turn::state() const {
    if (responseStartedAt) {
        return TurnState::RESPONSE_STARTED;
    }
    if (transcriptCompleteAt) {
        return TurnState::TRANSCRIPT_RECEIVED;
    }
    if (speechStartedAt) {
        return TurnState::SPEECH_DETECTED;
    }
    return TurnState::WAITING_FOR_SPEECH;
}

bool Turn::isEmpty() const {
    return !speechStartedAt && !transcriptCompleteAt && !responseStartedAt &&
           !responseCompleteAt && transitions.empty();
}

std::optional<double> Turn::turnLatencyMs() const {
    if (!speechStartedAt || !responseCompleteAt) {
        return std::nullopt;
    }
    return static_cast<double>(*responseCompleteAt - *speechStartedAt);
}

std::optional<double> Turn::responseLatencyMs() const {
    if (!transcriptCompleteAt || !responseStartedAt) {
        return std::nullopt;
    }
    return static_cast<double>(*responseStartedAt - *transcriptCompleteAt);
}

std::optional<double> Turn::endToEndLatencyMs() const {
    if (!speechStartedAt || !responseStartedAt) {
        return std::nullopt;
    }
    return static_cast<double>(*responseStartedAt - *speechStartedAt);
}

TurnStateMachine::TurnStateMachine() {
    reset();
}

void TurnStateMachine::reset() {
    session_ = Session();
    pending_speech_ms_.reset();
}

TurnUpdate TurnStateMachine::onEvent(const DomainEvent& event) {
    if (!session_.startedAtMs) {
        session_.startedAtMs = event.timestampMs;
    }

    switch (event.kind) {
        case EventKind::SPEECH_STARTED:
            return onSpeechStarted(event);
        case EventKind::TRANSCRIPT_COMPLETE:
            return onTranscriptComplete(event);
        case EventKind::RESPONSE_STARTED:
            return onResponseStarted(event);
        case EventKind::RESPONSE_COMPLETE:
            return onResponseComplete(event);
        case EventKind::STATE_TRANSITION:
            return onStateTransition(event);
        default:
            break;
    }

    TurnUpdate update;
    update.ignoredReason = "not a turn event";
    return update;
}

TurnUpdate TurnStateMachine::onSpeechStarted(const DomainEvent& event) {
    TurnUpdate update;
    Turn& turn = session_.currentTurn;

    if (turn.responseStartedAt) {
        // Speech over an active response opens the next turn once this one seals
        if (!pending_speech_ms_) {
            pending_speech_ms_ = event.timestampMs;
        }
        update.accepted = true;
        return update;
    }
    if (turn.speechStartedAt) {
        // Repeated VAD triggers within one turn keep the first timestamp
        update.ignoredReason = "speech already detected in turn " + std::to_string(turn.index);
        return update;
    }

    turn.speechStartedAt = event.timestampMs;
    update.accepted = true;
    utils::Logger::debug("Turn " + std::to_string(turn.index) + ": speech started at " +
                         std::to_string(event.timestampMs) + "ms");
    return update;
}

TurnUpdate TurnStateMachine::onTranscriptComplete(const DomainEvent& event) {
    TurnUpdate update;
    Turn& turn = session_.currentTurn;

    if (turn.state() == TurnState::WAITING_FOR_SPEECH) {
        update.ignoredReason = "transcript before speech in turn " + std::to_string(turn.index);
        utils::Logger::debug("Ignoring transcript.complete: no speech detected in turn " +
                             std::to_string(turn.index));
        return update;
    }
    if (turn.responseStartedAt) {
        update.ignoredReason = "transcript after response started in turn " + std::to_string(turn.index);
        return update;
    }

    update.transcriptOpened = !turn.transcriptCompleteAt.has_value();
    if (update.transcriptOpened) {
        turn.transcriptCompleteAt = event.timestampMs;
    }
    // Latest transcript text wins
    turn.transcriptText = event.text;
    update.accepted = true;
    return update;
}

TurnUpdate TurnStateMachine::onResponseStarted(const DomainEvent& event) {
    TurnUpdate update;
    Turn& turn = session_.currentTurn;

    if (!turn.transcriptCompleteAt) {
        update.ignoredReason = "response started before transcript in turn " + std::to_string(turn.index);
        utils::Logger::debug("Ignoring response start: turn " + std::to_string(turn.index) +
                             " has no transcript yet");
        return update;
    }
    if (turn.responseStartedAt) {
        update.ignoredReason = "response already started in turn " + std::to_string(turn.index);
        return update;
    }

    turn.responseStartedAt = event.timestampMs;
    update.accepted = true;
    update.responseOpened = true;
    return update;
}

TurnUpdate TurnStateMachine::onResponseComplete(const DomainEvent& event) {
    TurnUpdate update;
    Turn& turn = session_.currentTurn;

    if (!turn.transcriptCompleteAt) {
        update.ignoredReason = "response complete before transcript in turn " + std::to_string(turn.index);
        utils::Logger::debug("Ignoring response complete: turn " + std::to_string(turn.index) +
                             " has no transcript yet");
        return update;
    }
    if (event.timestampMs < *turn.transcriptCompleteAt) {
        update.ignoredReason = "response complete precedes transcript in turn " + std::to_string(turn.index);
        update.outOfOrder = true;
        utils::Logger::warn("Response complete at " + std::to_string(event.timestampMs) +
                            "ms precedes transcript at " + std::to_string(*turn.transcriptCompleteAt) +
                            "ms, turn " + std::to_string(turn.index) + " left open");
        return update;
    }

    if (!turn.responseStartedAt) {
        turn.responseStartedAt = event.timestampMs;
        turn.responseStartBackfilled = true;
        update.responseOpened = true;
    }
    turn.responseCompleteAt = event.timestampMs;

    update.accepted = true;
    update.sealed = true;
    update.sealedTurn = turn;

    utils::Logger::info("Turn " + std::to_string(turn.index) + " complete, turn latency " +
                        metrics::formatMs(turn.turnLatencyMs().value_or(0.0)));

    uint32_t next_index = turn.index + 1;
    session_.completedTurns.push_back(std::move(turn));
    session_.currentTurn = Turn(next_index);
    if (pending_speech_ms_) {
        session_.currentTurn.speechStartedAt = pending_speech_ms_;
        pending_speech_ms_.reset();
    }
    return update;
}

TurnUpdate TurnStateMachine::onStateTransition(const DomainEvent& event) {
    TurnUpdate update;
    session_.currentTurn.transitions.push_back(TimedTransition{event.timestampMs, event.transition});
    update.accepted = true;
    return update;
}

StuckDiagnosis TurnStateMachine::diagnose() const {
    const Turn& turn = session_.currentTurn;
    if (!turn.speechStartedAt && !turn.transcriptCompleteAt && !turn.responseStartedAt) {
        StuckDiagnosis diagnosis;
        diagnosis.turnIndex = turn.index;
        diagnosis.completedTurns = session_.completedTurns.size();
        diagnosis.message = "Turn " + std::to_string(turn.index) + " has not started";
        return diagnosis;
    }
    return buildDiagnosis();
}

StuckDiagnosis TurnStateMachine::diagnose(size_t expectedTurns) const {
    if (session_.completedTurns.size() >= expectedTurns) {
        StuckDiagnosis diagnosis;
        diagnosis.turnIndex = session_.currentTurn.index;
        diagnosis.state = session_.currentTurn.state();
        diagnosis.completedTurns = session_.completedTurns.size();
        diagnosis.message = std::to_string(diagnosis.completedTurns) + " of " +
                            std::to_string(expectedTurns) + " turns completed";
        return diagnosis;
    }
    return buildDiagnosis();
}

StuckDiagnosis TurnStateMachine::buildDiagnosis() const {
    const Turn& turn = session_.currentTurn;

    StuckDiagnosis diagnosis;
    diagnosis.turnIndex = turn.index;
    diagnosis.state = turn.state();
    diagnosis.completedTurns = session_.completedTurns.size();

    std::string seen;
    if (!turn.speechStartedAt) {
        diagnosis.missing = MissingField::SPEECH_STARTED;
    } else if (!turn.transcriptCompleteAt) {
        diagnosis.missing = MissingField::TRANSCRIPT_COMPLETE;
        seen = "speechStarted at " + std::to_string(*turn.speechStartedAt) + "ms";
    } else if (!turn.responseStartedAt) {
        diagnosis.missing = MissingField::RESPONSE_STARTED;
        seen = "transcriptComplete at " + std::to_string(*turn.transcriptCompleteAt) + "ms";
    } else {
        diagnosis.missing = MissingField::RESPONSE_COMPLETE;
        seen = "responseStarted at " + std::to_string(*turn.responseStartedAt) + "ms";
    }

    diagnosis.message = "Turn " + std::to_string(turn.index) + " stuck: " +
                        missingFieldToString(diagnosis.missing) + " not observed";
    if (!seen.empty()) {
        diagnosis.message += " (last: " + seen + ")";
    }
    return diagnosis;
}

std::string turnStateToString(TurnState state) {
    switch (state) {
        case TurnState::WAITING_FOR_SPEECH: return "WAITING_FOR_SPEECH";
        case TurnState::SPEECH_DETECTED: return "SPEECH_DETECTED";
        case TurnState::TRANSCRIPT_RECEIVED: return "TRANSCRIPT_RECEIVED";
        case TurnState::RESPONSE_STARTED: return "RESPONSE_STARTED";
    }
    return "UNKNOWN";
}

std::string missingFieldToString(MissingField field) {
    switch (field) {
        case MissingField::NONE: return "none";
        case MissingField::SPEECH_STARTED: return "speechStarted";
        case MissingField::TRANSCRIPT_COMPLETE: return "transcriptComplete";
        case MissingField::RESPONSE_STARTED: return "responseStarted";
        case MissingField::RESPONSE_COMPLETE: return "responseComplete";
    }
    return "unknown";
}

} // namespace core
} // namespace voicegate
