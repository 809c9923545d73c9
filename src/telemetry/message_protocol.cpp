#include "telemetry/message_protocol.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace voicegate {
namespace telemetry {

using utils::MessageFormatException;

namespace {

std::string payloadString(const nlohmann::json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

bool payloadBool(const nlohmann::json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return false;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        return it->get<std::string>() == "true";
    }
    return false;
}

int payloadInt(const nlohmann::json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_number()) {
        return 0;
    }
    double value = it->get<double>();
    if (!std::isfinite(value)) {
        return 0;
    }
    // Counts saturate instead of wrapping
    value = std::clamp(value, 0.0, static_cast<double>(std::numeric_limits<int>::max()));
    return static_cast<int>(value);
}

} // namespace

std::string StructuredMessage::serialize() const {
    nlohmann::json root;
    root["type"] = typeName.empty() ? MessageProtocol::messageTypeToString(type) : typeName;
    root["timestamp"] = timestampMs;
    if (direction != MessageDirection::UNSPECIFIED) {
        root["direction"] = MessageProtocol::directionToString(direction);
    }
    root["payload"] = payload;
    return root.dump();
}

StructuredMessage MessageProtocol::parse(const std::string& json, int64_t fallbackTimestampMs) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw MessageFormatException("Invalid JSON envelope", e.what());
    }

    if (!root.is_object()) {
        throw MessageFormatException("Envelope is not a JSON object");
    }

    auto typeIt = root.find("type");
    if (typeIt == root.end() || !typeIt->is_string()) {
        throw MessageFormatException("Invalid message format: missing type field");
    }

    StructuredMessage message;
    message.typeName = typeIt->get<std::string>();
    message.type = stringToMessageType(message.typeName);
    message.timestampMs = fallbackTimestampMs;

    auto tsIt = root.find("timestamp");
    if (tsIt != root.end() && !tsIt->is_null()) {
        if (!tsIt->is_number()) {
            throw MessageFormatException("Invalid message format: non-numeric timestamp", message.typeName);
        }
        if (!timestampFromJson(*tsIt, message.timestampMs)) {
            throw MessageFormatException("Invalid message format: timestamp out of range", message.typeName);
        }
    }

    auto dirIt = root.find("direction");
    if (dirIt != root.end() && dirIt->is_string()) {
        message.direction = stringToDirection(dirIt->get<std::string>());
    }

    auto payloadIt = root.find("payload");
    if (payloadIt == root.end()) {
        // Older captures carried the body under "data"
        payloadIt = root.find("data");
    }
    if (payloadIt != root.end() && !payloadIt->is_null()) {
        if (!payloadIt->is_object()) {
            throw MessageFormatException("Invalid message format: payload is not an object", message.typeName);
        }
        message.payload = *payloadIt;
    }

    return message;
}

bool MessageProtocol::timestampFromJson(const nlohmann::json& value, int64_t& timestampMs) {
    if (value.is_number_unsigned()) {
        uint64_t raw = value.get<uint64_t>();
        if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        timestampMs = static_cast<int64_t>(raw);
        return true;
    }
    if (value.is_number_integer()) {
        timestampMs = value.get<int64_t>();
        return true;
    }
    if (!value.is_number()) {
        return false;
    }

    // 2^63 is exactly representable; anything at or beyond it does not fit
    const double limit = 9223372036854775808.0;
    double raw = value.get<double>();
    if (!std::isfinite(raw) || raw >= limit || raw < -limit) {
        return false;
    }
    timestampMs = static_cast<int64_t>(std::llround(raw));
    return true;
}

std::vector<DomainEvent> MessageProtocol::toEvents(const StructuredMessage& message) {
    std::vector<DomainEvent> events;
    const int64_t ts = message.timestampMs;
    const auto& payload = message.payload;

    switch (message.type) {
        case MessageType::SPEECH_STARTED:
            events.push_back(DomainEvent::speechStarted(ts));
            break;

        case MessageType::TRANSCRIPT_COMPLETE: {
            std::string text = payloadString(payload, "text");
            if (text.empty()) {
                text = payloadString(payload, "transcript");
            }
            events.push_back(DomainEvent::transcriptComplete(ts, text));
            break;
        }

        case MessageType::RESPONSE_STARTED:
            events.push_back(DomainEvent::responseStarted(ts));
            break;

        case MessageType::RESPONSE_COMPLETE:
            events.push_back(DomainEvent::responseComplete(ts));
            break;

        case MessageType::VOICE_STATE: {
            std::string to = payloadString(payload, "state");
            if (to.empty()) {
                throw MessageFormatException("voice.state without payload.state");
            }
            std::string from = payloadString(payload, "previous");
            if (from.empty()) {
                from = payloadString(payload, "from");
            }
            if (from.empty()) {
                from = "unknown";
            }
            std::string reason = payloadString(payload, "reason");

            if (to == "speaking" && from != "speaking") {
                events.push_back(DomainEvent::responseStarted(ts));
            } else if (from == "speaking" && to == "listening") {
                events.push_back(DomainEvent::responseComplete(ts));
            }
            events.push_back(DomainEvent::stateTransition(ts, from, to, reason));
            break;
        }

        case MessageType::BARGE_IN_CHECK:
            events.push_back(DomainEvent::bargeInProbe(ts,
                                                       payloadBool(payload, "isPlayingRef"),
                                                       payloadInt(payload, "activeSourcesCount"),
                                                       payloadBool(payload, "willTrigger")));
            break;

        case MessageType::BARGE_IN:
            // Only the client's outgoing barge-in request is an attempt signal
            if (message.direction == MessageDirection::SENT) {
                events.push_back(DomainEvent::bargeInProbe(ts, true, 0, true));
            }
            break;

        case MessageType::BARGE_IN_INITIATED:
            events.push_back(DomainEvent::bargeInProbe(ts, true, 0, true));
            break;

        case MessageType::BARGE_IN_CANCELLED:
            events.push_back(DomainEvent::bargeInCancelled(ts));
            break;

        case MessageType::ERROR: {
            std::string text = payloadString(payload, "message");
            if (text.empty()) {
                text = payloadString(payload, "code");
            }
            events.push_back(DomainEvent::error(ts, text.empty() ? "error message" : text));
            break;
        }

        case MessageType::QUEUE_OVERFLOW:
            events.push_back(DomainEvent::queueOverflow(ts));
            break;

        case MessageType::SCHEDULE_RESET:
            events.push_back(DomainEvent::scheduleReset(ts));
            break;

        case MessageType::PLAYBACK_INTERRUPTED:
            events.push_back(DomainEvent::playbackInterrupted(ts));
            break;

        case MessageType::FADE_STARTED:
            events.push_back(DomainEvent::fadeStarted(ts));
            break;

        case MessageType::FADE_COMPLETE:
            events.push_back(DomainEvent::fadeCompleted(ts));
            break;

        case MessageType::UNKNOWN:
            break;
    }

    for (auto& event : events) {
        event.from(RecordSource::MESSAGE);
    }
    return events;
}

MessageType MessageProtocol::stringToMessageType(const std::string& typeStr) {
    if (typeStr == "input_audio_buffer.speech_started" || typeStr == "speech_started") {
        return MessageType::SPEECH_STARTED;
    } else if (typeStr == "transcript.complete") {
        return MessageType::TRANSCRIPT_COMPLETE;
    } else if (typeStr == "response.started" || typeStr == "response.delta" || typeStr == "response.audio") {
        return MessageType::RESPONSE_STARTED;
    } else if (typeStr == "response.complete") {
        return MessageType::RESPONSE_COMPLETE;
    } else if (typeStr == "voice.state") {
        return MessageType::VOICE_STATE;
    } else if (typeStr == "barge_in.check") {
        return MessageType::BARGE_IN_CHECK;
    } else if (typeStr == "barge_in") {
        return MessageType::BARGE_IN;
    } else if (typeStr == "barge_in.initiated") {
        return MessageType::BARGE_IN_INITIATED;
    } else if (typeStr == "barge_in.cancelled") {
        return MessageType::BARGE_IN_CANCELLED;
    } else if (typeStr == "error") {
        return MessageType::ERROR;
    } else if (typeStr == "audio.queue_overflow") {
        return MessageType::QUEUE_OVERFLOW;
    } else if (typeStr == "audio.schedule_reset") {
        return MessageType::SCHEDULE_RESET;
    } else if (typeStr == "audio.playback_interrupted") {
        return MessageType::PLAYBACK_INTERRUPTED;
    } else if (typeStr == "audio.fade_started") {
        return MessageType::FADE_STARTED;
    } else if (typeStr == "audio.fade_complete") {
        return MessageType::FADE_COMPLETE;
    }
    return MessageType::UNKNOWN;
}

std::string MessageProtocol::messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::SPEECH_STARTED: return "input_audio_buffer.speech_started";
        case MessageType::TRANSCRIPT_COMPLETE: return "transcript.complete";
        case MessageType::RESPONSE_STARTED: return "response.started";
        case MessageType::RESPONSE_COMPLETE: return "response.complete";
        case MessageType::VOICE_STATE: return "voice.state";
        case MessageType::BARGE_IN_CHECK: return "barge_in.check";
        case MessageType::BARGE_IN: return "barge_in";
        case MessageType::BARGE_IN_INITIATED: return "barge_in.initiated";
        case MessageType::BARGE_IN_CANCELLED: return "barge_in.cancelled";
        case MessageType::ERROR: return "error";
        case MessageType::QUEUE_OVERFLOW: return "audio.queue_overflow";
        case MessageType::SCHEDULE_RESET: return "audio.schedule_reset";
        case MessageType::PLAYBACK_INTERRUPTED: return "audio.playback_interrupted";
        case MessageType::FADE_STARTED: return "audio.fade_started";
        case MessageType::FADE_COMPLETE: return "audio.fade_complete";
        case MessageType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

MessageDirection MessageProtocol::stringToDirection(const std::string& direction) {
    if (direction == "received") {
        return MessageDirection::RECEIVED;
    } else if (direction == "sent") {
        return MessageDirection::SENT;
    }
    return MessageDirection::UNSPECIFIED;
}

std::string MessageProtocol::directionToString(MessageDirection direction) {
    switch (direction) {
        case MessageDirection::RECEIVED: return "received";
        case MessageDirection::SENT: return "sent";
        case MessageDirection::UNSPECIFIED: return "";
    }
    return "";
}

} // namespace telemetry
} // namespace voicegate
