#pragma once

#include "telemetry/domain_event.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace voicegate {
namespace telemetry {

// Structured message types understood by the classifier
enum class MessageType {
    UNKNOWN,
    SPEECH_STARTED,
    TRANSCRIPT_COMPLETE,
    RESPONSE_STARTED,
    RESPONSE_COMPLETE,
    VOICE_STATE,
    BARGE_IN_CHECK,
    BARGE_IN,
    BARGE_IN_INITIATED,
    BARGE_IN_CANCELLED,
    ERROR,
    QUEUE_OVERFLOW,
    SCHEDULE_RESET,
    PLAYBACK_INTERRUPTED,
    FADE_STARTED,
    FADE_COMPLETE
};

enum class MessageDirection {
    RECEIVED,
    SENT,
    UNSPECIFIED
};

/**
 * Parsed {type, timestamp, direction, payload} envelope
 */
struct StructuredMessage {
    MessageType type = MessageType::UNKNOWN;
    std::string typeName;
    int64_t timestampMs = 0;
    MessageDirection direction = MessageDirection::UNSPECIFIED;
    nlohmann::json payload = nlohmann::json::object();

    std::string serialize() const;
};

class MessageProtocol {
public:
    /**
     * Parse an envelope.
     * @param json Envelope text
     * @param fallbackTimestampMs Used when the envelope carries no timestamp
     * @throws utils::MessageFormatException on malformed input
     */
    static StructuredMessage parse(const std::string& json, int64_t fallbackTimestampMs);

    /**
     * Map a parsed message to domain events.
     * Unknown types yield no events.
     * @throws utils::MessageFormatException when a known type lacks a required field
     */
    static std::vector<DomainEvent> toEvents(const StructuredMessage& message);

    /**
     * Convert a JSON timestamp to whole milliseconds.
     * @return false when the value is not a finite number that fits int64_t
     */
    static bool timestampFromJson(const nlohmann::json& value, int64_t& timestampMs);

    static MessageType stringToMessageType(const std::string& typeStr);
    static std::string messageTypeToString(MessageType type);
    static MessageDirection stringToDirection(const std::string& direction);
    static std::string directionToString(MessageDirection direction);
};

} // namespace telemetry
} // namespace voicegate
