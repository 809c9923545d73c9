#pragma once

#include <cstdint>
#include <string>

namespace voicegate {
namespace telemetry {

enum class RecordSource {
    LOG,        // Free-text diagnostic line
    MESSAGE     // Structured {type, timestamp, direction, payload} envelope
};

/**
 * One record as received from the observed system.
 * For MESSAGE records, text holds the JSON envelope.
 */
struct RawRecord {
    int64_t receivedAtMs;
    std::string text;
    RecordSource source;

    RawRecord() : receivedAtMs(0), source(RecordSource::LOG) {}
    RawRecord(int64_t atMs, const std::string& body, RecordSource src = RecordSource::LOG)
        : receivedAtMs(atMs), text(body), source(src) {}

    static RawRecord log(int64_t atMs, const std::string& line) {
        return RawRecord(atMs, line, RecordSource::LOG);
    }
    static RawRecord message(int64_t atMs, const std::string& json) {
        return RawRecord(atMs, json, RecordSource::MESSAGE);
    }
};

std::string sourceToString(RecordSource source);

} // namespace telemetry
} // namespace voicegate
