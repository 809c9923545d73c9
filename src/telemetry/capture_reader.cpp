#include "telemetry/capture_reader.hpp"
#include "telemetry/message_protocol.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <cctype>

namespace voicegate {
namespace telemetry {

CaptureReader::CaptureReader(std::istream& input) : input_(input) {
}

bool CaptureReader::next(RawRecord& record) {
    std::string line;
    while (std::getline(input_, line)) {
        ++line_number_;

        std::string error;
        if (parseLine(line, last_timestamp_ms_, record, error)) {
            last_timestamp_ms_ = record.receivedAtMs;
            return true;
        }
        if (!error.empty()) {
            std::string problem = "line " + std::to_string(line_number_) + ": " + error;
            utils::Logger::warn("Skipping capture " + problem);
            problems_.push_back(problem);
        }
    }
    return false;
}

bool CaptureReader::parseLine(const std::string& line, int64_t previousMs, RawRecord& record, std::string& error) {
    size_t start = 0;
    while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start]))) {
        ++start;
    }
    if (start == line.size() || line[start] == '#') {
        return false;
    }

    std::string body = line.substr(start);
    while (!body.empty() && std::isspace(static_cast<unsigned char>(body.back()))) {
        body.pop_back();
    }

    if (body[0] == '{') {
        // Receipt time follows the envelope when it carries one; validity is the classifier's call
        int64_t receivedAt = previousMs;
        nlohmann::json envelope = nlohmann::json::parse(body, nullptr, false);
        if (!envelope.is_discarded() && envelope.is_object() && envelope.contains("timestamp")) {
            int64_t timestampMs = 0;
            if (MessageProtocol::timestampFromJson(envelope["timestamp"], timestampMs)) {
                receivedAt = timestampMs;
            }
        }
        record = RawRecord::message(receivedAt, body);
        return true;
    }

    size_t digits = 0;
    while (digits < body.size() && std::isdigit(static_cast<unsigned char>(body[digits]))) {
        ++digits;
    }
    if (digits == 0 || (digits < body.size() && !std::isspace(static_cast<unsigned char>(body[digits])))) {
        error = "expected '<timestampMs> <text>' or a JSON message";
        return false;
    }

    int64_t timestamp = 0;
    try {
        timestamp = std::stoll(body.substr(0, digits));
    } catch (const std::out_of_range&) {
        error = "timestamp out of range";
        return false;
    }

    size_t text_start = digits;
    while (text_start < body.size() && std::isspace(static_cast<unsigned char>(body[text_start]))) {
        ++text_start;
    }
    record = RawRecord::log(timestamp, body.substr(text_start));
    return true;
}

} // namespace telemetry
} // namespace voicegate
