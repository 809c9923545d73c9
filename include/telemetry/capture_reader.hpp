#pragma once

#include "telemetry/raw_record.hpp"
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace voicegate {
namespace telemetry {

/**
 * Reads recorded telemetry, one record per line:
 *
 *   {"type": "transcript.complete", "timestamp": 500, ...}   structured message
 *   1200 [ThinkerTalker] state: speaking -> listening        log line
 *
 * Blank lines and lines starting with '#' are skipped. Lines that are
 * neither are reported and skipped.
 */
class CaptureReader {
public:
    explicit CaptureReader(std::istream& input);

    /**
     * Read the next record
     * @return false at end of input
     */
    bool next(RawRecord& record);

    size_t getLineNumber() const { return line_number_; }
    const std::vector<std::string>& getProblems() const { return problems_; }

    /**
     * Parse a single capture line
     * @param previousMs timestamp used for structured messages without one
     * @return false if the line holds no record; error is set when it was invalid
     */
    static bool parseLine(const std::string& line, int64_t previousMs, RawRecord& record, std::string& error);

private:
    std::istream& input_;
    size_t line_number_ = 0;
    int64_t last_timestamp_ms_ = 0;
    std::vector<std::string> problems_;
};

} // namespace telemetry
} // namespace voicegate
