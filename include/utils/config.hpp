#pragma once

#include "metrics/quality_gate.hpp"
#include "utils/logging.hpp"
#include <map>
#include <string>
#include <vector>

namespace voicegate {
namespace utils {

/**
 * Engine configuration: log level, per-metric latency targets and
 * quality thresholds.
 *
 * {
 *   "logLevel": "INFO",
 *   "latencyTargets": { "bargeIn": {"p50": 100, "p90": 150, "p99": 250} },
 *   "qualityThresholds": { "errors": {"max": 0}, "totalTurns": {"min": 1} }
 * }
 */
class EngineConfig {
public:
    EngineConfig();

    /**
     * Load configuration, falling back to defaults when the file is
     * missing or invalid. Never throws.
     */
    static EngineConfig load(const std::string& configPath);

    /**
     * Load configuration from a file
     * @throws ConfigurationException if the file cannot be read or is invalid
     */
    static EngineConfig loadFromFile(const std::string& configPath);

    /**
     * Parse configuration from JSON text. Keys that are absent keep their defaults.
     * @throws ConfigurationException on invalid JSON or invalid values
     */
    static EngineConfig fromJson(const std::string& jsonText, const std::string& origin = "<memory>");

    std::string toJson() const;

    LogLevel getLogLevel() const { return logLevel_; }
    void setLogLevel(LogLevel level) { logLevel_ = level; }

    const std::map<std::string, metrics::LatencyTargets>& getLatencyTargets() const { return latencyTargets_; }
    void setLatencyTargets(const std::string& metric, const metrics::LatencyTargets& targets);

    const metrics::QualityThresholds& getQualityThresholds() const { return qualityThresholds_; }
    void setQualityThresholds(const metrics::QualityThresholds& thresholds) { qualityThresholds_ = thresholds; }

    /**
     * @return list of validation errors, empty if the configuration is valid
     */
    std::vector<std::string> validate() const;

    static const std::vector<std::string>& knownTargetKeys();

private:
    LogLevel logLevel_;
    std::map<std::string, metrics::LatencyTargets> latencyTargets_;
    metrics::QualityThresholds qualityThresholds_;
};

} // namespace utils
} // namespace voicegate
