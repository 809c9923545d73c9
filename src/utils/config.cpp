#include "utils/config.hpp"
#include "metrics/latency_histogram.hpp"
#include "utils/error_handler.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>

namespace voicegate {
namespace utils {

EngineConfig::EngineConfig() : logLevel_(LogLevel::INFO) {
    latencyTargets_[metrics::METRIC_BARGE_IN_LATENCY] = {{"p50", 100.0}, {"p90", 150.0}, {"p99", 250.0}};
    latencyTargets_[metrics::METRIC_RESPONSE_LATENCY] = {{"p50", 800.0}, {"p90", 1500.0}, {"p99", 2500.0}};
    latencyTargets_[metrics::METRIC_E2E_LATENCY] = {{"p50", 1200.0}, {"p90", 2000.0}, {"p99", 3500.0}};
    latencyTargets_[metrics::METRIC_DETECTION_TO_FADE] = {{"p50", 10.0}};
    latencyTargets_[metrics::METRIC_FADE_TO_SILENCE] = {{"p50", 50.0}};
}

const std::vector<std::string>& EngineConfig::knownTargetKeys() {
    static const std::vector<std::string> keys = {"p50", "p90", "p99", "mean", "max", "min"};
    return keys;
}

void EngineConfig::setLatencyTargets(const std::string& metric, const metrics::LatencyTargets& targets) {
    latencyTargets_[metric] = targets;
}

EngineConfig EngineConfig::load(const std::string& configPath) {
    try {
        return loadFromFile(configPath);
    } catch (const ConfigurationException& e) {
        Logger::warn(std::string(e.what()) + "; using default configuration");
        return EngineConfig();
    }
}

EngineConfig EngineConfig::loadFromFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigurationException("Failed to open config file", configPath);
    }

    std::string jsonText((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());

    EngineConfig config = fromJson(jsonText, configPath);
    Logger::info("Configuration loaded from: " + configPath);
    return config;
}

EngineConfig EngineConfig::fromJson(const std::string& jsonText, const std::string& origin) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationException("Invalid JSON: " + std::string(e.what()), origin);
    }

    if (!j.is_object()) {
        throw ConfigurationException("Configuration root must be an object", origin);
    }

    EngineConfig config;

    if (j.contains("logLevel")) {
        if (!j["logLevel"].is_string()) {
            throw ConfigurationException("logLevel must be a string", origin);
        }
        std::string name = j["logLevel"].get<std::string>();
        LogLevel level = Logger::parseLevel(name, LogLevel::OFF);
        if (level != Logger::parseLevel(name, LogLevel::DEBUG)) {
            throw ConfigurationException("Unknown logLevel '" + name + "'", origin);
        }
        config.logLevel_ = level;
    }

    if (j.contains("latencyTargets")) {
        const auto& targets = j["latencyTargets"];
        if (!targets.is_object()) {
            throw ConfigurationException("latencyTargets must be an object", origin);
        }
        for (auto it = targets.begin(); it != targets.end(); ++it) {
            if (!it.value().is_object()) {
                throw ConfigurationException("latencyTargets." + it.key() + " must be an object", origin);
            }
            metrics::LatencyTargets metricTargets;
            for (auto target = it.value().begin(); target != it.value().end(); ++target) {
                if (!target.value().is_number()) {
                    throw ConfigurationException("latencyTargets." + it.key() + "." + target.key() +
                                                 " must be a number", origin);
                }
                metricTargets[target.key()] = target.value().get<double>();
            }
            config.latencyTargets_[it.key()] = metricTargets;
        }
    }

    if (j.contains("qualityThresholds")) {
        const auto& thresholds = j["qualityThresholds"];
        if (!thresholds.is_object()) {
            throw ConfigurationException("qualityThresholds must be an object", origin);
        }
        for (auto it = thresholds.begin(); it != thresholds.end(); ++it) {
            const auto& bound = it.value();
            if (!bound.is_object() || bound.size() != 1) {
                throw ConfigurationException("qualityThresholds." + it.key() +
                                             " must contain exactly one of 'max' or 'min'", origin);
            }
            auto kind = bound.begin();
            if (!kind.value().is_number()) {
                throw ConfigurationException("qualityThresholds." + it.key() + "." + kind.key() +
                                             " must be a number", origin);
            }
            double value = kind.value().get<double>();
            if (kind.key() == "max") {
                config.qualityThresholds_.setMax(it.key(), value);
            } else if (kind.key() == "min") {
                config.qualityThresholds_.setMin(it.key(), value);
            } else {
                throw ConfigurationException("Unknown bound kind '" + kind.key() + "' for " + it.key(), origin);
            }
        }
    }

    std::vector<std::string> errors = config.validate();
    if (!errors.empty()) {
        std::string message = "Invalid configuration: " + errors.front();
        for (size_t i = 1; i < errors.size(); ++i) {
            message += "; " + errors[i];
        }
        throw ConfigurationException(message, origin);
    }

    return config;
}

std::vector<std::string> EngineConfig::validate() const {
    std::vector<std::string> errors;
    const auto& keys = knownTargetKeys();

    for (const auto& metric : latencyTargets_) {
        for (const auto& target : metric.second) {
            if (std::find(keys.begin(), keys.end(), target.first) == keys.end()) {
                errors.push_back("unknown target '" + target.first + "' for " + metric.first);
            } else if (!std::isfinite(target.second) || target.second < 0.0) {
                errors.push_back("target " + metric.first + "." + target.first + " must be >= 0");
            }
        }
    }

    for (const auto& entry : qualityThresholds_.bounds()) {
        if (!std::isfinite(entry.second.value)) {
            errors.push_back("threshold " + entry.first + " must be finite");
        }
    }

    return errors;
}

std::string EngineConfig::toJson() const {
    nlohmann::json j;
    j["logLevel"] = Logger::levelToString(logLevel_);

    nlohmann::json targets = nlohmann::json::object();
    for (const auto& metric : latencyTargets_) {
        targets[metric.first] = metric.second;
    }
    j["latencyTargets"] = targets;

    nlohmann::json thresholds = nlohmann::json::object();
    for (const auto& entry : qualityThresholds_.bounds()) {
        thresholds[entry.first] = {{metrics::boundKindToString(entry.second.kind), entry.second.value}};
    }
    j["qualityThresholds"] = thresholds;

    return j.dump(2);
}

} // namespace utils
} // namespace voicegate
