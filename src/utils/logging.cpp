#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace voicegate {
namespace utils {

std::atomic<bool> Logger::initialized_{false};
std::atomic<LogLevel> Logger::level_{LogLevel::INFO};

void Logger::initialize(LogLevel level) {
  level_.store(level);
  if (!initialized_.exchange(true)) {
    debug("Logger initialized at level " + levelToString(level));
  }
}

void Logger::info(const std::string &message) {
  if (isEnabled(LogLevel::INFO)) {
    std::cout << "[INFO] " << message << std::endl;
  }
}

void Logger::warn(const std::string &message) {
  if (isEnabled(LogLevel::WARN)) {
    std::cout << "[WARN] " << message << std::endl;
  }
}

void Logger::error(const std::string &message) {
  if (isEnabled(LogLevel::ERROR)) {
    std::cerr << "[ERROR] " << message << std::endl;
  }
}

void Logger::debug(const std::string &message) {
  if (isEnabled(LogLevel::DEBUG)) {
    std::cout << "[DEBUG] " << message << std::endl;
  }
}

void Logger::setLevel(LogLevel level) { level_.store(level); }

LogLevel Logger::getLevel() { return level_.load(); }

bool Logger::isEnabled(LogLevel level) {
  LogLevel current = level_.load();
  return current != LogLevel::OFF && static_cast<int>(level) >= static_cast<int>(current);
}

LogLevel Logger::parseLevel(const std::string &name, LogLevel fallback) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG" || upper == "TRACE") {
    return LogLevel::DEBUG;
  }
  if (upper == "INFO") {
    return LogLevel::INFO;
  }
  if (upper == "WARN" || upper == "WARNING") {
    return LogLevel::WARN;
  }
  if (upper == "ERROR") {
    return LogLevel::ERROR;
  }
  if (upper == "OFF" || upper == "NONE") {
    return LogLevel::OFF;
  }
  return fallback;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::OFF:
    return "OFF";
  }
  return "INFO";
}

} // namespace utils
} // namespace voicegate
