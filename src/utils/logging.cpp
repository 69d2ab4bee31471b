#include "utils/logging.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace affectrt {
namespace utils {

namespace {
std::atomic<int> g_minLevel{static_cast<int>(LogLevel::INFO)};
std::mutex g_outputMutex;
}

bool Logger::initialized_ = false;

void Logger::initialize() {
  if (!initialized_) {
    initialized_ = true;
    info("Logger initialized at level " + levelToString(getLevel()));
  }
}

void Logger::initialize(LogLevel level) {
  setLevel(level);
  initialize();
}

void Logger::setLevel(LogLevel level) {
  g_minLevel.store(static_cast<int>(level));
}

LogLevel Logger::getLevel() {
  return static_cast<LogLevel>(g_minLevel.load());
}

void Logger::info(const std::string &message) {
  write(LogLevel::INFO, "[INFO] ", message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::WARN, "[WARN] ", message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::ERROR, "[ERROR] ", message);
}

void Logger::debug(const std::string &message) {
  write(LogLevel::DEBUG, "[DEBUG] ", message);
}

LogLevel Logger::levelFromString(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") return LogLevel::DEBUG;
  if (lower == "warn" || lower == "warning") return LogLevel::WARN;
  if (lower == "error") return LogLevel::ERROR;
  if (lower == "off" || lower == "none") return LogLevel::OFF;
  return LogLevel::INFO;
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG: return "DEBUG";
  case LogLevel::INFO: return "INFO";
  case LogLevel::WARN: return "WARN";
  case LogLevel::ERROR: return "ERROR";
  case LogLevel::OFF: return "OFF";
  }
  return "INFO";
}

void Logger::write(LogLevel level, const char *prefix, const std::string &message) {
  if (static_cast<int>(level) < g_minLevel.load()) {
    return;
  }
  std::lock_guard<std::mutex> lock(g_outputMutex);
  if (level == LogLevel::ERROR) {
    std::cerr << prefix << message << std::endl;
  } else {
    std::cout << prefix << message << std::endl;
  }
}

} // namespace utils
} // namespace affectrt
