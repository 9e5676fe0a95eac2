#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace printvoice {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

void Logger::initialize(LogLevel level) {
  setLevel(level);
  if (!initialized_) {
    initialized_ = true;
    info("Logger initialized");
  }
}

void Logger::info(const std::string &message) {
  log(LogLevel::INFO, message);
}

void Logger::warn(const std::string &message) {
  log(LogLevel::WARN, message);
}

void Logger::error(const std::string &message) {
  log(LogLevel::ERROR, message);
}

void Logger::debug(const std::string &message) {
  log(LogLevel::DEBUG, message);
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::getLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

LogLevel Logger::parseLevel(const std::string &name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "debug") {
    return LogLevel::DEBUG;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::WARN;
  }
  if (lowered == "error") {
    return LogLevel::ERROR;
  }
  return LogLevel::INFO;
}

const char *Logger::levelTag(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "[DEBUG] ";
  case LogLevel::INFO:
    return "[INFO] ";
  case LogLevel::WARN:
    return "[WARN] ";
  case LogLevel::ERROR:
    return "[ERROR] ";
  }
  return "[INFO] ";
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_)) {
    return;
  }

  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) %
                1000;
  std::tm local{};
  localtime_r(&seconds, &local);

  std::ostringstream line;
  line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << millis.count() << ' '
       << levelTag(level) << message;

  if (level == LogLevel::ERROR) {
    std::cerr << line.str() << std::endl;
  } else {
    std::cout << line.str() << std::endl;
  }
}

} // namespace utils
} // namespace printvoice
