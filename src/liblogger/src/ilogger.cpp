#include "fbr/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::mutex fbr::TimeFormatter::formatMutex_;

bool fbr::TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) {
    return false;
  }
  try {
    format(std::chrono::system_clock::now(), fmt);
    std::lock_guard<std::mutex> lock(formatMutex_);
    globalFormat_ = fmt;
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Time format error: " << e.what() << std::endl;
    return false;
  }
}

std::string fbr::TimeFormatter::getGlobalFormat() {
  std::lock_guard<std::mutex> lock(formatMutex_);
  return globalFormat_;
}

std::string fbr::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  return format(tp, getGlobalFormat());
}

std::string fbr::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp, const std::string& fmt) {
  try {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, fmt.c_str());
    return oss.str();
  } catch (const std::exception&) {
    return "[INVALID_TIME]";
  }
}

fbr::LogLevel fbr::ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void fbr::ILogger::debug(const std::string& message) {
  log(fbr::LogLevel::LOG_DEBUG, message);
}

void fbr::ILogger::info(const std::string& message) {
  log(fbr::LogLevel::LOG_INFO, message);
}

void fbr::ILogger::warning(const std::string& message) {
  log(fbr::LogLevel::LOG_WARNING, message);
}

void fbr::ILogger::error(const std::string& message) {
  log(fbr::LogLevel::LOG_ERROR, message);
}

void fbr::ILogger::critical(const std::string& message) {
  log(fbr::LogLevel::LOG_CRITICAL, message);
}

std::string fbr::leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "";
}

fbr::LogLevel fbr::stringToLogLevel(const std::string& level) {
  std::string lowered = level;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "debug") return LogLevel::LOG_DEBUG;
  if (lowered == "warning" || lowered == "warn") return LogLevel::LOG_WARNING;
  if (lowered == "error") return LogLevel::LOG_ERROR;
  if (lowered == "critical") return LogLevel::LOG_CRITICAL;
  return LogLevel::LOG_INFO;
}
