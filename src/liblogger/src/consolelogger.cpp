#include "fbr/consolelogger.hpp"

#include <iostream>
#include <sstream>

fbr::ConsoleLogger& fbr::ConsoleLogger::instance() {
  static fbr::ConsoleLogger instance;
  return instance;
}

void fbr::ConsoleLogger::init(const LogLevel level) { setLogLevel(level); }

void fbr::ConsoleLogger::setLogLevel(fbr::LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void fbr::ConsoleLogger::setColorsEnabled(bool enabled) {
  colorsEnabled_.store(enabled, std::memory_order_relaxed);
}

void fbr::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout.flush();
  std::cerr.flush();
}

void fbr::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message;

  const bool colored = colorsEnabled_.load(std::memory_order_relaxed);

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    if (colored) std::cout << colorCode(level);
    std::cout << formatted.str();
    if (colored) std::cout << FBR_ANSI_COLOR_RESET;
    std::cout << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "[LOGGER ERROR: " << e.what() << "] " << formatted.str()
              << std::endl;
  }
}

bool fbr::ConsoleLogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

const char* fbr::ConsoleLogger::colorCode(LogLevel level) const {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "\033[36m";  // Cyan
    case LogLevel::LOG_INFO:
      return "\033[32m";  // Green
    case LogLevel::LOG_WARNING:
      return "\033[33m";  // Yellow
    case LogLevel::LOG_ERROR:
      return "\033[31m";  // Red
    case LogLevel::LOG_CRITICAL:
      return "\033[41m\033[37m";  // White on Red
  }
  return FBR_ANSI_COLOR_RESET;
}
