#include "fbr/basefilelogger.hpp"

#include <iostream>
#include <sstream>

namespace fbr {

void BaseFileLogger::init(const LogLevel level) {
  setLogLevel(level);
  std::lock_guard<std::mutex> lock(mutex_);
  reopenFilesLocked();
}

void BaseFileLogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void BaseFileLogger::setRotationConfig(const RotationConfig& config) {
  std::lock_guard<std::mutex> lock(mutex_);
  rotationConfig_ = config;
}

RotationConfig BaseFileLogger::getRotationConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rotationConfig_;
}

void BaseFileLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogFile_.is_open()) mainLogFile_.flush();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

void BaseFileLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
            << leveltoString(level) << "] " << message << "\n";
  const std::string line = formatted.str();

  std::lock_guard<std::mutex> lock(mutex_);
  rotateIfNeededLocked(line.size());
  writeLocked(line);
}

bool BaseFileLogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

void BaseFileLogger::reopenFilesLocked() {
  if (mainLogFile_.is_open()) mainLogFile_.close();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.close();

  mainLogFile_.open(mainLogPath_, std::ios::app);
  if (mainLogFile_.is_open()) return;

  std::cerr << "[LOGGER ERROR] Cannot open main log file: " << mainLogPath_
            << std::endl;
  fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
  if (!fallbackLogFile_.is_open()) {
    std::cerr << "[LOGGER ERROR] Cannot open fallback log file: "
              << fallbackLogPath_ << std::endl;
  }
}

void BaseFileLogger::rotateIfNeededLocked(std::size_t incomingBytes) {
  namespace fs = std::filesystem;
  if (!rotationConfig_.enabled || !mainLogFile_.is_open()) return;

  bool needRotate = false;
  const auto now = std::chrono::system_clock::now();
  std::error_code ec;

  if (rotationConfig_.type == RotationType::SIZE) {
    mainLogFile_.flush();
    auto currentSize = fs::file_size(mainLogPath_, ec);
    needRotate = !ec && rotationConfig_.maxFileSizeBytes > 0 &&
                 currentSize + incomingBytes > rotationConfig_.maxFileSizeBytes;
  } else if (rotationConfig_.type == RotationType::TIME) {
    needRotate = rotationConfig_.rotationInterval.count() > 0 &&
                 now - rotationConfig_.lastRotationTime >
                     rotationConfig_.rotationInterval;
  }
  if (!needRotate) return;

  mainLogFile_.close();

  std::string rotatedName =
      rotationConfig_.type == RotationType::SIZE
          ? mainLogPath_ + ".1"
          : mainLogPath_ + "_" + TimeFormatter::format(now, "%Y%m%d_%H%M%S");

  fs::rename(mainLogPath_, rotatedName, ec);
  if (ec) {
    std::cerr << "[LOGGER ERROR] Log rotation failed: " << ec.message()
              << std::endl;
  }
  rotationConfig_.lastRotationTime = now;
  reopenFilesLocked();
}

void BaseFileLogger::setMainLogPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogPath_ == path && mainLogFile_.is_open()) return;
  mainLogPath_ = path;
  reopenFilesLocked();
}

void BaseFileLogger::setFallbackLogPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fallbackLogPath_ == path) return;
  fallbackLogPath_ = path;
  reopenFilesLocked();
}

std::string BaseFileLogger::getMainLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mainLogPath_;
}

std::string BaseFileLogger::getFallbackLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fallbackLogPath_;
}

}  // namespace fbr
