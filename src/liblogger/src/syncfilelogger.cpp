#include "fbr/syncfilelogger.hpp"

#include <iostream>

namespace fbr {

SyncFileLogger& SyncFileLogger::instance() {
  static SyncFileLogger instance;
  return instance;
}

void SyncFileLogger::writeLocked(const std::string& message) {
  // Файл могли удалить или не открыть: одна попытка переоткрытия
  if (!mainLogFile_.is_open() && !fallbackLogFile_.is_open()) {
    reopenFilesLocked();
  }

  if (mainLogFile_.is_open()) {
    mainLogFile_ << message;
    mainLogFile_.flush();
    warnedAboutFallback_ = false;
  } else if (fallbackLogFile_.is_open()) {
    if (!warnedAboutFallback_) {
      std::cerr << "[LOGGER WARNING] Main log file unavailable, switching to "
                   "fallback log file: "
                << fallbackLogPath_ << std::endl;
      warnedAboutFallback_ = true;
    }
    fallbackLogFile_ << message;
    fallbackLogFile_.flush();
  } else {
    std::cerr << "[LOGGER ERROR] No log file is open for writing: " << message;
  }
}

}  // namespace fbr
