#pragma once
#include "fbr/basefilelogger.hpp"

namespace fbr {

/// Синхронная запись в файл с flush после каждого сообщения
class SyncFileLogger : public BaseFileLogger {
 public:
  static SyncFileLogger& instance();

 protected:
  void writeLocked(const std::string& message) override;

 private:
  SyncFileLogger() = default;
  bool warnedAboutFallback_ = false;
};

}  // namespace fbr
