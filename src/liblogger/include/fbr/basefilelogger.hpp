#pragma once
#include <filesystem>
#include <fstream>
#include <mutex>

#include "fbr/ilogger.hpp"
#include "fbr/irotatablelogger.hpp"

namespace fbr {

/**
 * @class BaseFileLogger
 * @brief Общая часть файловых логгеров: основной и резервный файл, ротация
 *
 * @details
 * Если основной файл открыть не удалось, запись идёт в резервный.
 * Все операции с файлами выполняются под mutex_; наследник реализует только
 * writeLocked(), вызываемый уже под блокировкой.
 */
class BaseFileLogger : public ILogger, public IRotatableLogger {
 public:
  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void setRotationConfig(const RotationConfig& config) override;
  RotationConfig getRotationConfig() const override;
  void flush() override;

  void setMainLogPath(const std::string& path);
  void setFallbackLogPath(const std::string& path);
  std::string getMainLogPath() const;
  std::string getFallbackLogPath() const;

 protected:
  BaseFileLogger() = default;
  ~BaseFileLogger() override = default;

  void log(LogLevel level, const std::string& message) override;
  bool shouldSkipLog(LogLevel level) const override;

  /// Запись отформатированной строки; вызывается под mutex_
  virtual void writeLocked(const std::string& formattedMessage) = 0;

  void reopenFilesLocked();
  void rotateIfNeededLocked(std::size_t incomingBytes);

  mutable std::mutex mutex_;
  std::ofstream mainLogFile_;
  std::ofstream fallbackLogFile_;
  std::string mainLogPath_ = "filebridge.log";
  std::string fallbackLogPath_ = "filebridge_fallback.log";
  RotationConfig rotationConfig_;
};

}  // namespace fbr
