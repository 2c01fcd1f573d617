#pragma once

#include "fbr/ilogger.hpp"

#define FBR_ANSI_COLOR_RESET "\033[0m"

namespace fbr {

/**
 * @class ConsoleLogger
 * @brief Вывод журнала в stdout с цветовой разметкой уровней
 *
 * @note Синглтон; цвет можно отключить для вывода в пайп или файл.
 */
class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  void setColorsEnabled(bool enabled);

 protected:
  ConsoleLogger() = default;
  ~ConsoleLogger() override = default;
  void log(LogLevel level, const std::string& message) override;
  bool shouldSkipLog(LogLevel level) const override;

 private:
  const char* colorCode(LogLevel level) const;

  mutable std::mutex mutex_;
  std::atomic<bool> colorsEnabled_{true};
};
}  // namespace fbr
