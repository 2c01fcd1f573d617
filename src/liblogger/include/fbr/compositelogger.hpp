#pragma once

#include <initializer_list>
#include <memory>
#include <vector>

#include "fbr/ilogger.hpp"

namespace fbr {

/**
 * @class CompositeLogger
 * @brief Рассылает сообщения всем зарегистрированным логгерам
 *
 * @details
 * Используется всеми компонентами filebridge как единая точка журналирования.
 * Фильтрация по уровню выполняется вложенными логгерами; setLogLevel()
 * распространяется на каждый из них.
 */
class CompositeLogger : public ILogger {
 public:
  static CompositeLogger& instance();

  CompositeLogger() = default;
  CompositeLogger(std::initializer_list<std::shared_ptr<ILogger>> loggers)
      : loggers_(loggers) {}
  ~CompositeLogger() override = default;

  void addLogger(const std::shared_ptr<ILogger>& logger);
  void removeLogger(const std::shared_ptr<ILogger>& logger);
  void clearLoggers();
  std::size_t loggerCount() const;

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

  void debug(const std::string& message) override;
  void info(const std::string& message) override;
  void warning(const std::string& message) override;
  void error(const std::string& message) override;
  void critical(const std::string& message) override;

 protected:
  bool shouldSkipLog(LogLevel level) const override;
  void log(LogLevel level, const std::string& message) override;

 private:
  std::vector<std::shared_ptr<ILogger>> snapshot() const;

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<ILogger>> loggers_;
};

/**
 * @brief Оборачивает логгер-синглтон в shared_ptr без владения
 *
 * @code
 * CompositeLogger::instance().addLogger(
 *     makeUnownedLogger(ConsoleLogger::instance()));
 * @endcode
 */
template <typename Logger>
std::shared_ptr<ILogger> makeUnownedLogger(Logger& logger) {
  return std::shared_ptr<ILogger>(&logger, [](ILogger*) {});
}

}  // namespace fbr
