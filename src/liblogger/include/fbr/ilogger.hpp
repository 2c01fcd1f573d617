/**
 * @file ilogger.hpp
 * @brief Базовый интерфейс логгеров filebridge и форматирование времени.
 *
 * @details
 * ILogger задаёт общий контракт для всех приёмников журнала (консоль, файл,
 * композиция). Фильтрация по уровню выполняется в реализациях через
 * shouldSkipLog(), публичные методы debug()/info()/... делегируют в log().
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace fbr {

enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/**
 * @class TimeFormatter
 * @brief Форматирование временных меток журнала по strftime-шаблону
 */
class TimeFormatter {
 public:
  /**
   * @brief Устанавливает глобальный формат времени
   * @param fmt Шаблон в стиле std::put_time, например "%Y-%m-%d %T"
   * @return false, если шаблон пустой или не может быть применён
   */
  static bool setGlobalFormat(const std::string& fmt);

  static std::string getGlobalFormat();

  /// Форматирует момент времени в локальной зоне по глобальному шаблону
  static std::string format(const std::chrono::system_clock::time_point& tp);

  /// Форматирует момент времени по явно заданному шаблону
  static std::string format(const std::chrono::system_clock::time_point& tp,
                            const std::string& fmt);

 private:
  static std::mutex formatMutex_;
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
};

class ILogger {
 public:
  virtual ~ILogger() = default;

  virtual void init(const LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level) = 0;
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual void log(LogLevel, const std::string&) = 0;
  virtual bool shouldSkipLog(LogLevel level) const = 0;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Разбор имени уровня журнала
 * @param level Имя уровня (debug, info, warning, error, critical), регистр
 *              не учитывается
 * @return Соответствующий LogLevel; для неизвестных имён LOG_INFO
 */
LogLevel stringToLogLevel(const std::string& level);

}  // namespace fbr
