/**
 * @file MetricsCollector.hpp
 * @brief Сбор метрик конвейера передачи файлов в формате Prometheus
 *
 * @details Реализует потокобезопасный сбор:
 * - Счетчиков (Counter): число собранных и доставленных файлов, байты
 * - Времени выполнения задач (Summary): количество и сумма в миллисекундах
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace fbr {

/**
 * @class MetricsCollector
 * @brief Потокобезопасный сборщик метрик с экспортом в Prometheus
 *
 * @note Синглтон. Для изолированных тестов есть reset().
 */
class MetricsCollector {
 public:
  /**
   * @brief Получить экземпляр MetricsCollector
   *
   * @code
   * auto& metrics = MetricsCollector::instance();
   * @endcode
   */
  static MetricsCollector& instance();

  /**
   * @brief Зарегистрировать новый счетчик
   * @param name Уникальное имя счетчика, [a-zA-Z_][a-zA-Z0-9_]*
   * @param help Описание метрики (для Prometheus)
   * @throw std::invalid_argument Имя не соответствует формату
   * @throw std::runtime_error Счетчик уже зарегистрирован
   */
  void registerCounter(const std::string& name, const std::string& help = "");

  /// Регистрирует счетчик, если его ещё нет; повторный вызов безопасен
  void ensureCounter(const std::string& name, const std::string& help = "");

  bool hasCounter(const std::string& name) const;

  /**
   * @brief Увеличить значение счетчика
   * @warning Незарегистрированные счетчики молча игнорируются
   */
  void incrementCounter(const std::string& name, double value = 1.0);

  /// Текущее значение счетчика; 0 для незарегистрированного
  double counterValue(const std::string& name) const;

  /**
   * @brief Записать время выполнения задачи
   * @param name Имя summary-метрики; регистрируется при первой записи
   */
  void recordTaskTime(const std::string& name,
                      std::chrono::milliseconds duration);

  std::uint64_t taskCount(const std::string& name) const;
  std::uint64_t taskTimeSum(const std::string& name) const;

  /// Экспорт в Prometheus text-based формате
  std::string exportPrometheus() const;

  /// Сбрасывает все метрики
  void reset();

 private:
  MetricsCollector() = default;

  struct Counter {
    double value = 0.0;
    std::string help;
  };

  struct Summary {
    std::uint64_t count = 0;
    std::uint64_t sumMs = 0;
  };

  static bool isValidName(const std::string& name);

  mutable std::mutex mutex_;
  std::map<std::string, Counter> counters_;
  std::map<std::string, Summary> summaries_;
};

}  // namespace fbr
