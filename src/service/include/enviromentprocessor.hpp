/**
 * @file enviromentprocessor.hpp
 * @brief Подстановка переменных окружения в конфигурацию
 *
 * @details
 * Строковые значения JSON (ключи не затрагиваются) могут ссылаться на
 * переменные окружения:
 * - $ENV{NAME}: значение NAME; если переменная не задана, ссылка остаётся
 *   в строке как есть и журналируется предупреждение;
 * - $ENV{NAME:-default}: значение NAME или default, если NAME не задана
 *   или пуста.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <set>
#include <string>

class EnvironmentProcessor {
 public:
  /**
   * @code
   * nlohmann::json cfg = R"({"sourceDirectory": "$ENV{DATA_DIR}/in"})"_json;
   * EnvironmentProcessor ep;
   * ep.process(cfg);
   * // при DATA_DIR=/data => cfg["sourceDirectory"] == "/data/in"
   * @endcode
   */
  void process(nlohmann::json &config) const;

  /// Подстановка в одной строке
  std::string expand(const std::string &value) const;

 private:
  /// Имена уже отмеченных в журнале незаданных переменных
  mutable std::set<std::string> reportedMissing_;
};
