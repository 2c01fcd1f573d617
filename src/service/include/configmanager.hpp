/**
 * @file configmanager.hpp
 * @brief Единая точка доступа к конфигурации filebridge
 *
 * @details
 * Файл конфигурации состоит из разделов "defaults" и "environments".
 * Эффективная конфигурация окружения - это defaults, к которому применён
 * JSON merge patch (RFC 7386) из environments.<env>. Результат кэшируется
 * по имени окружения до следующей загрузки или переопределения.
 *
 * Пример файла:
 * @code
 * {
 *   "defaults": {
 *     "logging": [{"type": "console", "level": "info"}],
 *     "flows": []
 *   },
 *   "environments": {
 *     "production": {
 *       "flows": [{"name": "invoices",
 *                  "sourceDirectory": "$ENV{DATA}/in",
 *                  "targetDirectory": "$ENV{DATA}/out"}]
 *     }
 *   }
 * }
 * @endcode
 */

#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

#include "../include/configloader.hpp"
#include "../include/configvalidator.hpp"
#include "../include/enviromentprocessor.hpp"
#include "../include/flowconfig.hpp"

class ConfigManager {
 public:
  static ConfigManager &instance();

  /**
   * @brief Загрузить и проверить конфигурацию
   * @throw std::runtime_error Файл недоступен, неверный JSON или структура
   */
  void initialize(const std::string &filename);

  /**
   * @brief Эффективная конфигурация окружения
   * @throw std::runtime_error Окружение отсутствует или конфигурация
   * не загружена
   */
  nlohmann::json getMergedConfig(const std::string &env) const;

  /**
   * @brief Потоки окружения в типизированном виде
   * @throw std::invalid_argument Неверная конфигурация потока
   */
  std::vector<FlowConfig> getFlowConfigs(const std::string &env) const;

  /// Массив "logging" окружения; пустой массив, если раздел не задан
  nlohmann::json getLoggingConfig(const std::string &env) const;

  /**
   * @brief Переопределения из командной строки
   *
   * @details Ключ задаётся путём через точку от корня конфигурации,
   * значение разбирается как JSON, а при неудаче берётся строкой:
   * @code
   * mgr.applyCliOverrides({{"defaults.flows", "[]"},
   *                        {"environments.dev.logging", "[]"}});
   * @endcode
   * @throw std::runtime_error Конфигурация после переопределения неверна
   */
  void applyCliOverrides(
      const std::unordered_map<std::string, std::string> &overrides);

  std::string getConfigFilePath() const;

 private:
  ConfigManager() = default;
  ~ConfigManager() = default;

  ConfigLoader loader_;
  ConfigValidator validator_;
  EnvironmentProcessor envProcessor_;

  nlohmann::json baseConfig_;
  std::string configFilePath_;

  mutable std::unordered_map<std::string, nlohmann::json> cache_;
  mutable std::mutex configMutex_;
};
