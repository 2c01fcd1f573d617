/**
 * @file configvalidator.hpp
 * @brief Проверка структуры JSON-конфигурации filebridge
 *
 * @details
 * Проверяются только структура и типы разделов. Значения полей потока
 * проверяет FlowConfig::validate().
 */

#pragma once

#include <nlohmann/json.hpp>

class ConfigValidator {
 public:
  /**
   * @brief Корень: объекты "defaults" и "environments"
   * @throw std::runtime_error С описанием нарушения
   */
  bool validateRoot(const nlohmann::json &config) const;

  /**
   * @brief Массив потоков: объекты с name, sourceDirectory, targetDirectory
   * @throw std::runtime_error С описанием нарушения
   */
  bool validateFlows(const nlohmann::json &flows) const;

  /**
   * @brief Массив логгеров: type console|sync_file, file для sync_file
   * @throw std::runtime_error С описанием нарушения
   */
  bool validateLogging(const nlohmann::json &logging) const;
};
