/**
 * @file configloader.hpp
 * @brief Загрузчик конфигурации filebridge из JSON-файла
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

/**
 * @class ConfigLoader
 * @brief Читает и разбирает JSON-файл конфигурации
 *
 * @details Допускаются комментарии в стиле C и C++; корень должен быть
 * объектом.
 *
 * @code
 * ConfigLoader loader;
 * auto config = loader.loadFromFile("filebridge.json");
 * @endcode
 */
class ConfigLoader {
 public:
  /**
   * @brief Загрузить конфигурацию из файла
   * @throw std::runtime_error Файл не открывается, содержит неверный JSON
   * или корень не является объектом
   */
  nlohmann::json loadFromFile(const std::string &path);

  /// Путь последнего успешно загруженного файла; пусто до первой загрузки
  const std::string &lastLoadedFile() const { return lastLoadedFile_; }

 private:
  std::string lastLoadedFile_;
};
