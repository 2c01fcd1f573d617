/**
 * @file errorquarantine.hpp
 * @brief Перемещение отклонённых файлов в каталог ошибок
 */

#pragma once

#include <optional>
#include <string>

#include "../include/fileops.hpp"
#include "../include/transfertypes.hpp"

/**
 * @class ErrorQuarantine
 * @brief Карантин отклонённых файлов
 *
 * @details
 * Файл переносится в errorDirectory под именем "yyyyMMdd_HHmmss_<имя>";
 * каталог создаётся при необходимости. Работает только если карантин
 * включён и каталог задан. Ошибки журналируются и не выбрасываются: при
 * неудаче файл остаётся на исходном месте.
 */
class ErrorQuarantine {
 public:
  ErrorQuarantine(bool enabled, std::string errorDirectory,
                  fileops::Clock clock = fileops::systemClock());

  bool active() const { return enabled_ && !errorDirectory_.empty(); }

  /**
   * @brief Поместить файл в карантин
   * @return Новый путь файла; nullopt, если карантин не активен или
   * перемещение не удалось
   */
  std::optional<fs::path> quarantine(const fs::path &file,
                                     const std::string &reason) const;

 private:
  bool enabled_;
  std::string errorDirectory_;
  fileops::Clock clock_;
};
