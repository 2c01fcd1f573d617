/**
 * @file directoryscanner.hpp
 * @brief Поиск файлов-кандидатов в исходном каталоге
 */

#pragma once

#include <string>
#include <vector>

#include "../include/globmatcher.hpp"
#include "../include/transfertypes.hpp"

/**
 * @class DirectoryScanner
 * @brief Перечисляет обычные файлы каталога, имя которых совпадает с маской
 *
 * @details
 * Подкаталоги не обходятся. Порядок перечисления файловой системы не
 * гарантирован, поэтому scan() явно сортирует результат по имени файла.
 */
class DirectoryScanner {
 public:
  DirectoryScanner(fs::path sourceDirectory,
                   const std::string &includePattern = "*");

  /**
   * @brief Сканирование каталога
   * @return Кандидаты, отсортированные по имени
   * @throw PipelineFatalError Каталог не существует, не является каталогом
   * или не читается
   */
  std::vector<FileCandidate> scan() const;

  /**
   * @brief Снимок атрибутов файла
   * @throw std::filesystem::filesystem_error Файл недоступен
   */
  static FileCandidate describe(const fs::path &path);

  const fs::path &sourceDirectory() const { return sourceDirectory_; }

 private:
  fs::path sourceDirectory_;
  GlobMatcher includeMatcher_;
};
