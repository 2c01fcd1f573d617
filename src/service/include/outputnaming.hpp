/**
 * @file outputnaming.hpp
 * @brief Имя файла в целевом каталоге
 *
 * @details
 * Режимы:
 * - ORIGINAL: имя источника без изменений;
 * - TIMESTAMPED: "<основа>_<YYYYMMDDHHMMSS><расширение>";
 * - CUSTOM_PATTERN: шаблон с подстановками {original_name}, {timestamp},
 *   {date}, {extension}, {uuid}.
 *
 * outputName() никогда не выбрасывает исключений: при любой ошибке
 * используется исходное имя.
 */

#pragma once

#include <string>

#include "../include/fileops.hpp"
#include "../include/transfertypes.hpp"

class OutputNamingStrategy {
 public:
  OutputNamingStrategy(OutputNamingMode mode, std::string pattern,
                       fileops::Clock clock = fileops::systemClock());

  std::string outputName(const std::string &originalName) const noexcept;

  OutputNamingMode mode() const { return mode_; }

  /// Случайный UUID версии 4 (OpenSSL RAND_bytes)
  static std::string randomUuid();

 private:
  std::string applyPattern(const std::string &originalName) const;

  OutputNamingMode mode_;
  std::string pattern_;
  fileops::Clock clock_;
};
