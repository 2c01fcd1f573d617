/**
 * @file globmatcher.hpp
 * @brief Сопоставление имён файлов с glob-масками
 *
 * @details
 * Поддерживаются '*', '?', классы символов [abc], [a-z], [!abc] и
 * альтернативы {csv,txt}. Сравнение чувствительно к регистру; маска
 * применяется к имени файла, а не к полному пути.
 */

#pragma once

#include <regex>
#include <string>

class GlobMatcher {
 public:
  /**
   * @brief Компилирует маску
   * @throw std::invalid_argument Пустая маска, незакрытая '[' или '{',
   * вложенные '{'
   */
  explicit GlobMatcher(const std::string &pattern);

  bool matches(const std::string &fileName) const;

  const std::string &pattern() const { return pattern_; }

  /// Проверка синтаксиса без исключений
  static bool isValid(const std::string &pattern);

 private:
  static std::string toRegex(const std::string &pattern);

  std::string pattern_;
  std::regex regex_;
};
