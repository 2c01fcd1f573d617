/**
 * @file validationrules.hpp
 * @brief Пользовательские правила валидации файлов
 *
 * @details
 * Правила выполняются после чтения файла и работают с содержимым в памяти.
 * Каждое правило независимо возвращает результат; уровень (error/warning)
 * определяет, отклоняет ли провал файл или только добавляет предупреждение.
 *
 * Поддерживаемые типы:
 * - filename_regex      {pattern}
 * - file_size_range     {minSize, maxSize}
 * - content_contains    {text, caseInsensitive}
 * - content_excludes    {text, caseInsensitive}
 * - header_validation   {expectedHeader, linesToCheck}
 * - line_count          {minLines, maxLines}
 */

#pragma once

#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "../include/flowconfig.hpp"
#include "../include/transfertypes.hpp"

struct RuleResult {
  bool passed = true;
  std::string message;
  ValidationCategory category = ValidationCategory::UNKNOWN;
};

/**
 * @class ValidationRule
 * @brief Базовый класс правила
 */
class ValidationRule {
 public:
  ValidationRule(std::string type, RuleSeverity severity,
                 std::string errorMessage);
  virtual ~ValidationRule() = default;

  virtual RuleResult evaluate(const FileCandidate &file,
                              const std::vector<char> &content) const = 0;

  const std::string &type() const { return type_; }
  RuleSeverity severity() const { return severity_; }

 protected:
  /// Сообщение из конфигурации, если задано, иначе сгенерированное
  RuleResult fail(ValidationCategory category,
                  const std::string &defaultMessage) const;

 private:
  std::string type_;
  RuleSeverity severity_;
  std::string errorMessage_;
};

class FilenameRegexRule : public ValidationRule {
 public:
  FilenameRegexRule(const ValidationRuleConfig &config, std::string pattern);
  RuleResult evaluate(const FileCandidate &file,
                      const std::vector<char> &content) const override;

 private:
  std::string pattern_;
  std::regex regex_;
};

class FileSizeRangeRule : public ValidationRule {
 public:
  FileSizeRangeRule(const ValidationRuleConfig &config, long long minSize,
                    long long maxSize);
  RuleResult evaluate(const FileCandidate &file,
                      const std::vector<char> &content) const override;

 private:
  long long minSize_;
  long long maxSize_;  ///< < 0 - без верхней границы
};

/**
 * @class ContentTextRule
 * @brief content_contains / content_excludes
 *
 * @note Содержимое больше kMaxScannedContent не просматривается: правило
 * проходит с предупреждением.
 */
class ContentTextRule : public ValidationRule {
 public:
  static constexpr std::size_t kMaxScannedContent = 10 * 1024 * 1024;

  ContentTextRule(const ValidationRuleConfig &config, std::string text,
                  bool caseInsensitive, bool mustContain);
  RuleResult evaluate(const FileCandidate &file,
                      const std::vector<char> &content) const override;

 private:
  std::string text_;
  bool caseInsensitive_;
  bool mustContain_;
};

class HeaderValidationRule : public ValidationRule {
 public:
  HeaderValidationRule(const ValidationRuleConfig &config,
                       std::string expectedHeader, int linesToCheck);
  RuleResult evaluate(const FileCandidate &file,
                      const std::vector<char> &content) const override;

 private:
  std::string expectedHeader_;
  int linesToCheck_;
};

class LineCountRule : public ValidationRule {
 public:
  LineCountRule(const ValidationRuleConfig &config, long long minLines,
                long long maxLines);
  RuleResult evaluate(const FileCandidate &file,
                      const std::vector<char> &content) const override;

  /// Число строк; завершающий перевод строки не добавляет пустую строку
  static long long countLines(const std::vector<char> &content);

 private:
  long long minLines_;
  long long maxLines_;  ///< < 0 - без верхней границы
};

/**
 * @class ValidationRuleFactory
 * @brief Создание правил из конфигурации
 */
class ValidationRuleFactory {
 public:
  /**
   * @brief Создать правило
   * @param warning Причина, если правило настроено неверно
   * @return nullptr для неверно настроенного или неизвестного правила
   */
  static std::unique_ptr<ValidationRule> create(
      const ValidationRuleConfig &config, std::string &warning);
};
