/**
 * @file validationchain.hpp
 * @brief Цепочка проверок файла перед передачей
 *
 * @details
 * Проверки выполняются в фиксированном порядке, первая неудачная
 * прерывает цепочку:
 *  1. существование, обычный файл, доступ на чтение;
 *  2. маска исключения (отклонение без карантина);
 *  3. политика файлов только для чтения;
 *  4. максимальный размер;
 *  5. политика пустых файлов;
 *  6. стабильность (самая дорогая, может ждать);
 *  7. пользовательские правила по содержимому.
 *
 * Проверки 1-5 выполняет precheck(), 6 - checkStability(), 7 -
 * applyRules() после однократного чтения файла.
 */

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

#include "../include/flowconfig.hpp"
#include "../include/globmatcher.hpp"
#include "../include/stabilitygate.hpp"
#include "../include/validationrules.hpp"

class ValidationChain {
 public:
  explicit ValidationChain(const FlowConfig &config);

  /// Проверки 1-5; не читает содержимое и не ждёт
  ValidationOutcome precheck(const FileCandidate &file) const;

  /// Проверка 6 для ранее поставленной отметки StabilityGate::stamp()
  ValidationOutcome checkStability(
      const StabilityGate::PendingCheck &check,
      const std::atomic<bool> *stopRequested = nullptr) const;

  /// Проверка 7; warning-правила не влияют на решение
  ValidationOutcome applyRules(const FileCandidate &file,
                               const std::vector<char> &content) const;

  /**
   * @brief Полная цепочка для одного файла
   * @param content Содержимое для правил; nullptr - правила пропускаются
   */
  ValidationOutcome validate(const FileCandidate &file,
                             const std::vector<char> *content = nullptr) const;

  const StabilityGate &stabilityGate() const { return stabilityGate_; }

  std::size_t ruleCount() const { return rules_.size(); }

 private:
  std::optional<ValidationOutcome> checkAccessible(
      const FileCandidate &file) const;
  std::optional<ValidationOutcome> checkExclusion(
      const FileCandidate &file) const;
  std::optional<ValidationOutcome> checkReadOnly(
      const FileCandidate &file) const;
  std::optional<ValidationOutcome> checkSize(const FileCandidate &file) const;
  std::optional<ValidationOutcome> checkEmpty(const FileCandidate &file) const;

  bool processReadOnlyFiles_;
  long long maximumFileSize_;
  EmptyFileHandling emptyFileHandling_;
  std::optional<GlobMatcher> exclusionMatcher_;
  StabilityGate stabilityGate_;
  std::vector<std::unique_ptr<ValidationRule>> rules_;
};
