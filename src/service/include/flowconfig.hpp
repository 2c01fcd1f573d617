/**
 * @file flowconfig.hpp
 * @brief Конфигурация одного потока передачи файлов
 *
 * @details
 * Поток описывает пару "сбор из sourceDirectory" и "доставка в
 * targetDirectory" со всеми политиками: маски, проверки, запись,
 * именование, постобработка, карантин.
 *
 * Строковые режимы разбираются в fromJson() ровно один раз; неизвестные
 * значения заменяются значением по умолчанию с предупреждением в журнале.
 *
 * Пример:
 * @code
 * {
 *   "name": "invoices",
 *   "sourceDirectory": "/data/in",
 *   "targetDirectory": "/data/out",
 *   "filePattern": "*.pdf",
 *   "postProcessAction": "ARCHIVE",
 *   "archiveDirectory": "/data/archive",
 *   "writeMode": "Create Temp File"
 * }
 * @endcode
 */

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../include/transfertypes.hpp"

enum class RuleSeverity { ERROR, WARNING };

/**
 * @struct ValidationRuleConfig
 * @brief Описание пользовательского правила валидации
 *
 * @details Параметры конкретного типа правила (pattern, minSize, text и т.п.)
 * хранятся как есть в params и разбираются фабрикой правил.
 */
struct ValidationRuleConfig {
  std::string type;
  RuleSeverity severity = RuleSeverity::ERROR;
  std::string errorMessage;
  nlohmann::json params = nlohmann::json::object();

  static ValidationRuleConfig fromJson(const nlohmann::json &src);
  nlohmann::json toJson() const;
};

/**
 * @struct FlowConfig
 * @brief Полная типизированная конфигурация потока
 */
struct FlowConfig {
  // ============= Обязательные поля =============

  /// Уникальное имя потока; используется в журнале, аудите и метриках
  std::string name;

  std::string sourceDirectory;

  std::string targetDirectory;

  // ============= Сбор =============

  bool enabled = true;

  /// Интервал между прогонами в режиме службы
  std::chrono::seconds pollInterval{30};

  std::string filePattern = "*";

  /// Пустая строка - исключений нет
  std::string exclusionMask;

  bool processReadOnlyFiles = false;

  /// Байты; 0 - без ограничения
  long long maximumFileSize = 0;

  /// Окно проверки стабильности; 0 - проверка отключена
  long long msecsToWaitBeforeModificationCheck = 0;

  EmptyFileHandling emptyFileHandling = EmptyFileHandling::DO_NOT_CREATE_MESSAGE;

  std::vector<ValidationRuleConfig> customValidationRules;

  // ============= Карантин =============

  bool archiveFaultySourceFiles = false;

  std::string archiveErrorDirectory;

  // ============= Постобработка =============

  PostProcessAction postProcessAction = PostProcessAction::ARCHIVE;

  std::string archiveDirectory;

  /// Добавлять _yyyyMMdd_HHmmss к имени архивного файла
  bool addTimestamp = false;

  // ============= Доставка =============

  EmptyMessageHandling emptyMessageHandling =
      EmptyMessageHandling::WRITE_EMPTY_FILE;

  OutputNamingMode outputFilenameMode = OutputNamingMode::ORIGINAL;

  std::string customFilenamePattern;

  WriteMode writeMode = WriteMode::DIRECT;

  /// Размер пула доставки; 1 - последовательная доставка
  int maximumConcurrency = 1;

  /**
   * @brief Создаёт конфигурацию из JSON и проверяет её
   * @throw std::invalid_argument Отсутствуют обязательные поля, неверные
   * типы или значения
   */
  static FlowConfig fromJson(const nlohmann::json &src);

  nlohmann::json toJson() const;

  /**
   * @brief Проверка согласованности значений
   * @throw std::invalid_argument С описанием первой найденной ошибки
   */
  void validate() const;
};
