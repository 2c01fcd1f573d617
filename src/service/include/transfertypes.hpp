/**
 * @file transfertypes.hpp
 * @brief Модель данных конвейера передачи файлов
 *
 * @details
 * Перечисления режимов (постобработка, запись, именование, обработка пустых
 * файлов) и структуры, которыми обмениваются этапы конвейера:
 * кандидат сканирования, результат валидации, единица передачи и
 * результат доставки.
 *
 * Строковые значения режимов из конфигурации разбираются только здесь,
 * функциями parse*(); остальной код работает с закрытыми enum.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/// Судьба исходного файла после успешной доставки
enum class PostProcessAction { ARCHIVE, DELETE, KEEP_AND_MARK, KEEP_AND_REPROCESS };

enum class WriteMode { DIRECT, TEMP_THEN_RENAME };

enum class OutputNamingMode { ORIGINAL, TIMESTAMPED, CUSTOM_PATTERN };

/// Политика для файлов нулевого размера на стороне сбора
enum class EmptyFileHandling { DO_NOT_CREATE_MESSAGE, SKIP, PROCESS };

/// Политика для пустого содержимого на стороне доставки
enum class EmptyMessageHandling { WRITE_EMPTY_FILE, SKIP_EMPTY };

enum class ValidationDecision { ACCEPT, REJECT, REJECT_QUARANTINE };

enum class ValidationCategory {
  FORMAT,
  SIZE,
  NAME,
  CONTENT,
  PERMISSION,
  TIMESTAMP,
  LOCK_STATUS,
  UNKNOWN
};

enum class ReadStatus { READ_SUCCESS, READ_FAILED };

enum class DeliveryStatus { SUCCESS, FAILED };

/**
 * @brief Фатальная ошибка уровня каталога, прерывающая весь прогон
 *
 * @details Исходный каталог отсутствует или не является каталогом,
 * целевой каталог не может быть создан.
 */
class PipelineFatalError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// ============= Разбор строковых режимов =============
// Регистр, пробелы, '_' и '-' не учитываются. nullopt для неизвестных
// значений: значение по умолчанию выбирает вызывающий код.

std::optional<PostProcessAction> parsePostProcessAction(const std::string &value);
std::optional<WriteMode> parseWriteMode(const std::string &value);
std::optional<OutputNamingMode> parseOutputNamingMode(const std::string &value);
std::optional<EmptyFileHandling> parseEmptyFileHandling(const std::string &value);
std::optional<EmptyMessageHandling> parseEmptyMessageHandling(
    const std::string &value);

/// Приводит строку к виду для сравнения: нижний регистр без ' ', '_', '-'
std::string normalizeEnumLiteral(const std::string &value);

std::string toString(PostProcessAction action);
std::string toString(WriteMode mode);
std::string toString(OutputNamingMode mode);
std::string toString(EmptyFileHandling handling);
std::string toString(EmptyMessageHandling handling);
std::string toString(ValidationDecision decision);
std::string toString(ValidationCategory category);
std::string toString(DeliveryStatus status);

/**
 * @struct FileCandidate
 * @brief Файл, найденный сканированием и ещё не прошедший валидацию
 *
 * @note Создаётся заново в каждом цикле сканирования и нигде не сохраняется.
 */
struct FileCandidate {
  fs::path path;
  std::string name;
  std::uintmax_t sizeBytes = 0;
  fs::file_time_type lastModifiedAt{};
  bool readOnly = false;
};

/**
 * @struct ValidationOutcome
 * @brief Решение цепочки валидации по одному файлу
 *
 * @details warnings накапливаются проверками уровня warning и не влияют
 * на решение.
 */
struct ValidationOutcome {
  ValidationDecision decision = ValidationDecision::ACCEPT;
  std::string reason;
  ValidationCategory category = ValidationCategory::UNKNOWN;
  std::vector<std::string> warnings;

  bool accepted() const { return decision == ValidationDecision::ACCEPT; }

  static ValidationOutcome accept() { return ValidationOutcome{}; }

  static ValidationOutcome reject(ValidationDecision decision,
                                  ValidationCategory category,
                                  std::string reason) {
    ValidationOutcome outcome;
    outcome.decision = decision;
    outcome.category = category;
    outcome.reason = std::move(reason);
    return outcome;
  }
};

/**
 * @class TransferUnit
 * @brief Содержимое файла и инструкции постобработки, передаваемые от
 * стороны сбора к стороне доставки
 *
 * @details
 * Содержимое устанавливается ровно один раз (setContent) и дальше не
 * меняется: буфер хранится как shared_ptr на const-вектор и может
 * разделяться без копирования между потоками доставки.
 */
class TransferUnit {
 public:
  TransferUnit(std::string fileName, fs::path originalPath,
               PostProcessAction postProcessAction,
               std::string archiveDirectory);

  /**
   * @brief Устанавливает прочитанное содержимое
   * @throw std::logic_error Содержимое уже установлено
   */
  void setContent(std::shared_ptr<const std::vector<char>> content,
                  std::string sha256);

  /// Помечает единицу как непрочитанную; содержимое остаётся пустым
  void markReadFailed(const std::string &error);

  bool hasContent() const { return content_ != nullptr; }
  const std::vector<char> &content() const;
  std::shared_ptr<const std::vector<char>> sharedContent() const {
    return content_;
  }

  const std::string &fileName() const { return fileName_; }
  const fs::path &originalPath() const { return originalPath_; }
  std::uintmax_t sizeBytes() const { return sizeBytes_; }
  PostProcessAction postProcessAction() const { return postProcessAction_; }
  const std::string &archiveDirectory() const { return archiveDirectory_; }
  ReadStatus status() const { return status_; }
  const std::string &sha256() const { return sha256_; }
  const std::string &errorMessage() const { return errorMessage_; }

 private:
  std::string fileName_;
  fs::path originalPath_;
  std::shared_ptr<const std::vector<char>> content_;
  std::uintmax_t sizeBytes_ = 0;
  PostProcessAction postProcessAction_;
  std::string archiveDirectory_;
  ReadStatus status_ = ReadStatus::READ_FAILED;
  std::string sha256_;
  std::string errorMessage_;
};

/**
 * @struct DeliveryResult
 * @brief Итог записи одной единицы передачи в целевой каталог
 */
struct DeliveryResult {
  std::string fileName;
  std::string outputFileName;
  std::string outputPath;
  std::uintmax_t sizeBytes = 0;
  DeliveryStatus status = DeliveryStatus::FAILED;
  std::optional<std::string> errorMessage;

  bool succeeded() const { return status == DeliveryStatus::SUCCESS; }
};

/// Первая ошибка по файлу для отчёта о прогоне
struct FileError {
  std::string fileName;
  std::string message;
};
