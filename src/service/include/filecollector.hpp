/**
 * @file filecollector.hpp
 * @brief Сторона сбора: сканирование, валидация и чтение файлов
 */

#pragma once

#include <atomic>
#include <memory>
#include <vector>

#include "../include/auditsink.hpp"
#include "../include/directoryscanner.hpp"
#include "../include/errorquarantine.hpp"
#include "../include/executioncontext.hpp"
#include "../include/flowconfig.hpp"
#include "../include/steprecorder.hpp"
#include "../include/validationchain.hpp"

/// Итоги стадии сбора
struct CollectionReport {
  std::size_t discovered = 0;
  std::size_t collected = 0;
  std::size_t rejected = 0;
  std::size_t quarantined = 0;
  std::size_t errors = 0;
  std::vector<FileError> fileErrors;
};

/**
 * @class FileCollector
 * @brief Собирает файлы потока в контекст выполнения
 *
 * @details
 * Порядок обработки:
 * 1. Сканирование каталога (кандидаты отсортированы по имени).
 * 2. Проверки 1-5 цепочки валидации для каждого кандидата; прошедшие
 *    получают отметку mtime.
 * 3. Отложенная проверка стабильности: каждый кандидат ждёт только до
 *    своего срока, так что общее ожидание прогона не превышает W.
 * 4. Однократное чтение содержимого и пользовательские правила.
 *
 * Отклонённые файлы с решением REJECT_QUARANTINE переносятся в карантин,
 * если он включён. Принятые файлы попадают в filesToProcess контекста;
 * файлы, которые не удалось прочитать, тоже попадают туда со статусом
 * READ_FAILED и учитываются как ошибки.
 *
 * @throw PipelineFatalError из collect(), если исходный каталог недоступен
 */
class FileCollector {
 public:
  FileCollector(const FlowConfig &config, std::shared_ptr<IAuditSink> audit,
                std::shared_ptr<IStepRecorder> steps,
                fileops::Clock clock = fileops::systemClock());

  CollectionReport collect(ExecutionContext &context,
                           const std::atomic<bool> *stopRequested = nullptr);

 private:
  void reject(const FileCandidate &file, const ValidationOutcome &outcome,
              CollectionReport &report);
  void publish(AuditEventType type, const FileCandidate &file,
               const std::string &detail = {}, std::uintmax_t bytes = 0);

  static bool stopped(const std::atomic<bool> *stopRequested) {
    return stopRequested && stopRequested->load();
  }

  std::string flowName_;
  PostProcessAction postProcessAction_;
  std::string archiveDirectory_;
  DirectoryScanner scanner_;
  ValidationChain chain_;
  ErrorQuarantine quarantine_;
  std::shared_ptr<IAuditSink> audit_;
  std::shared_ptr<IStepRecorder> steps_;
};
