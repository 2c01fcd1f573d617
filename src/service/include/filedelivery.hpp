/**
 * @file filedelivery.hpp
 * @brief Сторона доставки: запись в целевой каталог и постобработка
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../include/auditsink.hpp"
#include "../include/executioncontext.hpp"
#include "../include/flowconfig.hpp"
#include "../include/outputnaming.hpp"
#include "../include/postprocessor.hpp"
#include "../include/steprecorder.hpp"
#include "../include/writestrategy.hpp"

/// Итоги стадии доставки
struct DeliveryReport {
  std::size_t delivered = 0;
  std::size_t errors = 0;
  std::size_t skippedEmpty = 0;
  std::size_t postProcessed = 0;
  std::uintmax_t bytesDelivered = 0;
  std::vector<DeliveryResult> results;
  std::vector<FileError> fileErrors;
};

/**
 * @class FileDelivery
 * @brief Доставляет единицы передачи из контекста выполнения
 *
 * @details
 * Для каждой прочитанной единицы: политика пустых сообщений, имя
 * назначения, запись выбранной стратегией, затем постобработка источника
 * (только после успешной записи, не более одного раза, если в контексте
 * не установлен флаг skipSenderPostProcessing).
 *
 * При maximumConcurrency > 1 записи выполняются в пуле из
 * min(maximumConcurrency, число единиц) потоков; результаты всегда
 * возвращаются в порядке входа. Записи в один и тот же путь назначения
 * выполняются строго по очереди. Остановка прерывает доставку между файлами, но постобработка
 * уже записанного файла выполняется всегда.
 *
 * По завершении в контекст записываются receiverProcessingSuccessful
 * (нет ошибок доставки) и successfulFiles.
 */
class FileDelivery {
 public:
  FileDelivery(const FlowConfig &config, std::shared_ptr<IAuditSink> audit,
               std::shared_ptr<IStepRecorder> steps,
               fileops::Clock clock = fileops::systemClock());

  /**
   * @throw PipelineFatalError Целевой каталог не удалось создать
   */
  DeliveryReport deliver(ExecutionContext &context,
                         const std::atomic<bool> *stopRequested = nullptr);

  /**
   * @brief Записывает одну единицу; исключений не выбрасывает
   * @return Результат со статусом SUCCESS или FAILED и текстом ошибки
   */
  DeliveryResult write(const TransferUnit &unit) const noexcept;

  const PostProcessor &postProcessor() const { return postProcessor_; }

 private:
  struct FileOutcome {
    DeliveryResult delivery;
    std::optional<PostProcessResult> postProcess;
  };

  FileOutcome process(const TransferUnit &unit, bool skipPostProcessing);
  void ensureTargetDirectory() const;
  std::shared_ptr<std::mutex> destinationLock(const std::string &path) const;
  void publish(AuditEventType type, const DeliveryResult &result,
               const std::string &detail);

  std::string flowName_;
  fs::path targetDirectory_;
  EmptyMessageHandling emptyMessageHandling_;
  int maximumConcurrency_;
  OutputNamingStrategy naming_;
  std::unique_ptr<WriteStrategy> writer_;
  PostProcessor postProcessor_;
  std::shared_ptr<IAuditSink> audit_;
  std::shared_ptr<IStepRecorder> steps_;

  mutable std::mutex destinationsMutex_;
  mutable std::map<std::string, std::shared_ptr<std::mutex>> destinationLocks_;
};
