/**
 * @file transferpipeline.hpp
 * @brief Один прогон потока: сбор, доставка, постобработка
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../include/auditsink.hpp"
#include "../include/executioncontext.hpp"
#include "../include/fileops.hpp"
#include "../include/flowconfig.hpp"
#include "../include/steprecorder.hpp"

/**
 * @struct RunReport
 * @brief Итоги одного прогона потока
 *
 * @details rejected включает quarantined. steps содержит шаги только этого
 * прогона. fatalError заполняется только Master::runOnce, когда прогон
 * прерван фатальной ошибкой.
 */
struct RunReport {
  std::string flowName;
  std::size_t discovered = 0;
  std::size_t collected = 0;
  std::size_t delivered = 0;
  std::size_t rejected = 0;
  std::size_t quarantined = 0;
  std::size_t skippedEmpty = 0;
  std::size_t errors = 0;
  std::size_t postProcessed = 0;
  std::uintmax_t bytesDelivered = 0;
  std::chrono::milliseconds duration{0};
  std::vector<FileError> fileErrors;
  std::vector<DeliveryResult> deliveries;
  std::vector<StepRecord> steps;
  std::optional<std::string> fatalError;

  bool succeeded() const { return !fatalError && errors == 0; }

  /// Однострочная сводка для журнала
  std::string summary() const;
};

/**
 * @class TransferPipeline
 * @brief Выполняет прогон потока в свежем контексте выполнения
 *
 * @details
 * Ошибки отдельных файлов изолированы и попадают в отчёт. Наружу
 * выбрасывается только PipelineFatalError (исходный каталог недоступен,
 * целевой каталог не создаётся).
 *
 * @code
 * TransferPipeline pipeline(FlowConfig::fromJson(flowJson));
 * RunReport report = pipeline.run();
 * @endcode
 */
class TransferPipeline {
 public:
  explicit TransferPipeline(
      FlowConfig config,
      std::shared_ptr<IAuditSink> audit = std::make_shared<LoggerAuditSink>(),
      std::shared_ptr<IStepRecorder> steps =
          std::make_shared<MetricsStepRecorder>(),
      fileops::Clock clock = fileops::systemClock());

  /// @throw PipelineFatalError
  RunReport run();

  /// Прогон с внешним контекстом (атрибуты задаются вызывающим)
  RunReport run(ExecutionContext &context);

  /// Прервать текущий прогон между файлами
  void requestStop() { stopRequested_.store(true); }
  void resetStop() { stopRequested_.store(false); }
  bool stopRequested() const { return stopRequested_.load(); }

  const FlowConfig &config() const { return config_; }

 private:
  FlowConfig config_;
  std::shared_ptr<IAuditSink> audit_;
  std::shared_ptr<IStepRecorder> steps_;
  fileops::Clock clock_;
  std::atomic<bool> stopRequested_{false};
};
