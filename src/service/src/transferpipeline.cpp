/**
 * @file transferpipeline.cpp
 * @brief Реализация прогона потока
 */

#include "../include/transferpipeline.hpp"

#include "../include/filecollector.hpp"
#include "../include/filedelivery.hpp"
#include "fbr/compositelogger.hpp"

std::string RunReport::summary() const {
  std::string text = "Flow '" + flowName + "': discovered=" +
                     std::to_string(discovered) +
                     " collected=" + std::to_string(collected) +
                     " delivered=" + std::to_string(delivered) +
                     " rejected=" + std::to_string(rejected) +
                     " quarantined=" + std::to_string(quarantined) +
                     " skippedEmpty=" + std::to_string(skippedEmpty) +
                     " errors=" + std::to_string(errors) +
                     " postProcessed=" + std::to_string(postProcessed) +
                     " bytes=" + std::to_string(bytesDelivered) +
                     " duration=" + std::to_string(duration.count()) + "ms";
  if (fatalError) text += " fatal=\"" + *fatalError + "\"";
  return text;
}

TransferPipeline::TransferPipeline(FlowConfig config,
                                   std::shared_ptr<IAuditSink> audit,
                                   std::shared_ptr<IStepRecorder> steps,
                                   fileops::Clock clock)
    : config_(std::move(config)),
      audit_(std::move(audit)),
      steps_(std::move(steps)),
      clock_(std::move(clock)) {
  if (!audit_ || !steps_) {
    throw std::invalid_argument("TransferPipeline: collaborators required");
  }
}

RunReport TransferPipeline::run() {
  ExecutionContext context(config_.name);
  return run(context);
}

RunReport TransferPipeline::run(ExecutionContext &context) {
  auto &logger = fbr::CompositeLogger::instance();
  const auto started = std::chrono::steady_clock::now();

  RunReport report;
  report.flowName = config_.name;
  logger.debug("Flow '" + config_.name + "': run started");
  steps_->beginRun();

  FileCollector collector(config_, audit_, steps_, clock_);
  auto collected = collector.collect(context, &stopRequested_);

  report.discovered = collected.discovered;
  report.collected = collected.collected;
  report.rejected = collected.rejected;
  report.quarantined = collected.quarantined;
  report.errors = collected.errors;
  report.fileErrors = std::move(collected.fileErrors);

  FileDelivery delivery(config_, audit_, steps_, clock_);
  auto delivered = delivery.deliver(context, &stopRequested_);

  report.delivered = delivered.delivered;
  report.skippedEmpty = delivered.skippedEmpty;
  report.postProcessed = delivered.postProcessed;
  report.bytesDelivered = delivered.bytesDelivered;
  report.errors += delivered.errors;
  report.deliveries = std::move(delivered.results);
  for (auto &error : delivered.fileErrors) {
    report.fileErrors.push_back(std::move(error));
  }

  report.steps = steps_->steps();
  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  AuditEvent event;
  event.type = AuditEventType::RUN_COMPLETED;
  event.flow = config_.name;
  event.detail = report.summary();
  event.bytes = report.bytesDelivered;
  publishAudit(*audit_, event);

  if (report.errors > 0) {
    logger.warning(report.summary());
  } else {
    logger.info(report.summary());
  }
  return report;
}
