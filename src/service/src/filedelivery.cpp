/**
 * @file filedelivery.cpp
 * @brief Реализация стороны доставки
 */

#include "../include/filedelivery.hpp"

#include <algorithm>
#include <chrono>

#include "../include/workerpool.hpp"
#include "fbr/MetricsCollector.hpp"
#include "fbr/compositelogger.hpp"

FileDelivery::FileDelivery(const FlowConfig &config,
                           std::shared_ptr<IAuditSink> audit,
                           std::shared_ptr<IStepRecorder> steps,
                           fileops::Clock clock)
    : flowName_(config.name),
      targetDirectory_(config.targetDirectory),
      emptyMessageHandling_(config.emptyMessageHandling),
      maximumConcurrency_(config.maximumConcurrency),
      naming_(config.outputFilenameMode, config.customFilenamePattern, clock),
      writer_(WriteStrategy::create(config.writeMode)),
      postProcessor_(config.addTimestamp, clock),
      audit_(std::move(audit)),
      steps_(std::move(steps)) {
  fbr::MetricsCollector::instance().ensureCounter(
      "files_failed", "Files whose delivery failed");
}

void FileDelivery::ensureTargetDirectory() const {
  std::error_code ec;
  fs::create_directories(targetDirectory_, ec);
  if (ec || !fs::is_directory(targetDirectory_)) {
    throw PipelineFatalError("Target directory not accessible: " +
                             targetDirectory_.string() +
                             (ec ? " (" + ec.message() + ")" : ""));
  }
}

std::shared_ptr<std::mutex> FileDelivery::destinationLock(
    const std::string &path) const {
  std::lock_guard<std::mutex> lock(destinationsMutex_);
  auto &entry = destinationLocks_[path];
  if (!entry) entry = std::make_shared<std::mutex>();
  return entry;
}

DeliveryResult FileDelivery::write(const TransferUnit &unit) const noexcept {
  DeliveryResult result;
  result.fileName = unit.fileName();
  result.sizeBytes = unit.content().size();

  try {
    result.outputFileName = naming_.outputName(unit.fileName());
    const fs::path destination = targetDirectory_ / result.outputFileName;
    result.outputPath = destination.string();

    // общий временный файл <dest>.tmp: записи в один путь по очереди
    const auto pathLock = destinationLock(result.outputPath);
    std::lock_guard<std::mutex> guard(*pathLock);

    const auto started = std::chrono::steady_clock::now();
    writer_->write(destination, unit.content());
    fbr::MetricsCollector::instance().recordTaskTime(
        "file_transfer_time",
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started));

    result.status = DeliveryStatus::SUCCESS;
  } catch (const std::exception &e) {
    result.status = DeliveryStatus::FAILED;
    result.errorMessage = e.what();
  }
  return result;
}

FileDelivery::FileOutcome FileDelivery::process(const TransferUnit &unit,
                                                bool skipPostProcessing) {
  auto &logger = fbr::CompositeLogger::instance();
  FileOutcome outcome{write(unit), std::nullopt};
  const auto &delivery = outcome.delivery;

  if (!delivery.succeeded()) {
    logger.error("Flow '" + flowName_ + "': failed to deliver " +
                 unit.fileName() + ": " + delivery.errorMessage.value_or(""));
    return outcome;
  }

  logger.info("Flow '" + flowName_ + "': delivered " + unit.fileName() +
              " -> " + delivery.outputPath + " (" +
              std::to_string(delivery.sizeBytes) + " bytes, " +
              toString(writer_->mode()) + ")");

  if (skipPostProcessing) {
    logger.debug("Post-processing disabled by context for " +
                 unit.fileName());
  } else {
    outcome.postProcess = postProcessor_.apply(unit, delivery);
  }
  return outcome;
}

DeliveryReport FileDelivery::deliver(ExecutionContext &context,
                                     const std::atomic<bool> *stopRequested) {
  auto &logger = fbr::CompositeLogger::instance();
  DeliveryReport report;

  std::vector<const TransferUnit *> units;
  for (const auto &unit : context.filesToProcess()) {
    if (unit.status() != ReadStatus::READ_SUCCESS) {
      logger.debug("Skipping unreadable unit " + unit.fileName());
      continue;
    }
    if (unit.content().empty() &&
        emptyMessageHandling_ == EmptyMessageHandling::SKIP_EMPTY) {
      logger.info("Flow '" + flowName_ + "': empty message skipped for " +
                  unit.fileName());
      ++report.skippedEmpty;
      continue;
    }
    units.push_back(&unit);
  }

  if (units.empty()) {
    context.setReceiverProcessingSuccessful(true);
    return report;
  }

  ensureTargetDirectory();

  const bool skipPostProcessing =
      context.flag(ExecutionContext::kSkipPostProcessing);
  auto stopped = [stopRequested] {
    return stopRequested && stopRequested->load();
  };

  std::vector<std::optional<FileOutcome>> outcomes(units.size());
  if (maximumConcurrency_ > 1 && units.size() > 1) {
    const std::size_t threads = std::min(
        static_cast<std::size_t>(maximumConcurrency_), units.size());
    WorkerPool pool(static_cast<unsigned int>(threads), threads * 2);
    for (std::size_t i = 0; i < units.size(); ++i) {
      if (stopped()) break;
      pool.enqueue([this, &outcomes, &units, i, skipPostProcessing, stopped] {
        if (stopped()) return;
        outcomes[i] = process(*units[i], skipPostProcessing);
      });
    }
    pool.finalize();
  } else {
    for (std::size_t i = 0; i < units.size(); ++i) {
      if (stopped()) break;
      outcomes[i] = process(*units[i], skipPostProcessing);
    }
  }

  std::size_t notAttempted = 0;
  for (auto &outcome : outcomes) {
    if (!outcome) {
      ++notAttempted;
      continue;
    }
    DeliveryResult &delivery = outcome->delivery;

    if (delivery.succeeded()) {
      ++report.delivered;
      report.bytesDelivered += delivery.sizeBytes;
      context.addSuccessfulFile(delivery.fileName);
      steps_->recordFile(delivery.fileName, delivery.outputPath,
                         delivery.sizeBytes);
      publish(AuditEventType::FILE_TRANSFERRED, delivery,
              toString(writer_->mode()));
    } else {
      ++report.errors;
      fbr::MetricsCollector::instance().incrementCounter("files_failed");
      report.fileErrors.push_back(
          {delivery.fileName, delivery.errorMessage.value_or("unknown error")});
      publish(AuditEventType::FILE_TRANSFER_FAILED, delivery,
              delivery.errorMessage.value_or(""));
    }

    if (outcome->postProcess) {
      const PostProcessResult result = *outcome->postProcess;
      if (result == PostProcessResult::ARCHIVED ||
          result == PostProcessResult::DELETED ||
          result == PostProcessResult::MARKED ||
          result == PostProcessResult::KEPT) {
        ++report.postProcessed;
      }
      publish(AuditEventType::FILE_POST_PROCESSED, delivery,
              toString(result));
    }

    report.results.push_back(std::move(delivery));
  }

  if (notAttempted > 0) {
    logger.info("Flow '" + flowName_ + "': delivery interrupted, " +
                std::to_string(notAttempted) + " file(s) left for next run");
  }

  context.setReceiverProcessingSuccessful(report.errors == 0);
  return report;
}

void FileDelivery::publish(AuditEventType type, const DeliveryResult &result,
                           const std::string &detail) {
  AuditEvent event;
  event.type = type;
  event.flow = flowName_;
  event.fileName = result.fileName;
  event.path = result.outputPath;
  event.detail = detail;
  event.bytes = result.sizeBytes;
  publishAudit(*audit_, event);
}
