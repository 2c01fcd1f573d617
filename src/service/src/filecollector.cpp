/**
 * @file filecollector.cpp
 * @brief Реализация стороны сбора
 */

#include "../include/filecollector.hpp"

#include <utility>

#include "../include/contentreader.hpp"
#include "fbr/compositelogger.hpp"

FileCollector::FileCollector(const FlowConfig &config,
                             std::shared_ptr<IAuditSink> audit,
                             std::shared_ptr<IStepRecorder> steps,
                             fileops::Clock clock)
    : flowName_(config.name),
      postProcessAction_(config.postProcessAction),
      archiveDirectory_(config.archiveDirectory),
      scanner_(config.sourceDirectory, config.filePattern),
      chain_(config),
      quarantine_(config.archiveFaultySourceFiles, config.archiveErrorDirectory,
                  std::move(clock)),
      audit_(std::move(audit)),
      steps_(std::move(steps)) {}

CollectionReport FileCollector::collect(
    ExecutionContext &context, const std::atomic<bool> *stopRequested) {
  auto &logger = fbr::CompositeLogger::instance();
  CollectionReport report;

  const auto candidates = scanner_.scan();
  report.discovered = candidates.size();
  logger.debug("Flow '" + flowName_ + "': " +
               std::to_string(candidates.size()) + " candidate(s) in " +
               scanner_.sourceDirectory().string());

  // Проверки 1-5 и отметка mtime для всех кандидатов
  std::vector<std::pair<FileCandidate, StabilityGate::PendingCheck>> pending;
  for (const auto &candidate : candidates) {
    if (stopped(stopRequested)) break;
    publish(AuditEventType::FILE_DISCOVERED, candidate, {},
            candidate.sizeBytes);

    auto outcome = chain_.precheck(candidate);
    if (!outcome.accepted()) {
      reject(candidate, outcome, report);
      continue;
    }
    pending.emplace_back(candidate,
                         chain_.stabilityGate().stamp(candidate.path));
  }

  for (const auto &[candidate, check] : pending) {
    if (stopped(stopRequested)) {
      logger.info("Flow '" + flowName_ + "': collection interrupted");
      break;
    }

    auto outcome = chain_.checkStability(check, stopRequested);
    if (!outcome.accepted()) {
      reject(candidate, outcome, report);
      continue;
    }

    TransferUnit unit(candidate.name, candidate.path, postProcessAction_,
                      archiveDirectory_);
    ContentReader::Content content;
    try {
      content = ContentReader::read(candidate.path);
    } catch (const std::exception &e) {
      logger.error("Flow '" + flowName_ + "': " + e.what());
      unit.markReadFailed(e.what());
      ++report.errors;
      report.fileErrors.push_back({candidate.name, e.what()});
      publish(AuditEventType::FILE_READ_FAILED, candidate, e.what());
      context.filesToProcess().push_back(std::move(unit));
      continue;
    }

    outcome = chain_.applyRules(candidate, *content.bytes);
    for (const auto &warning : outcome.warnings) {
      logger.warning("Flow '" + flowName_ + "': " + candidate.name + ": " +
                     warning);
    }
    if (!outcome.accepted()) {
      reject(candidate, outcome, report);
      continue;
    }

    const auto bytes = content.bytes->size();
    unit.setContent(std::move(content.bytes), std::move(content.sha256));
    steps_->recordFile(unit.fileName(), IStepRecorder::kReadForProcessing,
                       bytes);
    publish(AuditEventType::FILE_VALIDATED, candidate, unit.sha256(), bytes);
    logger.info("Flow '" + flowName_ + "': collected " + unit.fileName() +
                " (" + std::to_string(bytes) + " bytes)");

    context.filesToProcess().push_back(std::move(unit));
    ++report.collected;
  }

  return report;
}

void FileCollector::reject(const FileCandidate &file,
                           const ValidationOutcome &outcome,
                           CollectionReport &report) {
  auto &logger = fbr::CompositeLogger::instance();
  ++report.rejected;

  const std::string detail =
      "[" + toString(outcome.category) + "] " + outcome.reason;
  if (outcome.category == ValidationCategory::LOCK_STATUS) {
    logger.info("Flow '" + flowName_ + "': " + outcome.reason +
                ", will retry on next scan");
  } else {
    logger.warning("Flow '" + flowName_ + "': file rejected: " + file.name +
                   " - " + outcome.reason);
  }
  publish(AuditEventType::FILE_REJECTED, file, detail, file.sizeBytes);

  if (outcome.decision != ValidationDecision::REJECT_QUARANTINE ||
      !quarantine_.active()) {
    return;
  }

  if (auto moved = quarantine_.quarantine(file.path, outcome.reason)) {
    ++report.quarantined;
    AuditEvent event;
    event.type = AuditEventType::FILE_QUARANTINED;
    event.flow = flowName_;
    event.fileName = file.name;
    event.path = moved->string();
    event.detail = outcome.reason;
    event.bytes = file.sizeBytes;
    publishAudit(*audit_, event);
  }
}

void FileCollector::publish(AuditEventType type, const FileCandidate &file,
                            const std::string &detail, std::uintmax_t bytes) {
  AuditEvent event;
  event.type = type;
  event.flow = flowName_;
  event.fileName = file.name;
  event.path = file.path.string();
  event.detail = detail;
  event.bytes = bytes;
  publishAudit(*audit_, event);
}
