/**
 * @file postprocessor.cpp
 * @brief Постобработка исходных файлов
 */

#include "../include/postprocessor.hpp"

#include "fbr/compositelogger.hpp"

std::string toString(PostProcessResult result) {
  switch (result) {
    case PostProcessResult::ARCHIVED:
      return "ARCHIVED";
    case PostProcessResult::DELETED:
      return "DELETED";
    case PostProcessResult::MARKED:
      return "MARKED";
    case PostProcessResult::KEPT:
      return "KEPT";
    case PostProcessResult::SKIPPED:
      return "SKIPPED";
    case PostProcessResult::ALREADY_APPLIED:
      return "ALREADY_APPLIED";
    case PostProcessResult::FAILED:
      return "FAILED";
  }
  return "FAILED";
}

PostProcessor::PostProcessor(bool addTimestamp, fileops::Clock clock)
    : addTimestamp_(addTimestamp), clock_(std::move(clock)) {}

bool PostProcessor::wasApplied(const fs::path &source) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return applied_.count(source.string()) != 0;
}

PostProcessResult PostProcessor::apply(const TransferUnit &unit,
                                       const DeliveryResult &delivery) noexcept {
  auto &logger = fbr::CompositeLogger::instance();

  if (!delivery.succeeded()) {
    logger.debug("Post-processing skipped for " + unit.fileName() +
                 ": delivery did not succeed");
    return PostProcessResult::SKIPPED;
  }

  try {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!applied_.insert(unit.originalPath().string()).second) {
        logger.warning("Post-processing already applied to " +
                       unit.originalPath().string());
        return PostProcessResult::ALREADY_APPLIED;
      }
    }

    switch (unit.postProcessAction()) {
      case PostProcessAction::ARCHIVE:
        return archive(unit);
      case PostProcessAction::DELETE:
        return remove(unit);
      case PostProcessAction::KEEP_AND_MARK:
        return mark(unit);
      case PostProcessAction::KEEP_AND_REPROCESS:
        logger.debug("File kept for reprocessing: " +
                     unit.originalPath().string());
        return PostProcessResult::KEPT;
    }
    return PostProcessResult::SKIPPED;
  } catch (const std::exception &e) {
    logger.error("Post-processing failed for " + unit.originalPath().string() +
                 ": " + e.what() + ". File remains in original location");
    return PostProcessResult::FAILED;
  }
}

PostProcessResult PostProcessor::archive(const TransferUnit &unit) {
  auto &logger = fbr::CompositeLogger::instance();

  if (unit.archiveDirectory().empty()) {
    logger.warning("No archive directory configured, file " +
                   unit.fileName() + " left in place");
    return PostProcessResult::SKIPPED;
  }

  std::error_code ec;
  if (!fs::exists(unit.originalPath(), ec)) {
    logger.warning("Source file already gone, nothing to archive: " +
                   unit.originalPath().string());
    return PostProcessResult::SKIPPED;
  }

  const std::string archivedName =
      addTimestamp_ ? fileops::timestampSuffixedName(unit.fileName(), clock_())
                    : unit.fileName();
  const fs::path destination = fs::path(unit.archiveDirectory()) / archivedName;

  fileops::moveFile(unit.originalPath(), destination, true);
  logger.info("Archived source file " + unit.fileName() + " to " +
              destination.string());
  return PostProcessResult::ARCHIVED;
}

PostProcessResult PostProcessor::remove(const TransferUnit &unit) {
  auto &logger = fbr::CompositeLogger::instance();

  std::error_code ec;
  const bool removed = fs::remove(unit.originalPath(), ec);
  if (ec) {
    throw std::runtime_error("Cannot delete " + unit.originalPath().string() +
                             ": " + ec.message());
  }
  if (!removed) {
    logger.warning("Source file already gone, nothing to delete: " +
                   unit.originalPath().string());
    return PostProcessResult::SKIPPED;
  }

  logger.info("Deleted source file " + unit.originalPath().string());
  return PostProcessResult::DELETED;
}

PostProcessResult PostProcessor::mark(const TransferUnit &unit) {
  auto &logger = fbr::CompositeLogger::instance();

  std::error_code ec;
  if (!fs::exists(unit.originalPath(), ec)) {
    logger.debug("Source file already gone, nothing to mark: " +
                 unit.originalPath().string());
    return PostProcessResult::SKIPPED;
  }

  fs::path marked = unit.originalPath();
  marked += kProcessedSuffix;
  fs::rename(unit.originalPath(), marked);

  logger.info("Marked source file as processed: " + marked.string());
  return PostProcessResult::MARKED;
}
