/**
 * @file errorquarantine.cpp
 * @brief Карантин отклонённых файлов
 */

#include "../include/errorquarantine.hpp"

#include "fbr/compositelogger.hpp"

ErrorQuarantine::ErrorQuarantine(bool enabled, std::string errorDirectory,
                                 fileops::Clock clock)
    : enabled_(enabled),
      errorDirectory_(std::move(errorDirectory)),
      clock_(std::move(clock)) {}

std::optional<fs::path> ErrorQuarantine::quarantine(
    const fs::path &file, const std::string &reason) const {
  if (!active()) return std::nullopt;

  auto &logger = fbr::CompositeLogger::instance();
  try {
    const fs::path destination =
        fs::path(errorDirectory_) /
        fileops::timestampPrefixedName(file.filename().string(), clock_());

    fileops::moveFile(file, destination, true);

    logger.warning("Moved rejected file to error directory: " +
                   destination.string() + " (" + reason + ")");
    return destination;
  } catch (const std::exception &e) {
    logger.error("Failed to quarantine " + file.string() + ": " + e.what() +
                 ". File remains in original location");
    return std::nullopt;
  }
}
