/**
 * @file directoryscanner.cpp
 * @brief Реализация сканирования исходного каталога
 */

#include "../include/directoryscanner.hpp"

#include <algorithm>

#include "fbr/compositelogger.hpp"

DirectoryScanner::DirectoryScanner(fs::path sourceDirectory,
                                   const std::string &includePattern)
    : sourceDirectory_(std::move(sourceDirectory)),
      includeMatcher_(includePattern.empty() ? "*" : includePattern) {}

std::vector<FileCandidate> DirectoryScanner::scan() const {
  std::error_code ec;

  if (!fs::exists(sourceDirectory_, ec) ||
      !fs::is_directory(sourceDirectory_, ec)) {
    throw PipelineFatalError("Source directory not accessible: " +
                             sourceDirectory_.string());
  }

  std::vector<FileCandidate> candidates;

  fs::directory_iterator it(sourceDirectory_, ec);
  if (ec) {
    throw PipelineFatalError("Source directory not accessible: " +
                             sourceDirectory_.string() + ": " + ec.message());
  }

  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      throw PipelineFatalError("Failed to list source directory " +
                               sourceDirectory_.string() + ": " +
                               ec.message());
    }

    std::error_code entryEc;
    if (!it->is_regular_file(entryEc) || entryEc) continue;

    const std::string name = it->path().filename().string();
    if (!includeMatcher_.matches(name)) continue;

    try {
      candidates.push_back(describe(it->path()));
    } catch (const fs::filesystem_error &e) {
      // Файл исчез между перечислением и чтением атрибутов
      fbr::CompositeLogger::instance().debug("Skipping vanished file " + name +
                                             ": " + e.what());
    }
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const FileCandidate &a, const FileCandidate &b) {
              return a.name < b.name;
            });

  fbr::CompositeLogger::instance().debug(
      "Found " + std::to_string(candidates.size()) + " files in: " +
      sourceDirectory_.string());

  return candidates;
}

FileCandidate DirectoryScanner::describe(const fs::path &path) {
  FileCandidate candidate;
  candidate.path = path;
  candidate.name = path.filename().string();
  candidate.sizeBytes = fs::file_size(path);
  candidate.lastModifiedAt = fs::last_write_time(path);

  const auto perms = fs::status(path).permissions();
  candidate.readOnly = (perms & fs::perms::owner_write) == fs::perms::none;
  return candidate;
}
