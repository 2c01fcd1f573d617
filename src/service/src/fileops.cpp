/**
 * @file fileops.cpp
 * @brief Реализация общих файловых операций
 */

#include "../include/fileops.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include "fbr/compositelogger.hpp"

namespace fileops {

Clock systemClock() {
  return [] { return std::chrono::system_clock::now(); };
}

void moveFile(const fs::path &from, const fs::path &to, bool replaceExisting) {
  std::error_code ec;

  const fs::path dir = to.parent_path();
  if (!dir.empty() && !fs::exists(dir, ec)) {
    fs::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error("Cannot create directory " + dir.string() +
                               ": " + ec.message());
    }
    fbr::CompositeLogger::instance().info("Created directory: " +
                                          dir.string());
  }

  if (!replaceExisting && fs::exists(to, ec)) {
    throw std::runtime_error("Destination already exists: " + to.string());
  }

  fs::rename(from, to, ec);
  if (!ec) return;

  if (ec.value() != EXDEV) {
    throw std::runtime_error("Failed to move " + from.string() + " to " +
                             to.string() + ": " + ec.message());
  }

  // Разные файловые системы: копирование и удаление источника
  ec.clear();
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    std::error_code cleanup;
    fs::remove(to, cleanup);
    throw std::runtime_error("Failed to copy " + from.string() + " to " +
                             to.string() + ": " + ec.message());
  }

  fs::remove(from, ec);
  if (ec) {
    std::error_code cleanup;
    fs::remove(to, cleanup);
    throw std::runtime_error("Failed to remove " + from.string() +
                             " after copy: " + ec.message());
  }
}

std::pair<std::string, std::string> splitExtension(const std::string &name) {
  const auto dot = name.find_last_of('.');
  if (dot == std::string::npos || dot == 0) {
    return {name, ""};
  }
  return {name.substr(0, dot), name.substr(dot)};
}

std::string timestampSuffixedName(const std::string &name,
                                  std::chrono::system_clock::time_point when) {
  auto [stem, extension] = splitExtension(name);
  return stem + "_" + fbr::TimeFormatter::format(when, "%Y%m%d_%H%M%S") +
         extension;
}

std::string timestampPrefixedName(const std::string &name,
                                  std::chrono::system_clock::time_point when) {
  return fbr::TimeFormatter::format(when, "%Y%m%d_%H%M%S") + "_" + name;
}

}  // namespace fileops
