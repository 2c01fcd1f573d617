/**
 * @file writestrategy.cpp
 * @brief Стратегии записи целевых файлов
 */

#include "../include/writestrategy.hpp"

#include <fstream>
#include <stdexcept>

#include "fbr/compositelogger.hpp"

std::unique_ptr<WriteStrategy> WriteStrategy::create(WriteMode mode) {
  switch (mode) {
    case WriteMode::TEMP_THEN_RENAME:
      return std::make_unique<TempThenRenameWriteStrategy>();
    case WriteMode::DIRECT:
      break;
  }
  return std::make_unique<DirectWriteStrategy>();
}

void WriteStrategy::writeFile(const fs::path &path,
                              const std::vector<char> &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Cannot open file for writing: " + path.string());
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    throw std::runtime_error("Failed to write file: " + path.string());
  }
}

void DirectWriteStrategy::write(const fs::path &destination,
                                const std::vector<char> &content) const {
  writeFile(destination, content);
}

fs::path TempThenRenameWriteStrategy::tempPathFor(
    const fs::path &destination) {
  fs::path temp = destination;
  temp += kTempSuffix;
  return temp;
}

void TempThenRenameWriteStrategy::write(
    const fs::path &destination, const std::vector<char> &content) const {
  const fs::path temp = tempPathFor(destination);

  try {
    writeFile(temp, content);
    fs::rename(temp, destination);
  } catch (const std::exception &e) {
    std::error_code ec;
    fs::remove(temp, ec);
    if (ec) {
      fbr::CompositeLogger::instance().warning(
          "Failed to remove temp file " + temp.string() + ": " + ec.message());
    }
    throw std::runtime_error("Atomic write to " + destination.string() +
                             " failed: " + e.what());
  }
}
