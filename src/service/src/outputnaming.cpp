/**
 * @file outputnaming.cpp
 * @brief Стратегии именования выходных файлов
 */

#include "../include/outputnaming.hpp"

#include <openssl/rand.h>

#include <cstdio>
#include <stdexcept>

#include "fbr/compositelogger.hpp"

namespace {

void replaceAll(std::string &text, const std::string &token,
                const std::string &value) {
  size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.replace(pos, token.size(), value);
    pos += value.size();
  }
}

}  // namespace

OutputNamingStrategy::OutputNamingStrategy(OutputNamingMode mode,
                                           std::string pattern,
                                           fileops::Clock clock)
    : mode_(mode), pattern_(std::move(pattern)), clock_(std::move(clock)) {
  if (mode_ == OutputNamingMode::CUSTOM_PATTERN && pattern_.empty()) {
    fbr::CompositeLogger::instance().warning(
        "Custom output filename mode without pattern, using original names");
    mode_ = OutputNamingMode::ORIGINAL;
  }
}

std::string OutputNamingStrategy::outputName(
    const std::string &originalName) const noexcept {
  try {
    std::string name;
    switch (mode_) {
      case OutputNamingMode::ORIGINAL:
        return originalName;
      case OutputNamingMode::TIMESTAMPED: {
        auto [stem, extension] = fileops::splitExtension(originalName);
        name = stem + "_" +
               fbr::TimeFormatter::format(clock_(), "%Y%m%d%H%M%S") + extension;
        break;
      }
      case OutputNamingMode::CUSTOM_PATTERN:
        name = applyPattern(originalName);
        break;
    }

    if (name.empty() || name.find('/') != std::string::npos || name == "." ||
        name == "..") {
      fbr::CompositeLogger::instance().warning(
          "Generated output name '" + name + "' is unusable, keeping " +
          originalName);
      return originalName;
    }
    return name;
  } catch (const std::exception &e) {
    fbr::CompositeLogger::instance().warning(
        "Output name generation failed for " + originalName + ": " + e.what() +
        ", keeping original name");
    return originalName;
  }
}

std::string OutputNamingStrategy::applyPattern(
    const std::string &originalName) const {
  const auto now = clock_();
  auto [stem, extension] = fileops::splitExtension(originalName);

  std::string name = pattern_;
  replaceAll(name, "{original_name}", stem);
  replaceAll(name, "{timestamp}",
             fbr::TimeFormatter::format(now, "%Y%m%d%H%M%S"));
  replaceAll(name, "{date}", fbr::TimeFormatter::format(now, "%Y%m%d"));
  replaceAll(name, "{extension}", extension);
  if (name.find("{uuid}") != std::string::npos) {
    replaceAll(name, "{uuid}", randomUuid());
  }
  return name;
}

std::string OutputNamingStrategy::randomUuid() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  char buffer[37];
  std::snprintf(buffer, sizeof(buffer),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x"
                "%02x",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                bytes[12], bytes[13], bytes[14], bytes[15]);
  return buffer;
}
