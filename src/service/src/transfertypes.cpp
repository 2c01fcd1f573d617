/**
 * @file transfertypes.cpp
 * @brief Разбор строковых режимов и единица передачи
 */

#include "../include/transfertypes.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

std::string normalizeEnumLiteral(const std::string &value) {
  std::string result;
  result.reserve(value.size());
  for (unsigned char c : value) {
    if (c == ' ' || c == '_' || c == '-' || c == '\t') continue;
    result.push_back(static_cast<char>(std::tolower(c)));
  }
  return result;
}

namespace {

template <typename Enum>
std::optional<Enum> lookup(const std::unordered_map<std::string, Enum> &table,
                           const std::string &value) {
  auto it = table.find(normalizeEnumLiteral(value));
  if (it == table.end()) return std::nullopt;
  return it->second;
}

}  // namespace

std::optional<PostProcessAction> parsePostProcessAction(
    const std::string &value) {
  static const std::unordered_map<std::string, PostProcessAction> table = {
      {"archive", PostProcessAction::ARCHIVE},
      {"delete", PostProcessAction::DELETE},
      {"keepandmark", PostProcessAction::KEEP_AND_MARK},
      {"keepandreprocess", PostProcessAction::KEEP_AND_REPROCESS},
      // Тестовый режим: файлы остаются на месте
      {"test", PostProcessAction::KEEP_AND_REPROCESS},
  };
  return lookup(table, value);
}

std::optional<WriteMode> parseWriteMode(const std::string &value) {
  static const std::unordered_map<std::string, WriteMode> table = {
      {"directly", WriteMode::DIRECT},
      {"direct", WriteMode::DIRECT},
      {"createtempfile", WriteMode::TEMP_THEN_RENAME},
      {"tempthenrename", WriteMode::TEMP_THEN_RENAME},
  };
  return lookup(table, value);
}

std::optional<OutputNamingMode> parseOutputNamingMode(
    const std::string &value) {
  static const std::unordered_map<std::string, OutputNamingMode> table = {
      {"useoriginal", OutputNamingMode::ORIGINAL},
      {"original", OutputNamingMode::ORIGINAL},
      {"addtimestamp", OutputNamingMode::TIMESTAMPED},
      {"timestamped", OutputNamingMode::TIMESTAMPED},
      {"custom", OutputNamingMode::CUSTOM_PATTERN},
      {"custompattern", OutputNamingMode::CUSTOM_PATTERN},
  };
  return lookup(table, value);
}

std::optional<EmptyFileHandling> parseEmptyFileHandling(
    const std::string &value) {
  static const std::unordered_map<std::string, EmptyFileHandling> table = {
      {"donotcreatemessage", EmptyFileHandling::DO_NOT_CREATE_MESSAGE},
      {"skipemptyfiles", EmptyFileHandling::SKIP},
      {"skip", EmptyFileHandling::SKIP},
      {"processemptyfiles", EmptyFileHandling::PROCESS},
      {"process", EmptyFileHandling::PROCESS},
  };
  return lookup(table, value);
}

std::optional<EmptyMessageHandling> parseEmptyMessageHandling(
    const std::string &value) {
  static const std::unordered_map<std::string, EmptyMessageHandling> table = {
      {"writeemptyfile", EmptyMessageHandling::WRITE_EMPTY_FILE},
      {"skipemptymessages", EmptyMessageHandling::SKIP_EMPTY},
      {"skipempty", EmptyMessageHandling::SKIP_EMPTY},
  };
  return lookup(table, value);
}

std::string toString(PostProcessAction action) {
  switch (action) {
    case PostProcessAction::ARCHIVE:
      return "ARCHIVE";
    case PostProcessAction::DELETE:
      return "DELETE";
    case PostProcessAction::KEEP_AND_MARK:
      return "KEEP_AND_MARK";
    case PostProcessAction::KEEP_AND_REPROCESS:
      return "KEEP_AND_REPROCESS";
  }
  return "ARCHIVE";
}

std::string toString(WriteMode mode) {
  return mode == WriteMode::TEMP_THEN_RENAME ? "Create Temp File" : "Directly";
}

std::string toString(OutputNamingMode mode) {
  switch (mode) {
    case OutputNamingMode::ORIGINAL:
      return "UseOriginal";
    case OutputNamingMode::TIMESTAMPED:
      return "AddTimestamp";
    case OutputNamingMode::CUSTOM_PATTERN:
      return "Custom";
  }
  return "UseOriginal";
}

std::string toString(EmptyFileHandling handling) {
  switch (handling) {
    case EmptyFileHandling::DO_NOT_CREATE_MESSAGE:
      return "DoNotCreateMessage";
    case EmptyFileHandling::SKIP:
      return "SkipEmptyFiles";
    case EmptyFileHandling::PROCESS:
      return "ProcessEmptyFiles";
  }
  return "DoNotCreateMessage";
}

std::string toString(EmptyMessageHandling handling) {
  return handling == EmptyMessageHandling::SKIP_EMPTY ? "SkipEmptyMessages"
                                                      : "WriteEmptyFile";
}

std::string toString(ValidationDecision decision) {
  switch (decision) {
    case ValidationDecision::ACCEPT:
      return "ACCEPT";
    case ValidationDecision::REJECT:
      return "REJECT";
    case ValidationDecision::REJECT_QUARANTINE:
      return "REJECT_QUARANTINE";
  }
  return "REJECT";
}

std::string toString(ValidationCategory category) {
  switch (category) {
    case ValidationCategory::FORMAT:
      return "format";
    case ValidationCategory::SIZE:
      return "size";
    case ValidationCategory::NAME:
      return "name";
    case ValidationCategory::CONTENT:
      return "content";
    case ValidationCategory::PERMISSION:
      return "permission";
    case ValidationCategory::TIMESTAMP:
      return "timestamp";
    case ValidationCategory::LOCK_STATUS:
      return "lock-status";
    case ValidationCategory::UNKNOWN:
      return "unknown";
  }
  return "unknown";
}

std::string toString(DeliveryStatus status) {
  return status == DeliveryStatus::SUCCESS ? "SUCCESS" : "FAILED";
}

// ============= TransferUnit =============

TransferUnit::TransferUnit(std::string fileName, fs::path originalPath,
                           PostProcessAction postProcessAction,
                           std::string archiveDirectory)
    : fileName_(std::move(fileName)),
      originalPath_(std::move(originalPath)),
      postProcessAction_(postProcessAction),
      archiveDirectory_(std::move(archiveDirectory)) {}

void TransferUnit::setContent(std::shared_ptr<const std::vector<char>> content,
                              std::string sha256) {
  if (content_) {
    throw std::logic_error("Content of '" + fileName_ + "' is already set");
  }
  if (!content) {
    throw std::invalid_argument("Content of '" + fileName_ +
                                "' cannot be null");
  }
  content_ = std::move(content);
  sizeBytes_ = content_->size();
  sha256_ = std::move(sha256);
  status_ = ReadStatus::READ_SUCCESS;
  errorMessage_.clear();
}

void TransferUnit::markReadFailed(const std::string &error) {
  status_ = ReadStatus::READ_FAILED;
  errorMessage_ = error;
}

const std::vector<char> &TransferUnit::content() const {
  static const std::vector<char> empty;
  return content_ ? *content_ : empty;
}
