/**
 * @file validationrules.cpp
 * @brief Реализация пользовательских правил валидации
 */

#include "../include/validationrules.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

/// Целое число из params; nullopt при отсутствии, ошибка - при неверном типе
std::optional<long long> optionalInteger(const nlohmann::json &params,
                                         const std::string &key,
                                         std::string &warning) {
  if (!params.contains(key) || params[key].is_null()) return std::nullopt;
  if (!params[key].is_number_integer()) {
    warning = "'" + key + "' must be an integer";
    return std::nullopt;
  }
  return params[key].get<long long>();
}

std::string optionalString(const nlohmann::json &params,
                           const std::string &key) {
  if (params.contains(key) && params[key].is_string()) {
    return params[key].get<std::string>();
  }
  return "";
}

}  // namespace

// ============= ValidationRule =============

ValidationRule::ValidationRule(std::string type, RuleSeverity severity,
                               std::string errorMessage)
    : type_(std::move(type)),
      severity_(severity),
      errorMessage_(std::move(errorMessage)) {}

RuleResult ValidationRule::fail(ValidationCategory category,
                                const std::string &defaultMessage) const {
  RuleResult result;
  result.passed = false;
  result.category = category;
  result.message = errorMessage_.empty() ? defaultMessage : errorMessage_;
  return result;
}

// ============= filename_regex =============

FilenameRegexRule::FilenameRegexRule(const ValidationRuleConfig &config,
                                     std::string pattern)
    : ValidationRule(config.type, config.severity, config.errorMessage),
      pattern_(std::move(pattern)),
      regex_(pattern_) {}

RuleResult FilenameRegexRule::evaluate(const FileCandidate &file,
                                       const std::vector<char> &) const {
  if (std::regex_match(file.name, regex_)) return {};
  return fail(ValidationCategory::NAME, "Filename '" + file.name +
                                            "' does not match pattern '" +
                                            pattern_ + "'");
}

// ============= file_size_range =============

FileSizeRangeRule::FileSizeRangeRule(const ValidationRuleConfig &config,
                                     long long minSize, long long maxSize)
    : ValidationRule(config.type, config.severity, config.errorMessage),
      minSize_(minSize),
      maxSize_(maxSize) {}

RuleResult FileSizeRangeRule::evaluate(const FileCandidate &,
                                       const std::vector<char> &content) const {
  const auto size = static_cast<long long>(content.size());
  if (size < minSize_) {
    return fail(ValidationCategory::SIZE,
                "File size " + std::to_string(size) +
                    " bytes is below minimum " + std::to_string(minSize_) +
                    " bytes");
  }
  if (maxSize_ >= 0 && size > maxSize_) {
    return fail(ValidationCategory::SIZE,
                "File size " + std::to_string(size) +
                    " bytes exceeds maximum " + std::to_string(maxSize_) +
                    " bytes");
  }
  return {};
}

// ============= content_contains / content_excludes =============

ContentTextRule::ContentTextRule(const ValidationRuleConfig &config,
                                 std::string text, bool caseInsensitive,
                                 bool mustContain)
    : ValidationRule(config.type, config.severity, config.errorMessage),
      text_(caseInsensitive ? toLower(text) : std::move(text)),
      caseInsensitive_(caseInsensitive),
      mustContain_(mustContain) {}

RuleResult ContentTextRule::evaluate(const FileCandidate &file,
                                     const std::vector<char> &content) const {
  if (content.size() > kMaxScannedContent) {
    RuleResult skipped;
    skipped.message = "Content of '" + file.name +
                      "' is too large to scan for text rule " + type();
    skipped.category = ValidationCategory::CONTENT;
    return skipped;
  }

  std::string haystack(content.begin(), content.end());
  if (caseInsensitive_) haystack = toLower(std::move(haystack));

  const bool found = haystack.find(text_) != std::string::npos;
  if (mustContain_ && !found) {
    return fail(ValidationCategory::CONTENT,
                "File content does not contain required text '" + text_ + "'");
  }
  if (!mustContain_ && found) {
    return fail(ValidationCategory::CONTENT,
                "File content contains forbidden text '" + text_ + "'");
  }
  return {};
}

// ============= header_validation =============

HeaderValidationRule::HeaderValidationRule(const ValidationRuleConfig &config,
                                           std::string expectedHeader,
                                           int linesToCheck)
    : ValidationRule(config.type, config.severity, config.errorMessage),
      expectedHeader_(std::move(expectedHeader)),
      linesToCheck_(linesToCheck) {}

RuleResult HeaderValidationRule::evaluate(
    const FileCandidate &, const std::vector<char> &content) const {
  std::istringstream stream(std::string(content.begin(), content.end()));
  std::string line;
  for (int i = 0; i < linesToCheck_ && std::getline(stream, line); ++i) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find(expectedHeader_) != std::string::npos) return {};
  }
  return fail(ValidationCategory::FORMAT,
              "Expected header '" + expectedHeader_ + "' not found in first " +
                  std::to_string(linesToCheck_) + " lines");
}

// ============= line_count =============

LineCountRule::LineCountRule(const ValidationRuleConfig &config,
                             long long minLines, long long maxLines)
    : ValidationRule(config.type, config.severity, config.errorMessage),
      minLines_(minLines),
      maxLines_(maxLines) {}

long long LineCountRule::countLines(const std::vector<char> &content) {
  if (content.empty()) return 0;
  long long lines = std::count(content.begin(), content.end(), '\n');
  if (content.back() != '\n') ++lines;
  return lines;
}

RuleResult LineCountRule::evaluate(const FileCandidate &,
                                   const std::vector<char> &content) const {
  const long long lines = countLines(content);
  if (lines < minLines_) {
    return fail(ValidationCategory::CONTENT,
                "File has " + std::to_string(lines) +
                    " lines, minimum is " + std::to_string(minLines_));
  }
  if (maxLines_ >= 0 && lines > maxLines_) {
    return fail(ValidationCategory::CONTENT,
                "File has " + std::to_string(lines) +
                    " lines, maximum is " + std::to_string(maxLines_));
  }
  return {};
}

// ============= ValidationRuleFactory =============

std::unique_ptr<ValidationRule> ValidationRuleFactory::create(
    const ValidationRuleConfig &config, std::string &warning) {
  const auto &params = config.params;
  warning.clear();

  if (config.type == "filename_regex") {
    const std::string pattern = optionalString(params, "pattern");
    if (pattern.empty()) {
      warning = "filename_regex rule requires 'pattern'";
      return nullptr;
    }
    try {
      return std::make_unique<FilenameRegexRule>(config, pattern);
    } catch (const std::regex_error &e) {
      warning = "Invalid regex '" + pattern + "': " + e.what();
      return nullptr;
    }
  }

  if (config.type == "file_size_range") {
    auto minSize = optionalInteger(params, "minSize", warning);
    auto maxSize = optionalInteger(params, "maxSize", warning);
    if (!warning.empty()) return nullptr;
    if (!minSize && !maxSize) {
      warning = "file_size_range rule requires 'minSize' or 'maxSize'";
      return nullptr;
    }
    if (minSize.value_or(0) < 0 || maxSize.value_or(0) < 0) {
      warning = "file_size_range bounds cannot be negative";
      return nullptr;
    }
    if (minSize && maxSize && *minSize > *maxSize) {
      warning = "file_size_range 'minSize' is greater than 'maxSize'";
      return nullptr;
    }
    return std::make_unique<FileSizeRangeRule>(config, minSize.value_or(0),
                                               maxSize.value_or(-1));
  }

  if (config.type == "content_contains" || config.type == "content_excludes") {
    const std::string text = optionalString(params, "text");
    if (text.empty()) {
      warning = config.type + " rule requires 'text'";
      return nullptr;
    }
    const bool caseInsensitive = params.contains("caseInsensitive") &&
                                 params["caseInsensitive"].is_boolean() &&
                                 params["caseInsensitive"].get<bool>();
    return std::make_unique<ContentTextRule>(
        config, text, caseInsensitive, config.type == "content_contains");
  }

  if (config.type == "header_validation") {
    const std::string header = optionalString(params, "expectedHeader");
    if (header.empty()) {
      warning = "header_validation rule requires 'expectedHeader'";
      return nullptr;
    }
    auto lines = optionalInteger(params, "linesToCheck", warning);
    if (!warning.empty()) return nullptr;
    const long long linesToCheck = lines.value_or(1);
    if (linesToCheck < 1 || linesToCheck > 100) {
      warning = "header_validation 'linesToCheck' must be within 1..100";
      return nullptr;
    }
    return std::make_unique<HeaderValidationRule>(
        config, header, static_cast<int>(linesToCheck));
  }

  if (config.type == "line_count") {
    auto minLines = optionalInteger(params, "minLines", warning);
    auto maxLines = optionalInteger(params, "maxLines", warning);
    if (!warning.empty()) return nullptr;
    if (!minLines && !maxLines) {
      warning = "line_count rule requires 'minLines' or 'maxLines'";
      return nullptr;
    }
    if (minLines.value_or(0) < 0 || maxLines.value_or(0) < 0) {
      warning = "line_count bounds cannot be negative";
      return nullptr;
    }
    return std::make_unique<LineCountRule>(config, minLines.value_or(0),
                                           maxLines.value_or(-1));
  }

  warning = "Unknown validation rule type '" + config.type + "'";
  return nullptr;
}
