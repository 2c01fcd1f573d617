/**
 * @file flowconfig.cpp
 * @brief Разбор и проверка конфигурации потока
 */

#include "../include/flowconfig.hpp"

#include <limits>
#include <stdexcept>

#include "../include/globmatcher.hpp"
#include "fbr/compositelogger.hpp"

namespace {

std::string getString(const nlohmann::json &src, const std::string &key,
                      const std::string &def = "") {
  if (!src.contains(key) || src[key].is_null()) return def;
  if (!src[key].is_string()) {
    throw std::invalid_argument("'" + key + "' must be a string");
  }
  return src[key].get<std::string>();
}

bool getBool(const nlohmann::json &src, const std::string &key, bool def) {
  if (!src.contains(key) || src[key].is_null()) return def;
  if (src[key].is_boolean()) return src[key].get<bool>();
  // Значения из --override приходят строками
  if (src[key].is_string()) {
    const std::string value = normalizeEnumLiteral(src[key].get<std::string>());
    if (value == "true") return true;
    if (value == "false") return false;
  }
  throw std::invalid_argument("'" + key + "' must be a boolean");
}

long long getInteger(const nlohmann::json &src, const std::string &key,
                     long long def) {
  if (!src.contains(key) || src[key].is_null()) return def;
  if (src[key].is_number_unsigned() &&
      src[key].get<unsigned long long>() >
          static_cast<unsigned long long>(
              std::numeric_limits<long long>::max())) {
    throw std::invalid_argument("'" + key + "' is out of range");
  }
  if (src[key].is_number_integer()) return src[key].get<long long>();
  if (src[key].is_string()) {
    try {
      size_t pos = 0;
      const std::string text = src[key].get<std::string>();
      long long value = std::stoll(text, &pos);
      if (pos == text.size()) return value;
    } catch (const std::logic_error &) {
      // ниже общее сообщение об ошибке
    }
  }
  throw std::invalid_argument("'" + key + "' must be an integer");
}

int getInt(const nlohmann::json &src, const std::string &key, int def) {
  const long long value = getInteger(src, key, def);
  if (value < std::numeric_limits<int>::min() ||
      value > std::numeric_limits<int>::max()) {
    throw std::invalid_argument("'" + key + "' is out of range");
  }
  return static_cast<int>(value);
}

template <typename Enum, typename Parser>
Enum getEnum(const nlohmann::json &src, const std::string &key, Enum def,
             Parser parser, const std::string &flowName) {
  const std::string raw = getString(src, key);
  if (raw.empty()) return def;
  if (auto parsed = parser(raw)) return *parsed;
  fbr::CompositeLogger::instance().warning(
      "Flow '" + flowName + "': unknown " + key + " '" + raw +
      "', using default " + toString(def));
  return def;
}

}  // namespace

// ============= ValidationRuleConfig =============

ValidationRuleConfig ValidationRuleConfig::fromJson(const nlohmann::json &src) {
  if (!src.is_object()) {
    throw std::invalid_argument("Validation rule must be an object");
  }

  ValidationRuleConfig rule;
  rule.type = getString(src, "type");
  rule.errorMessage = getString(src, "errorMessage");

  if (src.contains("severity")) {
    const std::string severity = normalizeEnumLiteral(getString(src, "severity"));
    if (severity == "warning" || severity == "warn") {
      rule.severity = RuleSeverity::WARNING;
    } else if (severity != "error") {
      fbr::CompositeLogger::instance().warning(
          "Unknown rule severity '" + severity + "', treating as error");
    }
  } else if (src.contains("required")) {
    rule.severity =
        getBool(src, "required", true) ? RuleSeverity::ERROR : RuleSeverity::WARNING;
  }

  for (auto it = src.begin(); it != src.end(); ++it) {
    if (it.key() == "type" || it.key() == "errorMessage" ||
        it.key() == "severity" || it.key() == "required") {
      continue;
    }
    rule.params[it.key()] = it.value();
  }
  return rule;
}

nlohmann::json ValidationRuleConfig::toJson() const {
  nlohmann::json j = params;
  j["type"] = type;
  j["severity"] = severity == RuleSeverity::ERROR ? "error" : "warning";
  if (!errorMessage.empty()) j["errorMessage"] = errorMessage;
  return j;
}

// ============= FlowConfig =============

FlowConfig FlowConfig::fromJson(const nlohmann::json &src) {
  if (!src.is_object()) {
    throw std::invalid_argument("Flow configuration must be an object");
  }

  FlowConfig config;

  try {
    // ============= Обязательные поля =============
    config.name = getString(src, "name");
    config.sourceDirectory = getString(src, "sourceDirectory");
    config.targetDirectory = getString(src, "targetDirectory");

    // ============= Опциональные поля =============
    config.enabled = getBool(src, "enabled", true);
    config.pollInterval =
        std::chrono::seconds(getInteger(src, "pollInterval", 30));
    config.filePattern = getString(src, "filePattern", "*");
    config.exclusionMask = getString(src, "exclusionMask");
    config.processReadOnlyFiles = getBool(src, "processReadOnlyFiles", false);
    config.maximumFileSize = getInteger(src, "maximumFileSize", 0);
    config.msecsToWaitBeforeModificationCheck =
        getInteger(src, "msecsToWaitBeforeModificationCheck", 0);
    config.archiveFaultySourceFiles =
        getBool(src, "archiveFaultySourceFiles", false);
    config.archiveErrorDirectory = getString(src, "archiveErrorDirectory");
    config.archiveDirectory = getString(src, "archiveDirectory");
    config.addTimestamp = getBool(src, "addTimestamp", false);
    config.customFilenamePattern = getString(src, "customFilenamePattern");
    config.maximumConcurrency = getInt(src, "maximumConcurrency", 1);

    // ============= Режимы =============
    config.emptyFileHandling =
        getEnum(src, "emptyFileHandling", EmptyFileHandling::DO_NOT_CREATE_MESSAGE,
                parseEmptyFileHandling, config.name);
    config.emptyMessageHandling = getEnum(
        src, "emptyMessageHandling", EmptyMessageHandling::WRITE_EMPTY_FILE,
        parseEmptyMessageHandling, config.name);
    config.outputFilenameMode =
        getEnum(src, "outputFilenameMode", OutputNamingMode::ORIGINAL,
                parseOutputNamingMode, config.name);
    config.writeMode = getEnum(src, "writeMode", WriteMode::DIRECT,
                               parseWriteMode, config.name);

    // postProcessAction имеет приоритет над устаревшим processingMode
    const std::string actionKey =
        src.contains("postProcessAction") ? "postProcessAction"
                                          : "processingMode";
    config.postProcessAction =
        getEnum(src, actionKey, PostProcessAction::ARCHIVE,
                parsePostProcessAction, config.name);
    if (normalizeEnumLiteral(getString(src, actionKey)) == "test") {
      fbr::CompositeLogger::instance().info(
          "Flow '" + config.name +
          "': test processing mode, source files are kept in place");
    }

    // ============= Пользовательские правила =============
    if (src.contains("customValidationRules")) {
      const auto &rules = src["customValidationRules"];
      if (!rules.is_array()) {
        throw std::invalid_argument("'customValidationRules' must be an array");
      }
      for (const auto &rule : rules) {
        config.customValidationRules.push_back(
            ValidationRuleConfig::fromJson(rule));
      }
    }

    config.validate();
  } catch (const std::invalid_argument &e) {
    throw std::invalid_argument("Invalid flow configuration '" + config.name +
                                "': " + e.what());
  }

  return config;
}

nlohmann::json FlowConfig::toJson() const {
  nlohmann::json j;

  j["name"] = name;
  j["sourceDirectory"] = sourceDirectory;
  j["targetDirectory"] = targetDirectory;

  j["enabled"] = enabled;
  j["pollInterval"] = pollInterval.count();
  j["filePattern"] = filePattern;
  if (!exclusionMask.empty()) j["exclusionMask"] = exclusionMask;
  j["processReadOnlyFiles"] = processReadOnlyFiles;
  j["maximumFileSize"] = maximumFileSize;
  j["msecsToWaitBeforeModificationCheck"] = msecsToWaitBeforeModificationCheck;
  j["emptyFileHandling"] = toString(emptyFileHandling);
  j["emptyMessageHandling"] = toString(emptyMessageHandling);
  j["postProcessAction"] = toString(postProcessAction);
  if (!archiveDirectory.empty()) j["archiveDirectory"] = archiveDirectory;
  j["addTimestamp"] = addTimestamp;
  j["archiveFaultySourceFiles"] = archiveFaultySourceFiles;
  if (!archiveErrorDirectory.empty())
    j["archiveErrorDirectory"] = archiveErrorDirectory;
  j["outputFilenameMode"] = toString(outputFilenameMode);
  if (!customFilenamePattern.empty())
    j["customFilenamePattern"] = customFilenamePattern;
  j["writeMode"] = toString(writeMode);
  j["maximumConcurrency"] = maximumConcurrency;

  if (!customValidationRules.empty()) {
    nlohmann::json rules = nlohmann::json::array();
    for (const auto &rule : customValidationRules) {
      rules.push_back(rule.toJson());
    }
    j["customValidationRules"] = rules;
  }

  return j;
}

void FlowConfig::validate() const {
  if (name.empty()) {
    throw std::invalid_argument("Flow name cannot be empty");
  }
  if (sourceDirectory.empty()) {
    throw std::invalid_argument("'sourceDirectory' cannot be empty");
  }
  if (targetDirectory.empty()) {
    throw std::invalid_argument("'targetDirectory' cannot be empty");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("'pollInterval' must be positive");
  }
  if (maximumFileSize < 0) {
    throw std::invalid_argument("'maximumFileSize' cannot be negative");
  }
  if (msecsToWaitBeforeModificationCheck < 0) {
    throw std::invalid_argument(
        "'msecsToWaitBeforeModificationCheck' cannot be negative");
  }
  if (maximumConcurrency < 1) {
    throw std::invalid_argument("'maximumConcurrency' must be at least 1");
  }
  if (!GlobMatcher::isValid(filePattern)) {
    throw std::invalid_argument("Invalid 'filePattern': " + filePattern);
  }
  if (!exclusionMask.empty() && !GlobMatcher::isValid(exclusionMask)) {
    throw std::invalid_argument("Invalid 'exclusionMask': " + exclusionMask);
  }
}
