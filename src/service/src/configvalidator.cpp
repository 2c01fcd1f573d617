/**
 * @file configvalidator.cpp
 * @brief Реализация валидатора структуры JSON-конфигурации
 */
#include "../include/configvalidator.hpp"

#include <algorithm>
#include <set>
#include <vector>

using namespace std;

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
  if (!config.is_object()) {
    throw runtime_error("ConfigValidator: Root must be an object");
  }

  const vector<string> required_sections = {"defaults", "environments"};

  for (const auto &section : required_sections) {
    if (!config.contains(section) || !config[section].is_object()) {
      throw runtime_error("ConfigValidator: Missing required section: " +
                          section);
    }
  }

  if (config["defaults"].contains("flows")) {
    validateFlows(config["defaults"]["flows"]);
  }
  if (config["defaults"].contains("logging")) {
    validateLogging(config["defaults"]["logging"]);
  }

  return true;
}

bool ConfigValidator::validateFlows(const nlohmann::json &flows) const {
  if (!flows.is_array()) {
    throw runtime_error("ConfigValidator: Flows must be an array");
  }

  const vector<string> required_fields = {"name", "sourceDirectory",
                                          "targetDirectory"};
  set<string> names;

  for (const auto &flow : flows) {
    if (!flow.is_object()) {
      throw runtime_error("ConfigValidator: Flow entry must be an object");
    }

    for (const auto &field : required_fields) {
      if (!flow.contains(field)) {
        throw runtime_error("ConfigValidator: Missing required field in flow: " +
                            field);
      }
      if (!flow[field].is_string()) {
        throw runtime_error("ConfigValidator: Field '" + field +
                            "' must be a string");
      }
    }

    const string name = flow["name"].get<string>();
    if (!names.insert(name).second) {
      throw runtime_error("ConfigValidator: Duplicate flow name: " + name);
    }

    if (flow.contains("customValidationRules") &&
        !flow["customValidationRules"].is_array()) {
      throw runtime_error(
          "ConfigValidator: customValidationRules must be an array in flow " +
          name);
    }
  }
  return true;
}

bool ConfigValidator::validateLogging(const nlohmann::json &logging) const {
  if (!logging.is_array()) {
    throw runtime_error("ConfigValidator: Logging config must be an array");
  }

  const vector<string> valid_types = {"console", "sync_file"};

  for (const auto &logger : logging) {
    if (!logger.is_object()) {
      throw runtime_error("ConfigValidator: Logger entry must be an object");
    }

    if (!logger.contains("type") || !logger["type"].is_string()) {
      throw runtime_error("ConfigValidator: Logger missing type field");
    }

    const string type = logger["type"].get<string>();
    if (find(valid_types.begin(), valid_types.end(), type) ==
        valid_types.end()) {
      throw runtime_error("ConfigValidator: Invalid logger type: " + type);
    }

    if (logger.contains("level") && !logger["level"].is_string()) {
      throw runtime_error("ConfigValidator: Invalid log level type");
    }

    if (type == "sync_file" &&
        (!logger.contains("file") || !logger["file"].is_string())) {
      throw runtime_error("ConfigValidator: File logger missing file path");
    }
  }
  return true;
}
