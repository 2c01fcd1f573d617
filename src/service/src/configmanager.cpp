#include "../include/configmanager.hpp"

#include <stdexcept>

#include "fbr/compositelogger.hpp"

ConfigManager &ConfigManager::instance() {
  static ConfigManager instance;
  return instance;
}

void ConfigManager::initialize(const std::string &filename) {
  std::lock_guard<std::mutex> lock(configMutex_);

  try {
    nlohmann::json config = loader_.loadFromFile(filename);
    envProcessor_.process(config);
    validator_.validateRoot(config);

    baseConfig_ = std::move(config);
    configFilePath_ = filename;
    cache_.clear();
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Config initialization failed: ") +
                             e.what());
  }
}

nlohmann::json ConfigManager::getMergedConfig(const std::string &env) const {
  std::lock_guard<std::mutex> lock(configMutex_);

  if (auto it = cache_.find(env); it != cache_.end()) {
    return it->second;
  }

  if (baseConfig_.is_null()) {
    throw std::runtime_error("Configuration is not loaded");
  }
  if (!baseConfig_["environments"].contains(env)) {
    throw std::runtime_error("Environment '" + env + "' not found");
  }

  nlohmann::json merged = baseConfig_["defaults"];
  merged.merge_patch(baseConfig_["environments"][env]);

  if (merged.contains("flows")) validator_.validateFlows(merged["flows"]);
  if (merged.contains("logging")) validator_.validateLogging(merged["logging"]);

  cache_[env] = merged;
  return merged;
}

std::vector<FlowConfig> ConfigManager::getFlowConfigs(
    const std::string &env) const {
  const auto merged = getMergedConfig(env);
  std::vector<FlowConfig> flows;

  if (!merged.contains("flows")) {
    fbr::CompositeLogger::instance().warning(
        "No flows configured for environment '" + env + "'");
    return flows;
  }

  for (const auto &flow : merged["flows"]) {
    flows.push_back(FlowConfig::fromJson(flow));
  }
  return flows;
}

nlohmann::json ConfigManager::getLoggingConfig(const std::string &env) const {
  const auto merged = getMergedConfig(env);
  return merged.value("logging", nlohmann::json::array());
}

void ConfigManager::applyCliOverrides(
    const std::unordered_map<std::string, std::string> &overrides) {
  std::lock_guard<std::mutex> lock(configMutex_);

  nlohmann::json patched = baseConfig_;
  for (const auto &[key, value] : overrides) {
    if (key.empty()) {
      throw std::runtime_error("Override key cannot be empty");
    }

    std::string pointer = "/" + key;
    for (auto &c : pointer) {
      if (c == '.') c = '/';
    }

    nlohmann::json parsed =
        nlohmann::json::parse(value, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) parsed = value;

    nlohmann::json patch;
    patch[nlohmann::json::json_pointer(pointer)] = parsed;
    patched.merge_patch(patch);

    fbr::CompositeLogger::instance().info("Config override applied: " + key);
  }

  validator_.validateRoot(patched);
  baseConfig_ = std::move(patched);
  cache_.clear();
}

std::string ConfigManager::getConfigFilePath() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return configFilePath_;
}
