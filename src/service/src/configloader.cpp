/**
 * @file configloader.cpp
 * @brief Чтение JSON-файла конфигурации
 */

#include "../include/configloader.hpp"

#include <filesystem>
#include <fstream>

#include "fbr/compositelogger.hpp"

nlohmann::json ConfigLoader::loadFromFile(const std::string &path) {
  if (std::filesystem::is_directory(path)) {
    throw std::runtime_error("Config path is a directory: " + path);
  }

  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  nlohmann::json config;
  try {
    config = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/true,
                                   /*ignore_comments=*/true);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("Invalid JSON in " + path + " (byte " +
                             std::to_string(e.byte) + "): " + e.what());
  }

  if (!config.is_object()) {
    throw std::runtime_error("Config root in " + path +
                             " must be a JSON object");
  }

  lastLoadedFile_ = path;
  fbr::CompositeLogger::instance().debug("Configuration loaded from " + path);
  return config;
}
