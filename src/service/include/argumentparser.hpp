/**
 * @file argumentparser.hpp
 * @brief Разбор аргументов командной строки filebridge
 */

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

struct ParsedArgs {
  std::string config_path = "filebridge.json";
  std::unordered_map<std::string, std::string> overrides;
  std::vector<std::string> logger_types;
  std::optional<std::string> log_level;
  std::string environment = "production";
  bool use_cli_logging = false;
  bool help_message = false;
  bool version_message = false;
  /// Однократный прогон всех потоков вместо режима службы
  bool run_once = false;
};

/**
 * @class ArgumentParser
 * @brief Разбор POSIX/GNU-аргументов: "--key value" и "--key=value"
 *
 * @throw std::invalid_argument Неизвестный аргумент или неверное значение
 */
class ArgumentParser {
 public:
  ParsedArgs parse(int argc, char **argv);

  static std::string helpText();

 private:
  static const std::vector<std::string> validLogLevels;
  static const std::vector<std::string> validLogTypes;

  std::string takeValue(const std::string &arg, const std::string &name,
                        int &i, int argc, char **argv);
  void parseOverride(const std::string &arg, ParsedArgs &args);
  void parseLogType(const std::string &value, ParsedArgs &args);
  void parseLogLevel(const std::string &value, ParsedArgs &args);
};
