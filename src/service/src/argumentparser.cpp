/**
 * @file argumentparser.cpp
 * @brief Реализация парсера аргументов командной строки
 */

#include "../include/argumentparser.hpp"

#include <algorithm>

using namespace std;

const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

const vector<string> ArgumentParser::validLogTypes = {"console", "sync_file"};

namespace {
bool hasOption(const string &arg, const string &name) {
  return arg == name || arg.compare(0, name.size() + 1, name + "=") == 0;
}
}  // namespace

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--version" || arg == "-v") {
      args.version_message = true;
    } else if (arg == "--once") {
      args.run_once = true;
    } else if (hasOption(arg, "--override")) {
      parseOverride(arg, args);
    } else if (hasOption(arg, "--log-type")) {
      parseLogType(takeValue(arg, "--log-type", i, argc, argv), args);
    } else if (hasOption(arg, "--log-level")) {
      parseLogLevel(takeValue(arg, "--log-level", i, argc, argv), args);
    } else if (hasOption(arg, "--config-file")) {
      args.config_path = takeValue(arg, "--config-file", i, argc, argv);
    } else if (hasOption(arg, "--environment")) {
      args.environment = takeValue(arg, "--environment", i, argc, argv);
    } else {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    }
  }

  return args;
}

string ArgumentParser::takeValue(const string &arg, const string &name,
                                 int &i, int argc, char **argv) {
  size_t eqPos = arg.find('=');
  string value;

  if (eqPos != string::npos) {
    value = arg.substr(eqPos + 1);
  } else if (i + 1 < argc) {
    value = argv[++i];
  } else {
    throw invalid_argument("ArgumentParser: " + name + " requires a value");
  }

  if (value.empty()) {
    throw invalid_argument("ArgumentParser: " + name + " requires a value");
  }
  return value;
}

void ArgumentParser::parseOverride(const string &arg, ParsedArgs &args) {
  size_t eqPos = arg.find('=');
  if (eqPos == string::npos) {
    throw invalid_argument(
        "ArgumentParser: Invalid override format. Use --override=key:value");
  }

  string overrideStr = arg.substr(eqPos + 1);
  size_t colonPos = overrideStr.find(':');
  if (colonPos == string::npos || colonPos == 0) {
    throw invalid_argument(
        "ArgumentParser: Invalid override format. Use key:value");
  }

  string key = overrideStr.substr(0, colonPos);
  string value = overrideStr.substr(colonPos + 1);
  args.overrides[key] = value;
}

void ArgumentParser::parseLogType(const string &value, ParsedArgs &args) {
  string rest = value;
  size_t pos = 0;
  while ((pos = rest.find(',')) != string::npos) {
    args.logger_types.push_back(rest.substr(0, pos));
    rest.erase(0, pos + 1);
  }
  if (!rest.empty()) {
    args.logger_types.push_back(rest);
  }

  for (const auto &type : args.logger_types) {
    if (find(validLogTypes.begin(), validLogTypes.end(), type) ==
        validLogTypes.end()) {
      throw invalid_argument("ArgumentParser: Invalid logger type: " + type);
    }
  }
  args.use_cli_logging = true;
}

void ArgumentParser::parseLogLevel(const string &value, ParsedArgs &args) {
  if (find(validLogLevels.begin(), validLogLevels.end(), value) ==
      validLogLevels.end()) {
    throw invalid_argument("ArgumentParser: Invalid log level: " + value);
  }
  args.log_level = value;
}

string ArgumentParser::helpText() {
  return "Usage: filebridge [options]\n"
         "  -h, --help                 Show this help and exit\n"
         "  -v, --version              Show version and exit\n"
         "  --config-file <path>       Configuration file (default "
         "filebridge.json)\n"
         "  --environment <name>       Environment section (default "
         "production)\n"
         "  --override=<key>:<value>   Override a configuration value, key is "
         "a dotted path\n"
         "  --log-type <types>         Comma-separated: console,sync_file\n"
         "  --log-level <level>        debug|info|warning|error|critical\n"
         "  --once                     Run every enabled flow once and exit\n";
}
