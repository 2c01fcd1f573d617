#include "../include/enviromentprocessor.hpp"

#include <cstdlib>

#include "fbr/compositelogger.hpp"

namespace {

constexpr const char *kPrefix = "$ENV{";
constexpr std::size_t kPrefixLength = 5;
constexpr const char *kDefaultSeparator = ":-";

}  // namespace

void EnvironmentProcessor::process(nlohmann::json &config) const {
  if (config.is_string()) {
    config = expand(config.get_ref<const std::string &>());
    return;
  }
  if (config.is_structured()) {
    for (auto &child : config) process(child);
  }
}

std::string EnvironmentProcessor::expand(const std::string &value) const {
  std::string result;
  std::size_t pos = 0;

  while (true) {
    const std::size_t start = value.find(kPrefix, pos);
    const std::size_t end =
        start == std::string::npos ? start : value.find('}', start);
    if (end == std::string::npos) {
      result.append(value, pos, std::string::npos);
      return result;
    }

    result.append(value, pos, start - pos);
    const std::string body =
        value.substr(start + kPrefixLength, end - start - kPrefixLength);

    std::string name = body;
    const std::string *fallback = nullptr;
    std::string defaultValue;
    const std::size_t sep = body.find(kDefaultSeparator);
    if (sep != std::string::npos) {
      name = body.substr(0, sep);
      defaultValue = body.substr(sep + 2);
      fallback = &defaultValue;
    }

    const char *env = std::getenv(name.c_str());
    if (env && (*env != '\0' || !fallback)) {
      result += env;
    } else if (fallback) {
      result += *fallback;
    } else {
      result.append(value, start, end - start + 1);
      if (reportedMissing_.insert(name).second) {
        fbr::CompositeLogger::instance().warning(
            "Environment variable '" + name +
            "' is not set, reference left unresolved");
      }
    }
    pos = end + 1;
  }
}
