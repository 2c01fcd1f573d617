/**
 * @file globmatcher.cpp
 * @brief Преобразование glob-маски в регулярное выражение
 */

#include "../include/globmatcher.hpp"

#include <stdexcept>

GlobMatcher::GlobMatcher(const std::string &pattern) : pattern_(pattern) {
  if (pattern.empty()) {
    throw std::invalid_argument("Glob pattern cannot be empty");
  }
  try {
    regex_ = std::regex(toRegex(pattern), std::regex::ECMAScript);
  } catch (const std::regex_error &e) {
    throw std::invalid_argument("Invalid glob pattern '" + pattern +
                                "': " + e.what());
  }
}

bool GlobMatcher::matches(const std::string &fileName) const {
  return std::regex_match(fileName, regex_);
}

bool GlobMatcher::isValid(const std::string &pattern) {
  try {
    GlobMatcher matcher(pattern);
    return true;
  } catch (const std::invalid_argument &) {
    return false;
  }
}

std::string GlobMatcher::toRegex(const std::string &pattern) {
  std::string regex;
  regex.reserve(pattern.size() * 2);
  bool inBraces = false;

  for (size_t i = 0; i < pattern.size(); ++i) {
    const char c = pattern[i];
    switch (c) {
      case '*':
        regex += ".*";
        break;
      case '?':
        regex += '.';
        break;
      case '[': {
        size_t end = i + 1;
        if (end < pattern.size() && (pattern[end] == '!' || pattern[end] == '^'))
          ++end;
        if (end < pattern.size() && pattern[end] == ']') ++end;
        while (end < pattern.size() && pattern[end] != ']') ++end;
        if (end >= pattern.size()) {
          throw std::invalid_argument("Unclosed '[' in glob pattern '" +
                                      pattern + "'");
        }
        std::string cls = pattern.substr(i + 1, end - i - 1);
        regex += '[';
        size_t k = 0;
        if (!cls.empty() && (cls[0] == '!' || cls[0] == '^')) {
          regex += '^';
          k = 1;
        }
        for (; k < cls.size(); ++k) {
          if (cls[k] == '\\' || cls[k] == '[' || cls[k] == ']' ||
              cls[k] == '^') {
            regex += '\\';
          }
          regex += cls[k];
        }
        regex += ']';
        i = end;
        break;
      }
      case '{':
        if (inBraces) {
          throw std::invalid_argument("Nested '{' in glob pattern '" +
                                      pattern + "'");
        }
        inBraces = true;
        regex += "(?:";
        break;
      case '}':
        if (!inBraces) {
          regex += "\\}";
        } else {
          inBraces = false;
          regex += ')';
        }
        break;
      case ',':
        regex += inBraces ? "|" : ",";
        break;
      case '.':
      case '+':
      case '(':
      case ')':
      case '^':
      case '$':
      case '|':
      case '\\':
      case ']':
        regex += '\\';
        regex += c;
        break;
      default:
        regex += c;
    }
  }

  if (inBraces) {
    throw std::invalid_argument("Unclosed '{' in glob pattern '" + pattern +
                                "'");
  }
  return regex;
}
