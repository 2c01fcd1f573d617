#include "fbr/compositelogger.hpp"

#include <algorithm>

namespace fbr {

CompositeLogger& CompositeLogger::instance() {
  static CompositeLogger instance;
  return instance;
}

void CompositeLogger::addLogger(const std::shared_ptr<ILogger>& logger) {
  if (!logger) return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(loggers_.begin(), loggers_.end(), logger) == loggers_.end()) {
    loggers_.push_back(logger);
  }
}

void CompositeLogger::removeLogger(const std::shared_ptr<ILogger>& logger) {
  std::lock_guard<std::mutex> lock(mutex_);
  loggers_.erase(std::remove(loggers_.begin(), loggers_.end(), logger),
                 loggers_.end());
}

void CompositeLogger::clearLoggers() {
  std::lock_guard<std::mutex> lock(mutex_);
  loggers_.clear();
}

std::size_t CompositeLogger::loggerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loggers_.size();
}

std::vector<std::shared_ptr<ILogger>> CompositeLogger::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return loggers_;
}

void CompositeLogger::init(const LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
  for (auto& logger : snapshot()) logger->init(level);
}

void CompositeLogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
  for (auto& logger : snapshot()) logger->setLogLevel(level);
}

void CompositeLogger::flush() {
  for (auto& logger : snapshot()) logger->flush();
}

void CompositeLogger::debug(const std::string& message) {
  for (auto& logger : snapshot()) logger->debug(message);
}

void CompositeLogger::info(const std::string& message) {
  for (auto& logger : snapshot()) logger->info(message);
}

void CompositeLogger::warning(const std::string& message) {
  for (auto& logger : snapshot()) logger->warning(message);
}

void CompositeLogger::error(const std::string& message) {
  for (auto& logger : snapshot()) logger->error(message);
}

void CompositeLogger::critical(const std::string& message) {
  for (auto& logger : snapshot()) logger->critical(message);
}

void CompositeLogger::log(LogLevel level, const std::string& message) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      debug(message);
      break;
    case LogLevel::LOG_INFO:
      info(message);
      break;
    case LogLevel::LOG_WARNING:
      warning(message);
      break;
    case LogLevel::LOG_ERROR:
      error(message);
      break;
    case LogLevel::LOG_CRITICAL:
      critical(message);
      break;
  }
}

bool CompositeLogger::shouldSkipLog(LogLevel) const {
  // фильтрацию выполняют вложенные логгеры
  return false;
}

}  // namespace fbr
