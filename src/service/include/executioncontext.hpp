/**
 * @file executioncontext.hpp
 * @brief Контекст одного прогона между стороной сбора и стороной доставки
 *
 * @details
 * Создаётся заново на каждый прогон и не разделяется между прогонами.
 * Сторона сбора заполняет filesToProcess, сторона доставки выставляет
 * receiverProcessingSuccessful и successfulFiles. Прочие флаги передаются
 * через JSON-атрибуты, например "skipSenderPostProcessing".
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../include/transfertypes.hpp"

class ExecutionContext {
 public:
  static constexpr const char *kSkipPostProcessing = "skipSenderPostProcessing";

  explicit ExecutionContext(std::string flowName)
      : flowName_(std::move(flowName)) {}

  ExecutionContext(const ExecutionContext &) = delete;
  ExecutionContext &operator=(const ExecutionContext &) = delete;

  const std::string &flowName() const { return flowName_; }

  std::vector<TransferUnit> &filesToProcess() { return filesToProcess_; }
  const std::vector<TransferUnit> &filesToProcess() const {
    return filesToProcess_;
  }

  /// nullopt, пока доставка не выполнялась
  std::optional<bool> receiverProcessingSuccessful() const {
    return receiverProcessingSuccessful_;
  }
  void setReceiverProcessingSuccessful(bool value) {
    receiverProcessingSuccessful_ = value;
  }

  const std::vector<std::string> &successfulFiles() const {
    return successfulFiles_;
  }
  void addSuccessfulFile(const std::string &fileName) {
    successfulFiles_.push_back(fileName);
  }

  nlohmann::json &attributes() { return attributes_; }
  const nlohmann::json &attributes() const { return attributes_; }

  /// Булев атрибут; def при отсутствии или неверном типе
  bool flag(const std::string &key, bool def = false) const {
    auto it = attributes_.find(key);
    if (it == attributes_.end() || !it->is_boolean()) return def;
    return it->get<bool>();
  }

 private:
  std::string flowName_;
  std::vector<TransferUnit> filesToProcess_;
  std::optional<bool> receiverProcessingSuccessful_;
  std::vector<std::string> successfulFiles_;
  nlohmann::json attributes_ = nlohmann::json::object();
};
