/**
 * @file validationchain.cpp
 * @brief Реализация цепочки валидации
 */

#include "../include/validationchain.hpp"

#include <unistd.h>

#include "fbr/compositelogger.hpp"

ValidationChain::ValidationChain(const FlowConfig &config)
    : processReadOnlyFiles_(config.processReadOnlyFiles),
      maximumFileSize_(config.maximumFileSize),
      emptyFileHandling_(config.emptyFileHandling),
      stabilityGate_(std::chrono::milliseconds(
          config.msecsToWaitBeforeModificationCheck)) {
  if (!config.exclusionMask.empty()) {
    exclusionMatcher_.emplace(config.exclusionMask);
  }

  for (const auto &ruleConfig : config.customValidationRules) {
    std::string warning;
    auto rule = ValidationRuleFactory::create(ruleConfig, warning);
    if (rule) {
      rules_.push_back(std::move(rule));
    } else {
      fbr::CompositeLogger::instance().warning(
          "Flow '" + config.name + "': validation rule ignored: " + warning);
    }
  }
}

ValidationOutcome ValidationChain::precheck(const FileCandidate &file) const {
  for (auto check : {&ValidationChain::checkAccessible,
                     &ValidationChain::checkExclusion,
                     &ValidationChain::checkReadOnly, &ValidationChain::checkSize,
                     &ValidationChain::checkEmpty}) {
    if (auto rejection = (this->*check)(file)) {
      return *rejection;
    }
  }
  return ValidationOutcome::accept();
}

std::optional<ValidationOutcome> ValidationChain::checkAccessible(
    const FileCandidate &file) const {
  std::error_code ec;
  if (!fs::exists(file.path, ec)) {
    // Переносить нечего
    return ValidationOutcome::reject(ValidationDecision::REJECT,
                                     ValidationCategory::UNKNOWN,
                                     "File does not exist: " + file.name);
  }
  if (!fs::is_regular_file(file.path, ec)) {
    return ValidationOutcome::reject(ValidationDecision::REJECT_QUARANTINE,
                                     ValidationCategory::FORMAT,
                                     "Not a regular file: " + file.name);
  }
  if (::access(file.path.c_str(), R_OK) != 0) {
    return ValidationOutcome::reject(ValidationDecision::REJECT_QUARANTINE,
                                     ValidationCategory::PERMISSION,
                                     "File is not readable: " + file.name);
  }
  return std::nullopt;
}

std::optional<ValidationOutcome> ValidationChain::checkExclusion(
    const FileCandidate &file) const {
  if (exclusionMatcher_ && exclusionMatcher_->matches(file.name)) {
    return ValidationOutcome::reject(
        ValidationDecision::REJECT, ValidationCategory::NAME,
        "File matches exclusion mask '" + exclusionMatcher_->pattern() + "'");
  }
  return std::nullopt;
}

std::optional<ValidationOutcome> ValidationChain::checkReadOnly(
    const FileCandidate &file) const {
  if (file.readOnly && !processReadOnlyFiles_) {
    return ValidationOutcome::reject(
        ValidationDecision::REJECT_QUARANTINE, ValidationCategory::PERMISSION,
        "File is read-only and processReadOnlyFiles is disabled");
  }
  return std::nullopt;
}

std::optional<ValidationOutcome> ValidationChain::checkSize(
    const FileCandidate &file) const {
  if (maximumFileSize_ > 0 &&
      file.sizeBytes > static_cast<std::uintmax_t>(maximumFileSize_)) {
    return ValidationOutcome::reject(
        ValidationDecision::REJECT_QUARANTINE, ValidationCategory::SIZE,
        "File size " + std::to_string(file.sizeBytes) +
            " bytes exceeds maximum " + std::to_string(maximumFileSize_) +
            " bytes");
  }
  return std::nullopt;
}

std::optional<ValidationOutcome> ValidationChain::checkEmpty(
    const FileCandidate &file) const {
  if (file.sizeBytes != 0) return std::nullopt;

  switch (emptyFileHandling_) {
    case EmptyFileHandling::PROCESS:
      return std::nullopt;
    case EmptyFileHandling::DO_NOT_CREATE_MESSAGE:
      return ValidationOutcome::reject(
          ValidationDecision::REJECT_QUARANTINE, ValidationCategory::SIZE,
          "Empty file, message creation disabled");
    case EmptyFileHandling::SKIP:
      return ValidationOutcome::reject(ValidationDecision::REJECT_QUARANTINE,
                                       ValidationCategory::SIZE,
                                       "Empty file skipped");
  }
  return std::nullopt;
}

ValidationOutcome ValidationChain::checkStability(
    const StabilityGate::PendingCheck &check,
    const std::atomic<bool> *stopRequested) const {
  if (stabilityGate_.await(check, stopRequested)) {
    return ValidationOutcome::accept();
  }
  // Повторная попытка в следующем цикле сканирования
  return ValidationOutcome::reject(
      ValidationDecision::REJECT, ValidationCategory::LOCK_STATUS,
      "File is still being modified: " + check.path.filename().string());
}

ValidationOutcome ValidationChain::applyRules(
    const FileCandidate &file, const std::vector<char> &content) const {
  ValidationOutcome outcome = ValidationOutcome::accept();

  for (const auto &rule : rules_) {
    RuleResult result = rule->evaluate(file, content);

    if (result.passed) {
      if (!result.message.empty()) outcome.warnings.push_back(result.message);
      continue;
    }

    if (rule->severity() == RuleSeverity::WARNING) {
      outcome.warnings.push_back(result.message);
      continue;
    }

    auto rejection = ValidationOutcome::reject(
        ValidationDecision::REJECT_QUARANTINE, result.category,
        result.message);
    rejection.warnings = std::move(outcome.warnings);
    return rejection;
  }

  return outcome;
}

ValidationOutcome ValidationChain::validate(
    const FileCandidate &file, const std::vector<char> *content) const {
  auto outcome = precheck(file);
  if (!outcome.accepted()) return outcome;

  outcome = checkStability(stabilityGate_.stamp(file.path));
  if (!outcome.accepted()) return outcome;

  if (content) return applyRules(file, *content);
  return outcome;
}
