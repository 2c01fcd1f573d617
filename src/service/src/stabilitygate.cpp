/**
 * @file stabilitygate.cpp
 * @brief Проверка стабильности по времени модификации
 */

#include "../include/stabilitygate.hpp"

#include <algorithm>
#include <thread>

#include "fbr/compositelogger.hpp"

StabilityGate::StabilityGate(std::chrono::milliseconds wait) : wait_(wait) {
  if (wait_.count() < 0) wait_ = std::chrono::milliseconds(0);
}

StabilityGate::PendingCheck StabilityGate::stamp(const fs::path &path) const {
  PendingCheck check;
  check.path = path;
  check.deadline = SteadyClock::now() + wait_;

  std::error_code ec;
  auto modified = fs::last_write_time(path, ec);
  if (!ec) check.initialModified = modified;
  return check;
}

bool StabilityGate::await(const PendingCheck &check,
                          const std::atomic<bool> *stopRequested) const {
  if (!check.initialModified) return false;
  if (!enabled()) return true;

  // Сон короткими отрезками, чтобы остановка не ждала всё окно
  constexpr auto slice = std::chrono::milliseconds(50);
  for (auto now = SteadyClock::now(); now < check.deadline;
       now = SteadyClock::now()) {
    if (stopRequested && stopRequested->load()) return false;
    std::this_thread::sleep_for(std::min<SteadyClock::duration>(
        slice, check.deadline - now));
  }

  std::error_code ec;
  if (!fs::is_regular_file(check.path, ec) || ec) {
    fbr::CompositeLogger::instance().debug(
        "File disappeared during stability check: " + check.path.string());
    return false;
  }

  auto modified = fs::last_write_time(check.path, ec);
  if (ec) return false;

  return modified == *check.initialModified;
}

bool StabilityGate::isStable(const fs::path &path,
                             const std::atomic<bool> *stopRequested) const {
  return await(stamp(path), stopRequested);
}
