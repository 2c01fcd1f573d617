#include "fbr/MetricsCollector.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace fbr {

namespace {
constexpr const char* kPrefix = "filebridge_";
}

MetricsCollector& MetricsCollector::instance() {
  static MetricsCollector instance;
  return instance;
}

bool MetricsCollector::isValidName(const std::string& name) {
  if (name.empty()) return false;
  const auto first = static_cast<unsigned char>(name.front());
  if (!std::isalpha(first) && first != '_') return false;
  for (unsigned char c : name) {
    if (!std::isalnum(c) && c != '_') return false;
  }
  return true;
}

void MetricsCollector::registerCounter(const std::string& name,
                                       const std::string& help) {
  if (!isValidName(name)) {
    throw std::invalid_argument("Invalid metric name: '" + name + "'");
  }
  std::lock_guard lock(mutex_);
  if (counters_.count(name)) {
    throw std::runtime_error("Metric already registered: " + name);
  }
  counters_[name].help = help;
}

void MetricsCollector::ensureCounter(const std::string& name,
                                     const std::string& help) {
  if (!isValidName(name)) {
    throw std::invalid_argument("Invalid metric name: '" + name + "'");
  }
  std::lock_guard lock(mutex_);
  if (!counters_.count(name)) counters_[name].help = help;
}

bool MetricsCollector::hasCounter(const std::string& name) const {
  std::lock_guard lock(mutex_);
  return counters_.count(name) != 0;
}

void MetricsCollector::incrementCounter(const std::string& name,
                                        double value) {
  std::lock_guard lock(mutex_);
  if (auto it = counters_.find(name); it != counters_.end()) {
    it->second.value += value;
  }
}

double MetricsCollector::counterValue(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second.value;
}

void MetricsCollector::recordTaskTime(const std::string& name,
                                      std::chrono::milliseconds duration) {
  std::lock_guard lock(mutex_);
  auto& summary = summaries_[name];
  ++summary.count;
  summary.sumMs += static_cast<std::uint64_t>(duration.count());
}

std::uint64_t MetricsCollector::taskCount(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto it = summaries_.find(name);
  return it == summaries_.end() ? 0 : it->second.count;
}

std::uint64_t MetricsCollector::taskTimeSum(const std::string& name) const {
  std::lock_guard lock(mutex_);
  auto it = summaries_.find(name);
  return it == summaries_.end() ? 0 : it->second.sumMs;
}

std::string MetricsCollector::exportPrometheus() const {
  std::stringstream ss;
  std::lock_guard lock(mutex_);

  for (const auto& [name, counter] : counters_) {
    if (!counter.help.empty()) {
      ss << "# HELP " << kPrefix << name << " " << counter.help << "\n";
    }
    ss << "# TYPE " << kPrefix << name << " counter\n";
    ss << kPrefix << name << " " << counter.value << "\n";
  }

  for (const auto& [name, summary] : summaries_) {
    ss << "# TYPE " << kPrefix << name << " summary\n";
    ss << kPrefix << name << "_sum " << summary.sumMs << "\n";
    ss << kPrefix << name << "_count " << summary.count << "\n";
  }

  return ss.str();
}

void MetricsCollector::reset() {
  std::lock_guard lock(mutex_);
  counters_.clear();
  summaries_.clear();
}

}  // namespace fbr
