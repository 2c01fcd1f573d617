/**
 * @file steprecorder.cpp
 * @brief Учёт шагов прогона и счетчики передачи
 */

#include "../include/steprecorder.hpp"

#include "fbr/MetricsCollector.hpp"

MetricsStepRecorder::MetricsStepRecorder() {
  auto &metrics = fbr::MetricsCollector::instance();
  metrics.ensureCounter("files_collected", "Files read from source directories");
  metrics.ensureCounter("files_delivered", "Files written to target directories");
  metrics.ensureCounter("bytes_delivered", "Bytes written to target directories");
}

void MetricsStepRecorder::recordFile(const std::string &fileName,
                                     const std::string &destination,
                                     std::uintmax_t bytes) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    steps_.push_back(StepRecord{fileName, destination, bytes});
  }

  auto &metrics = fbr::MetricsCollector::instance();
  if (destination == kReadForProcessing) {
    metrics.incrementCounter("files_collected");
  } else {
    metrics.incrementCounter("files_delivered");
    metrics.incrementCounter("bytes_delivered", static_cast<double>(bytes));
  }
}

void MetricsStepRecorder::beginRun() {
  std::lock_guard<std::mutex> lock(mutex_);
  steps_.clear();
}

std::vector<StepRecord> MetricsStepRecorder::steps() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return steps_;
}
