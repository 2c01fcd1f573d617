/**
 * @file worker.cpp
 * @brief Реализация класса Worker
 */

#include "../include/worker.hpp"

#include "fbr/MetricsCollector.hpp"
#include "fbr/compositelogger.hpp"

std::atomic<int> Worker::instanceCounter_{0};

Worker::Worker(const FlowConfig &config, std::shared_ptr<IAuditSink> audit)
    : pipeline_(config, std::move(audit)) {
  int id = instanceCounter_.fetch_add(1, std::memory_order_relaxed);
  workerTag_ = config.name + "#" + std::to_string(id);

  auto &metrics = fbr::MetricsCollector::instance();
  metrics.ensureCounter("worker_started", "Worker threads started");
  metrics.ensureCounter("runs_completed", "Pipeline runs completed");
  metrics.ensureCounter("runs_failed", "Pipeline runs aborted by fatal error");

  fbr::CompositeLogger::instance().info(
      "Worker created for flow: " + config.name + " (" +
      config.sourceDirectory + " -> " + config.targetDirectory + "), " +
      workerTag_);
}

Worker::~Worker() {
  stop();
  fbr::CompositeLogger::instance().debug("Worker destroyed, " + workerTag_);
}

void Worker::start() {
  std::lock_guard<std::mutex> lock(state_mutex_);

  if (running_) {
    fbr::CompositeLogger::instance().warning("Worker already running, " +
                                             workerTag_);
    return;
  }

  // Поток мог завершиться аварийно
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }

  pipeline_.resetStop();
  running_ = true;
  paused_ = false;
  alive_ = true;
  worker_thread_ = std::thread(&Worker::run, this);

  fbr::CompositeLogger::instance().info(
      "Worker started, polling " + pipeline_.config().sourceDirectory +
      " every " + std::to_string(pipeline_.config().pollInterval.count()) +
      "s, " + workerTag_);
  fbr::MetricsCollector::instance().incrementCounter("worker_started");
}

void Worker::stop() {
  std::lock_guard<std::mutex> lock(state_mutex_);

  bool wasRunning = false;
  {
    std::lock_guard<std::mutex> waitLock(wait_mutex_);
    wasRunning = running_.exchange(false);
    paused_ = false;
  }
  cv_.notify_all();
  pipeline_.requestStop();

  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }

  if (wasRunning) {
    fbr::CompositeLogger::instance().info("Worker stopped, " + workerTag_);
  }
}

void Worker::pause() {
  std::lock_guard<std::mutex> lock(state_mutex_);

  if (!running_ || paused_) return;

  paused_ = true;
  fbr::CompositeLogger::instance().info("Worker paused, " + workerTag_);
}

void Worker::resume() {
  std::lock_guard<std::mutex> lock(state_mutex_);

  if (!running_ || !paused_) return;

  {
    std::lock_guard<std::mutex> waitLock(wait_mutex_);
    paused_ = false;
  }
  cv_.notify_all();

  fbr::CompositeLogger::instance().info("Worker resumed, " + workerTag_);
}

void Worker::restart() {
  fbr::CompositeLogger::instance().info("Restarting worker, " + workerTag_);

  stop();
  start();
}

void Worker::stopGracefully() {
  if (!running_) {
    stop();
    return;
  }

  // Ожидаем завершения текущего прогона
  while (processing_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  stop();
}

bool Worker::isAlive() const noexcept {
  return alive_.load(std::memory_order_relaxed);
}

bool Worker::isRunning() const noexcept {
  return running_.load(std::memory_order_relaxed);
}

bool Worker::isPaused() const noexcept {
  return paused_.load(std::memory_order_relaxed);
}

std::optional<RunReport> Worker::lastReport() const {
  std::lock_guard<std::mutex> lock(report_mutex_);
  return lastReport_;
}

void Worker::run() {
  try {
    while (running_) {
      {
        std::unique_lock<std::mutex> lock(wait_mutex_);
        cv_.wait(lock, [this] { return !paused_ || !running_; });
      }
      if (!running_) break;

      processing_ = true;
      runPipelineOnce();
      processing_ = false;

      std::unique_lock<std::mutex> lock(wait_mutex_);
      cv_.wait_for(lock, pipeline_.config().pollInterval,
                   [this] { return !running_; });
    }
  } catch (const std::exception &e) {
    fbr::CompositeLogger::instance().error(
        "Worker crashed: " + std::string(e.what()) + ", " + workerTag_);
  }
  processing_ = false;
  alive_ = false;
}

void Worker::runPipelineOnce() {
  auto &metrics = fbr::MetricsCollector::instance();
  RunReport report;

  try {
    report = pipeline_.run();
    metrics.incrementCounter("runs_completed");
  } catch (const PipelineFatalError &e) {
    fbr::CompositeLogger::instance().error("Flow '" +
                                           pipeline_.config().name +
                                           "': run aborted: " + e.what() +
                                           ", " + workerTag_);
    metrics.incrementCounter("runs_failed");
    report.flowName = pipeline_.config().name;
    report.fatalError = e.what();
  }

  ++runsCompleted_;
  std::lock_guard<std::mutex> lock(report_mutex_);
  lastReport_ = std::move(report);
}
