/**
 * @file master.cpp
 * @brief Запуск воркеров, контроль их состояния и однократный прогон
 */

#include "../include/master.hpp"

#include "fbr/MetricsCollector.hpp"
#include "fbr/compositelogger.hpp"

Master::Master(FlowProvider flowProvider) : getFlows_(std::move(flowProvider)) {
  auto &metrics = fbr::MetricsCollector::instance();
  metrics.ensureCounter("workers_created", "Workers created");
  metrics.ensureCounter("workers_terminated", "Workers terminated");
  metrics.ensureCounter("workers_restarted", "Workers restarted by health check");
}

Master::~Master() { stop(); }

bool Master::start() {
  State expected = State::STOPPED;
  if (!state_.compare_exchange_strong(expected, State::STARTING)) {
    fbr::CompositeLogger::instance().warning("Master already running");
    return false;
  }

  try {
    spawnWorkers(getFlows_());

    state_.store(State::RUNNING);
    fbr::CompositeLogger::instance().info(
        "Master started with " + std::to_string(getWorkerCount()) + " workers");
    return true;
  } catch (const std::exception &e) {
    state_.store(State::FATAL);
    fbr::CompositeLogger::instance().critical("Start failed: " +
                                              std::string(e.what()));
    return false;
  }
}

void Master::stop() noexcept {
  requestStop();
  State current = state_.exchange(State::STOPPED);
  if (current != State::STOPPED) {
    const auto count = workers_.size();
    terminateWorkers();
    fbr::MetricsCollector::instance().incrementCounter(
        "workers_terminated", static_cast<double>(count));
    fbr::CompositeLogger::instance().info("Master stopped");
  }
}

void Master::spawnWorkers(const std::vector<FlowConfig> &flows) {
  fbr::CompositeLogger::instance().debug(
      "Master: Workers creation started, number of flows: " +
      std::to_string(flows.size()));

  workers_.access([&](auto &workers) {
    for (const auto &flow : flows) {
      if (!flow.enabled) {
        fbr::CompositeLogger::instance().debug(
            "Master: Flow '" + flow.name + "' is disabled. Skipping creation.");
        continue;
      }

      try {
        auto worker = std::make_unique<Worker>(flow);
        worker->start();
        workers.push_back(std::move(worker));
        fbr::MetricsCollector::instance().incrementCounter("workers_created");
      } catch (const std::exception &e) {
        fbr::CompositeLogger::instance().error("Worker creation failed for '" +
                                               flow.name + "': " + e.what());
      }
    }
  });
}

void Master::terminateWorkers() {
  workers_.access([](auto &workers) {
    for (auto &w : workers) {
      w->stop();
    }
  });
  workers_.clear();
}

void Master::healthCheck() {
  if (state_.load() != State::RUNNING) return;

  workers_.access([&](auto &workers) {
    for (auto &w : workers) {
      if (!w->isAlive()) {
        fbr::CompositeLogger::instance().warning(
            "Master: Worker for flow '" + w->getConfig().name +
            "' isn't alive, attempt to restart worker...");
        w->restart();
        fbr::MetricsCollector::instance().incrementCounter("workers_restarted");
      }
    }
  });
}

int Master::runOnce(std::vector<RunReport> *reports) {
  auto &logger = fbr::CompositeLogger::instance();
  stopRequested_.store(false);
  int exitCode = 0;

  for (const auto &flow : getFlows_()) {
    if (!flow.enabled) {
      logger.debug("Master: Flow '" + flow.name + "' is disabled, skipped");
      continue;
    }
    if (stopRequested_.load()) {
      logger.info("Master: single run interrupted");
      break;
    }

    TransferPipeline pipeline(flow);
    {
      std::lock_guard<std::mutex> lock(onceMutex_);
      activePipeline_ = &pipeline;
    }

    RunReport report;
    try {
      report = pipeline.run();
    } catch (const std::exception &e) {
      // PipelineFatalError и прочие ошибки уровня прогона
      logger.critical("Flow '" + flow.name + "': run aborted: " + e.what());
      report.flowName = flow.name;
      report.fatalError = e.what();
      exitCode = 1;
    }

    {
      std::lock_guard<std::mutex> lock(onceMutex_);
      activePipeline_ = nullptr;
    }
    if (reports) reports->push_back(std::move(report));
  }

  return exitCode;
}

void Master::requestStop() {
  stopRequested_.store(true);
  std::lock_guard<std::mutex> lock(onceMutex_);
  if (activePipeline_) activePipeline_->requestStop();
}

Master::State Master::getState() const noexcept { return state_.load(); }

size_t Master::getWorkerCount() const { return workers_.size(); }

std::string Master::metricsSnapshot() const {
  return fbr::MetricsCollector::instance().exportPrometheus();
}
