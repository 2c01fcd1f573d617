/**
 * @file workerpool.cpp
 * @brief Реализация пула потоков доставки
 */

#include "../include/workerpool.hpp"

#include <stdexcept>

#include "fbr/compositelogger.hpp"

WorkerPool::WorkerPool(unsigned int threadCount, std::size_t maxQueueSize)
    : maxQueueSize_(maxQueueSize == 0 ? 1 : maxQueueSize) {
  if (threadCount == 0) threadCount = 1;
  workers_.reserve(threadCount);
  for (unsigned int i = 0; i < threadCount; ++i) {
    workers_.emplace_back([this] { workerLoop(); });
  }
}

WorkerPool::~WorkerPool() { finalize(); }

void WorkerPool::enqueue(Task task) {
  std::unique_lock<std::mutex> lock(queueMutex_);
  queueCv_.wait(lock, [this] { return done_ || tasks_.size() < maxQueueSize_; });
  if (done_) {
    throw std::logic_error("WorkerPool: enqueue after finalize");
  }
  tasks_.push(std::move(task));
  queueCv_.notify_all();
}

void WorkerPool::finalize() {
  {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (done_ && workers_.empty()) return;
    done_ = true;
  }
  queueCv_.notify_all();

  for (auto &worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
}

void WorkerPool::workerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(queueMutex_);
      queueCv_.wait(lock, [this] { return done_ || !tasks_.empty(); });
      if (tasks_.empty()) return;  // done_ и очередь пуста
      task = std::move(tasks_.front());
      tasks_.pop();
      queueCv_.notify_all();
    }

    try {
      task();
    } catch (const std::exception &e) {
      fbr::CompositeLogger::instance().error(
          std::string("WorkerPool task failed: ") + e.what());
    }
  }
}
