/**
 * @file workerpool.hpp
 * @brief Ограниченный пул потоков для задач доставки
 *
 * @details
 * Фиксированное число потоков обслуживает очередь задач ограниченной
 * длины: enqueue() блокируется, пока очередь заполнена. finalize()
 * дожидается выполнения всех поставленных задач и завершает потоки.
 *
 * Исключения из задач перехватываются и журналируются; задача, которой
 * важен результат, должна сама сохранять ошибку.
 */

#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

class WorkerPool {
 public:
  using Task = std::function<void()>;

  /**
   * @param threadCount Число потоков, не меньше 1
   * @param maxQueueSize Длина очереди, после которой enqueue() ждёт
   */
  WorkerPool(unsigned int threadCount, std::size_t maxQueueSize);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Поставить задачу в очередь
   * @throw std::logic_error Пул уже завершён
   */
  void enqueue(Task task);

  /// Дождаться выполнения всех задач и остановить потоки
  void finalize();

  std::size_t threadCount() const { return workers_.size(); }

 private:
  void workerLoop();

  std::size_t maxQueueSize_;
  std::mutex queueMutex_;
  std::condition_variable queueCv_;
  std::queue<Task> tasks_;
  std::vector<std::thread> workers_;
  bool done_ = false;
};
