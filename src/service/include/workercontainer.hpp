/**
 * @file workercontainer.hpp
 * @brief Потокобезопасный контейнер для управления объектами Worker
 *
 * @details
 * Класс WorkersContainer хранит набор объектов Worker (по одному на
 * включённый поток передачи) с гарантией потокобезопасного доступа.
 * Использует std::mutex для синхронизации операций чтения и модификации
 * внутреннего вектора workers_. Применяется в Master для запуска,
 * остановки и перезапуска воркеров.
 *
 * @warning
 * Держите время удержания мьютекса минимальным, не выполняйте внутри
 * него длительные операции, кроме останова воркеров.
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "../include/worker.hpp"

/**
 * @class WorkersContainer
 * @brief Вектор unique_ptr<Worker> под мьютексом
 * @ingroup Core
 */
class WorkersContainer {
 public:
  /**
   * @brief Выполнить функцию над вектором воркеров под блокировкой
   *
   * @code
     container.access([&](auto &workers) {
         workers.push_back(std::make_unique<Worker>(flow));
     });
     @endcode
   */
  template <typename Func>
  void access(Func &&func) {
    std::lock_guard lock(mutex_);
    func(workers_);
  }

  size_t size() const {
    std::lock_guard lock(mutex_);
    return workers_.size();
  }

  /// Удаляет все воркеры (деструкторы останавливают потоки)
  void clear() {
    std::lock_guard lock(mutex_);
    workers_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<Worker>> workers_;
};
