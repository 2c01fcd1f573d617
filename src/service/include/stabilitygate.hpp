/**
 * @file stabilitygate.hpp
 * @brief Отсев файлов, которые ещё записываются
 *
 * @details
 * Файл считается стабильным, если за окно ожидания W его время
 * модификации не изменилось и он по-прежнему существует. Любая ошибка при
 * проверке означает "нестабилен": файл пропускается до следующего
 * сканирования.
 *
 * Проверка разделена на две фазы, чтобы ожидание не складывалось по
 * файлам: stamp() фиксирует mtime и срок для всех кандидатов сразу,
 * await() затем ждёт только до срока конкретного файла.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <optional>

#include "../include/transfertypes.hpp"

class StabilityGate {
 public:
  using SteadyClock = std::chrono::steady_clock;

  struct PendingCheck {
    fs::path path;
    /// nullopt, если файл не удалось прочитать при постановке
    std::optional<fs::file_time_type> initialModified;
    SteadyClock::time_point deadline;
  };

  explicit StabilityGate(std::chrono::milliseconds wait);

  bool enabled() const { return wait_.count() > 0; }
  std::chrono::milliseconds wait() const { return wait_; }

  /// Первая фаза: запоминает mtime и срок повторной проверки
  PendingCheck stamp(const fs::path &path) const;

  /**
   * @brief Вторая фаза: ожидание срока и повторное чтение mtime
   * @param stopRequested Прерывает ожидание; файл считается нестабильным
   * @return true, если файл существует и mtime не изменился
   */
  bool await(const PendingCheck &check,
             const std::atomic<bool> *stopRequested = nullptr) const;

  /// Обе фазы подряд для одного файла
  bool isStable(const fs::path &path,
                const std::atomic<bool> *stopRequested = nullptr) const;

 private:
  std::chrono::milliseconds wait_;
};
