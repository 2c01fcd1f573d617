/**
 * @file worker.hpp
 * @brief Периодический исполнитель одного потока передачи файлов
 *
 * @details
 * Worker представляет собой автономную единицу обработки, которая:
 *  - каждые pollInterval секунд выполняет прогон TransferPipeline
 *  - журналирует сводку каждого прогона и ведёт счётчики runs_completed и
 *    runs_failed
 *  - поддерживает управление жизненным циклом: запуск, пауза, возобновление,
 *    останов
 *
 * @warning Должен запускаться и останавливаться из одного потока,
 *          управление состоянием потокобезопасно c помощью std::mutex.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "../include/transferpipeline.hpp"

/**
 * @defgroup Core Основные компоненты сервиса
 */

/**
 * @class Worker
 * @brief Выполняет прогоны одного потока в собственном потоке
 * @ingroup Core
 *
 * @details
 * Фатальная ошибка прогона (недоступен исходный каталог) не завершает
 * Worker: она журналируется, и следующий прогон выполняется через
 * pollInterval. Поток завершается только при остановке или при
 * непредвиденном исключении; во втором случае isAlive() возвращает false
 * и Master перезапускает Worker в healthCheck().
 */
class Worker {
 public:
  /**
   * @brief Конструктор Worker на основе конфигурации потока
   *
   * @param[in] config Конфигурация потока
   * @param[in] audit  Приёмник событий аудита
   *
   * @code
   FlowConfig cfg = FlowConfig::fromJson(flowJson);
   Worker w(cfg);
   w.start();
   @endcode
   */
  explicit Worker(
      const FlowConfig &config,
      std::shared_ptr<IAuditSink> audit = std::make_shared<LoggerAuditSink>());

  /**
   * @brief Деструктор Worker
   * @note Вызывает stop(); текущий прогон прерывается между файлами
   */
  ~Worker();

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;

  /**
   * @brief Запускает рабочий поток; первый прогон выполняется сразу
   * @note Повторный вызов для работающего Worker только журналируется
   */
  void start();

  /**
   * @brief Останавливает рабочий поток
   *
   * @details
   * 1. Сбрасывает running_ и paused_, будит поток
   * 2. Запрашивает остановку текущего прогона (между файлами)
   * 3. Ждет join() у worker_thread_
   */
  void stop();

  /// Приостанавливает прогоны до resume(); текущий прогон завершается
  void pause();

  void resume();

  /// stop() + start()
  void restart();

  /**
   * @brief Дожидается окончания текущего прогона и останавливает поток
   *
   * @code
   worker.stopGracefully();
   @endcode
   */
  void stopGracefully();

  /// true, пока рабочий поток выполняет цикл прогонов
  bool isAlive() const noexcept;

  bool isRunning() const noexcept;

  bool isPaused() const noexcept;

  const FlowConfig &getConfig() const noexcept { return pipeline_.config(); }

  /// Отчёт последнего завершённого прогона
  std::optional<RunReport> lastReport() const;

  std::size_t runsCompleted() const noexcept { return runsCompleted_.load(); }

 private:
  void run();

  /// Один прогон с учётом метрик; PipelineFatalError не выходит наружу
  void runPipelineOnce();

  std::string workerTag_;

  static std::atomic<int> instanceCounter_;

  TransferPipeline pipeline_;

  std::atomic<bool> running_{false};
  std::atomic<bool> paused_{false};
  std::atomic<bool> processing_{false};
  std::atomic<bool> alive_{false};
  std::atomic<std::size_t> runsCompleted_{0};

  /// Сериализует start/stop/pause/resume
  std::mutex state_mutex_;

  /// Ожидание интервала опроса и паузы
  std::mutex wait_mutex_;
  std::condition_variable cv_;

  std::thread worker_thread_;

  mutable std::mutex report_mutex_;
  std::optional<RunReport> lastReport_;
};
