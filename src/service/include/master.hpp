/**
 * @file master.hpp
 * @brief Управление воркерами потоков передачи
 *
 * @details
 * Master создаёт по одному Worker на каждый включённый поток из
 * конфигурации, запускает и останавливает их, перезапускает упавшие
 * воркеры в healthCheck(). Режим runOnce() выполняет каждый включённый
 * поток ровно один раз синхронно, без создания воркеров.
 */

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../include/flowconfig.hpp"
#include "../include/transferpipeline.hpp"
#include "../include/workercontainer.hpp"

class Master {
 public:
  enum class State { STOPPED, STARTING, RUNNING, FATAL };

  using FlowProvider = std::function<std::vector<FlowConfig>()>;

  /**
   * @param flowProvider Источник конфигураций потоков
   *
   * @code
     Master m([&](){
         return ConfigManager::instance().getFlowConfigs("production");
     });
     @endcode
   */
  explicit Master(FlowProvider flowProvider);
  ~Master();

  Master(const Master &) = delete;
  Master &operator=(const Master &) = delete;

  /**
   * @brief Создаёт и запускает воркеры
   * @return false, если Master уже запущен или конфигурация не получена
   */
  bool start();

  void stop() noexcept;

  /// Перезапускает воркеры, у которых завершился рабочий поток
  void healthCheck();

  /**
   * @brief Однократный синхронный прогон всех включённых потоков
   * @param[out] reports Отчёты прогонов (может быть nullptr)
   * @return 0, если ни один прогон не прерван фатальной ошибкой, иначе 1
   */
  int runOnce(std::vector<RunReport> *reports = nullptr);

  /// Прервать runOnce() между файлами
  void requestStop();

  State getState() const noexcept;

  size_t getWorkerCount() const;

  /// Счетчики и времена задач в текстовом формате Prometheus
  std::string metricsSnapshot() const;

 private:
  void spawnWorkers(const std::vector<FlowConfig> &flows);
  void terminateWorkers();

  WorkersContainer workers_;
  FlowProvider getFlows_;
  std::atomic<State> state_{State::STOPPED};
  std::atomic<bool> stopRequested_{false};
  std::mutex onceMutex_;
  TransferPipeline *activePipeline_ = nullptr;
};
