/**
 * @file steprecorder.hpp
 * @brief Учёт шагов выполнения по файлам
 */

#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct StepRecord {
  std::string fileName;
  std::string destination;
  std::uintmax_t bytes = 0;
};

class IStepRecorder {
 public:
  /// Назначение для файлов, прочитанных стороной сбора
  static constexpr const char *kReadForProcessing = "READ_FOR_PROCESSING";

  virtual ~IStepRecorder() = default;
  virtual void recordFile(const std::string &fileName,
                          const std::string &destination,
                          std::uintmax_t bytes) = 0;

  /// Вызывается в начале каждого прогона
  virtual void beginRun() {}

  /// Шаги, записанные с последнего beginRun()
  virtual std::vector<StepRecord> steps() const { return {}; }
};

/**
 * @class MetricsStepRecorder
 * @brief Хранит шаги прогона и обновляет счетчики MetricsCollector
 *
 * @details Счетчики: files_collected, files_delivered, bytes_delivered.
 * Список шагов очищается в beginRun(), поэтому долгоживущий Worker
 * держит в памяти только шаги последнего прогона; счетчики накапливаются.
 */
class MetricsStepRecorder : public IStepRecorder {
 public:
  MetricsStepRecorder();

  void recordFile(const std::string &fileName, const std::string &destination,
                  std::uintmax_t bytes) override;

  void beginRun() override;
  std::vector<StepRecord> steps() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<StepRecord> steps_;
};
