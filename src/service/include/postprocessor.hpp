/**
 * @file postprocessor.hpp
 * @brief Судьба исходного файла после успешной доставки
 *
 * @details
 * | Действие           | Эффект                                     |
 * |--------------------|--------------------------------------------|
 * | ARCHIVE            | перенос в archiveDirectory (с меткой time) |
 * | DELETE             | удаление источника                         |
 * | KEEP_AND_MARK      | переименование в "<имя>.processed"         |
 * | KEEP_AND_REPROCESS | ничего; файл будет найден снова            |
 *
 * Постобработка выполняется не более одного раза на исходный файл за
 * прогон и никогда не выбрасывает: при ошибке файл остаётся на месте.
 * Экземпляр создаётся на один прогон.
 */

#pragma once

#include <mutex>
#include <set>
#include <string>

#include "../include/fileops.hpp"
#include "../include/transfertypes.hpp"

enum class PostProcessResult {
  ARCHIVED,
  DELETED,
  MARKED,
  KEPT,
  SKIPPED,          ///< действие не выполнено, файл на месте (предупреждение)
  ALREADY_APPLIED,  ///< повторный вызов для того же файла
  FAILED
};

std::string toString(PostProcessResult result);

class PostProcessor {
 public:
  static constexpr const char *kProcessedSuffix = ".processed";

  explicit PostProcessor(bool addTimestamp,
                         fileops::Clock clock = fileops::systemClock());

  /**
   * @brief Применить действие к источнику доставленной единицы
   * @param delivery Результат доставки; для FAILED ничего не делается
   */
  PostProcessResult apply(const TransferUnit &unit,
                          const DeliveryResult &delivery) noexcept;

  bool wasApplied(const fs::path &source) const;

 private:
  PostProcessResult archive(const TransferUnit &unit);
  PostProcessResult remove(const TransferUnit &unit);
  PostProcessResult mark(const TransferUnit &unit);

  bool addTimestamp_;
  fileops::Clock clock_;
  mutable std::mutex mutex_;
  std::set<std::string> applied_;
};
