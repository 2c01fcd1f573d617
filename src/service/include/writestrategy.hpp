/**
 * @file writestrategy.hpp
 * @brief Запись содержимого в целевой файл
 *
 * @details
 * DirectWriteStrategy пишет прямо в файл назначения (перезаписывая его).
 * TempThenRenameWriteStrategy пишет в "<dest>.tmp" и затем атомарно
 * переименовывает его в "<dest>": читатели целевого каталога никогда не
 * видят частично записанный файл. При ошибке временный файл удаляется, а
 * исключение пробрасывается дальше.
 */

#pragma once

#include <memory>
#include <vector>

#include "../include/transfertypes.hpp"

class WriteStrategy {
 public:
  virtual ~WriteStrategy() = default;

  /**
   * @brief Записать содержимое
   * @throw std::runtime_error Ошибка записи или переименования
   */
  virtual void write(const fs::path &destination,
                     const std::vector<char> &content) const = 0;

  virtual WriteMode mode() const = 0;

  static std::unique_ptr<WriteStrategy> create(WriteMode mode);

 protected:
  /// Запись с усечением; выбрасывает при любой ошибке потока
  static void writeFile(const fs::path &path, const std::vector<char> &content);
};

class DirectWriteStrategy : public WriteStrategy {
 public:
  void write(const fs::path &destination,
             const std::vector<char> &content) const override;
  WriteMode mode() const override { return WriteMode::DIRECT; }
};

class TempThenRenameWriteStrategy : public WriteStrategy {
 public:
  static constexpr const char *kTempSuffix = ".tmp";

  void write(const fs::path &destination,
             const std::vector<char> &content) const override;
  WriteMode mode() const override { return WriteMode::TEMP_THEN_RENAME; }

  static fs::path tempPathFor(const fs::path &destination);
};
