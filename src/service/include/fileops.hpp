/**
 * @file fileops.hpp
 * @brief Общие файловые операции конвейера
 *
 * @details
 * Перемещение файлов с переходом на копирование между файловыми системами
 * и построение имён с временными метками. Используется архивированием,
 * карантином и пометкой обработанных файлов.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace fileops {

/// Источник текущего времени; подменяется в тестах
using Clock = std::function<std::chrono::system_clock::time_point()>;

/// Часы по умолчанию: std::chrono::system_clock::now
Clock systemClock();

/**
 * @brief Перемещает файл, создавая каталог назначения
 *
 * @details Сначала rename(); при EXDEV копирует и удаляет источник. Если
 * источник после копирования удалить не удалось, копия удаляется, чтобы
 * файл не оказался в двух местах.
 *
 * @param replaceExisting Заменять ли существующий файл назначения
 * @throw std::runtime_error При любой ошибке; источник остаётся на месте
 */
void moveFile(const fs::path &from, const fs::path &to, bool replaceExisting);

/**
 * @brief Делит имя на основу и расширение по последней точке
 *
 * @details Точка в начале имени расширением не считается: ".profile" ->
 * {".profile", ""}.
 */
std::pair<std::string, std::string> splitExtension(const std::string &name);

/// "<основа>_yyyyMMdd_HHmmss<расширение>" в локальном времени
std::string timestampSuffixedName(
    const std::string &name, std::chrono::system_clock::time_point when);

/// "yyyyMMdd_HHmmss_<имя>" в локальном времени
std::string timestampPrefixedName(
    const std::string &name, std::chrono::system_clock::time_point when);

}  // namespace fileops
