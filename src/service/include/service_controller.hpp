/**
 * @file service_controller.hpp
 * @brief Управление жизненным циклом службы filebridge
 *
 * @details
 * ServiceController разбирает аргументы командной строки, загружает
 * конфигурацию, настраивает журналирование и запускает Master либо в
 * режиме однократного прогона (--once), либо в режиме службы до
 * получения SIGINT/SIGTERM.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "../include/argumentparser.hpp"
#include "../include/configmanager.hpp"
#include "../include/master.hpp"

/**
 * @class ServiceController
 * @brief Точка управления службой
 *
 * @code
   int main(int argc, char** argv) {
       ServiceController svc;
       return svc.run(argc, argv);
   }
   @endcode
 */
class ServiceController {
 public:
  /**
   * @return EXIT_SUCCESS или EXIT_FAILURE; в режиме --once код
   * определяется Master::runOnce()
   */
  int run(int argc, char **argv);

 private:
  /// Регистрирует обработчики SIGINT/SIGTERM и создаёт Master
  void initialize(const ParsedArgs &args);

  /**
   * @brief Настройка логгеров
   *
   * @details
   * Без --log-type используется массив "logging" конфигурации окружения;
   * если он пуст, журнал выводится в консоль. Уровень --log-level
   * применяется поверх.
   */
  void initLogger(const ParsedArgs &args);

  /// Цикл healthCheck() до запроса на завершение
  void mainLoop();

  void handleShutdown();

  void printHelp();
  void printVersion();

  std::unique_ptr<Master> master_;

  std::string environment_;

  std::mutex mtx_;
  std::condition_variable cv_;

  std::atomic<bool> shutdown_requested_{false};
};
