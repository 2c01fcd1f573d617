/**
 * @file SignalRouter.hpp
 * @brief Асинхронный маршрутизатор POSIX-сигналов
 *
 * @details Сигналы читаются через signalfd в отдельном потоке под epoll,
 * поэтому обработчики выполняются в обычном контексте потока и могут
 * использовать логгер, мьютексы и т.п.
 */
#pragma once

#include <sys/signalfd.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace fbr {

/**
 * @class SignalRouter
 * @brief Потокобезопасный менеджер обработки сигналов
 *
 * @warning
 * - Только для Linux систем
 * - registerHandler() следует вызывать до создания остальных потоков:
 *   маска наследуется потоками, созданными после блокировки сигнала
 */
class SignalRouter {
 public:
  using Handler = std::function<void(int)>;

  static SignalRouter& instance() {
    static SignalRouter router;
    return router;
  }

  /**
   * @brief Зарегистрировать обработчик для сигнала
   * @throw std::invalid_argument Неверный номер сигнала, SIGKILL или SIGSTOP
   * @throw std::system_error При ошибках системных вызовов
   *
   * @code
   * router.registerHandler(SIGTERM, [](int) { controller.requestStop(); });
   * @endcode
   */
  void registerHandler(int signum, Handler handler);

  /// Удалить все обработчики сигнала; сигнал остаётся заблокированным
  void unregisterHandler(int signum);

  /**
   * @brief Запустить поток обработки сигналов
   * @throw std::system_error Не удалось создать epoll
   */
  void start();

  void stop() noexcept;

  bool isRunning() const noexcept { return running_; }

  ~SignalRouter();

 private:
  SignalRouter();
  void processSignals(int epollFd);

  std::unordered_map<int, std::vector<Handler>> handlers_;
  std::mutex handlers_mutex_;
  std::atomic<bool> running_{false};
  std::thread worker_thread_;
  int signal_fd_ = -1;
  sigset_t original_mask_;
  sigset_t blocked_mask_{};
};

}  // namespace fbr
