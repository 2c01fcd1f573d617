/**
 * @file service_controller.cpp
 * @brief Реализация методов ServiceController
 *
 * @details
 *  - run(): разбор аргументов, конфигурация, выбор режима
 *  - initialize(): настройка сигналов и Master
 *  - initLogger(): конфигурация логирования
 *  - mainLoop(): работа в цикле с healthCheck()
 *  - handleShutdown(): завершение работы
 */

#include "../include/service_controller.hpp"

#include <signal.h>

#include <iostream>

#include "fbr/SignalRouter.hpp"
#include "fbr/compositelogger.hpp"
#include "fbr/consolelogger.hpp"
#include "fbr/syncfilelogger.hpp"

using namespace std::chrono_literals;

namespace {

fbr::RotationConfig rotationFromJson(const nlohmann::json &entry) {
  fbr::RotationConfig rotation;
  if (!entry.contains("rotation") || !entry["rotation"].is_object()) {
    return rotation;
  }
  const auto &r = entry["rotation"];
  const std::string type = r.value("type", "none");
  if (type == "size") {
    rotation.enabled = true;
    rotation.type = fbr::RotationType::SIZE;
    rotation.maxFileSizeBytes = r.value("maxSizeBytes", std::size_t{10485760});
  } else if (type == "time") {
    rotation.enabled = true;
    rotation.type = fbr::RotationType::TIME;
    rotation.rotationInterval =
        std::chrono::seconds(r.value("intervalSeconds", 86400));
  }
  return rotation;
}

}  // namespace

int ServiceController::run(int argc, char **argv) {
  ParsedArgs args;
  try {
    ArgumentParser parser;
    args = parser.parse(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n\n" << ArgumentParser::helpText();
    return EXIT_FAILURE;
  }

  if (args.help_message) {
    printHelp();
    return EXIT_SUCCESS;
  }
  if (args.version_message) {
    printVersion();
    return EXIT_SUCCESS;
  }

  try {
    environment_ = args.environment;

    // Загрузка конфигурации и логгера
    ConfigManager::instance().initialize(args.config_path);
    if (!args.overrides.empty())
      ConfigManager::instance().applyCliOverrides(args.overrides);
    initLogger(args);

    fbr::CompositeLogger::instance().info(
        "Configuration loaded from " + args.config_path + ", environment '" +
        environment_ + "'");

    // Регистрация сигналов и запуск Master
    initialize(args);
    fbr::SignalRouter::instance().start();

    if (args.run_once) {
      const int code = master_->runOnce();
      fbr::CompositeLogger::instance().info("Metrics snapshot:\n" +
                                            master_->metricsSnapshot());
      fbr::SignalRouter::instance().stop();
      fbr::CompositeLogger::instance().flush();
      return code;
    }

    if (!master_->start()) {
      throw std::runtime_error("Master failed to start");
    }
    fbr::CompositeLogger::instance().info("SignalRouter started successfully");

    mainLoop();

    if (master_) {
      master_->stop();
      fbr::CompositeLogger::instance().info("Metrics snapshot:\n" +
                                            master_->metricsSnapshot());
    }
    fbr::SignalRouter::instance().stop();
    fbr::CompositeLogger::instance().info(
        "Service controller: Service shutdown complete");
    fbr::CompositeLogger::instance().flush();
    return EXIT_SUCCESS;
  } catch (const std::exception &e) {
    fbr::CompositeLogger::instance().critical(e.what());
    if (fbr::CompositeLogger::instance().loggerCount() == 0) {
      std::cerr << e.what() << std::endl;
    }
    return EXIT_FAILURE;
  }
}

void ServiceController::initialize(const ParsedArgs &args) {
  auto &router = fbr::SignalRouter::instance();
  fbr::CompositeLogger::instance().debug(
      "Service controller: Registering signal handlers ...");

  // Graceful shutdown на SIGTERM и SIGINT
  router.registerHandler(SIGTERM, [this](int sig_num) {
    fbr::CompositeLogger::instance().info(
        "SIGTERM received (signal " + std::to_string(sig_num) +
        "), shutting down");
    handleShutdown();
  });
  router.registerHandler(SIGINT, [this](int sig_num) {
    fbr::CompositeLogger::instance().info(
        "SIGINT received (signal " + std::to_string(sig_num) +
        "), shutting down");
    handleShutdown();
  });

  master_ = std::make_unique<Master>([env = args.environment]() {
    return ConfigManager::instance().getFlowConfigs(env);
  });
}

void ServiceController::initLogger(const ParsedArgs &args) {
  auto &composite_logger = fbr::CompositeLogger::instance();

  if (!args.use_cli_logging) {
    auto logging = ConfigManager::instance().getLoggingConfig(args.environment);
    for (const auto &entry : logging) {
      std::string type = entry.value("type", "console");
      std::string level = entry.value("level", "info");

      if (type == "console") {
        auto &logger = fbr::ConsoleLogger::instance();
        logger.setLogLevel(fbr::stringToLogLevel(level));
        logger.setColorsEnabled(entry.value("colors", true));
        composite_logger.addLogger(fbr::makeUnownedLogger(logger));
      } else if (type == "sync_file") {
        auto &logger = fbr::SyncFileLogger::instance();
        logger.setMainLogPath(entry.value("file", "filebridge.log"));
        if (entry.contains("fallbackFile")) {
          logger.setFallbackLogPath(entry["fallbackFile"].get<std::string>());
        }
        logger.setRotationConfig(rotationFromJson(entry));
        logger.setLogLevel(fbr::stringToLogLevel(level));
        composite_logger.addLogger(fbr::makeUnownedLogger(logger));
      }
    }
  } else {
    for (const auto &type : args.logger_types) {
      if (type == "console") {
        composite_logger.addLogger(
            fbr::makeUnownedLogger(fbr::ConsoleLogger::instance()));
      } else if (type == "sync_file") {
        auto &logger = fbr::SyncFileLogger::instance();
        logger.setMainLogPath("filebridge.log");
        composite_logger.addLogger(fbr::makeUnownedLogger(logger));
      }
    }
  }

  if (composite_logger.loggerCount() == 0) {
    composite_logger.addLogger(
        fbr::makeUnownedLogger(fbr::ConsoleLogger::instance()));
  }

  if (args.log_level.has_value()) {
    composite_logger.setLogLevel(fbr::stringToLogLevel(args.log_level.value()));
  }
}

void ServiceController::mainLoop() {
  std::unique_lock<std::mutex> lock(mtx_);

  fbr::CompositeLogger::instance().info(
      "Service controller: Service main loop started");

  while (!shutdown_requested_.load(std::memory_order_acquire)) {
    // Разблокируем мьютекс на время healthCheck
    lock.unlock();
    master_->healthCheck();
    lock.lock();

    // Ждем сигнал завершения или таймаут
    cv_.wait_for(lock, 500ms, [this] {
      return shutdown_requested_.load(std::memory_order_acquire);
    });
  }

  fbr::CompositeLogger::instance().info(
      "Service controller: Service main loop ended");
}

void ServiceController::handleShutdown() {
  // Останавливаем текущие прогоны между файлами
  if (master_) master_->requestStop();

  {
    std::lock_guard lg(mtx_);
    shutdown_requested_.store(true, std::memory_order_release);
  }
  cv_.notify_one();
}

void ServiceController::printHelp() {
  std::cout << "filebridge - file transfer service\n\n"
            << ArgumentParser::helpText();
}

void ServiceController::printVersion() { std::cout << "filebridge v1.0.0\n"; }
