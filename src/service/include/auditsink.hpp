/**
 * @file auditsink.hpp
 * @brief Структурированные события аудита конвейера
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

enum class AuditEventType {
  FILE_DISCOVERED,
  FILE_VALIDATED,
  FILE_REJECTED,
  FILE_QUARANTINED,
  FILE_READ_FAILED,
  FILE_TRANSFERRED,
  FILE_TRANSFER_FAILED,
  FILE_POST_PROCESSED,
  RUN_COMPLETED
};

std::string toString(AuditEventType type);

struct AuditEvent {
  AuditEventType type = AuditEventType::FILE_DISCOVERED;
  std::string flow;
  std::string fileName;
  std::string path;
  std::string detail;
  std::uintmax_t bytes = 0;
  std::chrono::system_clock::time_point timestamp =
      std::chrono::system_clock::now();

  nlohmann::json toJson() const;
};

/**
 * @class IAuditSink
 * @brief Приёмник событий аудита
 *
 * @note Сбой аудита не может прерывать прогон: конвейер вызывает
 * publish() только через publishAudit().
 */
class IAuditSink {
 public:
  virtual ~IAuditSink() = default;
  virtual void publish(const AuditEvent &event) = 0;
};

/**
 * @class LoggerAuditSink
 * @brief Пишет события в журнал одной JSON-строкой с префиксом "AUDIT "
 *
 * @code
 * 2025-06-01 12:00:00 [INFO] AUDIT {"bytes":100,"event":"FILE_TRANSFERRED",...}
 * @endcode
 */
class LoggerAuditSink : public IAuditSink {
 public:
  void publish(const AuditEvent &event) override;
};

/**
 * @brief Передаёт событие приёмнику, перехватывая его исключения
 *
 * @details Конвейер публикует события только через эту функцию:
 * исключение стороннего приёмника записывается в журнал как предупреждение
 * и дальше не распространяется.
 */
void publishAudit(IAuditSink &sink, const AuditEvent &event);
