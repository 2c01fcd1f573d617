/**
 * @file auditsink.cpp
 * @brief Сериализация событий аудита и приёмник на основе журнала
 */

#include "../include/auditsink.hpp"

#include "fbr/compositelogger.hpp"

std::string toString(AuditEventType type) {
  switch (type) {
    case AuditEventType::FILE_DISCOVERED:
      return "FILE_DISCOVERED";
    case AuditEventType::FILE_VALIDATED:
      return "FILE_VALIDATED";
    case AuditEventType::FILE_REJECTED:
      return "FILE_REJECTED";
    case AuditEventType::FILE_QUARANTINED:
      return "FILE_QUARANTINED";
    case AuditEventType::FILE_READ_FAILED:
      return "FILE_READ_FAILED";
    case AuditEventType::FILE_TRANSFERRED:
      return "FILE_TRANSFERRED";
    case AuditEventType::FILE_TRANSFER_FAILED:
      return "FILE_TRANSFER_FAILED";
    case AuditEventType::FILE_POST_PROCESSED:
      return "FILE_POST_PROCESSED";
    case AuditEventType::RUN_COMPLETED:
      return "RUN_COMPLETED";
  }
  return "UNKNOWN";
}

nlohmann::json AuditEvent::toJson() const {
  nlohmann::json j;
  j["event"] = toString(type);
  j["flow"] = flow;
  if (!fileName.empty()) j["file"] = fileName;
  if (!path.empty()) j["path"] = path;
  if (!detail.empty()) j["detail"] = detail;
  j["bytes"] = bytes;
  j["timestamp"] = fbr::TimeFormatter::format(timestamp, "%Y-%m-%dT%H:%M:%S");
  return j;
}

void LoggerAuditSink::publish(const AuditEvent &event) {
  try {
    // replace: имена файлов не обязаны быть валидным UTF-8
    fbr::CompositeLogger::instance().info(
        "AUDIT " +
        event.toJson().dump(-1, ' ', false,
                            nlohmann::json::error_handler_t::replace));
  } catch (const std::exception &e) {
    fbr::CompositeLogger::instance().warning(
        std::string("Failed to publish audit event: ") + e.what());
  }
}

void publishAudit(IAuditSink &sink, const AuditEvent &event) {
  try {
    sink.publish(event);
  } catch (const std::exception &e) {
    fbr::CompositeLogger::instance().warning(
        "Audit sink failed on " + toString(event.type) + " for flow '" +
        event.flow + "': " + e.what());
  }
}
