#include "warden/audit.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace warden {

namespace {

std::shared_ptr<spdlog::logger> sharedAuditLogger() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    std::string name(LoggingAuditSink::kLoggerName);
    auto existing = spdlog::get(name);
    if (existing) {
      return existing;
    }
    auto created = spdlog::stdout_color_mt(name);
    created->set_level(spdlog::level::info);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
    created->flush_on(spdlog::level::info);
    return created;
  }();
  return logger;
}

}  // namespace

std::string_view auditEventName(AuditEvent event) noexcept {
  switch (event) {
    case AuditEvent::AlgorithmDowngrade:
      return "algorithm_downgrade";
    case AuditEvent::RevokedTokenUsed:
      return "revoked_token_used";
    case AuditEvent::DeviceMismatch:
      return "device_mismatch";
    case AuditEvent::TokenRevoked:
      return "token_revoked";
    case AuditEvent::SubjectRevoked:
      return "subject_revoked";
    case AuditEvent::RefreshRotated:
      return "refresh_rotated";
    case AuditEvent::KeyRotated:
      return "key_rotated";
    case AuditEvent::KeysPurged:
      return "keys_purged";
  }
  return "unknown";
}

nlohmann::json AuditRecord::toJson() const {
  nlohmann::json j = nlohmann::json::object();
  j["event"] = std::string(auditEventName(event));
  j["at"] = toUnixSeconds(at);
  if (!subject.empty()) j["subject"] = subject;
  if (!token_id.empty()) j["token_id"] = token_id;
  if (generation) j["generation"] = *generation;
  if (!details.empty()) j["details"] = details;
  return j;
}

LoggingAuditSink::LoggingAuditSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : sharedAuditLogger()) {}

void LoggingAuditSink::record(const AuditRecord& record) {
  auto line = record.toJson().dump();
  switch (record.event) {
    case AuditEvent::AlgorithmDowngrade:
    case AuditEvent::RevokedTokenUsed:
    case AuditEvent::DeviceMismatch:
      logger_->critical("audit {}", line);
      break;
    default:
      logger_->info("audit {}", line);
      break;
  }
}

}  // namespace warden
