/**
 * @file audit.hpp
 * @brief Structured security audit records
 */

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "warden/clock.hpp"
#include "warden/key_set.hpp"

namespace warden {

enum class AuditEvent {
  AlgorithmDowngrade,  ///< Header algorithm differs from its generation's
  RevokedTokenUsed,    ///< A revoked token was presented
  DeviceMismatch,      ///< Bound token presented from another device
  TokenRevoked,        ///< A token id was added to the revocation list
  SubjectRevoked,      ///< All known tokens of a subject were revoked
  RefreshRotated,      ///< A refresh token was exchanged for a new pair
  KeyRotated,          ///< A new generation became current
  KeysPurged           ///< Retained generations were dropped
};

std::string_view auditEventName(AuditEvent event) noexcept;

struct AuditRecord {
  AuditEvent event = AuditEvent::TokenRevoked;
  TimePoint at;
  std::string subject;
  std::string token_id;
  std::optional<GenerationId> generation;
  nlohmann::json details = nlohmann::json::object();

  nlohmann::json toJson() const;
};

class AuditSink {
 public:
  virtual ~AuditSink() = default;
  virtual void record(const AuditRecord& record) = 0;
};

/**
 * @brief Writes one JSON object per record to the "warden.audit" logger
 *
 * Security violations are logged at critical level, everything else at
 * info. The audit logger is separate from the diagnostic one, so neither
 * log_level nor building without ENABLE_LOGGING silences it.
 */
class LoggingAuditSink : public AuditSink {
 public:
  static constexpr std::string_view kLoggerName = "warden.audit";

  /**
   * @param logger Destination, the shared "warden.audit" stdout logger
   *               when null
   */
  explicit LoggingAuditSink(std::shared_ptr<spdlog::logger> logger = nullptr);

  void record(const AuditRecord& record) override;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

class NullAuditSink : public AuditSink {
 public:
  void record(const AuditRecord&) override {}
};

}  // namespace warden
