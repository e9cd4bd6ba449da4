/**
 * @file token_validator.hpp
 * @brief Staged token validation
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>

#include "warden/audit.hpp"
#include "warden/claims.hpp"
#include "warden/clock.hpp"
#include "warden/config.hpp"
#include "warden/device_fingerprint.hpp"
#include "warden/error.hpp"
#include "warden/key_set.hpp"
#include "warden/revocation_store.hpp"
#include "warden/token_format.hpp"

namespace warden {

/// Accepted(TokenClaims) or Rejected(WardenError)
using ValidationResult = WardenResult<TokenClaims>;

/**
 * @brief Validates serialized tokens against the key set and revocation list
 *
 * Each call runs the stages parse, signature, algorithm, expiry,
 * revocation, binding and decrypt in that order and stops at the first
 * failure. The validator never writes to the key set or revocation store.
 */
class TokenValidator {
 public:
  /// How far in the future issued_at may lie
  static constexpr std::chrono::seconds kClockSkewTolerance{5};

  TokenValidator(const WardenConfig& config,
                 std::shared_ptr<const KeySet> keys,
                 std::shared_ptr<RevocationStore> revocations,
                 std::shared_ptr<const Clock> clock,
                 std::shared_ptr<const DeviceFingerprint> fingerprint,
                 std::shared_ptr<AuditSink> audit);

  /**
   * @brief Validate a token
   * @param token Serialized token
   * @param device_context Request attributes of the presenting client
   * @param require_binding Reject tokens that carry no device binding
   * @return Claims with sensitive values decrypted, or the first rejection
   */
  ValidationResult validate(
      std::string_view token,
      const std::optional<RequestMetadata>& device_context = std::nullopt,
      bool require_binding = false) const;

  /**
   * @brief Run only the parse, signature and algorithm stages
   *
   * Used where a token must be proven genuine but may already be expired
   * or revoked, such as revoking it.
   * @throws WardenError for the first failing stage
   */
  ParsedToken authenticate(std::string_view token) const;

 private:
  struct Authenticated {
    ParsedToken token;
    KeySetSnapshotPtr keys;
    TimePoint now;
  };

  Authenticated authenticateAt(std::string_view token, KeySetSnapshotPtr keys,
                               TimePoint now) const;

  TokenClaims run(std::string_view token,
                  const std::optional<RequestMetadata>& device_context,
                  bool require_binding) const;

  void checkExpiry(const TokenClaims& claims, TimePoint now) const;
  void checkRevocation(const TokenClaims& claims, TimePoint now) const;
  void checkBinding(const TokenClaims& claims,
                    const std::optional<RequestMetadata>& device_context,
                    bool require_binding, TimePoint now) const;
  void decryptPayload(ParsedToken& parsed, const KeySetSnapshot& keys,
                      TimePoint now) const;

  void audit(AuditEvent event, const TokenClaims& claims, TimePoint now,
             nlohmann::json details = nlohmann::json::object()) const;

  Environment environment_;
  std::shared_ptr<const KeySet> keys_;
  std::shared_ptr<RevocationStore> revocations_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<const DeviceFingerprint> fingerprint_;
  std::shared_ptr<AuditSink> audit_;
};

}  // namespace warden
