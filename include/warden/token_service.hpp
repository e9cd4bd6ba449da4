/**
 * @file token_service.hpp
 * @brief Caller-facing entry point for issuing, validating and revoking
 *        tokens
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/audit.hpp"
#include "warden/config.hpp"
#include "warden/device_fingerprint.hpp"
#include "warden/key_rotation.hpp"
#include "warden/key_set.hpp"
#include "warden/revocation_store.hpp"
#include "warden/token_issuer.hpp"
#include "warden/token_validator.hpp"

namespace warden {

/**
 * @brief Subject to active token ids, maintained by the session layer
 */
class SubjectTokenIndex {
 public:
  struct ActiveToken {
    std::string token_id;
    int64_t expires_at = 0;  ///< Unix seconds
  };

  virtual ~SubjectTokenIndex() = default;
  virtual std::vector<ActiveToken> activeTokens(std::string_view subject) = 0;
};

struct TokenPair {
  IssuedToken access;
  IssuedToken refresh;
};

/**
 * @brief Collaborators injected into a TokenService
 *
 * Every member is optional: system clock, in-memory revocation backend,
 * logging audit sink and generated key pairs are used when absent.
 */
struct ServiceDependencies {
  std::shared_ptr<const Clock> clock;
  std::shared_ptr<RevocationBackend> revocation_backend;
  std::shared_ptr<AuditSink> audit;
  std::shared_ptr<KeyPairProvider> key_pairs;
};

class TokenService {
 public:
  /**
   * @brief Validate the master secret and derive the first generation
   * @throws WeakSecretError if the master secret is unfit
   * @throws ConfigError if the configuration is invalid
   */
  static std::unique_ptr<TokenService> create(const WardenConfig& config,
                                              std::string_view master_secret,
                                              ServiceDependencies deps = {});

  ~TokenService();

  TokenService(const TokenService&) = delete;
  TokenService& operator=(const TokenService&) = delete;

  /**
   * @brief Issue one token
   * @throws As TokenIssuer::issue
   */
  std::string issue(const IssueRequest& request);

  IssuedToken issueDetailed(const IssueRequest& request);

  /**
   * @brief Issue an access token and a refresh token for the same request
   *
   * request.token_type and request.ttl are ignored; each token gets the
   * configured lifetime of its type.
   */
  TokenPair issuePair(const IssueRequest& request);

  ValidationResult validate(
      std::string_view token,
      const std::optional<RequestMetadata>& device_context = std::nullopt,
      bool require_binding = false) const;

  /**
   * @brief Exchange a refresh token for a new pair
   *
   * The presented refresh token is revoked with reason token_rotation, so
   * it can be used only once. A concurrent exchange of the same token that
   * loses the race gets TOKEN_REVOKED. Access tokens are rejected with
   * INVALID_ARGUMENT.
   * @throws As issuePair if the new pair cannot be issued
   */
  WardenResult<TokenPair> refresh(
      std::string_view refresh_token,
      const std::optional<RequestMetadata>& device_context = std::nullopt);

  /**
   * The entry is kept until expires_at or now + max_token_ttl, whichever
   * is later.
   * @throws RevocationUnavailableError if the store stays unreachable
   */
  void revoke(std::string_view token_id, int64_t expires_at,
              RevocationReason reason = RevocationReason::UserLogout,
              std::string_view subject = {});

  /**
   * @brief Revoke an id whose expiry is unknown, for now + max_token_ttl
   * @throws RevocationUnavailableError if the store stays unreachable
   */
  void revoke(std::string_view token_id,
              RevocationReason reason = RevocationReason::UserLogout,
              std::string_view subject = {});

  /**
   * @brief Revoke a serialized token after checking its signature
   *
   * Expired and already revoked tokens are accepted.
   * @return Claims of the revoked token
   * @throws WardenError if the token is malformed or not genuine
   */
  TokenClaims revokeToken(std::string_view token,
                          RevocationReason reason = RevocationReason::UserLogout);

  /**
   * @brief Revoke every active token the index lists for a subject
   * @return Number of ids revoked
   */
  size_t revokeAllForSubject(std::string_view subject, SubjectTokenIndex& index,
                             RevocationReason reason);

  /**
   * @brief Rotate to a new key generation
   * @return Id of the new current generation
   */
  GenerationId rotateKeys();

  size_t purgeExpiredKeys();

  size_t evictExpiredRevocations();

  RevocationStatistics revocationStatistics() const;

  /**
   * @brief Start scheduled rotation at config.rotation_interval
   * @return false if the interval is zero
   */
  bool startScheduledRotation();
  void stopScheduledRotation();

  const WardenConfig& config() const noexcept { return config_; }
  const KeySet& keySet() const noexcept { return *keys_; }
  const DeviceFingerprint& fingerprint() const noexcept { return *fingerprint_; }

 private:
  TokenService(const WardenConfig& config, std::string_view master_secret,
               ServiceDependencies deps);

  void auditRecord(AuditEvent event, std::string_view subject,
                   std::string_view token_id,
                   nlohmann::json details = nlohmann::json::object());

  WardenConfig config_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<AuditSink> audit_;
  std::shared_ptr<KeySet> keys_;
  std::shared_ptr<const DeviceFingerprint> fingerprint_;
  std::shared_ptr<RevocationStore> revocations_;
  std::shared_ptr<KeyRotationCoordinator> rotation_;
  std::unique_ptr<TokenIssuer> issuer_;
  std::unique_ptr<TokenValidator> validator_;
  std::unique_ptr<RotationScheduler> scheduler_;
};

}  // namespace warden
