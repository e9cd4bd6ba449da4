/**
 * @file token_issuer.hpp
 * @brief Builds, encrypts and signs tokens
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "warden/claims.hpp"
#include "warden/clock.hpp"
#include "warden/config.hpp"
#include "warden/device_fingerprint.hpp"
#include "warden/key_set.hpp"

namespace warden {

struct IssueRequest {
  std::string subject;
  CustomClaims custom;
  SensitiveClaims sensitive;
  std::optional<RequestMetadata> device_context;  ///< Binds the token if set
  /// Lifetime; the configured default for token_type when absent
  std::optional<std::chrono::seconds> ttl;
  bool encrypt_sensitive = true;
  TokenType token_type = TokenType::Access;
  DataClassification classification = DataClassification::Internal;
};

/**
 * @brief A serialized token together with the claims it carries
 */
struct IssuedToken {
  std::string token;
  TokenClaims claims;
};

class TokenIssuer {
 public:
  TokenIssuer(const WardenConfig& config, std::shared_ptr<const KeySet> keys,
              std::shared_ptr<const Clock> clock,
              std::shared_ptr<const DeviceFingerprint> fingerprint);

  /**
   * @brief Issue a signed token
   *
   * Signing key and encryption key are taken from a single key set
   * snapshot, so a concurrent rotation never produces a token that mixes
   * two generations.
   * @throws KeyUnavailableError if no generation is current
   * @throws ClaimTooLargeError if custom and sensitive claims together
   *         exceed max_custom_claim_bytes
   * @throws UnsupportedAlgorithmError if the generation's algorithm is not
   *         approved
   * @throws InvalidArgumentError for an empty subject or an out of range ttl
   */
  std::string issue(const IssueRequest& request) const;

  /**
   * @brief As issue(), also returning the claims that were signed
   */
  IssuedToken issueDetailed(const IssueRequest& request) const;

  /**
   * @brief Fresh 128-bit token id, base64url encoded
   */
  static std::string generateTokenId();

 private:
  std::chrono::seconds resolveTtl(const IssueRequest& request) const;
  void checkClaimSize(const IssueRequest& request) const;

  WardenConfig config_;
  std::shared_ptr<const KeySet> keys_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<const DeviceFingerprint> fingerprint_;
};

}  // namespace warden
