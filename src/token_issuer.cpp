#include "warden/token_issuer.hpp"

#include "warden/algorithm_policy.hpp"
#include "warden/base64.hpp"
#include "warden/json_serialization.hpp"
#include "warden/logging.hpp"
#include "warden/token_format.hpp"

namespace warden {

namespace {

constexpr size_t kTokenIdBytes = 16;
constexpr size_t kMaxSubjectLength = 256;

}  // namespace

TokenIssuer::TokenIssuer(const WardenConfig& config,
                         std::shared_ptr<const KeySet> keys,
                         std::shared_ptr<const Clock> clock,
                         std::shared_ptr<const DeviceFingerprint> fingerprint)
    : config_(config),
      keys_(std::move(keys)),
      clock_(std::move(clock)),
      fingerprint_(std::move(fingerprint)) {
  if (!keys_ || !clock_ || !fingerprint_) {
    throw InvalidArgumentError("TokenIssuer requires keys, clock and fingerprint");
  }
}

std::string TokenIssuer::generateTokenId() {
  return base64UrlEncode(randomBytes(kTokenIdBytes));
}

std::chrono::seconds TokenIssuer::resolveTtl(const IssueRequest& request) const {
  auto ttl = request.ttl.value_or(request.token_type == TokenType::Refresh
                                      ? config_.refresh_token_ttl
                                      : config_.access_token_ttl);
  if (ttl.count() <= 0) {
    throw InvalidArgumentError("ttl must be positive");
  }
  if (ttl > config_.max_token_ttl) {
    throw InvalidArgumentError("ttl of " + std::to_string(ttl.count()) +
                               "s exceeds max_token_ttl");
  }
  return ttl;
}

void TokenIssuer::checkClaimSize(const IssueRequest& request) const {
  size_t size = 0;
  if (!request.custom.empty()) {
    size += nlohmann::json(request.custom).dump().size();
  }
  if (!request.sensitive.empty()) {
    size += nlohmann::json(request.sensitive).dump().size();
  }
  if (size > config_.max_custom_claim_bytes) {
    throw ClaimTooLargeError(size, config_.max_custom_claim_bytes);
  }
}

std::string TokenIssuer::issue(const IssueRequest& request) const {
  return issueDetailed(request).token;
}

IssuedToken TokenIssuer::issueDetailed(const IssueRequest& request) const {
  if (request.subject.empty() || request.subject.size() > kMaxSubjectLength) {
    throw InvalidArgumentError("subject must be 1 to 256 characters");
  }
  auto ttl = resolveTtl(request);
  checkClaimSize(request);

  // One snapshot for the whole issuance
  auto snapshot = keys_->snapshot();
  auto key = snapshot->current();
  if (!key) {
    throw KeyUnavailableError();
  }
  auto alg = algorithm_policy::requireApproved(algorithmName(key->algorithm()),
                                               config_.environment);

  auto now = toUnixSeconds(clock_->now());

  TokenClaims claims;
  claims.subject = request.subject;
  claims.issued_at = now;
  claims.expires_at = now + ttl.count();
  claims.token_id = generateTokenId();
  claims.token_type = request.token_type;
  claims.custom = request.custom;
  claims.key_generation = key->generation();
  if (request.device_context) {
    claims.device_binding = fingerprint_->compute(*request.device_context);
  }

  std::optional<EncryptedPayload> encrypted;
  if (request.encrypt_sensitive && !request.sensitive.empty()) {
    encrypted = payload_cipher::encryptClaims(request.sensitive, *key);
  }
  claims.sensitive = request.sensitive;

  claims.compliance.contains_personal_data =
      !request.sensitive.empty() || claims.isBound();
  claims.compliance.data_classification = request.classification;
  claims.compliance.sensitive_encrypted = encrypted.has_value();

  TokenHeader header;
  header.alg = std::string(algorithmName(alg));
  header.kid = key->generation();

  auto header_segment = token_format::encodeHeader(header);
  auto body_segment = token_format::encodeSegment(
      json_serialization::bodyToJson(claims, encrypted));
  auto signature =
      key->signer().sign(createSigningInput(header_segment, body_segment));

  WARDEN_LOG_DEBUG("Issued {} token {} for {} under generation {}",
                   tokenTypeName(claims.token_type), claims.token_id,
                   claims.subject, claims.key_generation);

  return IssuedToken{
      token_format::assemble(header_segment, body_segment, signature),
      std::move(claims)};
}

}  // namespace warden
