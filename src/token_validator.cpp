#include "warden/token_validator.hpp"

#include "warden/algorithm_policy.hpp"
#include "warden/logging.hpp"

namespace warden {

TokenValidator::TokenValidator(
    const WardenConfig& config, std::shared_ptr<const KeySet> keys,
    std::shared_ptr<RevocationStore> revocations,
    std::shared_ptr<const Clock> clock,
    std::shared_ptr<const DeviceFingerprint> fingerprint,
    std::shared_ptr<AuditSink> audit)
    : environment_(config.environment),
      keys_(std::move(keys)),
      revocations_(std::move(revocations)),
      clock_(std::move(clock)),
      fingerprint_(std::move(fingerprint)),
      audit_(std::move(audit)) {
  if (!keys_ || !revocations_ || !clock_ || !fingerprint_) {
    throw InvalidArgumentError(
        "TokenValidator requires keys, revocations, clock and fingerprint");
  }
  if (!audit_) {
    audit_ = std::make_shared<NullAuditSink>();
  }
}

ValidationResult TokenValidator::validate(
    std::string_view token,
    const std::optional<RequestMetadata>& device_context,
    bool require_binding) const {
  try {
    return ValidationResult::success(
        run(token, device_context, require_binding));
  } catch (const WardenError& e) {
    WARDEN_LOG_DEBUG("Token rejected: {} ({})",
                     errorCodeToString(e.errorCode()), e.what());
    return ValidationResult::error(e);
  }
}

ParsedToken TokenValidator::authenticate(std::string_view token) const {
  return authenticateAt(token, keys_->snapshot(), clock_->now()).token;
}

TokenValidator::Authenticated TokenValidator::authenticateAt(
    std::string_view token, KeySetSnapshotPtr keys, TimePoint now) const {
  auto parsed = token_format::parse(token);

  // Signature, using the generation named in the header
  auto key = keys->findForVerification(parsed.header.kid, now);
  if (!key) {
    throw UnknownKeyGenerationError(parsed.header.kid);
  }
  if (!key->signer().verify(parsed.signingInput(), parsed.signature)) {
    throw InvalidSignatureError();
  }

  // Algorithm, compared against the generation rather than trusted
  try {
    algorithm_policy::checkHeader(parsed.header.alg, key->algorithm(),
                                  environment_);
  } catch (const AlgorithmDowngradeError&) {
    audit(AuditEvent::AlgorithmDowngrade, parsed.claims, now,
          {{"presented", parsed.header.alg},
           {"expected", std::string(algorithmName(key->algorithm()))}});
    throw;
  }
  return Authenticated{std::move(parsed), std::move(keys), now};
}

TokenClaims TokenValidator::run(
    std::string_view token,
    const std::optional<RequestMetadata>& device_context,
    bool require_binding) const {
  // One snapshot and one instant for every stage
  auto authenticated = authenticateAt(token, keys_->snapshot(), clock_->now());
  auto& parsed = authenticated.token;
  auto now = authenticated.now;

  checkExpiry(parsed.claims, now);
  checkRevocation(parsed.claims, now);
  checkBinding(parsed.claims, device_context, require_binding, now);
  if (parsed.encrypted) {
    decryptPayload(parsed, *authenticated.keys, now);
  }
  return std::move(parsed.claims);
}

void TokenValidator::checkExpiry(const TokenClaims& claims,
                                 TimePoint now) const {
  if (claims.expires_at <= claims.issued_at) {
    throw MalformedTokenError("expiry not after issuance");
  }
  auto now_seconds = toUnixSeconds(now);
  if (claims.issued_at > now_seconds + kClockSkewTolerance.count()) {
    throw MalformedTokenError("issued in the future");
  }
  if (now_seconds > claims.expires_at) {
    throw TokenExpiredError();
  }
}

void TokenValidator::checkRevocation(const TokenClaims& claims,
                                     TimePoint now) const {
  bool revoked = false;
  try {
    revoked = revocations_->isRevoked(claims.token_id);
  } catch (const RevocationUnavailableError& e) {
    WARDEN_LOG_ERROR("Rejecting token {}: {}", claims.token_id, e.what());
    throw;
  }
  if (revoked) {
    audit(AuditEvent::RevokedTokenUsed, claims, now);
    throw TokenRevokedError();
  }
}

void TokenValidator::checkBinding(
    const TokenClaims& claims,
    const std::optional<RequestMetadata>& device_context,
    bool require_binding, TimePoint now) const {
  if (!require_binding && !claims.isBound()) {
    return;
  }
  if (!claims.isBound()) {
    audit(AuditEvent::DeviceMismatch, claims, now,
          {{"reason", "token carries no device binding"}});
    throw DeviceMismatchError();
  }
  if (!device_context) {
    audit(AuditEvent::DeviceMismatch, claims, now,
          {{"reason", "no device context presented"}});
    throw DeviceMismatchError();
  }
  auto presented = fingerprint_->compute(*device_context);
  if (!DeviceFingerprint::matches(presented, *claims.device_binding)) {
    audit(AuditEvent::DeviceMismatch, claims, now);
    throw DeviceMismatchError();
  }
}

void TokenValidator::decryptPayload(ParsedToken& parsed,
                                    const KeySetSnapshot& keys,
                                    TimePoint now) const {
  try {
    parsed.claims.sensitive =
        payload_cipher::decryptClaims(*parsed.encrypted, keys, now);
  } catch (const IntegrityError&) {
    WARDEN_LOG_ERROR("Encrypted payload of token {} failed authentication",
                     parsed.claims.token_id);
    throw TokenTamperedError();
  } catch (const InvalidCborError&) {
    throw TokenTamperedError();
  }
}

void TokenValidator::audit(AuditEvent event, const TokenClaims& claims,
                           TimePoint now, nlohmann::json details) const {
  AuditRecord record;
  record.event = event;
  record.at = now;
  record.subject = claims.subject;
  record.token_id = claims.token_id;
  record.generation = claims.key_generation;
  record.details = std::move(details);
  audit_->record(record);
}

}  // namespace warden
