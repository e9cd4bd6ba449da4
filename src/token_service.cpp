#include "warden/token_service.hpp"

#include "warden/algorithm_policy.hpp"
#include "warden/key_derivation.hpp"
#include "warden/logging.hpp"

namespace warden {

namespace {

constexpr std::string_view kFingerprintLabel = "warden/v1/device-fingerprint";

SecureBytes fingerprintSalt(const WardenConfig& config,
                            std::string_view master_secret) {
  if (!config.fingerprint_salt.empty()) {
    auto salt = fromHex(config.fingerprint_salt);
    return SecureBytes(salt.begin(), salt.end());
  }
  std::span<const uint8_t> secret(
      reinterpret_cast<const uint8_t*>(master_secret.data()),
      master_secret.size());
  return KeyDerivation::expand(secret, kFingerprintLabel);
}

}  // namespace

std::unique_ptr<TokenService> TokenService::create(
    const WardenConfig& config, std::string_view master_secret,
    ServiceDependencies deps) {
  config.validate();
#ifdef ENABLE_LOGGING
  logging::Logger::getInstance().setLogLevel(config.log_level);
#endif
  KeyDerivation::validateMasterSecret(master_secret, config.environment);

  auto decision = algorithm_policy::approve(
      algorithmName(config.signing_algorithm), config.environment);
  if (decision.warning) {
    WARDEN_LOG_WARN("{}", *decision.warning);
  }

  std::unique_ptr<TokenService> service(
      new TokenService(config, master_secret, std::move(deps)));
  auto generation = service->rotation_->initialize();
  WARDEN_LOG_INFO("Token service ready ({}, {}), generation {}",
                  environmentName(config.environment),
                  algorithmName(config.signing_algorithm), generation);
  return service;
}

TokenService::TokenService(const WardenConfig& config,
                           std::string_view master_secret,
                           ServiceDependencies deps)
    : config_(config),
      clock_(deps.clock ? std::move(deps.clock)
                        : std::make_shared<SystemClock>()),
      audit_(deps.audit ? std::move(deps.audit)
                        : std::make_shared<LoggingAuditSink>()),
      keys_(std::make_shared<KeySet>()),
      fingerprint_(std::make_shared<DeviceFingerprint>(
          fingerprintSalt(config, master_secret))) {
  auto backend = deps.revocation_backend
                     ? std::move(deps.revocation_backend)
                     : std::make_shared<InMemoryRevocationBackend>(clock_);
  RetryPolicy retry;
  retry.max_attempts = config_.revocation_max_attempts;
  retry.initial_backoff = config_.revocation_initial_backoff;
  revocations_ =
      std::make_shared<RevocationStore>(std::move(backend), clock_, retry,
                                        config_.max_token_ttl);

  rotation_ = std::make_shared<KeyRotationCoordinator>(
      config_, keys_, master_secret, clock_, audit_, std::move(deps.key_pairs));
  issuer_ =
      std::make_unique<TokenIssuer>(config_, keys_, clock_, fingerprint_);
  validator_ = std::make_unique<TokenValidator>(
      config_, keys_, revocations_, clock_, fingerprint_, audit_);
}

TokenService::~TokenService() { stopScheduledRotation(); }

std::string TokenService::issue(const IssueRequest& request) {
  return issuer_->issue(request);
}

IssuedToken TokenService::issueDetailed(const IssueRequest& request) {
  return issuer_->issueDetailed(request);
}

TokenPair TokenService::issuePair(const IssueRequest& request) {
  IssueRequest access = request;
  access.token_type = TokenType::Access;
  access.ttl = config_.access_token_ttl;

  IssueRequest refresh = request;
  refresh.token_type = TokenType::Refresh;
  refresh.ttl = config_.refresh_token_ttl;
  // Refresh tokens carry identity only
  refresh.custom.clear();
  refresh.sensitive.clear();

  return TokenPair{issuer_->issueDetailed(access),
                   issuer_->issueDetailed(refresh)};
}

ValidationResult TokenService::validate(
    std::string_view token,
    const std::optional<RequestMetadata>& device_context,
    bool require_binding) const {
  return validator_->validate(token, device_context, require_binding);
}

WardenResult<TokenPair> TokenService::refresh(
    std::string_view refresh_token,
    const std::optional<RequestMetadata>& device_context) {
  auto result = validator_->validate(refresh_token, device_context, false);
  if (!result) {
    return WardenResult<TokenPair>::error(result.error());
  }
  const auto& claims = result.value();
  if (claims.token_type != TokenType::Refresh) {
    return WardenResult<TokenPair>::error(
        InvalidArgumentError("not a refresh token"));
  }

  try {
    if (!revocations_->revoke(claims.token_id, claims.expires_at,
                              RevocationReason::TokenRotation,
                              claims.subject)) {
      return WardenResult<TokenPair>::error(TokenRevokedError());
    }
  } catch (const RevocationUnavailableError& e) {
    return WardenResult<TokenPair>::error(e);
  }

  IssueRequest request;
  request.subject = claims.subject;
  request.device_context = device_context;
  auto pair = issuePair(request);

  auditRecord(AuditEvent::RefreshRotated, claims.subject, claims.token_id,
              {{"access", pair.access.claims.token_id},
               {"refresh", pair.refresh.claims.token_id}});
  return WardenResult<TokenPair>::success(std::move(pair));
}

void TokenService::revoke(std::string_view token_id, int64_t expires_at,
                          RevocationReason reason, std::string_view subject) {
  revocations_->revoke(token_id, expires_at, reason, subject);
  auditRecord(AuditEvent::TokenRevoked, subject, token_id,
              {{"reason", std::string(reasonName(reason))}});
}

void TokenService::revoke(std::string_view token_id, RevocationReason reason,
                          std::string_view subject) {
  revoke(token_id, toUnixSeconds(clock_->now()), reason, subject);
}

TokenClaims TokenService::revokeToken(std::string_view token,
                                      RevocationReason reason) {
  auto parsed = validator_->authenticate(token);
  revoke(parsed.claims.token_id, parsed.claims.expires_at, reason,
         parsed.claims.subject);
  return std::move(parsed.claims);
}

size_t TokenService::revokeAllForSubject(std::string_view subject,
                                         SubjectTokenIndex& index,
                                         RevocationReason reason) {
  auto active = index.activeTokens(subject);
  size_t revoked = 0;
  for (const auto& token : active) {
    revocations_->revoke(token.token_id, token.expires_at, reason, subject);
    ++revoked;
  }
  auditRecord(AuditEvent::SubjectRevoked, subject, {},
              {{"reason", std::string(reasonName(reason))},
               {"count", revoked}});
  return revoked;
}

GenerationId TokenService::rotateKeys() {
  return rotation_->rotate(RotationTrigger::Manual);
}

size_t TokenService::purgeExpiredKeys() { return rotation_->purgeExpired(); }

size_t TokenService::evictExpiredRevocations() {
  return revocations_->evictExpired();
}

RevocationStatistics TokenService::revocationStatistics() const {
  return revocations_->statistics();
}

bool TokenService::startScheduledRotation() {
  if (config_.rotation_interval.count() == 0) {
    return false;
  }
  if (!scheduler_) {
    scheduler_ =
        std::make_unique<RotationScheduler>(rotation_, config_.rotation_interval);
  }
  scheduler_->start();
  return true;
}

void TokenService::stopScheduledRotation() {
  if (scheduler_) {
    scheduler_->stop();
  }
}

void TokenService::auditRecord(AuditEvent event, std::string_view subject,
                               std::string_view token_id,
                               nlohmann::json details) {
  AuditRecord record;
  record.event = event;
  record.at = clock_->now();
  record.subject = std::string(subject);
  record.token_id = std::string(token_id);
  record.details = std::move(details);
  audit_->record(record);
}

}  // namespace warden
