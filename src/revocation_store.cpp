#include "warden/revocation_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <thread>

#include "warden/json_serialization.hpp"
#include "warden/logging.hpp"

namespace warden {

namespace {

constexpr std::string_view kKeyPrefix = "revoked:";

constexpr std::array<std::pair<RevocationReason, std::string_view>, 8>
    kReasonNames = {{
        {RevocationReason::UserLogout, "user_logout"},
        {RevocationReason::AdminRevocation, "admin_revocation"},
        {RevocationReason::SecurityBreach, "security_breach"},
        {RevocationReason::PasswordChange, "password_change"},
        {RevocationReason::AccountSuspended, "account_suspended"},
        {RevocationReason::TokenRotation, "token_rotation"},
        {RevocationReason::DeviceCompromised, "device_compromised"},
        {RevocationReason::SuspiciousActivity, "suspicious_activity"},
    }};

std::string storageKey(std::string_view token_id) {
  std::string key(kKeyPrefix);
  key.append(token_id);
  return key;
}

}  // namespace

std::string_view reasonName(RevocationReason reason) noexcept {
  for (const auto& [value, name] : kReasonNames) {
    if (value == reason) return name;
  }
  return "user_logout";
}

RevocationReason parseRevocationReason(std::string_view name) {
  for (const auto& [value, known] : kReasonNames) {
    if (known == name) return value;
  }
  throw InvalidArgumentError("unknown revocation reason: " + std::string(name));
}

//
// InMemoryRevocationBackend
//

InMemoryRevocationBackend::InMemoryRevocationBackend(
    std::shared_ptr<const Clock> clock)
    : clock_(std::move(clock)) {}

std::optional<std::string> InMemoryRevocationBackend::get(
    const std::string& key) {
  std::shared_lock lock(mutex_);
  auto it = slots_.find(key);
  if (it == slots_.end() || it->second.expires_at <= clock_->now()) {
    return std::nullopt;
  }
  return it->second.value;
}

void InMemoryRevocationBackend::setWithTtl(const std::string& key,
                                           std::string value,
                                           TimePoint expires_at) {
  std::unique_lock lock(mutex_);
  slots_[key] = Slot{std::move(value), expires_at};
}

bool InMemoryRevocationBackend::erase(const std::string& key) {
  std::unique_lock lock(mutex_);
  return slots_.erase(key) > 0;
}

size_t InMemoryRevocationBackend::evictExpired() {
  auto now = clock_->now();
  std::unique_lock lock(mutex_);
  return std::erase_if(slots_, [now](const auto& slot) {
    return slot.second.expires_at <= now;
  });
}

size_t InMemoryRevocationBackend::size() const {
  std::shared_lock lock(mutex_);
  return slots_.size();
}

//
// RevocationStore
//

RevocationStore::RevocationStore(std::shared_ptr<RevocationBackend> backend,
                                 std::shared_ptr<const Clock> clock,
                                 RetryPolicy retry,
                                 std::chrono::seconds minimum_retention)
    : backend_(std::move(backend)),
      clock_(std::move(clock)),
      retry_(retry),
      minimum_retention_(minimum_retention) {
  if (!backend_ || !clock_) {
    throw InvalidArgumentError("revocation store needs a backend and a clock");
  }
  if (minimum_retention_.count() < 0) {
    throw InvalidArgumentError("minimum retention must not be negative");
  }
  if (retry_.max_attempts == 0) {
    retry_.max_attempts = 1;
  }
}

template <typename F>
auto RevocationStore::withRetry(std::string_view operation, F&& fn)
    -> decltype(fn()) {
  auto backoff = retry_.initial_backoff;
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const RevocationBackendError& e) {
      if (attempt >= retry_.max_attempts) {
        WARDEN_LOG_ERROR("Revocation backend {} failed after {} attempts: {}",
                         operation, attempt, e.what());
        throw RevocationUnavailableError(e.what());
      }
      WARDEN_LOG_WARN("Revocation backend {} failed (attempt {}/{}): {}",
                      operation, attempt, retry_.max_attempts, e.what());
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }
}

std::optional<RevocationEntry> RevocationStore::load(const std::string& key) {
  auto stored = withRetry("get", [&] { return backend_->get(key); });
  if (!stored) {
    return std::nullopt;
  }
  // An unreadable record still marks the id as revoked
  auto corrupt = [&](const char* what) {
    WARDEN_LOG_ERROR("Corrupt revocation record under {}: {}", key, what);
    RevocationEntry entry;
    entry.token_id = key.substr(kKeyPrefix.size());
    entry.reason = RevocationReason::SecurityBreach;
    return entry;
  };
  try {
    RevocationEntry entry;
    json_serialization::from_json(nlohmann::json::parse(*stored), entry);
    return entry;
  } catch (const nlohmann::json::exception& e) {
    return corrupt(e.what());
  } catch (const InvalidArgumentError& e) {
    return corrupt(e.what());
  }
}

bool RevocationStore::revoke(std::string_view token_id, int64_t expires_at,
                             RevocationReason reason,
                             std::string_view subject) {
  if (token_id.empty()) {
    throw InvalidArgumentError("token id must not be empty");
  }
  auto key = storageKey(token_id);
  auto now = toUnixSeconds(clock_->now());
  // A caller may understate the expiry; never keep an entry shorter than
  // the longest lifetime a token can have
  expires_at = std::max(expires_at, now + minimum_retention_.count());

  std::lock_guard<std::mutex> lock(write_mutex_);
  auto existing = load(key);
  if (existing && existing->expires_at >= expires_at) {
    WARDEN_LOG_DEBUG("Token {} already revoked", token_id);
    return false;
  }

  RevocationEntry entry;
  entry.token_id = std::string(token_id);
  entry.subject = std::string(subject);
  entry.reason = reason;
  entry.revoked_at = now;
  entry.expires_at = expires_at;
  if (existing) {
    // Extending an existing entry keeps its original reason and time
    entry.reason = existing->reason;
    entry.revoked_at = existing->revoked_at;
    if (entry.subject.empty()) entry.subject = existing->subject;
  }

  nlohmann::json record;
  json_serialization::to_json(record, entry);
  auto value = record.dump();
  // The token is still acceptable during its expiry second
  auto keep_until = fromUnixSeconds(expires_at) + std::chrono::seconds(1);
  withRetry("set", [&] { backend_->setWithTtl(key, value, keep_until); });

  if (!existing) {
    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    ++stats_.total_revoked;
    ++stats_.by_reason[reason];
  }
  WARDEN_LOG_INFO("Revoked token {} (reason: {})", token_id,
                  reasonName(entry.reason));
  return !existing;
}

bool RevocationStore::isRevoked(std::string_view token_id) {
  auto key = storageKey(token_id);
  return withRetry("get", [&] { return backend_->get(key).has_value(); });
}

std::optional<RevocationEntry> RevocationStore::entry(
    std::string_view token_id) {
  return load(storageKey(token_id));
}

RevocationStatistics RevocationStore::statistics() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

size_t RevocationStore::evictExpired() {
  auto evicted = withRetry("evict", [&] { return backend_->evictExpired(); });
  if (evicted > 0) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.evicted += evicted;
    WARDEN_LOG_DEBUG("Evicted {} expired revocation entries", evicted);
  }
  return evicted;
}

}  // namespace warden
