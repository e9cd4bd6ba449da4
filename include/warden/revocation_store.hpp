/**
 * @file revocation_store.hpp
 * @brief Revoked token ids with bounded retries and fail-closed lookups
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "warden/clock.hpp"
#include "warden/error.hpp"

namespace warden {

enum class RevocationReason {
  UserLogout,
  AdminRevocation,
  SecurityBreach,
  PasswordChange,
  AccountSuspended,
  TokenRotation,
  DeviceCompromised,
  SuspiciousActivity
};

std::string_view reasonName(RevocationReason reason) noexcept;

/**
 * @throws InvalidArgumentError for an unknown reason name
 */
RevocationReason parseRevocationReason(std::string_view name);

struct RevocationEntry {
  std::string token_id;
  std::string subject;
  RevocationReason reason = RevocationReason::UserLogout;
  int64_t revoked_at = 0;  ///< Unix seconds
  int64_t expires_at = 0;  ///< Unix seconds, never lowered by a later revoke
};

/**
 * @brief Transient failure of the key-value store behind the revocation
 *        list. Retried by RevocationStore.
 */
class RevocationBackendError : public WardenError {
 public:
  explicit RevocationBackendError(std::string_view details)
      : WardenError(WardenErrorCode::IO_ERROR,
                    std::string("Revocation backend failure: ") +
                        std::string(details)) {}
};

/**
 * @brief Key-value store with per-key expiry
 *
 * Implementations may throw RevocationBackendError for transient
 * failures.
 */
class RevocationBackend {
 public:
  virtual ~RevocationBackend() = default;

  /// Value stored under key, nullopt if absent or expired
  virtual std::optional<std::string> get(const std::string& key) = 0;
  virtual void setWithTtl(const std::string& key, std::string value,
                          TimePoint expires_at) = 0;
  virtual bool erase(const std::string& key) = 0;
  /// Drop expired keys, returning how many were removed
  virtual size_t evictExpired() = 0;
};

/**
 * @brief Process-local backend, a hash map under a reader/writer lock
 */
class InMemoryRevocationBackend : public RevocationBackend {
 public:
  explicit InMemoryRevocationBackend(std::shared_ptr<const Clock> clock);

  std::optional<std::string> get(const std::string& key) override;
  void setWithTtl(const std::string& key, std::string value,
                  TimePoint expires_at) override;
  bool erase(const std::string& key) override;
  size_t evictExpired() override;

  /// Stored keys, expired ones included until evicted
  size_t size() const;

 private:
  struct Slot {
    std::string value;
    TimePoint expires_at;
  };

  std::shared_ptr<const Clock> clock_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Slot> slots_;
};

struct RetryPolicy {
  uint32_t max_attempts = 3;
  std::chrono::milliseconds initial_backoff{10};  ///< Doubled per retry
};

struct RevocationStatistics {
  size_t total_revoked = 0;
  std::map<RevocationReason, size_t> by_reason;
  size_t evicted = 0;
};

class RevocationStore {
 public:
  /**
   * @param minimum_retention Entries are kept at least this long after
   *        revocation, whatever expiry the caller states. Set it to the
   *        longest token lifetime so no revoked token outlives its entry.
   */
  RevocationStore(std::shared_ptr<RevocationBackend> backend,
                  std::shared_ptr<const Clock> clock, RetryPolicy retry = {},
                  std::chrono::seconds minimum_retention = {});

  /**
   * @brief Record a token id as revoked until its natural expiry
   *
   * The stored expiry is at least now + minimum_retention and only ever
   * grows. Revoking an id twice is harmless.
   * @return true if this call created the entry, false if the id was
   *         already revoked
   * @throws RevocationUnavailableError if the backend stays unreachable
   */
  bool revoke(std::string_view token_id, int64_t expires_at,
              RevocationReason reason, std::string_view subject = {});

  /**
   * @throws RevocationUnavailableError if the backend stays unreachable;
   *         callers must treat this as "revoked"
   */
  bool isRevoked(std::string_view token_id);

  /**
   * @throws RevocationUnavailableError as isRevoked
   */
  std::optional<RevocationEntry> entry(std::string_view token_id);

  RevocationStatistics statistics() const;

  /**
   * @brief Reclaim entries whose token has expired
   * @return Number of entries removed
   */
  size_t evictExpired();

 private:
  template <typename F>
  auto withRetry(std::string_view operation, F&& fn) -> decltype(fn());

  std::optional<RevocationEntry> load(const std::string& key);

  std::shared_ptr<RevocationBackend> backend_;
  std::shared_ptr<const Clock> clock_;
  RetryPolicy retry_;
  std::chrono::seconds minimum_retention_;

  std::mutex write_mutex_;
  mutable std::mutex stats_mutex_;
  RevocationStatistics stats_;
};

}  // namespace warden
