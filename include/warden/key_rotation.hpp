/**
 * @file key_rotation.hpp
 * @brief Generation rotation, retention and purging
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>

#include "warden/audit.hpp"
#include "warden/clock.hpp"
#include "warden/config.hpp"
#include "warden/key_derivation.hpp"
#include "warden/key_set.hpp"
#include "warden/secure_vector.hpp"

namespace warden {

enum class RotationTrigger {
  Initial,    ///< First generation at startup
  Scheduled,  ///< RotationScheduler interval elapsed
  Manual      ///< Operator request
};

std::string_view triggerName(RotationTrigger trigger) noexcept;

/**
 * @brief Source of provisioned signing key pairs for ES256/PS256
 */
class KeyPairProvider {
 public:
  virtual ~KeyPairProvider() = default;

  /**
   * @return Key pair for the new generation, nullopt to have one generated
   */
  virtual std::optional<KeyPairDer> keyPairFor(GenerationId generation,
                                               SigningAlgorithm algorithm) = 0;
};

/**
 * @brief Owns the transitions of the key set
 *
 * Every change builds a complete new snapshot and publishes it in one
 * step. Rotations are serialized with each other but never block readers.
 */
class KeyRotationCoordinator {
 public:
  KeyRotationCoordinator(const WardenConfig& config,
                         std::shared_ptr<KeySet> keys,
                         std::string_view master_secret,
                         std::shared_ptr<const Clock> clock,
                         std::shared_ptr<AuditSink> audit,
                         std::shared_ptr<KeyPairProvider> key_pairs = nullptr);

  /**
   * @brief Derive generation 1 if the key set is empty
   * @return The current generation
   */
  GenerationId initialize();

  /**
   * @brief Make a freshly derived generation current
   *
   * The previous current generation is retained for verification until
   * now + max_token_ttl. Retained generations whose valid_until plus the
   * purge grace has passed are dropped in the same snapshot.
   * @return Id of the new current generation
   * @throws CryptoError if derivation fails; the published set is unchanged
   */
  GenerationId rotate(RotationTrigger trigger = RotationTrigger::Manual);

  /**
   * @brief Drop retained generations past valid_until plus the purge grace
   * @return Number of generations removed
   */
  size_t purgeExpired();

  std::chrono::seconds retention() const noexcept { return retention_; }

 private:
  bool purgeable(const KeyMaterial& material, TimePoint now) const;
  void auditEvent(AuditEvent event, TimePoint now, GenerationId generation,
                  nlohmann::json details);

  SigningAlgorithm algorithm_;
  std::chrono::seconds retention_;
  std::chrono::seconds purge_grace_;
  KeyDerivation kdf_;
  SecureVector<char> master_secret_;
  std::shared_ptr<KeySet> keys_;
  std::shared_ptr<const Clock> clock_;
  std::shared_ptr<AuditSink> audit_;
  std::shared_ptr<KeyPairProvider> key_pairs_;
  std::mutex rotation_mutex_;
};

/**
 * @brief Background thread calling rotate(RotationTrigger::Scheduled) at a
 *        fixed interval
 */
class RotationScheduler {
 public:
  RotationScheduler(std::shared_ptr<KeyRotationCoordinator> coordinator,
                    std::chrono::milliseconds interval);
  ~RotationScheduler();

  RotationScheduler(const RotationScheduler&) = delete;
  RotationScheduler& operator=(const RotationScheduler&) = delete;

  /// Start the thread; no-op if already running
  void start();

  /// Stop and join the thread; no-op if not running
  void stop();

  bool running() const;

  /// Scheduled rotations completed since construction
  size_t completedRotations() const;

 private:
  void run(std::stop_token stop);

  std::shared_ptr<KeyRotationCoordinator> coordinator_;
  std::chrono::milliseconds interval_;

  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  size_t completed_ = 0;
  std::jthread thread_;
};

}  // namespace warden
