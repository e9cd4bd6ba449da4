/**
 * @file key_set.hpp
 * @brief Key generations and the atomically published set of them
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include "warden/clock.hpp"
#include "warden/crypto.hpp"
#include "warden/key_derivation.hpp"

namespace warden {

using GenerationId = uint64_t;

/**
 * @brief One immutable generation of key material
 *
 * Holds the AES-256-GCM cipher and the signer for the generation's
 * algorithm. A generation with no valid_until is current; once rotated out
 * it is replaced by a copy carrying valid_until.
 */
class KeyMaterial {
 public:
  KeyMaterial(GenerationId generation, SigningAlgorithm algorithm,
              std::vector<uint8_t> salt, TimePoint derived_at,
              std::optional<TimePoint> valid_until,
              std::shared_ptr<const AesGcmAlgorithm> cipher,
              std::shared_ptr<const CryptographicAlgorithm> signer,
              std::vector<uint8_t> public_key);

  /**
   * @brief Derive a new generation from the master secret
   *
   * PBKDF2 turns the secret and a fresh salt into a 256-bit key, which
   * HKDF splits into independent encryption and HMAC keys.
   * @param key_pair Signing key pair for ES256/PS256; generated when absent
   * @throws CryptoError if derivation or key loading fails
   */
  static std::shared_ptr<const KeyMaterial> derive(
      GenerationId generation, SigningAlgorithm algorithm,
      const KeyDerivation& kdf, std::string_view master_secret,
      TimePoint now, std::optional<KeyPairDer> key_pair = std::nullopt);

  /**
   * @brief Copy of this generation restricted to verification until `until`
   */
  std::shared_ptr<const KeyMaterial> withValidUntil(TimePoint until) const;

  GenerationId generation() const noexcept { return generation_; }
  SigningAlgorithm algorithm() const noexcept { return algorithm_; }
  const std::vector<uint8_t>& salt() const noexcept { return salt_; }
  TimePoint derivedAt() const noexcept { return derived_at_; }
  const std::optional<TimePoint>& validUntil() const noexcept {
    return valid_until_;
  }
  const AesGcmAlgorithm& cipher() const noexcept { return *cipher_; }
  const CryptographicAlgorithm& signer() const noexcept { return *signer_; }
  /// DER public key, empty for HS256
  const std::vector<uint8_t>& publicKey() const noexcept { return public_key_; }

  /// Usable for verification and decryption at `now`
  bool isUsableAt(TimePoint now) const noexcept {
    return !valid_until_ || now < *valid_until_;
  }

 private:
  GenerationId generation_;
  SigningAlgorithm algorithm_;
  std::vector<uint8_t> salt_;
  TimePoint derived_at_;
  std::optional<TimePoint> valid_until_;
  std::shared_ptr<const AesGcmAlgorithm> cipher_;
  std::shared_ptr<const CryptographicAlgorithm> signer_;
  std::vector<uint8_t> public_key_;
};

using KeyMaterialPtr = std::shared_ptr<const KeyMaterial>;

/**
 * @brief Immutable view of all active generations
 */
class KeySetSnapshot {
 public:
  KeySetSnapshot() = default;
  KeySetSnapshot(GenerationId current,
                 std::map<GenerationId, KeyMaterialPtr> generations);

  /// Current generation, nullptr before initialization
  KeyMaterialPtr current() const;

  /// Any generation still in the set, usable or not
  KeyMaterialPtr find(GenerationId generation) const;

  /**
   * @brief Generation that may verify a token at `now`
   * @return nullptr if the generation is unknown, purged or past valid_until
   */
  KeyMaterialPtr findForVerification(GenerationId generation,
                                     TimePoint now) const;

  GenerationId currentGeneration() const noexcept { return current_; }
  const std::map<GenerationId, KeyMaterialPtr>& generations() const noexcept {
    return generations_;
  }
  bool empty() const noexcept { return generations_.empty(); }
  size_t size() const noexcept { return generations_.size(); }

 private:
  GenerationId current_ = 0;
  std::map<GenerationId, KeyMaterialPtr> generations_;
};

using KeySetSnapshotPtr = std::shared_ptr<const KeySetSnapshot>;

/**
 * @brief Holder of the published snapshot
 *
 * Readers copy the snapshot pointer under a short lock and then work on an
 * immutable object, so a rotation is seen entirely or not at all.
 */
class KeySet {
 public:
  KeySet();

  KeySetSnapshotPtr snapshot() const;

  void publish(KeySetSnapshotPtr snapshot);

  /**
   * @brief Current generation of the published snapshot
   * @throws KeyUnavailableError if no generation has been published
   */
  KeyMaterialPtr requireCurrent() const;

 private:
  mutable std::mutex mutex_;
  KeySetSnapshotPtr snapshot_;
};

}  // namespace warden
