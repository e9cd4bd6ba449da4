/**
 * @file key_derivation.hpp
 * @brief PBKDF2 master-key derivation, HKDF sub-keys and secret strength
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "warden/config.hpp"
#include "warden/secure_vector.hpp"

namespace warden {

class KeyDerivation {
 public:
  static constexpr size_t kKeySize = 32;   ///< Derived key size (256 bits)
  static constexpr size_t kSaltSize = 16;  ///< Per-generation salt size
  static constexpr size_t kMinSecretSize = 32;
  static constexpr double kMinEntropyBitsPerChar = 3.5;

  /**
   * @param iterations PBKDF2 iteration count
   * @throws ConfigError if iterations is below kMinPbkdf2Iterations
   */
  explicit KeyDerivation(uint32_t iterations = kDefaultPbkdf2Iterations);

  /**
   * @brief Derive a 256-bit key with PBKDF2-HMAC-SHA256
   *
   * Identical secret, salt and iteration count always give the same key.
   * @throws CryptoError if OpenSSL fails
   */
  SecureBytes derive(std::string_view master_secret,
                     std::span<const uint8_t> salt) const;

  uint32_t iterations() const noexcept { return iterations_; }

  /**
   * @brief 16 fresh random bytes
   */
  static std::vector<uint8_t> generateSalt();

  /**
   * @brief HKDF-SHA256 expansion of a derived key under a context label
   *
   * Distinct labels give independent keys, so one generation's encryption
   * key and HMAC key never coincide.
   */
  static SecureBytes expand(std::span<const uint8_t> key,
                            std::string_view label, size_t length = kKeySize);

  /**
   * @brief Reject secrets unfit to protect tokens
   *
   * A secret is weak when it is shorter than 32 bytes, equals a well-known
   * default (case-insensitively), has Shannon entropy below 3.5 bits per
   * character, or, in production, contains a development marker.
   * @throws WeakSecretError describing the first failed check
   */
  static void validateMasterSecret(std::string_view secret, Environment env);

  static double shannonEntropy(std::string_view text);

 private:
  uint32_t iterations_;
};

}  // namespace warden
