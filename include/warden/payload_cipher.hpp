/**
 * @file payload_cipher.hpp
 * @brief AES-256-GCM protection of the sensitive claim subset
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "warden/clock.hpp"
#include "warden/key_set.hpp"
#include "warden/secure_vector.hpp"

// Forward declarations for CBOR types
typedef struct cbor_item_t cbor_item_t;

namespace warden {

struct CborItemDeleter {
  void operator()(cbor_item_t* item) const noexcept;
};
using CborItemPtr = std::unique_ptr<cbor_item_t, CborItemDeleter>;

struct CborBufferDeleter {
  void operator()(unsigned char* buffer) const noexcept;
};
using CborBufferPtr = std::unique_ptr<unsigned char, CborBufferDeleter>;

using SensitiveClaims = std::map<std::string, std::string>;

/**
 * @brief Ciphertext of the sensitive subset and what is needed to open it
 */
struct EncryptedPayload {
  GenerationId key_generation = 0;  ///< Generation whose key encrypted it
  std::vector<uint8_t> nonce;       ///< 96-bit GCM nonce
  std::vector<uint8_t> ciphertext;  ///< Ciphertext without the tag
  std::vector<uint8_t> tag;         ///< 128-bit GCM tag

  bool operator==(const EncryptedPayload&) const = default;
};

namespace payload_cipher {

/**
 * @brief CBOR array ["Encrypt0", generation, A256GCM] bound as GCM AAD
 *
 * Changing the generation recorded in a payload invalidates its tag.
 */
std::vector<uint8_t> associatedData(GenerationId generation);

/**
 * @brief Encrypt with a fresh random nonce under the generation's key
 */
EncryptedPayload encrypt(std::span<const uint8_t> plaintext,
                         const KeyMaterial& key);

/**
 * @brief Decrypt with a specific generation
 * @throws IntegrityError if the tag does not verify or the payload names a
 *         different generation
 */
SecureBytes decrypt(const EncryptedPayload& payload, const KeyMaterial& key);

/**
 * @brief Decrypt with the generation named in the payload
 * @throws UnknownKeyGenerationError if that generation is absent or no
 *         longer usable at `now`
 * @throws IntegrityError if the tag does not verify
 */
SecureBytes decrypt(const EncryptedPayload& payload,
                    const KeySetSnapshot& keys, TimePoint now);

/**
 * @brief Encode the sensitive map as CBOR and encrypt it
 */
EncryptedPayload encryptClaims(const SensitiveClaims& claims,
                               const KeyMaterial& key);

/**
 * @brief Decrypt and decode a sensitive map
 * @throws UnknownKeyGenerationError, IntegrityError, or InvalidCborError if
 *         an authenticated plaintext is not a text-to-text map
 */
SensitiveClaims decryptClaims(const EncryptedPayload& payload,
                              const KeySetSnapshot& keys, TimePoint now);

/**
 * @brief CBOR encoding of a text-to-text map
 */
SecureBytes encodeClaimMap(const SensitiveClaims& claims);

/**
 * @throws InvalidCborError if the data is not a definite text-to-text map
 */
SensitiveClaims decodeClaimMap(std::span<const uint8_t> data);

}  // namespace payload_cipher

}  // namespace warden
