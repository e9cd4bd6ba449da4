/**
 * @file crypto.hpp
 * @brief Signing and AEAD algorithm classes over OpenSSL
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "warden/error.hpp"
#include "warden/secure_vector.hpp"

// Forward declarations for OpenSSL types
typedef struct evp_pkey_st EVP_PKEY;
typedef struct bio_st BIO;

namespace warden {

/// COSE algorithm identifiers, bound into the encryption AAD
constexpr int64_t ALG_HMAC256_256 = 5;  ///< HMAC 256/256
constexpr int64_t ALG_ES256 = -7;       ///< ECDSA w/ SHA-256
constexpr int64_t ALG_PS256 = -37;      ///< RSASSA-PSS w/ SHA-256
constexpr int64_t ALG_A256GCM = 3;      ///< AES-GCM w/ 256-bit key, 128-bit tag

namespace crypto_constants {
constexpr size_t HMAC_KEY_SIZE = 32;    ///< HMAC-SHA256 key size
constexpr size_t AES256_KEY_SIZE = 32;  ///< AES-256 key size in bytes
constexpr size_t GCM_IV_SIZE = 12;      ///< GCM IV size in bytes (96 bits)
constexpr size_t GCM_TAG_SIZE = 16;     ///< GCM authentication tag size
constexpr size_t SHA256_SIZE = 32;      ///< SHA-256 digest size
constexpr int RSA_KEY_BITS = 2048;      ///< Modulus size for PS256 keys

constexpr bool is_valid_hmac_key_size(size_t size) noexcept {
  return size >= 16 && size <= 64;
}

}  // namespace crypto_constants

static_assert(
    crypto_constants::is_valid_hmac_key_size(crypto_constants::HMAC_KEY_SIZE),
    "HMAC key size is invalid");

/**
 * @brief Token signing algorithms on the allow-list
 */
enum class SigningAlgorithm { HS256, ES256, PS256 };

constexpr std::string_view algorithmName(SigningAlgorithm alg) noexcept {
  switch (alg) {
    case SigningAlgorithm::HS256:
      return "HS256";
    case SigningAlgorithm::ES256:
      return "ES256";
    case SigningAlgorithm::PS256:
      return "PS256";
  }
  return "unknown";
}

/**
 * @brief Look up an algorithm by its exact header name
 * @return The algorithm, or nullopt for anything off the allow-list
 *         (including "none" and case variants)
 */
constexpr std::optional<SigningAlgorithm> parseSigningAlgorithm(
    std::string_view name) noexcept {
  if (name == "HS256") return SigningAlgorithm::HS256;
  if (name == "ES256") return SigningAlgorithm::ES256;
  if (name == "PS256") return SigningAlgorithm::PS256;
  return std::nullopt;
}

constexpr bool isAsymmetric(SigningAlgorithm alg) noexcept {
  return alg != SigningAlgorithm::HS256;
}

struct EvpKeyDeleter {
  void operator()(EVP_PKEY* key) const noexcept;
};
using EvpKeyPtr = std::unique_ptr<EVP_PKEY, EvpKeyDeleter>;

struct BioDeleter {
  void operator()(BIO* bio) const noexcept;
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

/// DER private key (in secure memory) and DER SubjectPublicKeyInfo
using KeyPairDer = std::pair<SecureBytes, std::vector<uint8_t>>;

/**
 * @brief Concept for cryptographic algorithm data types
 */
template <typename T>
concept CryptoData = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

/**
 * @brief Abstract base class for cryptographic algorithms
 *
 * Instances are immutable after construction and safe to share between
 * threads.
 */
class CryptographicAlgorithm {
 public:
  virtual ~CryptographicAlgorithm() = default;

  /**
   * @brief Sign data with the algorithm
   * @param data Data to sign
   * @return Signature bytes
   * @throws CryptoError if the key cannot sign
   */
  template <CryptoData T>
  std::vector<uint8_t> sign(const T& data) const {
    return signImpl({std::data(data), std::size(data)});
  }

  /**
   * @brief Verify a signature
   * @return True if signature is valid
   */
  template <CryptoData T1, CryptoData T2>
  bool verify(const T1& data, const T2& signature) const {
    return verifyImpl({std::data(data), std::size(data)},
                      {std::data(signature), std::size(signature)});
  }

  /**
   * @brief Encrypt data with the algorithm
   * @param data Plaintext
   * @param iv Initialization vector
   * @param aad Additional authenticated data
   * @return Ciphertext followed by the authentication tag
   * @throws CryptoError if algorithm doesn't support encryption
   */
  template <CryptoData T1, CryptoData T2>
  std::vector<uint8_t> encrypt(const T1& data, const T2& iv,
                               std::span<const uint8_t> aad = {}) const {
    return encryptImpl({std::data(data), std::size(data)},
                       {std::data(iv), std::size(iv)}, aad);
  }

  /**
   * @brief Decrypt and authenticate data
   * @param encryptedData Ciphertext followed by the authentication tag
   * @param iv Initialization vector
   * @param aad Additional authenticated data used at encryption
   * @return Plaintext in secure memory
   * @throws IntegrityError if the tag does not verify
   * @throws CryptoError if algorithm doesn't support decryption
   */
  template <CryptoData T1, CryptoData T2>
  SecureBytes decrypt(const T1& encryptedData, const T2& iv,
                      std::span<const uint8_t> aad = {}) const {
    return decryptImpl({std::data(encryptedData), std::size(encryptedData)},
                       {std::data(iv), std::size(iv)}, aad);
  }

  /**
   * @brief Get the COSE algorithm identifier
   */
  virtual int64_t algorithmId() const = 0;

  virtual bool supportsEncryption() const { return false; }

 protected:
  virtual std::vector<uint8_t> signImpl(
      std::span<const uint8_t> data) const = 0;
  virtual bool verifyImpl(std::span<const uint8_t> data,
                          std::span<const uint8_t> signature) const = 0;
  virtual std::vector<uint8_t> encryptImpl(
      std::span<const uint8_t> data, std::span<const uint8_t> iv,
      std::span<const uint8_t> aad) const;
  virtual SecureBytes decryptImpl(std::span<const uint8_t> encryptedData,
                                  std::span<const uint8_t> iv,
                                  std::span<const uint8_t> aad) const;
};

/**
 * @brief HMAC-SHA256 (HS256) with the key held in secure memory
 */
class HmacSha256Algorithm : public CryptographicAlgorithm {
 private:
  SecureBytes key_;

 public:
  explicit HmacSha256Algorithm(SecureBytes key) : key_(std::move(key)) {
    if (!crypto_constants::is_valid_hmac_key_size(key_.size())) {
      throw CryptoError("Invalid HMAC key size");
    }
  }

  static SecureBytes generateSecureKey();

  std::vector<uint8_t> signImpl(std::span<const uint8_t> data) const override;
  bool verifyImpl(std::span<const uint8_t> data,
                  std::span<const uint8_t> signature) const override;
  int64_t algorithmId() const override;
};

/**
 * @brief ECDSA P-256 with SHA-256 (ES256)
 */
class Es256Algorithm : public CryptographicAlgorithm {
 public:
  struct Impl;

 private:
  std::unique_ptr<Impl> pImpl_;

  void initializeImpl();
  void loadPrivateKey(const uint8_t* keyData, size_t keySize);
  void loadPublicKey(const uint8_t* keyData, size_t keySize);

 public:
  /// Generates a fresh key pair
  Es256Algorithm();
  Es256Algorithm(const SecureBytes& privateKey,
                 const std::vector<uint8_t>& publicKey);
  /// Verification only
  explicit Es256Algorithm(const std::vector<uint8_t>& publicKey);
  ~Es256Algorithm() override;

  Es256Algorithm(Es256Algorithm&& other) noexcept;
  Es256Algorithm& operator=(Es256Algorithm&& other) noexcept;
  Es256Algorithm(const Es256Algorithm&) = delete;
  Es256Algorithm& operator=(const Es256Algorithm&) = delete;

  static KeyPairDer generateSecureKeyPair();

  std::vector<uint8_t> getPublicKey() const;

  std::vector<uint8_t> signImpl(std::span<const uint8_t> data) const override;
  bool verifyImpl(std::span<const uint8_t> data,
                  std::span<const uint8_t> signature) const override;
  int64_t algorithmId() const override;
};

/**
 * @brief RSASSA-PSS with SHA-256 (PS256)
 */
class Ps256Algorithm : public CryptographicAlgorithm {
 public:
  struct Impl;

 private:
  std::unique_ptr<Impl> pImpl_;

  void initializeImpl();
  void loadPrivateKey(const uint8_t* keyData, size_t keySize);
  void loadPublicKey(const uint8_t* keyData, size_t keySize);

 public:
  /// Generates a fresh 2048-bit key pair
  Ps256Algorithm();
  Ps256Algorithm(const SecureBytes& privateKey,
                 const std::vector<uint8_t>& publicKey);
  /// Verification only
  explicit Ps256Algorithm(const std::vector<uint8_t>& publicKey);
  ~Ps256Algorithm() override;

  Ps256Algorithm(Ps256Algorithm&& other) noexcept;
  Ps256Algorithm& operator=(Ps256Algorithm&& other) noexcept;
  Ps256Algorithm(const Ps256Algorithm&) = delete;
  Ps256Algorithm& operator=(const Ps256Algorithm&) = delete;

  static KeyPairDer generateSecureKeyPair();

  std::vector<uint8_t> getPublicKey() const;

  std::vector<uint8_t> signImpl(std::span<const uint8_t> data) const override;
  bool verifyImpl(std::span<const uint8_t> data,
                  std::span<const uint8_t> signature) const override;
  int64_t algorithmId() const override;
};

/**
 * @brief AES-256-GCM authenticated encryption
 */
class AesGcmAlgorithm : public CryptographicAlgorithm {
 private:
  SecureBytes key_;

 public:
  /**
   * @param key 32-byte AES key
   * @throws CryptoError for any other key size
   */
  explicit AesGcmAlgorithm(SecureBytes key);

  static SecureBytes generateSecureKey();

  /**
   * @brief Generate a random 96-bit IV
   */
  static std::vector<uint8_t> generateIV();

  std::vector<uint8_t> signImpl(std::span<const uint8_t> data) const override;
  bool verifyImpl(std::span<const uint8_t> data,
                  std::span<const uint8_t> signature) const override;

  std::vector<uint8_t> encryptImpl(std::span<const uint8_t> data,
                                   std::span<const uint8_t> iv,
                                   std::span<const uint8_t> aad) const override;
  SecureBytes decryptImpl(std::span<const uint8_t> encryptedData,
                          std::span<const uint8_t> iv,
                          std::span<const uint8_t> aad) const override;

  int64_t algorithmId() const override;
  bool supportsEncryption() const override { return true; }
};

/**
 * @brief Build a signer for a generation's algorithm
 * @param alg Signing algorithm
 * @param hmacKey Key for HS256, ignored otherwise
 * @param keyPair Key pair for ES256/PS256, ignored for HS256
 */
std::shared_ptr<const CryptographicAlgorithm> makeSigner(
    SigningAlgorithm alg, const SecureBytes& hmacKey,
    const std::optional<KeyPairDer>& keyPair);

/**
 * @brief Generate a key pair for an asymmetric algorithm
 * @throws UnsupportedAlgorithmError for HS256
 */
KeyPairDer generateKeyPair(SigningAlgorithm alg);

/**
 * @brief JWS-style signing input, the two encoded segments joined by '.'
 */
std::vector<uint8_t> createSigningInput(std::string_view headerSegment,
                                        std::string_view bodySegment);

std::vector<uint8_t> hashSha256(std::span<const uint8_t> data);

std::vector<uint8_t> hmacSha256(std::span<const uint8_t> key,
                                std::span<const uint8_t> data);

/**
 * @brief Fill a buffer from the OpenSSL CSPRNG
 * @throws CryptoError or an OS error if the generator fails
 */
void randomFill(std::span<uint8_t> out);

std::vector<uint8_t> randomBytes(size_t count);

/**
 * @brief Lowercase hexadecimal encoding
 */
std::string toHex(std::span<const uint8_t> data);

/**
 * @throws InvalidArgumentError for odd length or a non-hex digit
 */
std::vector<uint8_t> fromHex(std::string_view hex);

}  // namespace warden
