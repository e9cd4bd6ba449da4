#include "warden/crypto.hpp"

#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/sha.h>
#include <openssl/x509.h>

#include <array>
#include <cstring>
#include <memory>

#include "openssl_wrapper.hpp"
#include "warden/logging.hpp"

namespace warden {

void EvpKeyDeleter::operator()(EVP_PKEY* key) const noexcept {
  if (key) EVP_PKEY_free(key);
}

void BioDeleter::operator()(BIO* bio) const noexcept {
  if (bio) BIO_free(bio);
}

void randomFill(std::span<uint8_t> out) {
  if (out.empty()) return;
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    WARDEN_LOG_ERROR("RAND_bytes failed for {} bytes", out.size());
    unsigned long err = ERR_get_error();
    if (err == 0) {
      throwOsError("RAND_bytes");
    } else {
      throw CryptoError("Failed to generate random bytes: OpenSSL error " +
                        std::to_string(err));
    }
  }
}

std::vector<uint8_t> randomBytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  randomFill(bytes);
  return bytes;
}

std::vector<uint8_t> hashSha256(std::span<const uint8_t> data) {
  std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
  SHA256(data.data(), data.size(), hash.data());
  return hash;
}

std::vector<uint8_t> hmacSha256(std::span<const uint8_t> key,
                                std::span<const uint8_t> data) {
  std::vector<uint8_t> mac(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            data.data(), data.size(), mac.data(), &len)) {
    throw CryptoError("HMAC computation failed");
  }
  mac.resize(len);
  return mac;
}

std::string toHex(std::span<const uint8_t> data) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t b : data) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0F]);
  }
  return out;
}

std::vector<uint8_t> fromHex(std::string_view hex) {
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  if (hex.size() % 2 != 0) {
    throw InvalidArgumentError("hex string has odd length");
  }
  std::vector<uint8_t> out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw InvalidArgumentError("invalid hex digit");
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::vector<uint8_t> createSigningInput(std::string_view headerSegment,
                                        std::string_view bodySegment) {
  std::vector<uint8_t> input;
  input.reserve(headerSegment.size() + bodySegment.size() + 1);
  input.insert(input.end(), headerSegment.begin(), headerSegment.end());
  input.push_back('.');
  input.insert(input.end(), bodySegment.begin(), bodySegment.end());
  return input;
}

namespace {

KeyPairDer serializeKeyPair(EVP_PKEY* pkey) {
  auto priv_bio = BioPtr(BIO_new(BIO_s_mem()));
  auto pub_bio = BioPtr(BIO_new(BIO_s_mem()));
  if (!priv_bio || !pub_bio) {
    throw CryptoError("Failed to create BIO objects");
  }

  if (!i2d_PrivateKey_bio(priv_bio.get(), pkey) ||
      !i2d_PUBKEY_bio(pub_bio.get(), pkey)) {
    throw CryptoError("Failed to serialize keys");
  }

  char* priv_data = nullptr;
  char* pub_data = nullptr;
  long priv_len = BIO_get_mem_data(priv_bio.get(), &priv_data);
  long pub_len = BIO_get_mem_data(pub_bio.get(), &pub_data);

  SecureBytes privateKey(priv_data, priv_data + priv_len);
  std::vector<uint8_t> publicKey(pub_data, pub_data + pub_len);
  return {std::move(privateKey), std::move(publicKey)};
}

EVP_PKEY* loadDerPrivateKey(const uint8_t* keyData, size_t keySize) {
  auto bio = BioPtr(BIO_new_mem_buf(keyData, static_cast<int>(keySize)));
  if (!bio) {
    throw CryptoError("Failed to create BIO for private key");
  }
  EVP_PKEY* key = d2i_PrivateKey_bio(bio.get(), nullptr);
  if (!key) {
    throw CryptoError("Failed to load private key");
  }
  return key;
}

EVP_PKEY* loadDerPublicKey(const uint8_t* keyData, size_t keySize) {
  auto bio = BioPtr(BIO_new_mem_buf(keyData, static_cast<int>(keySize)));
  if (!bio) {
    throw CryptoError("Failed to create BIO for public key");
  }
  EVP_PKEY* key = d2i_PUBKEY_bio(bio.get(), nullptr);
  if (!key) {
    throw CryptoError("Failed to load public key");
  }
  return key;
}

std::vector<uint8_t> exportPublicKey(EVP_PKEY* key) {
  if (!key) {
    return {};
  }
  auto bio = BioPtr(BIO_new(BIO_s_mem()));
  if (!bio || !i2d_PUBKEY_bio(bio.get(), key)) {
    return {};
  }
  char* data = nullptr;
  long len = BIO_get_mem_data(bio.get(), &data);
  return std::vector<uint8_t>(data, data + len);
}

}  // namespace

//
// CryptographicAlgorithm defaults
//

std::vector<uint8_t> CryptographicAlgorithm::encryptImpl(
    std::span<const uint8_t>, std::span<const uint8_t>,
    std::span<const uint8_t>) const {
  throw CryptoError("Algorithm does not support encryption");
}

SecureBytes CryptographicAlgorithm::decryptImpl(std::span<const uint8_t>,
                                                std::span<const uint8_t>,
                                                std::span<const uint8_t>) const {
  throw CryptoError("Algorithm does not support decryption");
}

//
// HmacSha256Algorithm
//

SecureBytes HmacSha256Algorithm::generateSecureKey() {
  SecureBytes key(crypto_constants::HMAC_KEY_SIZE);
  randomFill(key);
  return key;
}

std::vector<uint8_t> HmacSha256Algorithm::signImpl(
    std::span<const uint8_t> data) const {
  return hmacSha256(key_, data);
}

bool HmacSha256Algorithm::verifyImpl(std::span<const uint8_t> data,
                                     std::span<const uint8_t> signature) const {
  auto computed = signImpl(data);
  return secure_utils::constantTimeEqual(std::span<const uint8_t>(computed),
                                         signature);
}

int64_t HmacSha256Algorithm::algorithmId() const { return ALG_HMAC256_256; }

//
// ES256
//

struct Es256Algorithm::Impl {
  EvpKeyPtr privateKey;
  EvpKeyPtr publicKey;
};

void Es256Algorithm::initializeImpl() {
  try {
    pImpl_ = std::make_unique<Impl>();
  } catch (const std::bad_alloc&) {
    throwOsError("Es256Algorithm constructor memory allocation", ENOMEM);
  }
}

void Es256Algorithm::loadPrivateKey(const uint8_t* keyData, size_t keySize) {
  pImpl_->privateKey.reset(loadDerPrivateKey(keyData, keySize));
  if (EVP_PKEY_base_id(pImpl_->privateKey.get()) != EVP_PKEY_EC) {
    throw CryptoError("ES256 requires an EC private key");
  }
}

void Es256Algorithm::loadPublicKey(const uint8_t* keyData, size_t keySize) {
  pImpl_->publicKey.reset(loadDerPublicKey(keyData, keySize));
  if (EVP_PKEY_base_id(pImpl_->publicKey.get()) != EVP_PKEY_EC) {
    throw CryptoError("ES256 requires an EC public key");
  }
}

Es256Algorithm::Es256Algorithm() {
  initializeImpl();
  auto keyPair = generateSecureKeyPair();
  loadPrivateKey(keyPair.first.data(), keyPair.first.size());
  loadPublicKey(keyPair.second.data(), keyPair.second.size());
}

Es256Algorithm::Es256Algorithm(const SecureBytes& privateKey,
                               const std::vector<uint8_t>& publicKey) {
  initializeImpl();
  loadPrivateKey(privateKey.data(), privateKey.size());
  loadPublicKey(publicKey.data(), publicKey.size());
}

Es256Algorithm::Es256Algorithm(const std::vector<uint8_t>& publicKey) {
  initializeImpl();
  loadPublicKey(publicKey.data(), publicKey.size());
}

Es256Algorithm::~Es256Algorithm() = default;

Es256Algorithm::Es256Algorithm(Es256Algorithm&& other) noexcept
    : pImpl_(std::move(other.pImpl_)) {}

Es256Algorithm& Es256Algorithm::operator=(Es256Algorithm&& other) noexcept {
  if (this != &other) {
    pImpl_ = std::move(other.pImpl_);
  }
  return *this;
}

KeyPairDer Es256Algorithm::generateSecureKeyPair() {
  WARDEN_LOG_DEBUG("Generating ES256 key pair");
  auto pctx = EvpPkeyCtxWrapper(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr));
  if (!pctx.get()) {
    throw CryptoError("Failed to create EC key context");
  }

  if (EVP_PKEY_keygen_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize EC key generation");
  }

  if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx.get(),
                                             NID_X9_62_prime256v1) <= 0) {
    throw CryptoError("Failed to set EC curve");
  }

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &pkey) <= 0) {
    throw CryptoError("Failed to generate EC key pair");
  }
  auto key = EvpKeyPtr(pkey);
  return serializeKeyPair(key.get());
}

std::vector<uint8_t> Es256Algorithm::getPublicKey() const {
  return exportPublicKey(pImpl_ ? pImpl_->publicKey.get() : nullptr);
}

std::vector<uint8_t> Es256Algorithm::signImpl(
    std::span<const uint8_t> data) const {
  if (!pImpl_ || !pImpl_->privateKey) {
    throw CryptoError("No private key available for signing");
  }

  auto mdctx = EvpMdCtxWrapper(EVP_MD_CTX_new());
  if (!mdctx.get()) throw CryptoError("Failed to create signing context");

  if (EVP_DigestSignInit(mdctx.get(), nullptr, EVP_sha256(), nullptr,
                         pImpl_->privateKey.get()) <= 0) {
    throw CryptoError("Failed to initialize signing");
  }

  if (EVP_DigestSignUpdate(mdctx.get(), data.data(), data.size()) <= 0) {
    throw CryptoError("Failed to update signing context");
  }

  size_t sigLen = 0;
  if (EVP_DigestSignFinal(mdctx.get(), nullptr, &sigLen) <= 0) {
    throw CryptoError("Failed to determine signature length");
  }

  std::vector<uint8_t> signature(sigLen);
  if (EVP_DigestSignFinal(mdctx.get(), signature.data(), &sigLen) <= 0) {
    throw CryptoError("Failed to sign data");
  }

  signature.resize(sigLen);
  return signature;
}

bool Es256Algorithm::verifyImpl(std::span<const uint8_t> data,
                                std::span<const uint8_t> signature) const {
  if (!pImpl_ || !pImpl_->publicKey) {
    return false;
  }

  auto mdctx = EvpMdCtxWrapper(EVP_MD_CTX_new());
  if (!mdctx.get()) return false;

  if (EVP_DigestVerifyInit(mdctx.get(), nullptr, EVP_sha256(), nullptr,
                           pImpl_->publicKey.get()) <= 0) {
    return false;
  }

  if (EVP_DigestVerifyUpdate(mdctx.get(), data.data(), data.size()) <= 0) {
    return false;
  }

  int result =
      EVP_DigestVerifyFinal(mdctx.get(), signature.data(), signature.size());
  // A malformed DER signature leaves an error on the thread's queue
  ERR_clear_error();
  return result == 1;
}

int64_t Es256Algorithm::algorithmId() const { return ALG_ES256; }

//
// PS256 (RSA-PSS with SHA-256)
//

struct Ps256Algorithm::Impl {
  EvpKeyPtr privateKey;
  EvpKeyPtr publicKey;
};

void Ps256Algorithm::initializeImpl() {
  try {
    pImpl_ = std::make_unique<Impl>();
  } catch (const std::bad_alloc&) {
    throwOsError("Ps256Algorithm constructor memory allocation", ENOMEM);
  }
}

void Ps256Algorithm::loadPrivateKey(const uint8_t* keyData, size_t keySize) {
  pImpl_->privateKey.reset(loadDerPrivateKey(keyData, keySize));
  if (EVP_PKEY_base_id(pImpl_->privateKey.get()) != EVP_PKEY_RSA) {
    throw CryptoError("PS256 requires an RSA private key");
  }
}

void Ps256Algorithm::loadPublicKey(const uint8_t* keyData, size_t keySize) {
  pImpl_->publicKey.reset(loadDerPublicKey(keyData, keySize));
  if (EVP_PKEY_base_id(pImpl_->publicKey.get()) != EVP_PKEY_RSA) {
    throw CryptoError("PS256 requires an RSA public key");
  }
}

Ps256Algorithm::Ps256Algorithm() {
  initializeImpl();
  auto keyPair = generateSecureKeyPair();
  loadPrivateKey(keyPair.first.data(), keyPair.first.size());
  loadPublicKey(keyPair.second.data(), keyPair.second.size());
}

Ps256Algorithm::Ps256Algorithm(const SecureBytes& privateKey,
                               const std::vector<uint8_t>& publicKey) {
  initializeImpl();
  loadPrivateKey(privateKey.data(), privateKey.size());
  loadPublicKey(publicKey.data(), publicKey.size());
}

Ps256Algorithm::Ps256Algorithm(const std::vector<uint8_t>& publicKey) {
  initializeImpl();
  loadPublicKey(publicKey.data(), publicKey.size());
}

Ps256Algorithm::~Ps256Algorithm() = default;

Ps256Algorithm::Ps256Algorithm(Ps256Algorithm&& other) noexcept
    : pImpl_(std::move(other.pImpl_)) {}

Ps256Algorithm& Ps256Algorithm::operator=(Ps256Algorithm&& other) noexcept {
  if (this != &other) {
    pImpl_ = std::move(other.pImpl_);
  }
  return *this;
}

KeyPairDer Ps256Algorithm::generateSecureKeyPair() {
  WARDEN_LOG_DEBUG("Generating PS256 key pair ({} bits)",
                   crypto_constants::RSA_KEY_BITS);
  auto pctx = EvpPkeyCtxWrapper(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
  if (!pctx.get()) throw CryptoError("Failed to create RSA key context");

  if (EVP_PKEY_keygen_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize RSA key generation");
  }

  if (EVP_PKEY_CTX_set_rsa_keygen_bits(pctx.get(),
                                       crypto_constants::RSA_KEY_BITS) <= 0) {
    throw CryptoError("Failed to set RSA key size");
  }

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen(pctx.get(), &pkey) <= 0) {
    throw CryptoError("Failed to generate RSA key pair");
  }
  auto key = EvpKeyPtr(pkey);
  return serializeKeyPair(key.get());
}

std::vector<uint8_t> Ps256Algorithm::getPublicKey() const {
  return exportPublicKey(pImpl_ ? pImpl_->publicKey.get() : nullptr);
}

std::vector<uint8_t> Ps256Algorithm::signImpl(
    std::span<const uint8_t> data) const {
  if (!pImpl_ || !pImpl_->privateKey) {
    throw CryptoError("No private key available for signing");
  }

  auto pctx =
      EvpPkeyCtxWrapper(EVP_PKEY_CTX_new(pImpl_->privateKey.get(), nullptr));
  if (!pctx.get()) throw CryptoError("Failed to create signing context");

  if (EVP_PKEY_sign_init(pctx.get()) <= 0) {
    throw CryptoError("Failed to initialize signing");
  }

  if (EVP_PKEY_CTX_set_rsa_padding(pctx.get(), RSA_PKCS1_PSS_PADDING) <= 0) {
    throw CryptoError("Failed to set PSS padding");
  }

  if (EVP_PKEY_CTX_set_signature_md(pctx.get(), EVP_sha256()) <= 0) {
    throw CryptoError("Failed to set signature hash");
  }

  auto hash = hashSha256(data);
  size_t sigLen = 0;
  if (EVP_PKEY_sign(pctx.get(), nullptr, &sigLen, hash.data(), hash.size()) <=
      0) {
    throw CryptoError("Failed to determine signature length");
  }

  std::vector<uint8_t> signature(sigLen);
  if (EVP_PKEY_sign(pctx.get(), signature.data(), &sigLen, hash.data(),
                    hash.size()) <= 0) {
    throw CryptoError("Failed to sign data");
  }

  signature.resize(sigLen);
  return signature;
}

bool Ps256Algorithm::verifyImpl(std::span<const uint8_t> data,
                                std::span<const uint8_t> signature) const {
  if (!pImpl_ || !pImpl_->publicKey) {
    return false;
  }

  auto pctx =
      EvpPkeyCtxWrapper(EVP_PKEY_CTX_new(pImpl_->publicKey.get(), nullptr));
  if (!pctx.get()) return false;

  if (EVP_PKEY_verify_init(pctx.get()) <= 0) {
    return false;
  }

  if (EVP_PKEY_CTX_set_rsa_padding(pctx.get(), RSA_PKCS1_PSS_PADDING) <= 0) {
    return false;
  }

  if (EVP_PKEY_CTX_set_signature_md(pctx.get(), EVP_sha256()) <= 0) {
    return false;
  }

  auto hash = hashSha256(data);
  int result = EVP_PKEY_verify(pctx.get(), signature.data(), signature.size(),
                               hash.data(), hash.size());
  ERR_clear_error();
  return result == 1;
}

int64_t Ps256Algorithm::algorithmId() const { return ALG_PS256; }

//
// AES-256-GCM
//

AesGcmAlgorithm::AesGcmAlgorithm(SecureBytes key) : key_(std::move(key)) {
  if (key_.size() != crypto_constants::AES256_KEY_SIZE) {
    throw CryptoError("Invalid AES key size (A256GCM requires 256-bit key)");
  }
}

SecureBytes AesGcmAlgorithm::generateSecureKey() {
  SecureBytes key(crypto_constants::AES256_KEY_SIZE);
  randomFill(key);
  return key;
}

std::vector<uint8_t> AesGcmAlgorithm::generateIV() {
  return randomBytes(crypto_constants::GCM_IV_SIZE);
}

std::vector<uint8_t> AesGcmAlgorithm::signImpl(std::span<const uint8_t>) const {
  throw CryptoError("AES-GCM algorithm does not support signing");
}

bool AesGcmAlgorithm::verifyImpl(std::span<const uint8_t>,
                                 std::span<const uint8_t>) const {
  throw CryptoError("AES-GCM algorithm does not support signature verification");
}

std::vector<uint8_t> AesGcmAlgorithm::encryptImpl(
    std::span<const uint8_t> data, std::span<const uint8_t> iv,
    std::span<const uint8_t> aad) const {
  if (iv.size() != crypto_constants::GCM_IV_SIZE) {
    throw CryptoError("Invalid IV size for AES-GCM (must be 12 bytes)");
  }

  auto ctx = EvpCipherCtxWrapper(EVP_CIPHER_CTX_new());
  if (!ctx.get()) {
    throw CryptoError("Failed to create AES-GCM context");
  }

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key_.data(),
                         iv.data()) != 1) {
    throw CryptoError("Failed to initialize AES-GCM encryption");
  }

  int len = 0;
  if (!aad.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    throw CryptoError("Failed to bind AES-GCM additional data");
  }

  std::vector<uint8_t> ciphertext(data.size() + crypto_constants::GCM_TAG_SIZE);
  if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, data.data(),
                        static_cast<int>(data.size())) != 1) {
    throw CryptoError("Failed to encrypt data");
  }
  int ciphertext_len = len;

  if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + len, &len) != 1) {
    throw CryptoError("Failed to finalize AES-GCM encryption");
  }
  ciphertext_len += len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          crypto_constants::GCM_TAG_SIZE,
                          ciphertext.data() + ciphertext_len) != 1) {
    throw CryptoError("Failed to get AES-GCM authentication tag");
  }

  ciphertext.resize(ciphertext_len + crypto_constants::GCM_TAG_SIZE);
  return ciphertext;
}

SecureBytes AesGcmAlgorithm::decryptImpl(std::span<const uint8_t> encryptedData,
                                         std::span<const uint8_t> iv,
                                         std::span<const uint8_t> aad) const {
  if (iv.size() != crypto_constants::GCM_IV_SIZE) {
    throw IntegrityError();
  }

  if (encryptedData.size() < crypto_constants::GCM_TAG_SIZE) {
    throw IntegrityError();
  }

  auto ctx = EvpCipherCtxWrapper(EVP_CIPHER_CTX_new());
  if (!ctx.get()) {
    throw CryptoError("Failed to create AES-GCM context");
  }

  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key_.data(),
                         iv.data()) != 1) {
    throw CryptoError("Failed to initialize AES-GCM decryption");
  }

  size_t ciphertext_len =
      encryptedData.size() - crypto_constants::GCM_TAG_SIZE;
  const uint8_t* ciphertext = encryptedData.data();
  std::array<uint8_t, crypto_constants::GCM_TAG_SIZE> tag{};
  std::memcpy(tag.data(), encryptedData.data() + ciphertext_len, tag.size());

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          crypto_constants::GCM_TAG_SIZE, tag.data()) != 1) {
    throw CryptoError("Failed to set AES-GCM authentication tag");
  }

  int len = 0;
  if (!aad.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                        static_cast<int>(aad.size())) != 1) {
    throw CryptoError("Failed to bind AES-GCM additional data");
  }

  // Plaintext stays in locked memory and is zeroed if the tag check fails
  SecureBytes plaintext(ciphertext_len);
  if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext,
                        static_cast<int>(ciphertext_len)) != 1) {
    throw CryptoError("Failed to decrypt data");
  }
  int plaintext_len = len;

  int ret = EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, &len);
  if (ret <= 0) {
    WARDEN_LOG_DEBUG("AES-GCM authentication tag verification failed");
    throw IntegrityError();
  }
  plaintext_len += len;

  plaintext.resize(plaintext_len);
  return plaintext;
}

int64_t AesGcmAlgorithm::algorithmId() const { return ALG_A256GCM; }

//
// Factories
//

KeyPairDer generateKeyPair(SigningAlgorithm alg) {
  switch (alg) {
    case SigningAlgorithm::ES256:
      return Es256Algorithm::generateSecureKeyPair();
    case SigningAlgorithm::PS256:
      return Ps256Algorithm::generateSecureKeyPair();
    default:
      throw UnsupportedAlgorithmError(
          std::string(algorithmName(alg)) + " does not use a key pair");
  }
}

std::shared_ptr<const CryptographicAlgorithm> makeSigner(
    SigningAlgorithm alg, const SecureBytes& hmacKey,
    const std::optional<KeyPairDer>& keyPair) {
  switch (alg) {
    case SigningAlgorithm::HS256:
      return std::make_shared<HmacSha256Algorithm>(hmacKey);
    case SigningAlgorithm::ES256:
      if (!keyPair) throw CryptoError("ES256 generation has no key pair");
      return std::make_shared<Es256Algorithm>(keyPair->first, keyPair->second);
    case SigningAlgorithm::PS256:
      if (!keyPair) throw CryptoError("PS256 generation has no key pair");
      return std::make_shared<Ps256Algorithm>(keyPair->first, keyPair->second);
  }
  throw UnsupportedAlgorithmError(algorithmName(alg));
}

}  // namespace warden
