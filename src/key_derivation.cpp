#include "warden/key_derivation.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <string>

#include "openssl_wrapper.hpp"
#include "warden/crypto.hpp"
#include "warden/logging.hpp"

namespace warden {

namespace {

constexpr std::array<std::string_view, 8> kWellKnownSecrets = {
    "secret", "jwt-secret",      "development", "test",
    "demo",   "your-secret-key", "change-me",   "default"};

constexpr std::array<std::string_view, 4> kDevelopmentMarkers = {
    "dev", "test", "demo", "local"};

std::string toLower(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return lower;
}

}  // namespace

KeyDerivation::KeyDerivation(uint32_t iterations) : iterations_(iterations) {
  if (iterations_ < kMinPbkdf2Iterations) {
    throw ConfigError("PBKDF2 iteration count " + std::to_string(iterations) +
                      " is below the minimum of " +
                      std::to_string(kMinPbkdf2Iterations));
  }
}

SecureBytes KeyDerivation::derive(std::string_view master_secret,
                                  std::span<const uint8_t> salt) const {
  SecureBytes key(kKeySize);
  if (PKCS5_PBKDF2_HMAC(master_secret.data(),
                        static_cast<int>(master_secret.size()), salt.data(),
                        static_cast<int>(salt.size()),
                        static_cast<int>(iterations_), EVP_sha256(),
                        static_cast<int>(key.size()), key.data()) != 1) {
    throw CryptoError("PBKDF2 key derivation failed");
  }
  return key;
}

std::vector<uint8_t> KeyDerivation::generateSalt() {
  return randomBytes(kSaltSize);
}

SecureBytes KeyDerivation::expand(std::span<const uint8_t> key,
                                  std::string_view label, size_t length) {
  auto pctx = EvpPkeyCtxWrapper(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  if (!pctx.get()) {
    throw CryptoError("Failed to create HKDF context");
  }
  if (EVP_PKEY_derive_init(pctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), key.data(),
                                 static_cast<int>(key.size())) <= 0 ||
      EVP_PKEY_CTX_add1_hkdf_info(
          pctx.get(), reinterpret_cast<const unsigned char*>(label.data()),
          static_cast<int>(label.size())) <= 0) {
    throw CryptoError("Failed to configure HKDF");
  }

  SecureBytes out(length);
  size_t out_len = out.size();
  if (EVP_PKEY_derive(pctx.get(), out.data(), &out_len) <= 0 ||
      out_len != length) {
    throw CryptoError("HKDF expansion failed");
  }
  return out;
}

double KeyDerivation::shannonEntropy(std::string_view text) {
  if (text.empty()) {
    return 0.0;
  }
  std::array<size_t, 256> counts{};
  for (unsigned char c : text) {
    ++counts[c];
  }
  double entropy = 0.0;
  const double length = static_cast<double>(text.size());
  for (size_t count : counts) {
    if (count == 0) continue;
    double p = static_cast<double>(count) / length;
    entropy -= p * std::log2(p);
  }
  return entropy;
}

void KeyDerivation::validateMasterSecret(std::string_view secret,
                                         Environment env) {
  if (secret.size() < kMinSecretSize) {
    throw WeakSecretError("must be at least " +
                          std::to_string(kMinSecretSize) + " bytes, got " +
                          std::to_string(secret.size()));
  }

  std::string problem;
  auto lower = toLower(secret);
  for (auto known : kWellKnownSecrets) {
    if (lower == known) {
      problem = "matches a well-known default value";
    }
  }

  double entropy = shannonEntropy(secret);
  if (problem.empty() && entropy < kMinEntropyBitsPerChar) {
    problem = "insufficient entropy (" + std::to_string(entropy) +
              " bits per character)";
  }

  if (problem.empty() && env == Environment::Production) {
    for (auto marker : kDevelopmentMarkers) {
      if (lower.find(marker) != std::string::npos) {
        problem = "production secret contains development marker '" +
                  std::string(marker) + "'";
        break;
      }
    }
  }

  secure_utils::wipe(lower);
  if (!problem.empty()) {
    throw WeakSecretError(problem);
  }
  WARDEN_LOG_DEBUG("Master secret passed strength checks");
}

}  // namespace warden
