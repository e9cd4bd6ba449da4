#include "warden/payload_cipher.hpp"

#include <cbor.h>

#include <cstdlib>

#include "warden/crypto.hpp"
#include "warden/logging.hpp"

namespace warden {

void CborItemDeleter::operator()(cbor_item_t* item) const noexcept {
  if (item) {
    cbor_decref(&item);
  }
}

void CborBufferDeleter::operator()(unsigned char* buffer) const noexcept {
  if (buffer) {
    free(buffer);
  }
}

namespace {

CborItemPtr buildText(std::string_view text) {
  auto item = CborItemPtr(cbor_build_stringn(text.data(), text.size()));
  if (!item) {
    throwOsError("cbor_build_stringn", ENOMEM);
  }
  return item;
}

std::string extractText(cbor_item_t* item) {
  if (!item || !cbor_isa_string(item) || !cbor_string_is_definite(item)) {
    throw InvalidCborError("expected a definite text string");
  }
  const char* data = reinterpret_cast<const char*>(cbor_string_handle(item));
  return std::string(data, cbor_string_length(item));
}

template <typename Vec>
Vec serialize(const CborItemPtr& item) {
  unsigned char* raw_buffer = nullptr;
  size_t buffer_size = 0;
  size_t length = cbor_serialize_alloc(item.get(), &raw_buffer, &buffer_size);
  auto buffer = CborBufferPtr(raw_buffer);
  if (length == 0) {
    throw InvalidCborError("serialization failed");
  }
  Vec out(buffer.get(), buffer.get() + length);
  SecureAllocator<unsigned char>::secureZero(buffer.get(), buffer_size);
  return out;
}

}  // namespace

namespace payload_cipher {

std::vector<uint8_t> associatedData(GenerationId generation) {
  auto array = CborItemPtr(cbor_new_definite_array(3));
  if (!array) {
    throwOsError("cbor_new_definite_array", ENOMEM);
  }
  auto context = buildText("Encrypt0");
  auto gen = CborItemPtr(cbor_build_uint64(generation));
  // A256GCM is positive, so it encodes as an unsigned integer
  auto alg = CborItemPtr(cbor_build_uint64(static_cast<uint64_t>(ALG_A256GCM)));
  if (!gen || !alg || !cbor_array_push(array.get(), context.get()) ||
      !cbor_array_push(array.get(), gen.get()) ||
      !cbor_array_push(array.get(), alg.get())) {
    throw InvalidCborError("failed to build associated data");
  }
  return serialize<std::vector<uint8_t>>(array);
}

EncryptedPayload encrypt(std::span<const uint8_t> plaintext,
                         const KeyMaterial& key) {
  auto nonce = AesGcmAlgorithm::generateIV();
  auto aad = associatedData(key.generation());
  auto sealed = key.cipher().encrypt(plaintext, nonce, aad);

  EncryptedPayload payload;
  payload.key_generation = key.generation();
  payload.nonce = std::move(nonce);
  auto tag_start = sealed.end() - crypto_constants::GCM_TAG_SIZE;
  payload.tag.assign(tag_start, sealed.end());
  sealed.erase(tag_start, sealed.end());
  payload.ciphertext = std::move(sealed);
  return payload;
}

SecureBytes decrypt(const EncryptedPayload& payload, const KeyMaterial& key) {
  if (payload.key_generation != key.generation() ||
      payload.tag.size() != crypto_constants::GCM_TAG_SIZE ||
      payload.nonce.size() != crypto_constants::GCM_IV_SIZE) {
    throw IntegrityError();
  }
  std::vector<uint8_t> sealed;
  sealed.reserve(payload.ciphertext.size() + payload.tag.size());
  sealed.insert(sealed.end(), payload.ciphertext.begin(),
                payload.ciphertext.end());
  sealed.insert(sealed.end(), payload.tag.begin(), payload.tag.end());

  auto aad = associatedData(payload.key_generation);
  return key.cipher().decrypt(sealed, payload.nonce, aad);
}

SecureBytes decrypt(const EncryptedPayload& payload,
                    const KeySetSnapshot& keys, TimePoint now) {
  auto key = keys.findForVerification(payload.key_generation, now);
  if (!key) {
    WARDEN_LOG_WARN("Encrypted payload names unusable key generation {}",
                    payload.key_generation);
    throw UnknownKeyGenerationError(payload.key_generation);
  }
  return decrypt(payload, *key);
}

SecureBytes encodeClaimMap(const SensitiveClaims& claims) {
  auto map = CborItemPtr(cbor_new_definite_map(claims.size()));
  if (!map) {
    throwOsError("cbor_new_definite_map", ENOMEM);
  }
  for (const auto& [name, value] : claims) {
    auto key = buildText(name);
    auto val = buildText(value);
    struct cbor_pair pair = {key.get(), val.get()};
    if (!cbor_map_add(map.get(), pair)) {
      throw InvalidCborError("failed to add sensitive claim to map");
    }
  }
  return serialize<SecureBytes>(map);
}

SensitiveClaims decodeClaimMap(std::span<const uint8_t> data) {
  struct cbor_load_result result;
  cbor_item_t* raw_item = cbor_load(data.data(), data.size(), &result);
  if (result.error.code != CBOR_ERR_NONE) {
    if (result.error.code == CBOR_ERR_MEMERROR) {
      throwOsError("cbor_load memory allocation", ENOMEM);
    }
    throw InvalidCborError("failed to parse sensitive claims");
  }
  CborItemPtr item(raw_item);

  if (!cbor_isa_map(item.get()) || !cbor_map_is_definite(item.get())) {
    throw InvalidCborError("sensitive claims are not a definite map");
  }

  SensitiveClaims claims;
  struct cbor_pair* pairs = cbor_map_handle(item.get());
  size_t map_size = cbor_map_size(item.get());
  for (size_t i = 0; i < map_size; ++i) {
    claims.emplace(extractText(pairs[i].key), extractText(pairs[i].value));
  }
  return claims;
}

EncryptedPayload encryptClaims(const SensitiveClaims& claims,
                               const KeyMaterial& key) {
  auto plaintext = encodeClaimMap(claims);
  return encrypt(plaintext, key);
}

SensitiveClaims decryptClaims(const EncryptedPayload& payload,
                              const KeySetSnapshot& keys, TimePoint now) {
  auto plaintext = decrypt(payload, keys, now);
  return decodeClaimMap(plaintext);
}

}  // namespace payload_cipher
}  // namespace warden
