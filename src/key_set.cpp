#include "warden/key_set.hpp"

#include "warden/logging.hpp"

namespace warden {

namespace {
constexpr std::string_view kEncryptionLabel = "warden/v1/payload-encryption";
constexpr std::string_view kSigningLabel = "warden/v1/token-signing";
}  // namespace

KeyMaterial::KeyMaterial(GenerationId generation, SigningAlgorithm algorithm,
                         std::vector<uint8_t> salt, TimePoint derived_at,
                         std::optional<TimePoint> valid_until,
                         std::shared_ptr<const AesGcmAlgorithm> cipher,
                         std::shared_ptr<const CryptographicAlgorithm> signer,
                         std::vector<uint8_t> public_key)
    : generation_(generation),
      algorithm_(algorithm),
      salt_(std::move(salt)),
      derived_at_(derived_at),
      valid_until_(valid_until),
      cipher_(std::move(cipher)),
      signer_(std::move(signer)),
      public_key_(std::move(public_key)) {
  if (!cipher_ || !signer_) {
    throw CryptoError("Key material requires a cipher and a signer");
  }
}

KeyMaterialPtr KeyMaterial::derive(GenerationId generation,
                                   SigningAlgorithm algorithm,
                                   const KeyDerivation& kdf,
                                   std::string_view master_secret,
                                   TimePoint now,
                                   std::optional<KeyPairDer> key_pair) {
  auto salt = KeyDerivation::generateSalt();
  auto master_key = kdf.derive(master_secret, salt);
  auto encryption_key = KeyDerivation::expand(master_key, kEncryptionLabel);
  auto signing_key = KeyDerivation::expand(master_key, kSigningLabel);

  if (isAsymmetric(algorithm) && !key_pair) {
    key_pair = generateKeyPair(algorithm);
  }
  std::vector<uint8_t> public_key;
  if (isAsymmetric(algorithm)) {
    public_key = key_pair->second;
  }

  auto cipher =
      std::make_shared<AesGcmAlgorithm>(std::move(encryption_key));
  auto signer = makeSigner(algorithm, signing_key, key_pair);

  WARDEN_LOG_DEBUG("Derived key generation {} ({})", generation,
                   algorithmName(algorithm));
  return std::make_shared<KeyMaterial>(
      generation, algorithm, std::move(salt), now, std::nullopt,
      std::move(cipher), std::move(signer), std::move(public_key));
}

KeyMaterialPtr KeyMaterial::withValidUntil(TimePoint until) const {
  return std::make_shared<KeyMaterial>(generation_, algorithm_, salt_,
                                             derived_at_, until, cipher_,
                                             signer_, public_key_);
}

KeySetSnapshot::KeySetSnapshot(GenerationId current,
                               std::map<GenerationId, KeyMaterialPtr> generations)
    : current_(current), generations_(std::move(generations)) {
  if (!generations_.empty() && !generations_.contains(current_)) {
    throw KeyUnavailableError();
  }
}

KeyMaterialPtr KeySetSnapshot::current() const { return find(current_); }

KeyMaterialPtr KeySetSnapshot::find(GenerationId generation) const {
  auto it = generations_.find(generation);
  if (it == generations_.end()) {
    return nullptr;
  }
  return it->second;
}

KeyMaterialPtr KeySetSnapshot::findForVerification(GenerationId generation,
                                                   TimePoint now) const {
  auto material = find(generation);
  if (!material) {
    return nullptr;
  }
  if (generation == current_ || material->isUsableAt(now)) {
    return material;
  }
  return nullptr;
}

KeySet::KeySet() : snapshot_(std::make_shared<KeySetSnapshot>()) {}

KeySetSnapshotPtr KeySet::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_;
}

void KeySet::publish(KeySetSnapshotPtr snapshot) {
  if (!snapshot) {
    throw KeyUnavailableError();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_ = std::move(snapshot);
}

KeyMaterialPtr KeySet::requireCurrent() const {
  auto material = snapshot()->current();
  if (!material) {
    throw KeyUnavailableError();
  }
  return material;
}

}  // namespace warden
