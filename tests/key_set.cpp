#include <doctest/doctest.h>
#include <chrono>
#include <map>
#include "warden/key_set.hpp"
#include "test_support.hpp"

using namespace warden;
using namespace std::chrono_literals;

namespace {

KeyMaterialPtr deriveGeneration(GenerationId id, SigningAlgorithm alg,
                                TimePoint now) {
    static const KeyDerivation kdf(kMinPbkdf2Iterations);
    return KeyMaterial::derive(id, alg, kdf, testing::kTestSecret, now);
}

}  // namespace

TEST_CASE("KeyMaterial - Derived generation is current and usable") {
    auto now = fromUnixSeconds(1700000000);
    auto key = deriveGeneration(1, SigningAlgorithm::HS256, now);

    CHECK(key->generation() == 1);
    CHECK(key->algorithm() == SigningAlgorithm::HS256);
    CHECK(key->salt().size() == KeyDerivation::kSaltSize);
    CHECK(key->derivedAt() == now);
    CHECK_FALSE(key->validUntil().has_value());
    CHECK(key->isUsableAt(now + 24h * 365));
    CHECK(key->publicKey().empty());
}

TEST_CASE("KeyMaterial - Same secret, different salt, different keys") {
    auto now = fromUnixSeconds(1700000000);
    auto a = deriveGeneration(1, SigningAlgorithm::HS256, now);
    auto b = deriveGeneration(2, SigningAlgorithm::HS256, now);
    CHECK(a->salt() != b->salt());

    std::vector<uint8_t> data = {1, 2, 3};
    CHECK_FALSE(b->signer().verify(data, a->signer().sign(data)));
}

TEST_CASE("KeyMaterial - Asymmetric generation carries a public key") {
    auto now = fromUnixSeconds(1700000000);
    auto key = deriveGeneration(1, SigningAlgorithm::ES256, now);
    CHECK_FALSE(key->publicKey().empty());

    std::vector<uint8_t> data = {4, 5, 6};
    auto signature = key->signer().sign(data);
    CHECK(Es256Algorithm(key->publicKey()).verify(data, signature));
}

TEST_CASE("KeyMaterial - withValidUntil keeps keys") {
    auto now = fromUnixSeconds(1700000000);
    auto key = deriveGeneration(1, SigningAlgorithm::HS256, now);
    auto retained = key->withValidUntil(now + 60s);

    REQUIRE(retained->validUntil().has_value());
    CHECK(retained->isUsableAt(now + 59s));
    CHECK_FALSE(retained->isUsableAt(now + 60s));
    CHECK(retained->salt() == key->salt());

    std::vector<uint8_t> data = {7};
    CHECK(retained->signer().verify(data, key->signer().sign(data)));
}

TEST_CASE("KeySetSnapshot - Lookup by generation") {
    auto now = fromUnixSeconds(1700000000);
    auto old_key = deriveGeneration(1, SigningAlgorithm::HS256, now)->withValidUntil(now + 10s);
    auto current = deriveGeneration(2, SigningAlgorithm::HS256, now);

    KeySetSnapshot snapshot(2, {{1, old_key}, {2, current}});
    CHECK(snapshot.size() == 2);
    CHECK(snapshot.currentGeneration() == 2);
    CHECK(snapshot.current() == current);
    CHECK(snapshot.find(1) == old_key);
    CHECK(snapshot.find(3) == nullptr);

    CHECK(snapshot.findForVerification(1, now + 5s) == old_key);
    CHECK(snapshot.findForVerification(1, now + 10s) == nullptr);
    CHECK(snapshot.findForVerification(2, now + 1000s) == current);
}

TEST_CASE("KeySetSnapshot - Current must be present") {
    auto now = fromUnixSeconds(1700000000);
    auto key = deriveGeneration(1, SigningAlgorithm::HS256, now);
    CHECK_THROWS_AS((KeySetSnapshot(7, {{1, key}})), KeyUnavailableError);
}

TEST_CASE("KeySet - Publish replaces snapshot atomically") {
    KeySet keys;
    CHECK(keys.snapshot()->empty());
    CHECK_THROWS_AS(keys.requireCurrent(), KeyUnavailableError);

    auto now = fromUnixSeconds(1700000000);
    auto key = deriveGeneration(1, SigningAlgorithm::HS256, now);
    auto before = keys.snapshot();
    keys.publish(std::make_shared<KeySetSnapshot>(
        1, std::map<GenerationId, KeyMaterialPtr>{{1, key}}));

    CHECK(before->empty());
    CHECK(keys.requireCurrent() == key);
    CHECK_THROWS_AS(keys.publish(nullptr), KeyUnavailableError);
}
