#include <doctest/doctest.h>
#include <openssl/evp.h>
#include <set>
#include <string>
#include <vector>
#include "warden/crypto.hpp"
#include "warden/key_derivation.hpp"
#include "test_support.hpp"

using namespace warden;

TEST_CASE("KeyDerivation - Matches PBKDF2-HMAC-SHA256 reference") {
    KeyDerivation kdf(kMinPbkdf2Iterations);
    std::string secret = testing::kTestSecret;
    std::vector<uint8_t> salt = {0x73, 0x61, 0x6c, 0x74, 0x73, 0x61, 0x6c, 0x74,
                                 0x73, 0x61, 0x6c, 0x74, 0x73, 0x61, 0x6c, 0x74};

    std::vector<uint8_t> expected(32);
    REQUIRE(PKCS5_PBKDF2_HMAC(secret.data(), static_cast<int>(secret.size()),
                              salt.data(), static_cast<int>(salt.size()),
                              static_cast<int>(kMinPbkdf2Iterations), EVP_sha256(),
                              static_cast<int>(expected.size()), expected.data()) == 1);

    auto key = kdf.derive(secret, salt);
    CHECK(std::vector<uint8_t>(key.begin(), key.end()) == expected);
}

TEST_CASE("KeyDerivation - Deterministic for identical inputs") {
    KeyDerivation kdf(kMinPbkdf2Iterations);
    auto salt = KeyDerivation::generateSalt();
    auto a = kdf.derive(testing::kTestSecret, salt);
    auto b = kdf.derive(testing::kTestSecret, salt);
    CHECK(a.size() == KeyDerivation::kKeySize);
    CHECK(a == b);

    auto other_salt = KeyDerivation::generateSalt();
    CHECK(kdf.derive(testing::kTestSecret, other_salt) != a);
}

TEST_CASE("KeyDerivation - Iteration floor") {
    CHECK_THROWS_AS(KeyDerivation(1000), ConfigError);
    CHECK_THROWS_AS(KeyDerivation(kMinPbkdf2Iterations - 1), ConfigError);
    CHECK(KeyDerivation().iterations() == kDefaultPbkdf2Iterations);
}

TEST_CASE("KeyDerivation - Salts are fresh") {
    std::set<std::vector<uint8_t>> salts;
    for (int i = 0; i < 32; ++i) {
        auto salt = KeyDerivation::generateSalt();
        CHECK(salt.size() == KeyDerivation::kSaltSize);
        salts.insert(salt);
    }
    CHECK(salts.size() == 32);
}

TEST_CASE("KeyDerivation - HKDF labels give independent keys") {
    auto master = HmacSha256Algorithm::generateSecureKey();
    auto enc = KeyDerivation::expand(master, "warden/v1/payload-encryption");
    auto sig = KeyDerivation::expand(master, "warden/v1/token-signing");
    CHECK(enc.size() == 32);
    CHECK(enc != sig);
    CHECK(KeyDerivation::expand(master, "warden/v1/token-signing") == sig);
}

TEST_CASE("ValidateMasterSecret - Short secret is weak") {
    std::string ten_bytes = "0123456789";
    CHECK_THROWS_AS(KeyDerivation::validateMasterSecret(ten_bytes, Environment::Development),
                    WeakSecretError);
    CHECK_THROWS_AS(KeyDerivation::validateMasterSecret("", Environment::Development),
                    WeakSecretError);
}

TEST_CASE("ValidateMasterSecret - Low entropy is weak") {
    std::string repeated(64, 'a');
    CHECK_THROWS_AS(KeyDerivation::validateMasterSecret(repeated, Environment::Development),
                    WeakSecretError);
    std::string two_chars;
    for (int i = 0; i < 32; ++i) two_chars += (i % 2) ? 'x' : 'y';
    CHECK_THROWS_AS(KeyDerivation::validateMasterSecret(two_chars, Environment::Development),
                    WeakSecretError);
}

TEST_CASE("ValidateMasterSecret - Random hex passes") {
    auto hex = toHex(randomBytes(32));
    CHECK_NOTHROW(KeyDerivation::validateMasterSecret(hex, Environment::Production));
}

TEST_CASE("ValidateMasterSecret - Development markers only matter in production") {
    std::string secret = "local-Q8f#2Lp$9Zr!4Tw@7Nk^1Hb&6Vm*3Jx";
    CHECK_NOTHROW(KeyDerivation::validateMasterSecret(secret, Environment::Development));
    CHECK_THROWS_AS(KeyDerivation::validateMasterSecret(secret, Environment::Production),
                    WeakSecretError);
    CHECK_NOTHROW(KeyDerivation::validateMasterSecret(testing::kTestSecret,
                                                      Environment::Production));
}

TEST_CASE("ShannonEntropy - Reference values") {
    CHECK(KeyDerivation::shannonEntropy("") == doctest::Approx(0.0));
    CHECK(KeyDerivation::shannonEntropy("aaaa") == doctest::Approx(0.0));
    CHECK(KeyDerivation::shannonEntropy("abab") == doctest::Approx(1.0));
    CHECK(KeyDerivation::shannonEntropy("abcdefgh") == doctest::Approx(3.0));
}
