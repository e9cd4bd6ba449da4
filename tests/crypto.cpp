#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "warden/crypto.hpp"

using namespace warden;

namespace {

std::vector<uint8_t> bytesOf(std::string_view text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace

TEST_CASE("Sha256Hash - Known answer") {
    auto hash = hashSha256(bytesOf("abc"));
    CHECK(toHex(hash) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("HmacSha256 - RFC 4231 test case 2") {
    auto mac = hmacSha256(bytesOf("Jefe"), bytesOf("what do ya want for nothing?"));
    CHECK(toHex(mac) ==
          "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_CASE("Hex - Encode and decode") {
    std::vector<uint8_t> data = {0x00, 0x0f, 0xa5, 0xff};
    CHECK(toHex(data) == "000fa5ff");
    CHECK(fromHex("000FA5ff") == data);
    CHECK_THROWS_AS(fromHex("abc"), InvalidArgumentError);
    CHECK_THROWS_AS(fromHex("zz"), InvalidArgumentError);
}

TEST_CASE("CreateSigningInput - Segments joined by dot") {
    auto input = createSigningInput("aGVhZGVy", "Ym9keQ");
    CHECK(std::string(input.begin(), input.end()) == "aGVhZGVy.Ym9keQ");
}

TEST_CASE("SigningAlgorithm - Names are exact") {
    CHECK(parseSigningAlgorithm("HS256") == SigningAlgorithm::HS256);
    CHECK(parseSigningAlgorithm("ES256") == SigningAlgorithm::ES256);
    CHECK(parseSigningAlgorithm("PS256") == SigningAlgorithm::PS256);
    CHECK_FALSE(parseSigningAlgorithm("hs256").has_value());
    CHECK_FALSE(parseSigningAlgorithm("none").has_value());
    CHECK_FALSE(parseSigningAlgorithm("RS256").has_value());
    CHECK(algorithmName(SigningAlgorithm::PS256) == "PS256");
    CHECK(isAsymmetric(SigningAlgorithm::ES256));
    CHECK_FALSE(isAsymmetric(SigningAlgorithm::HS256));
}

TEST_CASE("HmacSha256Algorithm - Sign and verify") {
    HmacSha256Algorithm hmac(HmacSha256Algorithm::generateSecureKey());
    auto data = bytesOf("payload");

    auto signature = hmac.sign(data);
    CHECK(signature.size() == 32);
    CHECK(hmac.verify(data, signature));

    signature[0] ^= 0x01;
    CHECK_FALSE(hmac.verify(data, signature));
    CHECK(hmac.algorithmId() == ALG_HMAC256_256);
}

TEST_CASE("HmacSha256Algorithm - Rejects short key") {
    CHECK_THROWS_AS(HmacSha256Algorithm(SecureBytes(8, 0x01)), CryptoError);
}

TEST_CASE("Es256Algorithm - Sign and verify") {
    Es256Algorithm signer;
    auto data = bytesOf("payload");
    auto signature = signer.sign(data);
    CHECK(signer.verify(data, signature));

    Es256Algorithm verifier(signer.getPublicKey());
    CHECK(verifier.verify(data, signature));
    CHECK_FALSE(verifier.verify(bytesOf("other payload"), signature));
    CHECK(verifier.algorithmId() == ALG_ES256);
}

TEST_CASE("Es256Algorithm - Key pair from DER") {
    auto [private_key, public_key] = Es256Algorithm::generateSecureKeyPair();
    Es256Algorithm signer(private_key, public_key);
    auto data = bytesOf("payload");
    CHECK(Es256Algorithm(public_key).verify(data, signer.sign(data)));
}

TEST_CASE("Ps256Algorithm - Sign and verify") {
    Ps256Algorithm signer;
    auto data = bytesOf("payload");
    auto signature = signer.sign(data);
    CHECK(signature.size() == 256);
    CHECK(Ps256Algorithm(signer.getPublicKey()).verify(data, signature));

    signature.back() ^= 0x80;
    CHECK_FALSE(signer.verify(data, signature));
}

TEST_CASE("MakeSigner - Matches algorithm") {
    auto hmac_key = HmacSha256Algorithm::generateSecureKey();
    auto hs = makeSigner(SigningAlgorithm::HS256, hmac_key, std::nullopt);
    CHECK(hs->algorithmId() == ALG_HMAC256_256);

    auto es = makeSigner(SigningAlgorithm::ES256, hmac_key,
                         generateKeyPair(SigningAlgorithm::ES256));
    CHECK(es->algorithmId() == ALG_ES256);

    CHECK_THROWS_AS(generateKeyPair(SigningAlgorithm::HS256),
                    UnsupportedAlgorithmError);
}

TEST_CASE("AesGcmAlgorithm - Encrypt and decrypt with AAD") {
    AesGcmAlgorithm aes(AesGcmAlgorithm::generateSecureKey());
    auto iv = AesGcmAlgorithm::generateIV();
    auto aad = bytesOf("context");
    auto plaintext = bytesOf("sensitive claim data");

    auto ciphertext = aes.encrypt(plaintext, iv, aad);
    CHECK(ciphertext.size() == plaintext.size() + crypto_constants::GCM_TAG_SIZE);

    auto decrypted = aes.decrypt(ciphertext, iv, aad);
    CHECK(std::vector<uint8_t>(decrypted.begin(), decrypted.end()) == plaintext);
}

TEST_CASE("AesGcmAlgorithm - Wrong AAD fails integrity") {
    AesGcmAlgorithm aes(AesGcmAlgorithm::generateSecureKey());
    auto iv = AesGcmAlgorithm::generateIV();
    auto ciphertext = aes.encrypt(bytesOf("data"), iv, bytesOf("gen-1"));
    CHECK_THROWS_AS(aes.decrypt(ciphertext, iv, bytesOf("gen-2")), IntegrityError);
}

TEST_CASE("AesGcmAlgorithm - Truncated input fails integrity") {
    AesGcmAlgorithm aes(AesGcmAlgorithm::generateSecureKey());
    auto iv = AesGcmAlgorithm::generateIV();
    std::vector<uint8_t> short_data(8, 0x00);
    CHECK_THROWS_AS(aes.decrypt(short_data, iv, std::vector<uint8_t>{}),
                    IntegrityError);
}

TEST_CASE("AesGcmAlgorithm - Cannot sign") {
    AesGcmAlgorithm aes(AesGcmAlgorithm::generateSecureKey());
    CHECK(aes.supportsEncryption());
    CHECK_THROWS_AS(aes.sign(bytesOf("data")), CryptoError);
}

TEST_CASE("RandomBytes - Distinct draws") {
    auto a = randomBytes(16);
    auto b = randomBytes(16);
    CHECK(a.size() == 16);
    CHECK(a != b);
}
