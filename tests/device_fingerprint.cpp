#include <doctest/doctest.h>
#include <string>
#include "warden/device_fingerprint.hpp"

using namespace warden;

namespace {

RequestMetadata laptop() {
    RequestMetadata m;
    m.user_agent = "Mozilla/5.0 (X11; Linux x86_64) Firefox/128.0";
    m.accept = "text/html,application/json";
    m.accept_language = "en-US,en;q=0.5";
    m.accept_encoding = "gzip, deflate, br";
    m.connection = "keep-alive";
    m.client_address = "203.0.113.7";
    return m;
}

SecureBytes salt(uint8_t fill) { return SecureBytes(32, fill); }

}  // namespace

TEST_CASE("DeviceFingerprint - Stable 64 hex characters") {
    DeviceFingerprint fp(salt(0x11));
    auto a = fp.compute(laptop());
    auto b = fp.compute(laptop());
    CHECK(a.size() == DeviceFingerprint::kFingerprintHexSize);
    CHECK(a.find_first_not_of("0123456789abcdef") == std::string::npos);
    CHECK(a == b);
}

TEST_CASE("DeviceFingerprint - Every attribute contributes") {
    DeviceFingerprint fp(salt(0x11));
    auto base = fp.compute(laptop());

    auto ua = laptop();
    ua.user_agent = "curl/8.5.0";
    CHECK(fp.compute(ua) != base);

    auto lang = laptop();
    lang.accept_language = "de-DE";
    CHECK(fp.compute(lang) != base);

    auto conn = laptop();
    conn.connection = "close";
    CHECK(fp.compute(conn) != base);

    auto addr = laptop();
    addr.client_address = "203.0.113.8";
    CHECK(fp.compute(addr) != base);
}

TEST_CASE("DeviceFingerprint - Salt changes the address contribution") {
    CHECK(DeviceFingerprint(salt(0x11)).compute(laptop()) !=
          DeviceFingerprint(salt(0x22)).compute(laptop()));
}

TEST_CASE("DeviceFingerprint - Raw address never appears") {
    DeviceFingerprint fp(salt(0x11));
    auto fingerprint = fp.compute(laptop());
    CHECK(fingerprint.find("203.0.113.7") == std::string::npos);
}

TEST_CASE("DeviceFingerprint - Empty salt rejected") {
    CHECK_THROWS_AS(DeviceFingerprint(SecureBytes{}), InvalidArgumentError);
}

TEST_CASE("DeviceFingerprint - Constant time match") {
    DeviceFingerprint fp(salt(0x11));
    auto a = fp.compute(laptop());
    CHECK(DeviceFingerprint::matches(a, a));
    auto b = a;
    b.back() = b.back() == '0' ? '1' : '0';
    CHECK_FALSE(DeviceFingerprint::matches(a, b));
    CHECK_FALSE(DeviceFingerprint::matches(a, a.substr(1)));
}

TEST_CASE("RequestMetadata - Headers matched case-insensitively") {
    HeaderMap headers = {
        {"user-agent", "Agent/1.0"},
        {"ACCEPT", "*/*"},
        {"Accept-Language", "fr"},
        {"X-Unrelated", "ignored"},
    };
    auto m = RequestMetadata::fromHeaders(headers, "198.51.100.4");
    CHECK(m.user_agent == "Agent/1.0");
    CHECK(m.accept == "*/*");
    CHECK(m.accept_language == "fr");
    CHECK(m.accept_encoding.empty());
    CHECK(m.connection.empty());
    CHECK(m.client_address == "198.51.100.4");
}
