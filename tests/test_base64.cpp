#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "warden/base64.hpp"
#include <string>
#include <vector>

using namespace warden;

TEST_CASE("Base64UrlEncode - Empty input") {
    std::vector<uint8_t> empty;
    CHECK(base64UrlEncode(empty).empty());
}

TEST_CASE("Base64UrlEncode - Unpadded lengths") {
    CHECK(base64UrlEncode(std::vector<uint8_t>{0x4d}) == "TQ");
    CHECK(base64UrlEncode(std::vector<uint8_t>{0x4d, 0x61}) == "TWE");
    CHECK(base64UrlEncode(std::vector<uint8_t>{0x4d, 0x61, 0x6e}) == "TWFu");
    CHECK(base64UrlEncode(std::vector<uint8_t>{0x4d, 0x61, 0x6e, 0x79}) == "TWFueQ");
}

TEST_CASE("Base64UrlEncode - URL-safe alphabet") {
    std::vector<uint8_t> data = {0x00, 0x01, 0x02, 0x03, 0xff, 0xfe, 0xfd};
    CHECK(base64UrlEncode(data) == "AAECA__-_Q");
    CHECK(base64UrlEncode(std::vector<uint8_t>{0xfb, 0xff}) == "-_8");
}

TEST_CASE("Base64UrlEncode - Text overload") {
    CHECK(base64UrlEncode(std::string_view("{\"alg\":\"HS256\"}")) ==
          "eyJhbGciOiJIUzI1NiJ9");
}

TEST_CASE("Base64UrlDecode - Known values") {
    CHECK(base64UrlDecode("").empty());
    CHECK(base64UrlDecode("TQ") == std::vector<uint8_t>{0x4d});
    CHECK(base64UrlDecode("-_8") == (std::vector<uint8_t>{0xfb, 0xff}));
    CHECK(base64UrlDecodeToString("eyJhbGciOiJIUzI1NiJ9") == "{\"alg\":\"HS256\"}");
}

TEST_CASE("Base64UrlDecode - Rejects padding and standard alphabet") {
    CHECK_THROWS_AS(base64UrlDecode("TQ=="), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("+/8"), InvalidBase64Error);
    CHECK_THROWS_AS(base64UrlDecode("TW@u"), InvalidBase64Error);
}

TEST_CASE("Base64UrlDecode - Rejects impossible length") {
    CHECK_THROWS_AS(base64UrlDecode("TWFuT"), InvalidBase64Error);
}

TEST_CASE("Base64Url - All byte values survive") {
    std::vector<uint8_t> data(256);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i);
    }
    auto encoded = base64UrlEncode(data);
    CHECK(encoded.find_first_of("+/=") == std::string::npos);
    CHECK(base64UrlDecode(encoded) == data);
}
