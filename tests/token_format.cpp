#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <string>
#include "warden/base64.hpp"
#include "warden/token_format.hpp"

using namespace warden;

namespace {

std::string segment(const nlohmann::json& j) { return token_format::encodeSegment(j); }

nlohmann::json validBody() {
    return {{"sub", "user-42"},
            {"iat", 1700000000},
            {"exp", 1700000900},
            {"jti", "AAAAAAAAAAAAAAAAAAAAAA"},
            {"typ", "access"},
            {"cmp", {{"pii", false}, {"cls", "internal"}, {"enc", false}}}};
}

nlohmann::json validHeader() { return {{"alg", "HS256"}, {"typ", "JWT"}, {"kid", 3}}; }

}  // namespace

TEST_CASE("TokenFormat - Parse well-formed token") {
    auto token = token_format::assemble(segment(validHeader()), segment(validBody()),
                                        std::vector<uint8_t>{1, 2, 3});
    auto parsed = token_format::parse(token);

    CHECK(parsed.header.alg == "HS256");
    CHECK(parsed.header.kid == 3);
    CHECK(parsed.claims.subject == "user-42");
    CHECK(parsed.claims.expires_at == 1700000900);
    CHECK(parsed.claims.key_generation == 3);
    CHECK(parsed.claims.token_type == TokenType::Access);
    CHECK_FALSE(parsed.encrypted.has_value());
    CHECK(parsed.signature == (std::vector<uint8_t>{1, 2, 3}));

    auto input = parsed.signingInput();
    CHECK(std::string(input.begin(), input.end()) ==
          parsed.header_segment + "." + parsed.body_segment);
}

TEST_CASE("TokenFormat - Header encoding") {
    TokenHeader header;
    header.alg = "ES256";
    header.kid = 12;
    auto j = nlohmann::json::parse(base64UrlDecodeToString(token_format::encodeHeader(header)));
    CHECK(j.at("alg") == "ES256");
    CHECK(j.at("typ") == "JWT");
    CHECK(j.at("kid") == 12);
}

TEST_CASE("TokenFormat - Wrong segment count") {
    auto h = segment(validHeader());
    auto b = segment(validBody());
    CHECK_THROWS_AS(token_format::parse(""), MalformedTokenError);
    CHECK_THROWS_AS(token_format::parse(h), MalformedTokenError);
    CHECK_THROWS_AS(token_format::parse(h + "." + b), MalformedTokenError);
    CHECK_THROWS_AS(token_format::parse(h + "." + b + ".AQID.AQID"), MalformedTokenError);
    CHECK_THROWS_AS(token_format::parse(h + "." + b + "."), MalformedTokenError);
}

TEST_CASE("TokenFormat - Bad base64 or JSON") {
    auto h = segment(validHeader());
    auto b = segment(validBody());
    CHECK_THROWS_AS(token_format::parse("!!!." + b + ".AQID"), MalformedTokenError);
    CHECK_THROWS_AS(token_format::parse(h + "." + b + ".A+=="), MalformedTokenError);
    auto not_json = base64UrlEncode(std::string_view("{nope"));
    CHECK_THROWS_AS(token_format::parse(h + "." + not_json + ".AQID"), MalformedTokenError);
}

TEST_CASE("TokenFormat - Missing fields") {
    auto b = segment(validBody());
    nlohmann::json no_kid = {{"alg", "HS256"}};
    CHECK_THROWS_AS(token_format::parse(segment(no_kid) + "." + b + ".AQID"),
                    MalformedTokenError);

    nlohmann::json string_kid = {{"alg", "HS256"}, {"kid", "1"}};
    CHECK_THROWS_AS(token_format::parse(segment(string_kid) + "." + b + ".AQID"),
                    MalformedTokenError);

    auto h = segment(validHeader());
    for (auto field : {"sub", "iat", "exp", "jti", "typ"}) {
        auto body = validBody();
        body.erase(field);
        CHECK_THROWS_AS(token_format::parse(h + "." + segment(body) + ".AQID"),
                        MalformedTokenError);
    }

    auto bad_type = validBody();
    bad_type["typ"] = "id";
    CHECK_THROWS_AS(token_format::parse(h + "." + segment(bad_type) + ".AQID"),
                    MalformedTokenError);
}

TEST_CASE("TokenFormat - Body cannot carry both plaintext and encrypted claims") {
    auto body = validBody();
    body["sens"] = {{"email", "a@example.com"}};
    body["enc"] = {{"kid", 3}, {"iv", "AAAAAAAAAAAAAAAA"}, {"ct", "AQ"}, {"tag", "AAAAAAAAAAAAAAAAAAAAAA"}};
    CHECK_THROWS_AS(token_format::parse(segment(validHeader()) + "." + segment(body) + ".AQID"),
                    MalformedTokenError);
}
