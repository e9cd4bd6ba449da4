#include "warden/token_format.hpp"

#include "warden/base64.hpp"
#include "warden/crypto.hpp"
#include "warden/json_serialization.hpp"

namespace warden {

namespace {

/// Upper bound on a serialized token accepted for parsing
constexpr size_t kMaxTokenSize = 64 * 1024;

nlohmann::json decodeSegment(std::string_view segment, const char* what) {
  if (segment.empty()) {
    throw MalformedTokenError(std::string("empty ") + what);
  }
  std::string text;
  try {
    text = base64UrlDecodeToString(segment);
  } catch (const InvalidBase64Error&) {
    throw MalformedTokenError(std::string(what) + " is not base64url");
  }
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error&) {
    throw MalformedTokenError(std::string(what) + " is not JSON");
  }
}

}  // namespace

std::vector<uint8_t> ParsedToken::signingInput() const {
  return createSigningInput(header_segment, body_segment);
}

namespace token_format {

std::string encodeSegment(const nlohmann::json& j) {
  return base64UrlEncode(std::string_view(j.dump()));
}

std::string encodeHeader(const TokenHeader& header) {
  nlohmann::json j = nlohmann::json::object();
  j["alg"] = header.alg;
  j["typ"] = header.typ;
  j["kid"] = header.kid;
  return encodeSegment(j);
}

std::string assemble(std::string_view header_segment,
                     std::string_view body_segment,
                     const std::vector<uint8_t>& signature) {
  std::string token;
  token.reserve(header_segment.size() + body_segment.size() +
                signature.size() * 4 / 3 + 4);
  token.append(header_segment);
  token.push_back('.');
  token.append(body_segment);
  token.push_back('.');
  token.append(base64UrlEncode(signature));
  return token;
}

ParsedToken parse(std::string_view serialized) {
  if (serialized.size() > kMaxTokenSize) {
    throw MalformedTokenError("token too large");
  }
  auto first = serialized.find('.');
  if (first == std::string_view::npos) {
    throw MalformedTokenError("expected three segments");
  }
  auto second = serialized.find('.', first + 1);
  if (second == std::string_view::npos ||
      serialized.find('.', second + 1) != std::string_view::npos) {
    throw MalformedTokenError("expected three segments");
  }

  ParsedToken token;
  token.header_segment = std::string(serialized.substr(0, first));
  token.body_segment =
      std::string(serialized.substr(first + 1, second - first - 1));
  auto signature_segment = serialized.substr(second + 1);
  if (signature_segment.empty()) {
    throw MalformedTokenError("empty signature");
  }
  try {
    token.signature = base64UrlDecode(signature_segment);
  } catch (const InvalidBase64Error&) {
    throw MalformedTokenError("signature is not base64url");
  }

  auto header = decodeSegment(token.header_segment, "header");
  if (!header.is_object()) {
    throw MalformedTokenError("header is not an object");
  }
  try {
    token.header.alg = header.at("alg").get<std::string>();
    token.header.typ = header.value("typ", std::string("JWT"));
    token.header.kid = header.at("kid").get<GenerationId>();
  } catch (const nlohmann::json::exception&) {
    throw MalformedTokenError("header lacks alg or kid");
  }

  auto body = decodeSegment(token.body_segment, "body");
  token.claims = json_serialization::bodyFromJson(body, token.encrypted);
  token.claims.key_generation = token.header.kid;
  return token;
}

}  // namespace token_format
}  // namespace warden
