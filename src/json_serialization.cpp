/**
 * @file json_serialization.cpp
 * @brief JSON conversions for token bodies and revocation records
 */

#include "warden/json_serialization.hpp"

#include "warden/base64.hpp"

namespace warden {
namespace json_serialization {

namespace {

template <typename T>
T required(const nlohmann::json& j, const char* key) {
  if (!j.contains(key)) {
    throw MalformedTokenError(std::string("missing field '") + key + "'");
  }
  try {
    return j.at(key).get<T>();
  } catch (const nlohmann::json::exception&) {
    throw MalformedTokenError(std::string("field '") + key +
                              "' has the wrong type");
  }
}

std::vector<uint8_t> requiredBytes(const nlohmann::json& j, const char* key) {
  try {
    return base64UrlDecode(required<std::string>(j, key));
  } catch (const InvalidBase64Error&) {
    throw MalformedTokenError(std::string("field '") + key +
                              "' is not base64url");
  }
}

}  // namespace

void to_json(nlohmann::json& j, const ComplianceMetadata& compliance) {
  j = nlohmann::json::object();
  j["pii"] = compliance.contains_personal_data;
  j["cls"] = std::string(classificationName(compliance.data_classification));
  j["enc"] = compliance.sensitive_encrypted;
}

void from_json(const nlohmann::json& j, ComplianceMetadata& compliance) {
  if (!j.is_object()) {
    throw MalformedTokenError("compliance metadata is not an object");
  }
  compliance.contains_personal_data = required<bool>(j, "pii");
  auto cls = parseClassification(required<std::string>(j, "cls"));
  if (!cls) {
    throw MalformedTokenError("unknown data classification");
  }
  compliance.data_classification = *cls;
  compliance.sensitive_encrypted = required<bool>(j, "enc");
}

void to_json(nlohmann::json& j, const EncryptedPayload& payload) {
  j = nlohmann::json::object();
  j["kid"] = payload.key_generation;
  j["iv"] = base64UrlEncode(payload.nonce);
  j["ct"] = base64UrlEncode(payload.ciphertext);
  j["tag"] = base64UrlEncode(payload.tag);
}

void from_json(const nlohmann::json& j, EncryptedPayload& payload) {
  if (!j.is_object()) {
    throw MalformedTokenError("encrypted payload is not an object");
  }
  payload.key_generation = required<GenerationId>(j, "kid");
  payload.nonce = requiredBytes(j, "iv");
  payload.ciphertext = requiredBytes(j, "ct");
  payload.tag = requiredBytes(j, "tag");
}

void to_json(nlohmann::json& j, const RevocationEntry& entry) {
  j = nlohmann::json::object();
  j["token_id"] = entry.token_id;
  j["subject"] = entry.subject;
  j["reason"] = std::string(reasonName(entry.reason));
  j["revoked_at"] = entry.revoked_at;
  j["expires_at"] = entry.expires_at;
}

void from_json(const nlohmann::json& j, RevocationEntry& entry) {
  entry.token_id = j.at("token_id").get<std::string>();
  entry.subject = j.value("subject", std::string());
  entry.reason = parseRevocationReason(j.at("reason").get<std::string>());
  entry.revoked_at = j.at("revoked_at").get<int64_t>();
  entry.expires_at = j.at("expires_at").get<int64_t>();
}

nlohmann::json bodyToJson(const TokenClaims& claims,
                          const std::optional<EncryptedPayload>& encrypted) {
  nlohmann::json j = nlohmann::json::object();
  j["sub"] = claims.subject;
  j["iat"] = claims.issued_at;
  j["exp"] = claims.expires_at;
  j["jti"] = claims.token_id;
  j["typ"] = std::string(tokenTypeName(claims.token_type));
  if (claims.device_binding) {
    j["dfp"] = *claims.device_binding;
  }
  if (encrypted) {
    to_json(j["enc"], *encrypted);
  } else if (!claims.sensitive.empty()) {
    j["sens"] = claims.sensitive;
  }
  if (!claims.custom.empty()) {
    j["ctx"] = claims.custom;
  }
  to_json(j["cmp"], claims.compliance);
  return j;
}

TokenClaims bodyFromJson(const nlohmann::json& j,
                         std::optional<EncryptedPayload>& encrypted) {
  if (!j.is_object()) {
    throw MalformedTokenError("body is not an object");
  }

  TokenClaims claims;
  claims.subject = required<std::string>(j, "sub");
  claims.issued_at = required<int64_t>(j, "iat");
  claims.expires_at = required<int64_t>(j, "exp");
  claims.token_id = required<std::string>(j, "jti");
  if (claims.subject.empty() || claims.token_id.empty()) {
    throw MalformedTokenError("empty subject or token id");
  }

  auto typ = required<std::string>(j, "typ");
  if (typ == "access") {
    claims.token_type = TokenType::Access;
  } else if (typ == "refresh") {
    claims.token_type = TokenType::Refresh;
  } else {
    throw MalformedTokenError("unknown token type");
  }

  if (j.contains("dfp")) {
    claims.device_binding = required<std::string>(j, "dfp");
  }

  encrypted.reset();
  if (j.contains("enc")) {
    EncryptedPayload payload;
    from_json(j.at("enc"), payload);
    encrypted = std::move(payload);
  }
  if (j.contains("sens")) {
    if (encrypted) {
      throw MalformedTokenError("both clear and encrypted sensitive claims");
    }
    claims.sensitive = required<SensitiveClaims>(j, "sens");
  }
  if (j.contains("ctx")) {
    claims.custom = required<CustomClaims>(j, "ctx");
  }

  if (!j.contains("cmp")) {
    throw MalformedTokenError("missing field 'cmp'");
  }
  from_json(j.at("cmp"), claims.compliance);
  return claims;
}

namespace {

// Sensitive values never leave the process in clear
nlohmann::json describe(const TokenClaims& claims) {
  nlohmann::json j = bodyToJson(claims, std::nullopt);
  if (j.contains("sens")) {
    for (auto& value : j["sens"]) {
      value = "[redacted]";
    }
  }
  j["kid"] = claims.key_generation;
  return j;
}

}  // namespace

std::string to_compact_json(const TokenClaims& claims) {
  return describe(claims).dump();
}

std::string to_pretty_json(const TokenClaims& claims, int indent) {
  return describe(claims).dump(indent);
}

}  // namespace json_serialization
}  // namespace warden
