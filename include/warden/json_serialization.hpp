/**
 * @file json_serialization.hpp
 * @brief nlohmann::json conversions for token bodies and stored records
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

#include "warden/claims.hpp"
#include "warden/payload_cipher.hpp"
#include "warden/revocation_store.hpp"

namespace warden {

namespace json_serialization {

void to_json(nlohmann::json& j, const ComplianceMetadata& compliance);
void from_json(const nlohmann::json& j, ComplianceMetadata& compliance);

/**
 * @brief Encrypted payload as {"kid", "iv", "ct", "tag"}, byte fields
 *        base64url encoded
 */
void to_json(nlohmann::json& j, const EncryptedPayload& payload);
void from_json(const nlohmann::json& j, EncryptedPayload& payload);

void to_json(nlohmann::json& j, const RevocationEntry& entry);
void from_json(const nlohmann::json& j, RevocationEntry& entry);

/**
 * @brief Token body
 *
 * Sensitive claims appear in clear under "sens" only when `encrypted` is
 * empty; otherwise the payload goes under "enc".
 */
nlohmann::json bodyToJson(const TokenClaims& claims,
                          const std::optional<EncryptedPayload>& encrypted);

/**
 * @brief Parse a token body
 * @throws MalformedTokenError if a required field is missing or mistyped
 */
TokenClaims bodyFromJson(const nlohmann::json& j,
                         std::optional<EncryptedPayload>& encrypted);

/**
 * @brief Compact JSON of a validated claim set with sensitive values
 *        redacted, for logs and examples
 */
std::string to_compact_json(const TokenClaims& claims);

std::string to_pretty_json(const TokenClaims& claims, int indent = 2);

}  // namespace json_serialization

}  // namespace warden
