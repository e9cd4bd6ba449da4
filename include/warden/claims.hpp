/**
 * @file claims.hpp
 * @brief Fixed token claim set with a bounded custom map
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "warden/key_set.hpp"
#include "warden/payload_cipher.hpp"

namespace warden {

enum class TokenType { Access, Refresh };

constexpr std::string_view tokenTypeName(TokenType type) noexcept {
  return type == TokenType::Refresh ? "refresh" : "access";
}

/**
 * @brief Data-protection classification carried with every token
 */
enum class DataClassification { Public, Internal, Confidential, Restricted };

constexpr std::string_view classificationName(
    DataClassification classification) noexcept {
  switch (classification) {
    case DataClassification::Public:
      return "public";
    case DataClassification::Internal:
      return "internal";
    case DataClassification::Confidential:
      return "confidential";
    case DataClassification::Restricted:
      return "restricted";
  }
  return "internal";
}

constexpr std::optional<DataClassification> parseClassification(
    std::string_view name) noexcept {
  if (name == "public") return DataClassification::Public;
  if (name == "internal") return DataClassification::Internal;
  if (name == "confidential") return DataClassification::Confidential;
  if (name == "restricted") return DataClassification::Restricted;
  return std::nullopt;
}

struct ComplianceMetadata {
  bool contains_personal_data = false;
  DataClassification data_classification = DataClassification::Internal;
  bool sensitive_encrypted = false;

  bool operator==(const ComplianceMetadata&) const = default;
};

/// Application claims without a dedicated field
using CustomClaims = std::map<std::string, nlohmann::json>;

/**
 * @brief Everything a validated token asserts
 */
struct TokenClaims {
  std::string subject;                        ///< Authenticated principal
  int64_t issued_at = 0;                      ///< Unix seconds
  int64_t expires_at = 0;                     ///< Unix seconds
  std::string token_id;                       ///< 128-bit random, base64url
  TokenType token_type = TokenType::Access;   ///< Access or refresh
  std::optional<std::string> device_binding;  ///< Fingerprint, if bound
  SensitiveClaims sensitive;                  ///< Plaintext after decryption
  CustomClaims custom;                        ///< Bounded application data
  ComplianceMetadata compliance;
  GenerationId key_generation = 0;            ///< Generation that signed it

  bool isBound() const noexcept { return device_binding.has_value(); }
};

}  // namespace warden
