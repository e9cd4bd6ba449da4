/**
 * @file token_format.hpp
 * @brief header.body.signature encoding of serialized tokens
 */

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/claims.hpp"
#include "warden/key_set.hpp"
#include "warden/payload_cipher.hpp"

namespace warden {

struct TokenHeader {
  std::string alg;         ///< Algorithm name as presented
  std::string typ = "JWT";
  GenerationId kid = 0;    ///< Generation that signed the token
};

/**
 * @brief Structurally valid token whose signature has not been checked
 */
struct ParsedToken {
  TokenHeader header;
  TokenClaims claims;
  std::optional<EncryptedPayload> encrypted;
  std::string header_segment;  ///< As received, for the signing input
  std::string body_segment;    ///< As received, for the signing input
  std::vector<uint8_t> signature;

  std::vector<uint8_t> signingInput() const;
};

namespace token_format {

std::string encodeSegment(const nlohmann::json& j);

std::string encodeHeader(const TokenHeader& header);

/**
 * @brief Join the segments of a signed token
 */
std::string assemble(std::string_view header_segment,
                     std::string_view body_segment,
                     const std::vector<uint8_t>& signature);

/**
 * @brief Split and decode a serialized token
 * @throws MalformedTokenError for a wrong segment count, bad base64url,
 *         bad JSON or missing fields
 */
ParsedToken parse(std::string_view serialized);

}  // namespace token_format

}  // namespace warden
