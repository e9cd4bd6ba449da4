/**
 * @file base64.hpp
 * @brief Unpadded base64url encoding used for every token segment
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "warden/error.hpp"

namespace warden {

/**
 * @brief Encode a byte span as base64url without padding
 */
std::string base64UrlEncodeImpl(std::span<const uint8_t> data);

/**
 * @brief Concept for data types suitable for base64 encoding
 */
template <typename T>
concept Base64Data = requires(T t) {
  std::data(t);
  std::size(t);
  typename T::value_type;
  requires std::same_as<typename T::value_type, uint8_t>;
};

template <Base64Data T>
std::string base64UrlEncode(const T& data) {
  return base64UrlEncodeImpl({std::data(data), std::size(data)});
}

inline std::string base64UrlEncode(std::string_view text) {
  return base64UrlEncodeImpl(
      {reinterpret_cast<const uint8_t*>(text.data()), text.size()});
}

/**
 * @brief Decode a base64url string
 * @param data Base64url text, padding is not accepted
 * @return Decoded bytes
 * @throws InvalidBase64Error on characters outside the url alphabet or an
 *         impossible length
 */
std::vector<uint8_t> base64UrlDecode(std::string_view data);

/**
 * @brief Decode a base64url string into text
 * @throws InvalidBase64Error as base64UrlDecode
 */
std::string base64UrlDecodeToString(std::string_view data);

}  // namespace warden
