#include "warden/device_fingerprint.hpp"

#include <algorithm>
#include <cctype>

#include "warden/crypto.hpp"
#include "warden/error.hpp"

namespace warden {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

std::string headerValue(const HeaderMap& headers, std::string_view name) {
  for (const auto& [key, value] : headers) {
    if (equalsIgnoreCase(key, name)) {
      return value;
    }
  }
  return {};
}

std::span<const uint8_t> asBytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

}  // namespace

RequestMetadata RequestMetadata::fromHeaders(const HeaderMap& headers,
                                             std::string_view client_address) {
  RequestMetadata metadata;
  metadata.user_agent = headerValue(headers, "User-Agent");
  metadata.accept = headerValue(headers, "Accept");
  metadata.accept_language = headerValue(headers, "Accept-Language");
  metadata.accept_encoding = headerValue(headers, "Accept-Encoding");
  metadata.connection = headerValue(headers, "Connection");
  metadata.client_address = std::string(client_address);
  return metadata;
}

DeviceFingerprint::DeviceFingerprint(SecureBytes salt) : salt_(std::move(salt)) {
  if (salt_.empty()) {
    throw InvalidArgumentError("fingerprint salt must not be empty");
  }
}

std::string DeviceFingerprint::compute(const RequestMetadata& metadata) const {
  auto address_mac = hmacSha256(salt_, asBytes(metadata.client_address));

  std::string material;
  material.reserve(metadata.user_agent.size() + metadata.accept.size() +
                   metadata.accept_language.size() +
                   metadata.accept_encoding.size() +
                   metadata.connection.size() + 2 * address_mac.size() + 5);
  material.append(metadata.user_agent).push_back('|');
  material.append(metadata.accept).push_back('|');
  material.append(metadata.accept_language).push_back('|');
  material.append(metadata.accept_encoding).push_back('|');
  material.append(metadata.connection).push_back('|');
  material.append(toHex(address_mac));

  return toHex(hashSha256(asBytes(material)));
}

bool DeviceFingerprint::matches(std::string_view a,
                                std::string_view b) noexcept {
  return secure_utils::constantTimeEqual(a, b);
}

}  // namespace warden
