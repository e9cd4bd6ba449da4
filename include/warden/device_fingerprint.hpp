/**
 * @file device_fingerprint.hpp
 * @brief Privacy-preserving device binding hash
 */

#pragma once

#include <map>
#include <string>
#include <string_view>

#include "warden/secure_vector.hpp"

namespace warden {

using HeaderMap = std::map<std::string, std::string>;

/**
 * @brief Request attributes that identify a client device
 */
struct RequestMetadata {
  std::string user_agent;
  std::string accept;
  std::string accept_language;
  std::string accept_encoding;
  std::string connection;
  std::string client_address;

  /**
   * @brief Collect the fingerprinted headers, matching names
   *        case-insensitively. Missing headers are empty.
   */
  static RequestMetadata fromHeaders(const HeaderMap& headers,
                                     std::string_view client_address);
};

class DeviceFingerprint {
 public:
  static constexpr size_t kFingerprintHexSize = 64;

  /**
   * @param salt Secret mixed into the client address before hashing
   * @throws InvalidArgumentError if the salt is empty
   */
  explicit DeviceFingerprint(SecureBytes salt);

  /**
   * @brief SHA-256 hex digest of the request attributes
   *
   * The client address only enters as HMAC-SHA256(salt, address), so the
   * raw address cannot be recovered or brute forced without the salt.
   */
  std::string compute(const RequestMetadata& metadata) const;

  /**
   * @brief Constant-time comparison of two fingerprints
   */
  static bool matches(std::string_view a, std::string_view b) noexcept;

 private:
  SecureBytes salt_;
};

}  // namespace warden
