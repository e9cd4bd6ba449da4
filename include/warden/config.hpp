/**
 * @file config.hpp
 * @brief Runtime configuration with JSON loading and environment overrides
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "warden/crypto.hpp"

namespace warden {

/**
 * @brief Deployment environment, drives policy strictness
 */
enum class Environment { Development, Staging, Production };

std::string_view environmentName(Environment env) noexcept;

/**
 * @brief Parse "development", "staging" or "production"
 * @throws ConfigError for any other value
 */
Environment parseEnvironment(std::string_view name);

/// Default PBKDF2 iteration count
constexpr uint32_t kDefaultPbkdf2Iterations = 210000;
/// Lowest PBKDF2 iteration count accepted anywhere
constexpr uint32_t kMinPbkdf2Iterations = 100000;

struct WardenConfig {
  Environment environment = Environment::Development;
  SigningAlgorithm signing_algorithm = SigningAlgorithm::HS256;
  uint32_t pbkdf2_iterations = kDefaultPbkdf2Iterations;

  /// Longest lifetime any token may have. Also how long a rotated-out
  /// generation stays valid for verification.
  std::chrono::seconds max_token_ttl{std::chrono::hours(24 * 7)};
  std::chrono::seconds access_token_ttl{std::chrono::minutes(15)};
  std::chrono::seconds refresh_token_ttl{std::chrono::hours(24 * 7)};
  std::chrono::seconds purge_grace{std::chrono::minutes(5)};
  /// Zero disables scheduled rotation
  std::chrono::seconds rotation_interval{std::chrono::hours(24)};

  size_t max_custom_claim_bytes = 4096;

  uint32_t revocation_max_attempts = 3;
  std::chrono::milliseconds revocation_initial_backoff{10};

  /// Hex-encoded salt for the client address HMAC. Empty means derive one
  /// from the master secret.
  std::string fingerprint_salt;

  std::string log_level = "info";

  /**
   * @brief Check every field against its allowed range
   * @throws ConfigError naming the first offending field
   */
  void validate() const;
};

/**
 * @brief Parse configuration from JSON text
 *
 * Missing keys keep their defaults. Unknown keys are ignored.
 * @throws ConfigError on malformed JSON, wrong types or invalid values
 */
WardenConfig parseConfig(std::string_view json_text);

/**
 * @brief Load a JSON configuration file and apply environment overrides
 * @throws ConfigError if the file cannot be read or is invalid
 */
WardenConfig loadConfig(const std::string& path);

/**
 * @brief Apply WARDEN_ENVIRONMENT, WARDEN_LOG_LEVEL and
 *        WARDEN_PBKDF2_ITERATIONS when set
 * @throws ConfigError if a variable holds an invalid value
 */
void applyEnvironmentOverrides(WardenConfig& config);

}  // namespace warden
