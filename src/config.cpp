#include "warden/config.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>

#include "warden/logging.hpp"

namespace warden {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

template <typename T>
T readField(const nlohmann::json& j, const char* key, T fallback) {
  if (!j.contains(key)) {
    return fallback;
  }
  if constexpr (std::is_unsigned_v<T>) {
    if (j.at(key).is_number_integer() && !j.at(key).is_number_unsigned()) {
      throw ConfigError(std::string(key) + " must not be negative");
    }
  }
  try {
    return j.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string(key) + ": " + e.what());
  }
}

std::chrono::seconds readSeconds(const nlohmann::json& j, const char* key,
                                 std::chrono::seconds fallback) {
  return std::chrono::seconds(readField<int64_t>(j, key, fallback.count()));
}

uint32_t parseIterations(std::string_view text) {
  uint32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    throw ConfigError("WARDEN_PBKDF2_ITERATIONS is not a number: " +
                      std::string(text));
  }
  return value;
}

}  // namespace

std::string_view environmentName(Environment env) noexcept {
  switch (env) {
    case Environment::Development:
      return "development";
    case Environment::Staging:
      return "staging";
    case Environment::Production:
      return "production";
  }
  return "development";
}

Environment parseEnvironment(std::string_view name) {
  if (name == "development") return Environment::Development;
  if (name == "staging") return Environment::Staging;
  if (name == "production") return Environment::Production;
  throw ConfigError("unknown environment: " + std::string(name));
}

void WardenConfig::validate() const {
  if (pbkdf2_iterations < kMinPbkdf2Iterations) {
    throw ConfigError("pbkdf2_iterations must be at least " +
                      std::to_string(kMinPbkdf2Iterations));
  }
  if (max_token_ttl.count() <= 0) {
    throw ConfigError("max_token_ttl_seconds must be positive");
  }
  if (access_token_ttl.count() <= 0 || access_token_ttl > max_token_ttl) {
    throw ConfigError(
        "access_token_ttl_seconds must be positive and within "
        "max_token_ttl_seconds");
  }
  if (refresh_token_ttl.count() <= 0 || refresh_token_ttl > max_token_ttl) {
    throw ConfigError(
        "refresh_token_ttl_seconds must be positive and within "
        "max_token_ttl_seconds");
  }
  if (purge_grace.count() < 0) {
    throw ConfigError("purge_grace_seconds must not be negative");
  }
  if (rotation_interval.count() < 0) {
    throw ConfigError("rotation_interval_seconds must not be negative");
  }
  if (max_custom_claim_bytes == 0) {
    throw ConfigError("max_custom_claim_bytes must be positive");
  }
  if (revocation_max_attempts == 0) {
    throw ConfigError("revocation.max_attempts must be at least 1");
  }
  if (revocation_initial_backoff.count() < 0) {
    throw ConfigError("revocation.initial_backoff_ms must not be negative");
  }
  if (fingerprint_salt.size() % 2 != 0 ||
      fingerprint_salt.find_first_not_of("0123456789abcdefABCDEF") !=
          std::string::npos) {
    throw ConfigError("fingerprint_salt must be hex encoded");
  }
  bool known_level = false;
  for (auto level : kLogLevels) {
    if (log_level == level) known_level = true;
  }
  if (!known_level) {
    throw ConfigError("unknown log_level: " + log_level);
  }
}

WardenConfig parseConfig(std::string_view json_text) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("malformed JSON: ") + e.what());
  }
  if (!j.is_object()) {
    throw ConfigError("top level must be an object");
  }

  WardenConfig config;
  if (j.contains("environment")) {
    config.environment =
        parseEnvironment(readField<std::string>(j, "environment", ""));
  }
  if (j.contains("signing_algorithm")) {
    auto name = readField<std::string>(j, "signing_algorithm", "");
    auto alg = parseSigningAlgorithm(name);
    if (!alg) {
      throw ConfigError("signing_algorithm not on the allow-list: " + name);
    }
    config.signing_algorithm = *alg;
  }
  config.pbkdf2_iterations =
      readField<uint32_t>(j, "pbkdf2_iterations", config.pbkdf2_iterations);
  config.max_token_ttl =
      readSeconds(j, "max_token_ttl_seconds", config.max_token_ttl);
  config.access_token_ttl =
      readSeconds(j, "access_token_ttl_seconds", config.access_token_ttl);
  config.refresh_token_ttl =
      readSeconds(j, "refresh_token_ttl_seconds", config.refresh_token_ttl);
  config.purge_grace = readSeconds(j, "purge_grace_seconds", config.purge_grace);
  config.rotation_interval =
      readSeconds(j, "rotation_interval_seconds", config.rotation_interval);
  config.max_custom_claim_bytes = readField<size_t>(
      j, "max_custom_claim_bytes", config.max_custom_claim_bytes);

  if (j.contains("revocation")) {
    const auto& revocation = j.at("revocation");
    if (!revocation.is_object()) {
      throw ConfigError("revocation must be an object");
    }
    config.revocation_max_attempts = readField<uint32_t>(
        revocation, "max_attempts", config.revocation_max_attempts);
    config.revocation_initial_backoff =
        std::chrono::milliseconds(readField<int64_t>(
            revocation, "initial_backoff_ms",
            config.revocation_initial_backoff.count()));
  }

  config.fingerprint_salt =
      readField<std::string>(j, "fingerprint_salt", config.fingerprint_salt);
  config.log_level = readField<std::string>(j, "log_level", config.log_level);

  config.validate();
  return config;
}

WardenConfig loadConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();

  WardenConfig config = parseConfig(buffer.str());
  applyEnvironmentOverrides(config);
  config.validate();
  WARDEN_LOG_INFO("Loaded configuration from {} (environment: {})", path,
                  environmentName(config.environment));
  return config;
}

void applyEnvironmentOverrides(WardenConfig& config) {
  if (const char* env = std::getenv("WARDEN_ENVIRONMENT")) {
    config.environment = parseEnvironment(env);
  }
  if (const char* level = std::getenv("WARDEN_LOG_LEVEL")) {
    config.log_level = level;
  }
  if (const char* iterations = std::getenv("WARDEN_PBKDF2_ITERATIONS")) {
    config.pbkdf2_iterations = parseIterations(iterations);
  }
}

}  // namespace warden
