/**
 * @file algorithm_policy.hpp
 * @brief Signing-algorithm allow-list and downgrade detection
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "warden/config.hpp"
#include "warden/crypto.hpp"
#include "warden/error.hpp"

namespace warden {

/**
 * @brief Outcome of checking an algorithm against the allow-list
 */
struct PolicyDecision {
  bool approved = false;
  std::optional<SigningAlgorithm> algorithm;  ///< Set when approved
  std::optional<std::string> warning;         ///< Approved, but discouraged
  WardenErrorCode rejection = WardenErrorCode::SUCCESS;

  explicit operator bool() const noexcept { return approved; }
};

namespace algorithm_policy {

/**
 * @brief Decide whether an algorithm may be used in an environment
 *
 * HS256, ES256 and PS256 are approved. In production HS256 carries a
 * warning recommending an asymmetric algorithm. Everything else, including
 * "none" and case variants such as "hs256", is rejected with
 * UNSUPPORTED_ALGORITHM.
 */
PolicyDecision approve(std::string_view algorithm, Environment env);

/**
 * @brief Approve an algorithm or throw
 * @throws UnsupportedAlgorithmError if rejected
 */
SigningAlgorithm requireApproved(std::string_view algorithm, Environment env);

/**
 * @brief Compare a token header's algorithm with its key generation's
 * @param header_alg Value of "alg" as presented in the token
 * @param expected Algorithm configured on the generation that signed it
 * @param env Deployment environment
 * @throws UnsupportedAlgorithmError if header_alg is not on the allow-list
 * @throws AlgorithmDowngradeError if header_alg differs from expected
 */
void checkHeader(std::string_view header_alg, SigningAlgorithm expected,
                 Environment env);

}  // namespace algorithm_policy

}  // namespace warden
