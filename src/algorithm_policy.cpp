#include "warden/algorithm_policy.hpp"

#include "warden/logging.hpp"

namespace warden {
namespace algorithm_policy {

PolicyDecision approve(std::string_view algorithm, Environment env) {
  PolicyDecision decision;
  auto alg = parseSigningAlgorithm(algorithm);
  if (!alg) {
    decision.rejection = WardenErrorCode::UNSUPPORTED_ALGORITHM;
    return decision;
  }

  decision.approved = true;
  decision.algorithm = *alg;
  if (env == Environment::Production && !isAsymmetric(*alg)) {
    decision.warning =
        "HS256 shares one secret between issuer and verifier; prefer ES256 "
        "or PS256 in production";
  }
  return decision;
}

SigningAlgorithm requireApproved(std::string_view algorithm, Environment env) {
  auto decision = approve(algorithm, env);
  if (!decision) {
    throw UnsupportedAlgorithmError(algorithm);
  }
  return *decision.algorithm;
}

void checkHeader(std::string_view header_alg, SigningAlgorithm expected,
                 Environment env) {
  auto decision = approve(header_alg, env);
  if (!decision) {
    WARDEN_LOG_ERROR("Token header names unsupported algorithm '{}'",
                     header_alg);
    throw UnsupportedAlgorithmError(header_alg);
  }
  if (*decision.algorithm != expected) {
    WARDEN_LOG_CRITICAL(
        "Algorithm downgrade attempt: header '{}' against generation "
        "algorithm '{}'",
        header_alg, algorithmName(expected));
    throw AlgorithmDowngradeError(header_alg, algorithmName(expected));
  }
}

}  // namespace algorithm_policy
}  // namespace warden
