#include <doctest/doctest.h>
#include "warden/algorithm_policy.hpp"

using namespace warden;

TEST_CASE("AlgorithmPolicy - Approves allow-listed algorithms") {
    for (auto name : {"HS256", "ES256", "PS256"}) {
        auto decision = algorithm_policy::approve(name, Environment::Development);
        CHECK(decision.approved);
        CHECK(decision.algorithm.has_value());
        CHECK_FALSE(decision.warning.has_value());
    }
}

TEST_CASE("AlgorithmPolicy - Rejects everything else") {
    for (auto name : {"none", "None", "hs256", "RS256", "HS512", "ES384", ""}) {
        auto decision = algorithm_policy::approve(name, Environment::Production);
        CHECK_FALSE(decision.approved);
        CHECK(decision.rejection == WardenErrorCode::UNSUPPORTED_ALGORITHM);
    }
    CHECK_THROWS_AS(algorithm_policy::requireApproved("none", Environment::Development),
                    UnsupportedAlgorithmError);
}

TEST_CASE("AlgorithmPolicy - Symmetric warning in production only") {
    auto prod = algorithm_policy::approve("HS256", Environment::Production);
    CHECK(prod.approved);
    CHECK(prod.warning.has_value());

    auto staging = algorithm_policy::approve("HS256", Environment::Staging);
    CHECK(staging.approved);
    CHECK_FALSE(staging.warning.has_value());

    auto es = algorithm_policy::approve("ES256", Environment::Production);
    CHECK(es.approved);
    CHECK_FALSE(es.warning.has_value());
}

TEST_CASE("AlgorithmPolicy - Header check") {
    CHECK_NOTHROW(algorithm_policy::checkHeader("ES256", SigningAlgorithm::ES256,
                                                Environment::Production));
    CHECK_THROWS_AS(algorithm_policy::checkHeader("HS256", SigningAlgorithm::ES256,
                                                  Environment::Production),
                    AlgorithmDowngradeError);
    CHECK_THROWS_AS(algorithm_policy::checkHeader("none", SigningAlgorithm::HS256,
                                                  Environment::Development),
                    UnsupportedAlgorithmError);
}

TEST_CASE("ErrorClassification - Categories and public messages") {
    CHECK(classify(WardenErrorCode::ALGORITHM_DOWNGRADE) ==
          ErrorCategory::SecurityViolation);
    CHECK(classify(WardenErrorCode::INVALID_SIGNATURE) == ErrorCategory::Untrustworthy);
    CHECK(classify(WardenErrorCode::TOKEN_TAMPERED) == ErrorCategory::Untrustworthy);
    CHECK(classify(WardenErrorCode::TOKEN_EXPIRED) == ErrorCategory::Lifecycle);
    CHECK(classify(WardenErrorCode::KEY_UNAVAILABLE) == ErrorCategory::ServerError);
    CHECK(classify(WardenErrorCode::CLAIM_TOO_LARGE) == ErrorCategory::CallerError);

    CHECK(publicMessage(WardenErrorCode::INVALID_SIGNATURE) ==
          publicMessage(WardenErrorCode::ALGORITHM_DOWNGRADE));
    CHECK(publicMessage(WardenErrorCode::UNKNOWN_KEY_GENERATION) ==
          publicMessage(WardenErrorCode::TOKEN_TAMPERED));
}
