/**
 * @file warden_example.cpp
 * @brief Walk through the token lifecycle
 *
 * This example shows how to:
 * 1. Build a token service from a config file and WARDEN_MASTER_SECRET
 * 2. Issue a device-bound token with encrypted sensitive claims
 * 3. Validate it, refresh it, revoke it and rotate keys
 */

#include "warden/token_service.hpp"
#include "warden/json_serialization.hpp"

#include <getopt.h>

#include <cstdlib>
#include <iostream>
#include <string>

using namespace warden;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE    Load configuration from a JSON file\n";
    std::cout << "  -a, --algorithm ALG  Signing algorithm (HS256, ES256, PS256)\n";
    std::cout << "  -h, --help           Show this help message\n\n";
    std::cout << "The master secret is read from WARDEN_MASTER_SECRET.\n";
}

void print_result(const std::string& label, const ValidationResult& result) {
    std::cout << "  " << label << ": ";
    if (result) {
        std::cout << "valid (subject " << result.value().subject << ", generation "
                  << result.value().key_generation << ")\n";
    } else {
        std::cout << "rejected with " << errorCodeToString(result.errorCode())
                  << ", client sees \"" << publicMessage(result.errorCode()) << "\"\n";
    }
}

RequestMetadata laptop() {
    RequestMetadata device;
    device.user_agent = "Mozilla/5.0 (X11; Linux x86_64) Firefox/128.0";
    device.accept = "text/html,application/json";
    device.accept_language = "en-US";
    device.accept_encoding = "gzip, br";
    device.connection = "keep-alive";
    device.client_address = "198.51.100.7";
    return device;
}

RequestMetadata phone() {
    auto device = laptop();
    device.user_agent = "Mozilla/5.0 (iPhone; CPU iPhone OS 17_5) Mobile/15E148";
    return device;
}

int run(const WardenConfig& config, const char* secret) {
    auto service = TokenService::create(config, secret);

    std::cout << "\n1. Issue a device-bound token\n";
    IssueRequest request;
    request.subject = "user-42";
    request.custom = {{"roles", nlohmann::json::array({"reader", "editor"})}};
    request.sensitive = {{"email", "user42@example.com"}};
    request.device_context = laptop();
    request.classification = DataClassification::Confidential;
    auto pair = service->issuePair(request);
    std::cout << "  access:  " << pair.access.token << "\n";
    std::cout << "  claims:\n"
              << json_serialization::to_pretty_json(pair.access.claims) << "\n";

    std::cout << "\n2. Validate\n";
    print_result("same device", service->validate(pair.access.token, laptop()));
    print_result("other device", service->validate(pair.access.token, phone()));

    std::cout << "\n3. Refresh\n";
    auto refreshed = service->refresh(pair.refresh.token, laptop());
    if (!refreshed) {
        std::cout << "  refresh failed: " << refreshed.error().what() << "\n";
        return 1;
    }
    auto replay = service->refresh(pair.refresh.token, laptop());
    std::cout << "  replaying the old refresh token: "
              << errorCodeToString(replay.errorCode()) << "\n";

    std::cout << "\n4. Revoke\n";
    service->revokeToken(refreshed.value().access.token, RevocationReason::UserLogout);
    print_result("after logout",
                 service->validate(refreshed.value().access.token, laptop()));

    std::cout << "\n5. Rotate keys\n";
    auto generation = service->rotateKeys();
    std::cout << "  generation " << generation << " is current\n";
    print_result("token from the previous generation",
                 service->validate(pair.access.token, laptop()));

    auto stats = service->revocationStatistics();
    std::cout << "\nRevoked " << stats.total_revoked << " token(s)\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string algorithm;

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"algorithm", required_argument, 0, 'a'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "c:a:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                config_path = optarg;
                break;
            case 'a':
                algorithm = optarg;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    const char* secret = std::getenv("WARDEN_MASTER_SECRET");
    if (secret == nullptr) {
        std::cerr << "WARDEN_MASTER_SECRET is not set\n";
        return 1;
    }

    try {
        WardenConfig config;
        if (!config_path.empty()) {
            config = loadConfig(config_path);
        } else {
            applyEnvironmentOverrides(config);
        }
        if (!algorithm.empty()) {
            auto alg = parseSigningAlgorithm(algorithm);
            if (!alg) {
                std::cerr << "Unsupported algorithm: " << algorithm << "\n";
                return 1;
            }
            config.signing_algorithm = *alg;
        }

        std::cout << "Warden token lifecycle example ("
                  << algorithmName(config.signing_algorithm) << ", "
                  << environmentName(config.environment) << ")\n";
        return run(config, secret);
    } catch (const WardenError& e) {
        std::cerr << "Error: " << e.what() << " ("
                  << errorCodeToString(e.errorCode()) << ")\n";
        return 1;
    }
}
