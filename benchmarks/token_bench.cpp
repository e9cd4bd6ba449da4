#include <benchmark/benchmark.h>
#include "warden/token_service.hpp"
#include <memory>
#include <string>

using namespace warden;

static std::unique_ptr<TokenService> CreateService(SigningAlgorithm alg) {
    WardenConfig config;
    config.pbkdf2_iterations = kMinPbkdf2Iterations;
    config.signing_algorithm = alg;
    ServiceDependencies deps;
    deps.audit = std::make_shared<NullAuditSink>();
    return TokenService::create(config, "Xq7#Lm2$Vp9!Rt4@Wz6^Kc1&Hn8*Bd3%Fg5", deps);
}

static IssueRequest CreateSimpleRequest() {
    IssueRequest request;
    request.subject = "user-42";
    return request;
}

static IssueRequest CreateSensitiveRequest() {
    IssueRequest request;
    request.subject = "user-42";
    request.custom = {{"roles", nlohmann::json::array({"reader", "writer"})},
                      {"tenant", "acme"}};
    request.sensitive = {{"email", "user42@example.com"},
                         {"phone", "+44 20 7946 0000"}};
    return request;
}

static RequestMetadata CreateDevice() {
    RequestMetadata device;
    device.user_agent = "Mozilla/5.0 (X11; Linux x86_64) Firefox/128.0";
    device.accept = "application/json";
    device.accept_language = "en-US";
    device.accept_encoding = "gzip, br";
    device.connection = "keep-alive";
    device.client_address = "198.51.100.7";
    return device;
}

static void BM_IssueSimpleToken(benchmark::State& state) {
    auto service = CreateService(SigningAlgorithm::HS256);
    auto request = CreateSimpleRequest();

    for (auto _ : state) {
        auto token = service->issue(request);
        benchmark::DoNotOptimize(token);
    }
}
BENCHMARK(BM_IssueSimpleToken);

static void BM_IssueEncryptedToken(benchmark::State& state) {
    auto service = CreateService(SigningAlgorithm::HS256);
    auto request = CreateSensitiveRequest();

    for (auto _ : state) {
        auto token = service->issue(request);
        benchmark::DoNotOptimize(token);
    }
}
BENCHMARK(BM_IssueEncryptedToken);

static void BM_ValidateToken(benchmark::State& state) {
    auto alg = static_cast<SigningAlgorithm>(state.range(0));
    auto service = CreateService(alg);
    auto token = service->issue(CreateSensitiveRequest());

    for (auto _ : state) {
        auto result = service->validate(token);
        benchmark::DoNotOptimize(result);
    }
    state.SetLabel(std::string(algorithmName(alg)));
}
BENCHMARK(BM_ValidateToken)
    ->Arg(static_cast<int>(SigningAlgorithm::HS256))
    ->Arg(static_cast<int>(SigningAlgorithm::ES256))
    ->Arg(static_cast<int>(SigningAlgorithm::PS256));

static void BM_ValidateBoundToken(benchmark::State& state) {
    auto service = CreateService(SigningAlgorithm::HS256);
    auto request = CreateSimpleRequest();
    auto device = CreateDevice();
    request.device_context = device;
    auto token = service->issue(request);

    for (auto _ : state) {
        auto result = service->validate(token, device);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ValidateBoundToken);

static void BM_RejectTamperedToken(benchmark::State& state) {
    auto service = CreateService(SigningAlgorithm::HS256);
    auto token = service->issue(CreateSimpleRequest());
    token.back() = token.back() == 'A' ? 'B' : 'A';

    for (auto _ : state) {
        auto result = service->validate(token);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RejectTamperedToken);

static void BM_RevokedLookup(benchmark::State& state) {
    auto service = CreateService(SigningAlgorithm::HS256);
    for (int64_t i = 0; i < state.range(0); ++i) {
        service->revoke("revoked-" + std::to_string(i), 4102444800);
    }
    auto token = service->issue(CreateSimpleRequest());

    for (auto _ : state) {
        auto result = service->validate(token);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_RevokedLookup)->Range(8, 8 << 10);

static void BM_RotateKeys(benchmark::State& state) {
    auto service = CreateService(SigningAlgorithm::HS256);

    for (auto _ : state) {
        auto generation = service->rotateKeys();
        benchmark::DoNotOptimize(generation);
    }
}
BENCHMARK(BM_RotateKeys)->Unit(benchmark::kMillisecond);
