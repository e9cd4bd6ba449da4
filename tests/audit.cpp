#include <doctest/doctest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <sstream>
#include <string>
#include "warden/audit.hpp"
#include "warden/logging.hpp"
#include "warden/token_service.hpp"
#include "test_support.hpp"

using namespace warden;

namespace {

std::shared_ptr<spdlog::logger> captureLogger(std::ostringstream& out) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("audit-capture", sink);
    logger->set_pattern("%l %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

}  // namespace

TEST_CASE("Audit - Event names") {
    CHECK(auditEventName(AuditEvent::AlgorithmDowngrade) == "algorithm_downgrade");
    CHECK(auditEventName(AuditEvent::RevokedTokenUsed) == "revoked_token_used");
    CHECK(auditEventName(AuditEvent::DeviceMismatch) == "device_mismatch");
    CHECK(auditEventName(AuditEvent::TokenRevoked) == "token_revoked");
    CHECK(auditEventName(AuditEvent::SubjectRevoked) == "subject_revoked");
    CHECK(auditEventName(AuditEvent::RefreshRotated) == "refresh_rotated");
    CHECK(auditEventName(AuditEvent::KeyRotated) == "key_rotated");
    CHECK(auditEventName(AuditEvent::KeysPurged) == "keys_purged");
}

TEST_CASE("Audit - Record as JSON") {
    AuditRecord record;
    record.event = AuditEvent::DeviceMismatch;
    record.at = fromUnixSeconds(1700000000);
    record.subject = "user-42";
    record.token_id = "abc";
    record.generation = 3;
    record.details = {{"reason", "no device context presented"}};

    auto j = record.toJson();
    CHECK(j.at("event") == "device_mismatch");
    CHECK(j.at("at") == 1700000000);
    CHECK(j.at("subject") == "user-42");
    CHECK(j.at("token_id") == "abc");
    CHECK(j.at("generation") == 3);
    CHECK(j.at("details").at("reason") == "no device context presented");
}

TEST_CASE("Audit - Empty fields are omitted") {
    AuditRecord record;
    record.event = AuditEvent::KeyRotated;
    record.at = fromUnixSeconds(1700000000);

    auto j = record.toJson();
    CHECK(j.size() == 2);
    CHECK_FALSE(j.contains("subject"));
    CHECK_FALSE(j.contains("generation"));
    CHECK_FALSE(j.contains("details"));
}

TEST_CASE("Audit - Sinks accept every event") {
    LoggingAuditSink logging_sink;
    NullAuditSink null_sink;
    for (auto event : {AuditEvent::AlgorithmDowngrade, AuditEvent::TokenRevoked,
                       AuditEvent::KeysPurged}) {
        AuditRecord record;
        record.event = event;
        record.at = fromUnixSeconds(1700000000);
        CHECK_NOTHROW(logging_sink.record(record));
        CHECK_NOTHROW(null_sink.record(record));
    }
}

TEST_CASE("Audit - Logging sink writes levelled JSON lines") {
    std::ostringstream out;
    LoggingAuditSink sink(captureLogger(out));

    AuditRecord violation;
    violation.event = AuditEvent::RevokedTokenUsed;
    violation.at = fromUnixSeconds(1700000000);
    violation.token_id = "abc";
    sink.record(violation);

    AuditRecord routine;
    routine.event = AuditEvent::KeysPurged;
    routine.at = fromUnixSeconds(1700000000);
    sink.record(routine);

    auto text = out.str();
    CHECK(text.find("critical audit {\"at\":1700000000,\"event\":\"revoked_token_used\"") !=
          std::string::npos);
    CHECK(text.find("info audit {\"at\":1700000000,\"event\":\"keys_purged\"}") !=
          std::string::npos);
}

TEST_CASE("Audit - Records survive a quiet diagnostic log level") {
    std::ostringstream out;
    auto config = testing::testConfig();
    config.log_level = "error";

    ServiceDependencies deps;
    deps.clock = std::make_shared<testing::ManualClock>();
    deps.audit = std::make_shared<LoggingAuditSink>(captureLogger(out));
    auto service = TokenService::create(config, testing::kTestSecret, deps);

    IssueRequest request;
    request.subject = "user-42";
    auto issued = service->issueDetailed(request);
    service->revoke(issued.claims.token_id, issued.claims.expires_at);

    auto text = out.str();
    CHECK(text.find("\"event\":\"key_rotated\"") != std::string::npos);
    CHECK(text.find("\"event\":\"token_revoked\"") != std::string::npos);
    CHECK(text.find(issued.claims.token_id) != std::string::npos);

    // Leave the diagnostic logger as the other suites expect it
    logging::Logger::getInstance().setLogLevel("info");
}
