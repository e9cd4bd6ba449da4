#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "warden/audit.hpp"
#include "warden/clock.hpp"
#include "warden/config.hpp"
#include "warden/revocation_store.hpp"

namespace warden::testing {

/// Passes every strength check, including production's
inline constexpr const char* kTestSecret = "Xq7#Lm2$Vp9!Rt4@Wz6^Kc1&Hn8*Bd3%Fg5";

/// Clock moved only by the test
class ManualClock : public Clock {
 public:
  explicit ManualClock(TimePoint start = fromUnixSeconds(1700000000))
      : now_(start) {}

  TimePoint now() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = now_;
    now_ += step_on_read_;
    return current;
  }

  /// Move the clock forward by `step` after every read
  void stepOnRead(std::chrono::milliseconds step) {
    std::lock_guard<std::mutex> lock(mutex_);
    step_on_read_ = step;
  }

  void advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
  }

  void set(TimePoint tp) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = tp;
  }

 private:
  mutable std::mutex mutex_;
  mutable TimePoint now_;
  std::chrono::milliseconds step_on_read_{0};
};

class RecordingAuditSink : public AuditSink {
 public:
  void record(const AuditRecord& record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
  }

  std::vector<AuditRecord> records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
  }

  size_t count(AuditEvent event) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& r : records_) {
      if (r.event == event) ++n;
    }
    return n;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<AuditRecord> records_;
};

/**
 * In-memory backend that throws RevocationBackendError for the next
 * `failures` calls
 */
class FlakyRevocationBackend : public RevocationBackend {
 public:
  explicit FlakyRevocationBackend(std::shared_ptr<const Clock> clock)
      : inner_(std::move(clock)) {}

  void failNext(int failures) { failures_ = failures; }
  int calls() const { return calls_; }

  std::optional<std::string> get(const std::string& key) override {
    maybeFail();
    return inner_.get(key);
  }
  void setWithTtl(const std::string& key, std::string value,
                  TimePoint expires_at) override {
    maybeFail();
    inner_.setWithTtl(key, std::move(value), expires_at);
  }
  bool erase(const std::string& key) override {
    maybeFail();
    return inner_.erase(key);
  }
  size_t evictExpired() override {
    maybeFail();
    return inner_.evictExpired();
  }

 private:
  void maybeFail() {
    ++calls_;
    if (failures_ > 0) {
      --failures_;
      throw RevocationBackendError("connection refused");
    }
  }

  InMemoryRevocationBackend inner_;
  std::atomic<int> failures_{0};
  std::atomic<int> calls_{0};
};

/// Configuration with the cheapest allowed PBKDF2 cost and no backoff
inline WardenConfig testConfig() {
  WardenConfig config;
  config.pbkdf2_iterations = kMinPbkdf2Iterations;
  config.revocation_initial_backoff = std::chrono::milliseconds(0);
  config.rotation_interval = std::chrono::seconds(0);
  return config;
}

}  // namespace warden::testing
