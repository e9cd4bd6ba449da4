#include "warden/key_rotation.hpp"

#include "warden/logging.hpp"

namespace warden {

std::string_view triggerName(RotationTrigger trigger) noexcept {
  switch (trigger) {
    case RotationTrigger::Initial:
      return "initial";
    case RotationTrigger::Scheduled:
      return "scheduled";
    case RotationTrigger::Manual:
      return "manual";
  }
  return "manual";
}

KeyRotationCoordinator::KeyRotationCoordinator(
    const WardenConfig& config, std::shared_ptr<KeySet> keys,
    std::string_view master_secret, std::shared_ptr<const Clock> clock,
    std::shared_ptr<AuditSink> audit,
    std::shared_ptr<KeyPairProvider> key_pairs)
    : algorithm_(config.signing_algorithm),
      retention_(config.max_token_ttl),
      purge_grace_(config.purge_grace),
      kdf_(config.pbkdf2_iterations),
      master_secret_(master_secret.begin(), master_secret.end()),
      keys_(std::move(keys)),
      clock_(std::move(clock)),
      audit_(std::move(audit)),
      key_pairs_(std::move(key_pairs)) {
  if (!keys_ || !clock_) {
    throw InvalidArgumentError("rotation coordinator needs keys and a clock");
  }
  if (!audit_) {
    audit_ = std::make_shared<NullAuditSink>();
  }
}

GenerationId KeyRotationCoordinator::initialize() {
  {
    std::lock_guard<std::mutex> lock(rotation_mutex_);
    auto snapshot = keys_->snapshot();
    if (!snapshot->empty()) {
      return snapshot->currentGeneration();
    }
  }
  return rotate(RotationTrigger::Initial);
}

bool KeyRotationCoordinator::purgeable(const KeyMaterial& material,
                                       TimePoint now) const {
  const auto& until = material.validUntil();
  return until && *until + purge_grace_ <= now;
}

GenerationId KeyRotationCoordinator::rotate(RotationTrigger trigger) {
  std::lock_guard<std::mutex> lock(rotation_mutex_);
  auto now = clock_->now();
  auto previous = keys_->snapshot();

  GenerationId next = 1;
  if (!previous->empty()) {
    next = previous->generations().rbegin()->first + 1;
  }

  std::optional<KeyPairDer> key_pair;
  if (key_pairs_ && isAsymmetric(algorithm_)) {
    key_pair = key_pairs_->keyPairFor(next, algorithm_);
  }
  auto material = KeyMaterial::derive(
      next, algorithm_, kdf_,
      std::string_view(master_secret_.data(), master_secret_.size()), now,
      std::move(key_pair));

  std::map<GenerationId, KeyMaterialPtr> generations;
  size_t purged = 0;
  for (const auto& [id, existing] : previous->generations()) {
    auto kept = existing;
    if (id == previous->currentGeneration()) {
      kept = existing->withValidUntil(now + retention_);
    }
    if (purgeable(*kept, now)) {
      ++purged;
      continue;
    }
    generations.emplace(id, std::move(kept));
  }
  generations.emplace(next, material);

  keys_->publish(std::make_shared<KeySetSnapshot>(next, std::move(generations)));

  WARDEN_LOG_INFO(
      "Key rotation ({}): generation {} is current, {} retained, {} purged",
      triggerName(trigger), next, previous->size() - purged, purged);

  nlohmann::json details = {
      {"trigger", std::string(triggerName(trigger))},
      {"algorithm", std::string(algorithmName(algorithm_))},
      {"purged", purged}};
  if (!previous->empty()) {
    details["previous"] = previous->currentGeneration();
  }
  auditEvent(AuditEvent::KeyRotated, now, next, std::move(details));
  if (purged > 0) {
    auditEvent(AuditEvent::KeysPurged, now, next, {{"count", purged}});
  }
  return next;
}

size_t KeyRotationCoordinator::purgeExpired() {
  std::lock_guard<std::mutex> lock(rotation_mutex_);
  auto now = clock_->now();
  auto previous = keys_->snapshot();

  std::map<GenerationId, KeyMaterialPtr> generations;
  for (const auto& [id, material] : previous->generations()) {
    if (id != previous->currentGeneration() && purgeable(*material, now)) {
      WARDEN_LOG_INFO("Purging key generation {}", id);
      continue;
    }
    generations.emplace(id, material);
  }

  size_t purged = previous->size() - generations.size();
  if (purged == 0) {
    return 0;
  }
  keys_->publish(std::make_shared<KeySetSnapshot>(previous->currentGeneration(),
                                                  std::move(generations)));
  auditEvent(AuditEvent::KeysPurged, now, previous->currentGeneration(),
             {{"count", purged}});
  return purged;
}

void KeyRotationCoordinator::auditEvent(AuditEvent event, TimePoint now,
                                        GenerationId generation,
                                        nlohmann::json details) {
  AuditRecord record;
  record.event = event;
  record.at = now;
  record.generation = generation;
  record.details = std::move(details);
  audit_->record(record);
}

//
// RotationScheduler
//

RotationScheduler::RotationScheduler(
    std::shared_ptr<KeyRotationCoordinator> coordinator,
    std::chrono::milliseconds interval)
    : coordinator_(std::move(coordinator)), interval_(interval) {
  if (!coordinator_) {
    throw InvalidArgumentError("scheduler needs a rotation coordinator");
  }
  if (interval_.count() <= 0) {
    throw InvalidArgumentError("rotation interval must be positive");
  }
}

RotationScheduler::~RotationScheduler() { stop(); }

void RotationScheduler::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) {
    return;
  }
  thread_ = std::jthread([this](std::stop_token stop) { run(stop); });
  WARDEN_LOG_INFO("Key rotation scheduled every {} ms", interval_.count());
}

void RotationScheduler::stop() {
  std::jthread thread;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    thread = std::move(thread_);
  }
  if (thread.joinable()) {
    thread.request_stop();
    cv_.notify_all();
    thread.join();
  }
}

bool RotationScheduler::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return thread_.joinable();
}

size_t RotationScheduler::completedRotations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_;
}

void RotationScheduler::run(std::stop_token stop) {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop.stop_requested()) {
    cv_.wait_for(lock, stop, interval_, [] { return false; });
    if (stop.stop_requested()) {
      break;
    }
    lock.unlock();
    try {
      coordinator_->rotate(RotationTrigger::Scheduled);
      lock.lock();
      ++completed_;
    } catch (const WardenError& e) {
      WARDEN_LOG_ERROR("Scheduled key rotation failed: {}", e.what());
      lock.lock();
    } catch (const std::exception& e) {
      WARDEN_LOG_ERROR("Scheduled key rotation failed unexpectedly: {}",
                       e.what());
      lock.lock();
    }
  }
}

}  // namespace warden
