#include "herd_cache/lock_coordinator.hpp"

namespace herd_cache {
namespace {
bool store_failure(const std::string &msg, Error *err) {
  if (err)
    *err = {ErrorCode::StoreUnavailable, msg};
  return false;
}
} // namespace

const char *decision_name(DecisionKind kind) {
  switch (kind) {
  case DecisionKind::Hit:
    return "hit";
  case DecisionKind::NeedsFetchAsOwner:
    return "needs_fetch_as_owner";
  case DecisionKind::LockedByOther:
    return "locked_by_other";
  case DecisionKind::Miss:
    return "miss";
  }
  return "unknown";
}

LockCoordinator::LockCoordinator(std::shared_ptr<IStore> store,
                                 const Options &opts, IRandomSource &rng)
    : store_(std::move(store)), opts_(opts), rng_(rng) {}

bool LockCoordinator::decide(const std::string &key, const std::string &owner,
                             TimePoint now, Decision *out, Error *err) {
  if (opts_.disable_cache_read) {
    *out = Decision{};
    return true;
  }
  const auto lock_until =
      now + jittered(opts_.lock_ttl, opts_.lock_ttl_jitter, rng_);
  const auto lock_physical = opts_.lock_ttl + opts_.lock_ttl_jitter + opts_.delay;

  LockRead read;
  std::string store_err;
  if (!store_->read_and_lock(key, now, owner, lock_until, lock_physical, &read,
                             &store_err))
    return store_failure(store_err, err);
  *out = classify(read, owner);
  return true;
}

Decision LockCoordinator::classify(const LockRead &read,
                                   const std::string &owner) {
  Decision d;
  const auto &rec = read.record;
  if (read.acquired) {
    d.kind = DecisionKind::NeedsFetchAsOwner;
    d.owner = owner;
    if (rec.exists && rec.has_value) {
      d.has_stale = true;
      d.value = rec.value;
    }
    return d;
  }
  if (!rec.exists)
    return d;
  if (!rec.lock_owner.empty()) {
    d.kind = DecisionKind::LockedByOther;
    d.has_stale = rec.has_value;
    d.value = rec.value;
    return d;
  }
  if (rec.has_value) {
    d.kind = DecisionKind::Hit;
    d.value = rec.value;
  }
  return d;
}

bool LockCoordinator::commit(const std::string &key, const std::string &owner,
                             const std::optional<Bytes> &value,
                             std::chrono::milliseconds ttl, TimePoint now,
                             WriteOutcome *out, Error *err) {
  if (!value.has_value() && opts_.empty_ttl.count() == 0)
    return release(key, owner, now, out, err);

  const auto logical =
      value.has_value()
          ? adjusted_ttl(ttl, opts_.random_expire_adjustment, rng_)
          : opts_.empty_ttl;
  std::string store_err;
  if (!store_->write_result(key, owner, value, now + logical,
                            physical_ttl(logical), out, &store_err))
    return store_failure(store_err, err);
  return true;
}

bool LockCoordinator::release(const std::string &key, const std::string &owner,
                              TimePoint now, WriteOutcome *out, Error *err) {
  std::string store_err;
  if (!store_->release(key, owner, now, out, &store_err))
    return store_failure(store_err, err);
  return true;
}

bool LockCoordinator::tag_as_deleted(const std::string &key, TimePoint now,
                                     TagOutcome *out, Error *err) {
  if (opts_.disable_cache_delete) {
    if (out)
      *out = TagOutcome::Absent;
    return true;
  }
  std::string store_err;
  if (!store_->tag_deleted(key, now, opts_.delay, out, &store_err))
    return store_failure(store_err, err);
  return true;
}

std::chrono::milliseconds
LockCoordinator::physical_ttl(std::chrono::milliseconds logical) const {
  return logical + opts_.delay + opts_.lock_ttl + opts_.lock_ttl_jitter;
}

} // namespace herd_cache
