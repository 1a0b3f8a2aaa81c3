#pragma once

#include "herd_cache/options.hpp"
#include "herd_cache/random.hpp"
#include "herd_cache/store.hpp"

#include <memory>
#include <optional>
#include <string>

namespace herd_cache {

enum class DecisionKind { Hit, NeedsFetchAsOwner, LockedByOther, Miss };

const char *decision_name(DecisionKind kind);

struct Decision {
  DecisionKind kind{DecisionKind::Miss};
  // Fencing token held by this call; set for NeedsFetchAsOwner only.
  std::string owner;
  // For Hit, the cached value. Otherwise the stale value, if has_stale.
  // A nullopt value with has_stale set is a stale cached absence.
  bool has_stale{false};
  std::optional<Bytes> value;
};

class LockCoordinator {
public:
  LockCoordinator(std::shared_ptr<IStore> store, const Options &opts,
                  IRandomSource &rng);

  // One atomic read-and-lock round trip, classified.
  bool decide(const std::string &key, const std::string &owner, TimePoint now,
              Decision *out, Error *err = nullptr);

  // Writes a loader result under owner. A nullopt value is cached for
  // empty_ttl, or the lock is released when negative caching is off.
  bool commit(const std::string &key, const std::string &owner,
              const std::optional<Bytes> &value, std::chrono::milliseconds ttl,
              TimePoint now, WriteOutcome *out, Error *err = nullptr);

  bool release(const std::string &key, const std::string &owner,
               TimePoint now, WriteOutcome *out, Error *err = nullptr);

  bool tag_as_deleted(const std::string &key, TimePoint now,
                      TagOutcome *out = nullptr, Error *err = nullptr);

  // Whether this call acquired is the only thing separating a refresh by
  // us from a refresh by someone else.
  static Decision classify(const LockRead &read, const std::string &owner);

  std::chrono::milliseconds physical_ttl(std::chrono::milliseconds logical) const;

private:
  std::shared_ptr<IStore> store_;
  const Options &opts_;
  IRandomSource &rng_;
};

} // namespace herd_cache
