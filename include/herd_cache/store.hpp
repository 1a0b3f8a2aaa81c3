#pragma once

#include "herd_cache/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace herd_cache {

struct LockRead {
  CacheRecord record; // pre-mutation state
  bool acquired{false};
};

enum class WriteOutcome { Written, Stale };

enum class TagOutcome { Absent, Tagged, LockHeld };

// Every operation is a single atomic step with respect to all other callers of
// the same store, across processes. A false return means the store could not
// be reached or rejected the operation; *err then holds the reason.
class IStore {
public:
  virtual ~IStore() = default;
  virtual std::string name() const = 0;

  // Takes the lock iff the record is absent or lockUntil <= now.
  virtual bool read_and_lock(const std::string &key, TimePoint now,
                             const std::string &new_owner,
                             TimePoint new_lock_until,
                             std::chrono::milliseconds lock_physical_ttl,
                             LockRead *out, std::string *err = nullptr) = 0;

  // Fencing-checked: only the current lockOwner may write.
  virtual bool write_result(const std::string &key, const std::string &owner,
                            const std::optional<Bytes> &value,
                            TimePoint lock_until,
                            std::chrono::milliseconds physical_ttl,
                            WriteOutcome *out, std::string *err = nullptr) = 0;

  // Fencing-checked lockUntil = now, owner cleared.
  virtual bool release(const std::string &key, const std::string &owner,
                       TimePoint now, WriteOutcome *out,
                       std::string *err = nullptr) = 0;

  // Idempotent logical delete; never touches a live lock or creates a record.
  virtual bool tag_deleted(const std::string &key, TimePoint now,
                           std::chrono::milliseconds retain, TagOutcome *out,
                           std::string *err = nullptr) = 0;
};

} // namespace herd_cache
