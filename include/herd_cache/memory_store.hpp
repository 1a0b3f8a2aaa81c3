#pragma once

#include "herd_cache/store.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

namespace herd_cache {

struct MemoryStoreConfig {
  std::size_t max_key_len{256};
  std::size_t max_value_size{1024 * 1024};
  std::size_t ttl_cleanup_per_tick{128};
};

struct MemoryStoreStats {
  std::uint64_t locks_acquired{0};
  std::uint64_t lock_conflicts{0};
  std::uint64_t writes{0};
  std::uint64_t stale_writes{0};
  std::uint64_t releases{0};
  std::uint64_t tags{0};
  std::uint64_t expirations{0};
  std::uint64_t unavailable_errors{0};
};

// In-process store. A single mutex stands in for the atomicity a scripting
// server gives each script, so it is shared safely by any number of clients.
class MemoryStore final : public IStore {
public:
  explicit MemoryStore(MemoryStoreConfig cfg = {});

  std::string name() const override { return "memory"; }

  bool read_and_lock(const std::string &key, TimePoint now,
                     const std::string &new_owner, TimePoint new_lock_until,
                     std::chrono::milliseconds lock_physical_ttl, LockRead *out,
                     std::string *err = nullptr) override;
  bool write_result(const std::string &key, const std::string &owner,
                    const std::optional<Bytes> &value, TimePoint lock_until,
                    std::chrono::milliseconds physical_ttl, WriteOutcome *out,
                    std::string *err = nullptr) override;
  bool release(const std::string &key, const std::string &owner,
               TimePoint now, WriteOutcome *out,
               std::string *err = nullptr) override;
  bool tag_deleted(const std::string &key, TimePoint now,
                   std::chrono::milliseconds retain, TagOutcome *out,
                   std::string *err = nullptr) override;

  std::optional<CacheRecord> peek(const std::string &key);
  // Remaining physical lifetime in ms, -1 without expiry, nullopt if absent.
  std::optional<std::int64_t> pttl(const std::string &key);

  // Simulates an outage: every primitive fails while unavailable.
  void set_available(bool available);

  void tick();
  MemoryStoreStats stats() const;
  std::size_t size() const;
  std::string info() const;

private:
  struct Slot {
    CacheRecord record;
    std::optional<TimePoint> ttl_deadline;
  };

  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  bool admit(const std::string &key, std::string *err);
  Slot *find_live(const std::string &key);
  void set_deadline(const std::string &key, Slot &slot, TimePoint deadline);
  void erase_internal(const std::string &key, bool expiration);
  void tick_locked(TimePoint now);

  MemoryStoreConfig cfg_;
  mutable std::mutex mu_;
  bool available_{true};
  std::unordered_map<std::string, Slot> slots_;
  std::unordered_map<std::string, std::uint64_t> expiry_generation_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  MemoryStoreStats stats_;
};

} // namespace herd_cache
