#include "herd_cache/memory_store.hpp"

#include <algorithm>
#include <sstream>

namespace herd_cache {

MemoryStore::MemoryStore(MemoryStoreConfig cfg) : cfg_(std::move(cfg)) {}

bool MemoryStore::read_and_lock(const std::string &key, TimePoint now,
                                const std::string &new_owner,
                                TimePoint new_lock_until,
                                std::chrono::milliseconds lock_physical_ttl,
                                LockRead *out, std::string *err) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!admit(key, err))
    return false;

  LockRead result;
  Slot *slot = find_live(key);
  if (slot != nullptr) {
    result.record = slot->record;
    result.record.exists = true;
  }

  const bool unlocked = slot == nullptr ||
                        !slot->record.lock_until.has_value() ||
                        *slot->record.lock_until <= now;
  if (!unlocked) {
    ++stats_.lock_conflicts;
    if (out)
      *out = std::move(result);
    return true;
  }

  if (slot == nullptr) {
    slot = &slots_[key];
    slot->record.exists = true;
  }
  slot->record.lock_owner = new_owner;
  slot->record.lock_until = new_lock_until;
  const auto min_deadline = Clock::now() + lock_physical_ttl;
  if (!slot->ttl_deadline.has_value() || *slot->ttl_deadline < min_deadline)
    set_deadline(key, *slot, min_deadline);

  ++stats_.locks_acquired;
  result.acquired = true;
  if (out)
    *out = std::move(result);
  return true;
}

bool MemoryStore::write_result(const std::string &key, const std::string &owner,
                               const std::optional<Bytes> &value,
                               TimePoint lock_until,
                               std::chrono::milliseconds physical_ttl,
                               WriteOutcome *out, std::string *err) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!admit(key, err))
    return false;
  if (value.has_value() && value->size() > cfg_.max_value_size) {
    if (err)
      *err = "value too large";
    return false;
  }

  Slot *slot = find_live(key);
  if (slot == nullptr || owner.empty() || slot->record.lock_owner != owner) {
    ++stats_.stale_writes;
    if (out)
      *out = WriteOutcome::Stale;
    return true;
  }

  slot->record.has_value = true;
  slot->record.value = value;
  slot->record.lock_until = lock_until;
  slot->record.lock_owner.clear();
  set_deadline(key, *slot, Clock::now() + physical_ttl);
  ++stats_.writes;
  if (out)
    *out = WriteOutcome::Written;
  return true;
}

bool MemoryStore::release(const std::string &key, const std::string &owner,
                          TimePoint now, WriteOutcome *out, std::string *err) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!admit(key, err))
    return false;

  Slot *slot = find_live(key);
  if (slot == nullptr || owner.empty() || slot->record.lock_owner != owner) {
    if (out)
      *out = WriteOutcome::Stale;
    return true;
  }
  slot->record.lock_until = now;
  slot->record.lock_owner.clear();
  ++stats_.releases;
  if (out)
    *out = WriteOutcome::Written;
  return true;
}

bool MemoryStore::tag_deleted(const std::string &key, TimePoint now,
                              std::chrono::milliseconds retain,
                              TagOutcome *out, std::string *err) {
  std::lock_guard<std::mutex> lk(mu_);
  if (!admit(key, err))
    return false;

  Slot *slot = find_live(key);
  if (slot == nullptr) {
    if (out)
      *out = TagOutcome::Absent;
    return true;
  }
  auto &rec = slot->record;
  if (!rec.lock_owner.empty() && rec.lock_until.has_value() &&
      *rec.lock_until > now) {
    if (out)
      *out = TagOutcome::LockHeld;
    return true;
  }

  rec.lock_until = now;
  rec.lock_owner.clear();
  if (retain.count() > 0) {
    const auto deadline = Clock::now() + retain;
    if (!slot->ttl_deadline.has_value() || *slot->ttl_deadline > deadline)
      set_deadline(key, *slot, deadline);
  }
  ++stats_.tags;
  if (out)
    *out = TagOutcome::Tagged;
  return true;
}

std::optional<CacheRecord> MemoryStore::peek(const std::string &key) {
  std::lock_guard<std::mutex> lk(mu_);
  Slot *slot = find_live(key);
  if (slot == nullptr)
    return std::nullopt;
  return slot->record;
}

std::optional<std::int64_t> MemoryStore::pttl(const std::string &key) {
  std::lock_guard<std::mutex> lk(mu_);
  Slot *slot = find_live(key);
  if (slot == nullptr)
    return std::nullopt;
  if (!slot->ttl_deadline.has_value())
    return -1;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      *slot->ttl_deadline - Clock::now())
                      .count();
  return std::max<std::int64_t>(0, ms);
}

void MemoryStore::set_available(bool available) {
  std::lock_guard<std::mutex> lk(mu_);
  available_ = available;
}

void MemoryStore::tick() {
  std::lock_guard<std::mutex> lk(mu_);
  tick_locked(Clock::now());
}

MemoryStoreStats MemoryStore::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

std::size_t MemoryStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return slots_.size();
}

std::string MemoryStore::info() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::ostringstream os;
  os << "store:memory\n";
  os << "keys:" << slots_.size() << "\n";
  os << "available:" << (available_ ? 1 : 0) << "\n";
  os << "locks_acquired:" << stats_.locks_acquired << "\n";
  os << "lock_conflicts:" << stats_.lock_conflicts << "\n";
  os << "writes:" << stats_.writes << "\n";
  os << "stale_writes:" << stats_.stale_writes << "\n";
  os << "releases:" << stats_.releases << "\n";
  os << "tags:" << stats_.tags << "\n";
  os << "expirations:" << stats_.expirations << "\n";
  return os.str();
}

bool MemoryStore::admit(const std::string &key, std::string *err) {
  if (!available_) {
    ++stats_.unavailable_errors;
    if (err)
      *err = "store unavailable";
    return false;
  }
  if (key.empty() || key.size() > cfg_.max_key_len) {
    if (err)
      *err = "invalid key length";
    return false;
  }
  tick_locked(Clock::now());
  return true;
}

MemoryStore::Slot *MemoryStore::find_live(const std::string &key) {
  auto it = slots_.find(key);
  if (it == slots_.end())
    return nullptr;
  if (it->second.ttl_deadline.has_value() &&
      *it->second.ttl_deadline <= Clock::now()) {
    erase_internal(key, true);
    return nullptr;
  }
  return &it->second;
}

void MemoryStore::set_deadline(const std::string &key, Slot &slot,
                               TimePoint deadline) {
  slot.ttl_deadline = deadline;
  const auto gen = ++expiry_generation_[key];
  expiry_heap_.push({deadline, key, gen});
}

void MemoryStore::erase_internal(const std::string &key, bool expiration) {
  if (slots_.erase(key) == 0)
    return;
  expiry_generation_.erase(key);
  if (expiration)
    ++stats_.expirations;
}

void MemoryStore::tick_locked(TimePoint now) {
  std::size_t cleaned = 0;
  while (!expiry_heap_.empty() && cleaned < cfg_.ttl_cleanup_per_tick) {
    const auto &node = expiry_heap_.top();
    if (node.deadline > now)
      break;
    const auto key = node.key;
    const auto gen = node.generation;
    expiry_heap_.pop();
    auto it = slots_.find(key);
    if (it == slots_.end())
      continue;
    if (expiry_generation_[key] != gen)
      continue;
    if (it->second.ttl_deadline.has_value() && *it->second.ttl_deadline <= now)
      erase_internal(key, true);
    ++cleaned;
  }
}

} // namespace herd_cache
