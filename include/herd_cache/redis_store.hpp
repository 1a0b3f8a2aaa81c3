#pragma once

#include "herd_cache/resp.hpp"
#include "herd_cache/store.hpp"

#include <array>
#include <mutex>
#include <string>
#include <vector>

namespace herd_cache {

struct RedisStoreConfig {
  std::string host{"127.0.0.1"};
  int port{6379};
  int io_timeout_ms{2000};
  std::string key_prefix;
};

// Records live in a Redis hash per key (fields value, lockUntil, lockOwner).
// Each primitive is one Lua script, so every mutation is a single atomic step
// on the server. One connection is shared and serialized by a mutex; a failed
// round trip drops the connection and the next call reconnects.
class RedisStore final : public IStore {
public:
  explicit RedisStore(RedisStoreConfig cfg);
  ~RedisStore() override;
  RedisStore(const RedisStore &) = delete;
  RedisStore &operator=(const RedisStore &) = delete;

  std::string name() const override { return "redis"; }

  bool connect(std::string *err = nullptr);
  bool ping(std::string *err = nullptr);

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

private:
  enum class Script { ReadAndLock = 0, WriteResult, Release, TagDeleted };
  static constexpr std::size_t kScriptCount = 4;

  bool eval(Script script, const std::string &key,
            const std::vector<std::string> &args, RespReply *out,
            std::string *err);
  bool load_script(Script script, std::string *err);
  bool roundtrip(const std::vector<std::string> &args, RespReply *out,
                 std::string *err);
  bool ensure_connected(std::string *err);
  void disconnect();

  RedisStoreConfig cfg_;
  std::mutex mu_;
  int fd_{-1};
  RespReplyParser parser_;
  std::array<std::string, kScriptCount> sha_{};
};

} // namespace herd_cache
