#pragma once

#include "herd_cache/lock_coordinator.hpp"
#include "herd_cache/options.hpp"
#include "herd_cache/random.hpp"
#include "herd_cache/refresh_worker.hpp"
#include "herd_cache/store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace herd_cache {

// Computes the value for a key from the backing source. Returning true with
// *out == nullopt means the source confirmed the key does not exist.
// Returning false is a failure; *err should say why.
using Loader = std::function<bool(std::optional<Bytes> *out, std::string *err)>;

using ErrorHandler = std::function<void(const std::string &key, const Error &)>;

struct ClientStats {
  std::uint64_t fetches{0};
  std::uint64_t hits{0};
  std::uint64_t owner_loads{0};
  std::uint64_t uncached_loads{0};
  std::uint64_t loader_failures{0};
  std::uint64_t stale_served{0};
  std::uint64_t lock_waits{0};
  std::uint64_t retries_exhausted{0};
  std::uint64_t stale_writes_discarded{0};
  std::uint64_t background_refreshes{0};
  std::uint64_t background_failures{0};
  std::uint64_t refreshes_dropped{0};
  std::uint64_t store_errors{0};
  std::uint64_t tags{0};
};

class Client {
public:
  Client(std::shared_ptr<IStore> store, Options opts,
         std::unique_ptr<IRandomSource> rng = nullptr);
  ~Client();
  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  // Read-through fetch. On success *out holds the value, or nullopt for a
  // cached or freshly confirmed absence. Under weak consistency a stale value
  // may be returned while a refresh runs in the background; the loader is
  // copied into that refresh, so it must not capture references to the
  // caller's stack.
  bool fetch(const std::string &key, std::chrono::milliseconds ttl,
             const Loader &loader, std::optional<Bytes> *out,
             Error *err = nullptr);

  // Marks the cached value stale without deleting it. Idempotent.
  bool tag_as_deleted(const std::string &key, Error *err = nullptr);

  // Receives failures of background refreshes; the default prints to stderr.
  void set_error_handler(ErrorHandler handler);
  void wait_for_refreshes();

  const Options &options() const { return opts_; }
  IStore &store() { return *store_; }
  ClientStats stats() const;
  std::string info() const;

private:
  struct Counters {
    std::atomic<std::uint64_t> fetches{0};
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> owner_loads{0};
    std::atomic<std::uint64_t> uncached_loads{0};
    std::atomic<std::uint64_t> loader_failures{0};
    std::atomic<std::uint64_t> stale_served{0};
    std::atomic<std::uint64_t> lock_waits{0};
    std::atomic<std::uint64_t> retries_exhausted{0};
    std::atomic<std::uint64_t> stale_writes_discarded{0};
    std::atomic<std::uint64_t> background_refreshes{0};
    std::atomic<std::uint64_t> background_failures{0};
    std::atomic<std::uint64_t> refreshes_dropped{0};
    std::atomic<std::uint64_t> store_errors{0};
    std::atomic<std::uint64_t> tags{0};
  };

  bool load_and_write(const std::string &key, std::chrono::milliseconds ttl,
                      const std::string &owner, const Loader &loader,
                      std::optional<Bytes> *out, Error *err);
  bool run_loader(const Loader &loader, std::optional<Bytes> *out,
                  std::string *err);
  // Queue full: the lock is released so the next caller refreshes instead.
  void schedule_refresh(const std::string &key, std::chrono::milliseconds ttl,
                        const std::string &owner, const Loader &loader);
  void report_background_error(const std::string &key, const Error &e);

  std::shared_ptr<IStore> store_;
  Options opts_;
  std::unique_ptr<IRandomSource> rng_;
  LockCoordinator coordinator_;
  mutable std::mutex handler_mu_;
  ErrorHandler on_error_;
  Counters counters_;
  // Destroyed first so queued refreshes finish while the rest is alive.
  RefreshWorker worker_;
};

// Typed fetch through a codec (see codec.hpp). Codec::decode failures on the
// cached bytes are reported as ErrorCode::Codec.
template <typename Codec>
bool fetch_typed(
    Client &client, const std::string &key, std::chrono::milliseconds ttl,
    const std::function<bool(std::optional<typename Codec::value_type> *,
                             std::string *)> &loader,
    std::optional<typename Codec::value_type> *out, Error *err = nullptr) {
  using T = typename Codec::value_type;
  Loader raw = [loader](std::optional<Bytes> *bytes, std::string *lerr) {
    std::optional<T> v;
    if (!loader(&v, lerr))
      return false;
    if (v.has_value())
      *bytes = Codec::encode(*v);
    else
      *bytes = std::nullopt;
    return true;
  };
  std::optional<Bytes> bytes;
  if (!client.fetch(key, ttl, raw, &bytes, err))
    return false;
  if (!bytes.has_value()) {
    *out = std::nullopt;
    return true;
  }
  T decoded{};
  std::string codec_err;
  if (!Codec::decode(*bytes, &decoded, &codec_err)) {
    if (err)
      *err = {ErrorCode::Codec, codec_err};
    return false;
  }
  *out = std::move(decoded);
  return true;
}

} // namespace herd_cache
