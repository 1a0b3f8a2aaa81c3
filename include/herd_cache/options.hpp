#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace herd_cache {

struct Options {
  // Poll for a fresh value while another owner refreshes instead of serving
  // the stale one.
  bool strong_consistency{false};
  // A lock older than lock_ttl + [0, lock_ttl_jitter) is considered abandoned.
  // Keep it above the slowest expected loader.
  std::chrono::milliseconds lock_ttl{3000};
  std::chrono::milliseconds lock_ttl_jitter{300};
  std::chrono::milliseconds lock_retry_interval{100};
  std::chrono::milliseconds lock_retry_jitter{50};
  // Logical TTL of a cached absence; zero disables negative caching.
  std::chrono::milliseconds empty_ttl{60000};
  std::uint32_t max_retries{50};
  // How long a logically expired or deleted value stays physically available
  // for stale reads.
  std::chrono::milliseconds delay{10000};
  // The effective TTL is ttl * (1 - u * adjustment) for u in [0, 1).
  double random_expire_adjustment{0.1};
  // Downgrade switches for a store outage.
  bool disable_cache_read{false};
  bool disable_cache_delete{false};
  // Background refreshes served by weak-consistency fetches.
  std::size_t refresh_threads{2};
  std::size_t max_pending_refreshes{1024};
};

bool validate_options(const Options &opts, std::string *err = nullptr);

// Reads a flat JSON object. Unknown fields are ignored, known ones are
// clamped to a sane range. *out is only touched when the whole file is valid.
bool load_options(const std::string &path, Options *out,
                  std::string *err = nullptr);
bool parse_options(const std::string &text, Options *out,
                   std::string *err = nullptr);

std::string options_to_string(const Options &opts);

} // namespace herd_cache
