#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace herd_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Bytes = std::vector<std::uint8_t>;

enum class ErrorCode { None, StoreUnavailable, LoaderFailed, Codec };

struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;
};

const char *error_code_name(ErrorCode code);

// State of one key as seen by the store. A record can exist without a value
// (locked before the first load finished) and a value can be a cached absence.
struct CacheRecord {
  bool exists{false};
  bool has_value{false};
  std::optional<Bytes> value;
  std::optional<TimePoint> lock_until;
  std::string lock_owner;
};

std::int64_t to_epoch_ms(TimePoint tp);
TimePoint from_epoch_ms(std::int64_t ms);

} // namespace herd_cache
