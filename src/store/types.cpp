#include "herd_cache/types.hpp"

namespace herd_cache {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::StoreUnavailable:
    return "store_unavailable";
  case ErrorCode::LoaderFailed:
    return "loader_failed";
  case ErrorCode::Codec:
    return "codec";
  }
  return "unknown";
}

std::int64_t to_epoch_ms(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

TimePoint from_epoch_ms(std::int64_t ms) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds(ms)));
}

} // namespace herd_cache
