#pragma once

#include "herd_cache/types.hpp"

#include <optional>
#include <string>

namespace herd_cache {

// Layout of the stored value field: one tag byte, then the payload.
// Tag 0 is a cached absence, tag 1 carries the value bytes.
std::string encode_cached_value(const std::optional<Bytes> &value);
bool decode_cached_value(const std::string &field, std::optional<Bytes> *out,
                         std::string *err = nullptr);

// Codec for fetch_typed: maps a value type to and from stored bytes.
struct StringCodec {
  using value_type = std::string;
  static Bytes encode(const std::string &v) { return Bytes(v.begin(), v.end()); }
  static bool decode(const Bytes &b, std::string *out, std::string *) {
    out->assign(b.begin(), b.end());
    return true;
  }
};

// Fixed-width little-endian integer codec; rejects payloads of the wrong size.
struct Int64Codec {
  using value_type = std::int64_t;
  static Bytes encode(std::int64_t v);
  static bool decode(const Bytes &b, std::int64_t *out, std::string *err);
};

} // namespace herd_cache
