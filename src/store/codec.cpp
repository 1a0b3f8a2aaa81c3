#include "herd_cache/codec.hpp"

namespace herd_cache {
namespace {
constexpr char kTagAbsent = '\0';
constexpr char kTagValue = '\1';
} // namespace

std::string encode_cached_value(const std::optional<Bytes> &value) {
  if (!value.has_value())
    return std::string(1, kTagAbsent);
  std::string out;
  out.reserve(value->size() + 1);
  out.push_back(kTagValue);
  out.append(value->begin(), value->end());
  return out;
}

bool decode_cached_value(const std::string &field, std::optional<Bytes> *out,
                         std::string *err) {
  if (field.empty()) {
    if (err)
      *err = "empty value field";
    return false;
  }
  if (field[0] == kTagAbsent) {
    if (field.size() != 1) {
      if (err)
        *err = "trailing bytes after absent tag";
      return false;
    }
    *out = std::nullopt;
    return true;
  }
  if (field[0] != kTagValue) {
    if (err)
      *err = "unknown value tag";
    return false;
  }
  *out = Bytes(field.begin() + 1, field.end());
  return true;
}

Bytes Int64Codec::encode(std::int64_t v) {
  Bytes out(8);
  auto u = static_cast<std::uint64_t>(v);
  for (std::size_t i = 0; i < 8; ++i)
    out[i] = static_cast<std::uint8_t>((u >> (8 * i)) & 0xFF);
  return out;
}

bool Int64Codec::decode(const Bytes &b, std::int64_t *out, std::string *err) {
  if (b.size() != 8) {
    if (err)
      *err = "int64 payload must be 8 bytes";
    return false;
  }
  std::uint64_t u = 0;
  for (std::size_t i = 0; i < 8; ++i)
    u |= static_cast<std::uint64_t>(b[i]) << (8 * i);
  *out = static_cast<std::int64_t>(u);
  return true;
}

} // namespace herd_cache
