#include "herd_cache/codec.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace herd_cache;

TEST_CASE("value field keeps absence distinct from empty value",
          "[codec]") {
  const auto absent = encode_cached_value(std::nullopt);
  const auto empty = encode_cached_value(Bytes{});
  CHECK(absent != empty);

  std::optional<Bytes> out = Bytes{'x'};
  REQUIRE(decode_cached_value(absent, &out));
  CHECK_FALSE(out.has_value());

  REQUIRE(decode_cached_value(empty, &out));
  REQUIRE(out.has_value());
  CHECK(out->empty());

  const Bytes binary{0, 1, 0xFF, '\r', '\n'};
  REQUIRE(decode_cached_value(encode_cached_value(binary), &out));
  CHECK(*out == binary);
}

TEST_CASE("corrupt value fields are rejected", "[codec][adversarial]") {
  std::optional<Bytes> out;
  std::string err;
  CHECK_FALSE(decode_cached_value("", &out, &err));
  CHECK(err.find("empty") != std::string::npos);
  CHECK_FALSE(decode_cached_value("zzz", &out, &err));
  CHECK(err.find("unknown") != std::string::npos);
  CHECK_FALSE(decode_cached_value(std::string("\0x", 2), &out, &err));
}

TEST_CASE("int64 codec checks payload width", "[codec]") {
  std::int64_t v = 0;
  REQUIRE(Int64Codec::decode(Int64Codec::encode(-42), &v, nullptr));
  CHECK(v == -42);

  std::string err;
  CHECK_FALSE(Int64Codec::decode(Bytes{'a', 'b', 'c'}, &v, &err));
  CHECK(err.find("8 bytes") != std::string::npos);

  std::string s;
  REQUIRE(StringCodec::decode(StringCodec::encode("hello"), &s, nullptr));
  CHECK(s == "hello");
}
