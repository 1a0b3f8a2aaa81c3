#include "herd_cache/resp.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace herd_cache;

TEST_CASE("RESP reply parser handles partial feeds", "[resp]") {
  RespReplyParser p;
  p.feed("$5\r\nhel");
  CHECK_FALSE(p.next_reply().has_value());
  CHECK_FALSE(p.malformed());
  p.feed("lo\r\n+OK\r\n");
  auto r = p.next_reply();
  REQUIRE(r.has_value());
  CHECK(r->type == RespReply::Type::Bulk);
  CHECK(r->str == "hello");
  auto ok = p.next_reply();
  REQUIRE(ok.has_value());
  CHECK(ok->type == RespReply::Type::Simple);
  CHECK_FALSE(p.next_reply().has_value());
}

TEST_CASE("RESP reply parser decodes script result arrays", "[resp]") {
  RespReplyParser p;
  p.feed("*5\r\n:1\r\n$-1\r\n$13\r\n1700000000000\r\n$-1\r\n:0\r\n");
  auto r = p.next_reply();
  REQUIRE(r.has_value());
  REQUIRE(r->type == RespReply::Type::Array);
  REQUIRE(r->elements.size() == 5);
  CHECK(r->elements[0].integer == 1);
  CHECK(r->elements[1].is_null());
  CHECK(r->elements[2].str == "1700000000000");
  CHECK(r->elements[3].is_null());
  CHECK(r->elements[4].integer == 0);

  p.feed("-NOSCRIPT No matching script\r\n");
  auto e = p.next_reply();
  REQUIRE(e.has_value());
  CHECK(e->is_error());
  CHECK(e->str.rfind("NOSCRIPT", 0) == 0);
}

TEST_CASE("RESP reply parser flags malformed input", "[resp][adversarial]") {
  RespReplyParser bad_kind;
  bad_kind.feed("?what\r\n");
  CHECK_FALSE(bad_kind.next_reply().has_value());
  CHECK(bad_kind.malformed());

  RespReplyParser bad_len;
  bad_len.feed("$-7\r\n");
  CHECK_FALSE(bad_len.next_reply().has_value());
  CHECK(bad_len.malformed());

  RespReplyParser bad_term;
  bad_term.feed("$3\r\nabcXY");
  CHECK_FALSE(bad_term.next_reply().has_value());
  CHECK(bad_term.malformed());

  bad_term.reset();
  bad_term.feed(":7\r\n");
  auto r = bad_term.next_reply();
  REQUIRE(r.has_value());
  CHECK(r->integer == 7);
}

TEST_CASE("RESP command encoding is binary safe", "[resp]") {
  const std::string payload("a\r\nb\0c", 6);
  const auto cmd = resp_command({"EVALSHA", payload});
  CHECK(cmd == "*2\r\n$7\r\nEVALSHA\r\n$6\r\n" + payload + "\r\n");
}
