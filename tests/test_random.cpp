#include "herd_cache/random.hpp"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>

using namespace herd_cache;

TEST_CASE("unseeded sources issue distinct owner tokens", "[random]") {
  std::set<std::string> tokens;
  for (int i = 0; i < 64; ++i) {
    MtRandomSource rng;
    const auto t = rng.next_token();
    CHECK(t.size() == 32);
    tokens.insert(t);
  }
  CHECK(tokens.size() == 64);
}

TEST_CASE("a fixed seed is reproducible", "[random]") {
  MtRandomSource a(7);
  MtRandomSource b(7);
  CHECK(a.next_token() == b.next_token());
  CHECK(a.next_unit() == b.next_unit());
}

TEST_CASE("jitter stays inside its range", "[random]") {
  auto rng = make_random_source(11);
  for (int i = 0; i < 200; ++i) {
    const auto j = jittered(std::chrono::milliseconds(100),
                            std::chrono::milliseconds(50), *rng);
    CHECK(j >= std::chrono::milliseconds(100));
    CHECK(j < std::chrono::milliseconds(150));
    const auto t = adjusted_ttl(std::chrono::milliseconds(1000), 0.1, *rng);
    CHECK(t > std::chrono::milliseconds(900));
    CHECK(t <= std::chrono::milliseconds(1000));
  }
}
