#include "herd_cache/lock_coordinator.hpp"
#include "herd_cache/memory_store.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace herd_cache;
using namespace herd_cache::testing;
using namespace std::chrono_literals;

namespace {

LockRead read_of(bool exists, bool has_value, std::optional<Bytes> value,
                 const std::string &owner, bool acquired) {
  LockRead r;
  r.record.exists = exists;
  r.record.has_value = has_value;
  r.record.value = std::move(value);
  r.record.lock_owner = owner;
  r.acquired = acquired;
  return r;
}

} // namespace

TEST_CASE("classify covers every read_and_lock outcome", "[coordinator]") {
  SECTION("acquired on an empty key") {
    auto d = LockCoordinator::classify(read_of(false, false, {}, "", true), "me");
    CHECK(d.kind == DecisionKind::NeedsFetchAsOwner);
    CHECK(d.owner == "me");
    CHECK_FALSE(d.has_stale);
  }
  SECTION("acquired over a stale value") {
    auto d = LockCoordinator::classify(
        read_of(true, true, bytes("old"), "", true), "me");
    CHECK(d.kind == DecisionKind::NeedsFetchAsOwner);
    CHECK(d.has_stale);
    CHECK(text(d.value) == "old");
  }
  SECTION("acquired over a stale absence") {
    auto d = LockCoordinator::classify(
        read_of(true, true, std::nullopt, "", true), "me");
    CHECK(d.kind == DecisionKind::NeedsFetchAsOwner);
    CHECK(d.has_stale);
    CHECK_FALSE(d.value.has_value());
  }
  SECTION("locked by someone else, nothing loaded yet") {
    auto d = LockCoordinator::classify(
        read_of(true, false, {}, "other", false), "me");
    CHECK(d.kind == DecisionKind::LockedByOther);
    CHECK_FALSE(d.has_stale);
    CHECK(d.owner.empty());
  }
  SECTION("locked by someone else over a value") {
    auto d = LockCoordinator::classify(
        read_of(true, true, bytes("old"), "other", false), "me");
    CHECK(d.kind == DecisionKind::LockedByOther);
    CHECK(d.has_stale);
    CHECK(text(d.value) == "old");
  }
  SECTION("fresh value") {
    auto d = LockCoordinator::classify(
        read_of(true, true, bytes("v"), "", false), "me");
    CHECK(d.kind == DecisionKind::Hit);
    CHECK(text(d.value) == "v");
  }
  SECTION("fresh cached absence") {
    auto d = LockCoordinator::classify(
        read_of(true, true, std::nullopt, "", false), "me");
    CHECK(d.kind == DecisionKind::Hit);
    CHECK_FALSE(d.value.has_value());
  }
  SECTION("record without value or owner") {
    auto d = LockCoordinator::classify(
        read_of(true, false, {}, "", false), "me");
    CHECK(d.kind == DecisionKind::Miss);
  }
  CHECK(std::string(decision_name(DecisionKind::LockedByOther)) ==
        "locked_by_other");
}

TEST_CASE("decide sets a jittered lock deadline", "[coordinator]") {
  auto store = std::make_shared<MemoryStore>();
  Options opts;
  opts.lock_ttl = 1000ms;
  opts.lock_ttl_jitter = 200ms;
  FixedRandom rng(0.5);
  LockCoordinator coord(store, opts, rng);

  const auto now = Clock::now();
  Decision d;
  REQUIRE(coord.decide("k", "t1", now, &d));
  CHECK(d.kind == DecisionKind::NeedsFetchAsOwner);
  const auto rec = store->peek("k");
  REQUIRE(rec.has_value());
  CHECK(rec->lock_owner == "t1");
  CHECK(*rec->lock_until == now + 1100ms);
  CHECK(*store->pttl("k") <= (1000 + 200 + opts.delay.count()));

  REQUIRE(coord.decide("k", "t2", now + 500ms, &d));
  CHECK(d.kind == DecisionKind::LockedByOther);
}

TEST_CASE("commit writes with adjusted and physical ttl", "[coordinator]") {
  auto store = std::make_shared<MemoryStore>();
  Options opts;
  opts.lock_ttl = 1000ms;
  opts.lock_ttl_jitter = 0ms;
  opts.delay = 2000ms;
  opts.random_expire_adjustment = 0.2;
  opts.empty_ttl = 500ms;
  FixedRandom rng(0.5);
  LockCoordinator coord(store, opts, rng);

  CHECK(coord.physical_ttl(9000ms) == 12000ms);

  const auto now = Clock::now();
  Decision d;
  REQUIRE(coord.decide("k", "t1", now, &d));
  WriteOutcome w;
  REQUIRE(coord.commit("k", "t1", bytes("v"), 10000ms, now, &w));
  CHECK(w == WriteOutcome::Written);
  auto rec = store->peek("k");
  CHECK(*rec->lock_until == now + 9000ms);
  const auto pttl = *store->pttl("k");
  CHECK(pttl <= 12000);
  CHECK(pttl > 11000);

  SECTION("negative results use empty_ttl") {
    REQUIRE(coord.decide("n", "t2", now, &d));
    REQUIRE(coord.commit("n", "t2", std::nullopt, 10000ms, now, &w));
    CHECK(w == WriteOutcome::Written);
    rec = store->peek("n");
    CHECK(rec->has_value);
    CHECK_FALSE(rec->value.has_value());
    CHECK(*rec->lock_until == now + 500ms);
  }

  SECTION("a foreign owner is fenced off") {
    REQUIRE(coord.commit("k", "t9", bytes("late"), 10000ms, now, &w));
    CHECK(w == WriteOutcome::Stale);
    CHECK(text(store->peek("k")->value) == "v");
  }
}

TEST_CASE("negative caching off releases the lock", "[coordinator]") {
  auto store = std::make_shared<MemoryStore>();
  Options opts = fast_options();
  opts.empty_ttl = 0ms;
  FixedRandom rng;
  LockCoordinator coord(store, opts, rng);

  const auto now = Clock::now();
  Decision d;
  REQUIRE(coord.decide("k", "t1", now, &d));
  WriteOutcome w;
  REQUIRE(coord.commit("k", "t1", std::nullopt, 1000ms, now, &w));
  CHECK(w == WriteOutcome::Written);
  const auto rec = store->peek("k");
  CHECK_FALSE(rec->has_value);
  CHECK(rec->lock_owner.empty());

  REQUIRE(coord.decide("k", "t2", now, &d));
  CHECK(d.kind == DecisionKind::NeedsFetchAsOwner);
}

TEST_CASE("tag_as_deleted respects the delete switch", "[coordinator][tag]") {
  auto store = std::make_shared<MemoryStore>();
  Options opts = fast_options();
  FixedRandom rng;
  LockCoordinator coord(store, opts, rng);

  const auto now = Clock::now();
  Decision d;
  WriteOutcome w;
  REQUIRE(coord.decide("k", "t1", now, &d));
  REQUIRE(coord.commit("k", "t1", bytes("v"), 60s, now, &w));

  opts.disable_cache_delete = true;
  TagOutcome t;
  REQUIRE(coord.tag_as_deleted("k", now, &t));
  REQUIRE(coord.decide("k", "t2", now, &d));
  CHECK(d.kind == DecisionKind::Hit);

  opts.disable_cache_delete = false;
  REQUIRE(coord.tag_as_deleted("k", now, &t));
  CHECK(t == TagOutcome::Tagged);
  REQUIRE(coord.decide("k", "t3", now, &d));
  CHECK(d.kind == DecisionKind::NeedsFetchAsOwner);
  CHECK(text(d.value) == "v");
}

TEST_CASE("disable_cache_read skips the store", "[coordinator]") {
  auto store = std::make_shared<MemoryStore>();
  Options opts = fast_options();
  opts.disable_cache_read = true;
  FixedRandom rng;
  LockCoordinator coord(store, opts, rng);

  Decision d;
  REQUIRE(coord.decide("k", "t1", Clock::now(), &d));
  CHECK(d.kind == DecisionKind::Miss);
  CHECK(store->size() == 0);
}

TEST_CASE("store failures surface as StoreUnavailable", "[coordinator]") {
  auto store = std::make_shared<MemoryStore>();
  store->set_available(false);
  Options opts = fast_options();
  FixedRandom rng;
  LockCoordinator coord(store, opts, rng);

  Decision d;
  Error err;
  CHECK_FALSE(coord.decide("k", "t1", Clock::now(), &d, &err));
  CHECK(err.code == ErrorCode::StoreUnavailable);
  CHECK(err.message == "store unavailable");
  err = {};
  CHECK_FALSE(coord.tag_as_deleted("k", Clock::now(), nullptr, &err));
  CHECK(err.code == ErrorCode::StoreUnavailable);
}
