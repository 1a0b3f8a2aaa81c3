#pragma once

#include "herd_cache/client.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace herd_cache::testing {

// Pins every jitter draw and hands out predictable owner tokens.
class FixedRandom final : public IRandomSource {
public:
  explicit FixedRandom(double unit = 0.0) : unit_(unit) {}
  double next_unit() override { return unit_; }
  std::string next_token() override {
    return "owner-" + std::to_string(++issued_);
  }

private:
  double unit_;
  std::atomic<int> issued_{0};
};

inline Bytes bytes(const std::string &s) { return Bytes(s.begin(), s.end()); }

inline std::string text(const std::optional<Bytes> &v) {
  if (!v)
    return "<absent>";
  return std::string(v->begin(), v->end());
}

using Counter = std::shared_ptr<std::atomic<int>>;

inline Counter counter() { return std::make_shared<std::atomic<int>>(0); }

inline Loader value_loader(const std::string &value, Counter calls,
                           std::chrono::milliseconds cost = {}) {
  return [value, calls, cost](std::optional<Bytes> *out, std::string *) {
    ++*calls;
    if (cost.count() > 0)
      std::this_thread::sleep_for(cost);
    *out = bytes(value);
    return true;
  };
}

inline Loader absent_loader(Counter calls) {
  return [calls](std::optional<Bytes> *out, std::string *) {
    ++*calls;
    *out = std::nullopt;
    return true;
  };
}

inline Loader failing_loader(Counter calls, const std::string &why = "db down") {
  return [calls, why](std::optional<Bytes> *, std::string *err) {
    ++*calls;
    *err = why;
    return false;
  };
}

// A loader that signals when it starts and returns only once released.
struct GatedLoader {
  std::shared_ptr<std::promise<void>> started =
      std::make_shared<std::promise<void>>();
  std::shared_ptr<std::promise<void>> gate =
      std::make_shared<std::promise<void>>();
  std::shared_future<void> gate_future = gate->get_future().share();

  Loader make(const std::string &value, Counter calls) const {
    auto s = started;
    auto g = gate_future;
    return [value, calls, s, g](std::optional<Bytes> *out, std::string *) {
      ++*calls;
      s->set_value();
      g.wait();
      *out = bytes(value);
      return true;
    };
  }
  void wait_started() const { started->get_future().wait(); }
  void open() const { gate->set_value(); }
};

inline Options fast_options() {
  Options o;
  o.lock_ttl = std::chrono::milliseconds(3000);
  o.lock_ttl_jitter = std::chrono::milliseconds(0);
  o.lock_retry_interval = std::chrono::milliseconds(5);
  o.lock_retry_jitter = std::chrono::milliseconds(0);
  o.max_retries = 400;
  o.random_expire_adjustment = 0.0;
  return o;
}

} // namespace herd_cache::testing
