#include "herd_cache/client.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <sstream>
#include <thread>

namespace herd_cache {
namespace {
void print_error(const std::string &key, const Error &e) {
  std::cerr << "herd_cache: background refresh of '" << key << "' failed ("
            << error_code_name(e.code) << "): " << e.message << "\n";
}

// Unvalidated options are pulled into range; a worker pool without threads
// would queue refreshes that never run.
Options normalized(Options opts) {
  std::string why;
  if (validate_options(opts, &why))
    return opts;
  std::cerr << "herd_cache: adjusting options: " << why << "\n";
  opts.refresh_threads = std::clamp<std::size_t>(opts.refresh_threads, 1, 64);
  opts.max_pending_refreshes =
      std::max<std::size_t>(opts.max_pending_refreshes, 1);
  if (opts.lock_ttl.count() <= 0)
    opts.lock_ttl = std::chrono::milliseconds(1);
  if (opts.lock_retry_interval.count() <= 0)
    opts.lock_retry_interval = std::chrono::milliseconds(1);
  opts.lock_ttl_jitter =
      std::max(opts.lock_ttl_jitter, std::chrono::milliseconds(0));
  opts.lock_retry_jitter =
      std::max(opts.lock_retry_jitter, std::chrono::milliseconds(0));
  opts.empty_ttl = std::max(opts.empty_ttl, std::chrono::milliseconds(0));
  opts.delay = std::max(opts.delay, std::chrono::milliseconds(0));
  if (!(opts.random_expire_adjustment >= 0.0 &&
        opts.random_expire_adjustment < 1.0))
    opts.random_expire_adjustment = 0.0;
  return opts;
}
} // namespace

Client::Client(std::shared_ptr<IStore> store, Options opts,
               std::unique_ptr<IRandomSource> rng)
    : store_(std::move(store)), opts_(normalized(std::move(opts))),
      rng_(rng ? std::move(rng) : make_random_source()),
      coordinator_(store_, opts_, *rng_), on_error_(print_error),
      worker_(opts_.refresh_threads, opts_.max_pending_refreshes) {}

Client::~Client() = default;

bool Client::fetch(const std::string &key, std::chrono::milliseconds ttl,
                   const Loader &loader, std::optional<Bytes> *out,
                   Error *err) {
  ++counters_.fetches;
  const auto owner = rng_->next_token();
  std::optional<Bytes> last_seen;

  for (std::uint32_t attempt = 0;; ++attempt) {
    Decision d;
    if (!coordinator_.decide(key, owner, Clock::now(), &d, err)) {
      ++counters_.store_errors;
      return false;
    }

    switch (d.kind) {
    case DecisionKind::Hit:
      ++counters_.hits;
      *out = std::move(d.value);
      return true;

    case DecisionKind::Miss: {
      ++counters_.uncached_loads;
      std::string lerr;
      if (!run_loader(loader, out, &lerr)) {
        ++counters_.loader_failures;
        if (err)
          *err = {ErrorCode::LoaderFailed, lerr};
        return false;
      }
      return true;
    }

    case DecisionKind::NeedsFetchAsOwner:
      if (!opts_.strong_consistency && d.has_stale) {
        ++counters_.stale_served;
        schedule_refresh(key, ttl, owner, loader);
        *out = std::move(d.value);
        return true;
      }
      ++counters_.owner_loads;
      return load_and_write(key, ttl, owner, loader, out, err);

    case DecisionKind::LockedByOther:
      last_seen = std::move(d.value);
      // Weak callers only wait when there is nothing at all to serve.
      if (!opts_.strong_consistency && d.has_stale) {
        ++counters_.stale_served;
        *out = std::move(last_seen);
        return true;
      }
      if (attempt >= opts_.max_retries) {
        ++counters_.retries_exhausted;
        *out = std::move(last_seen);
        return true;
      }
      ++counters_.lock_waits;
      std::this_thread::sleep_for(
          jittered(opts_.lock_retry_interval, opts_.lock_retry_jitter, *rng_));
      break;
    }
  }
}

bool Client::tag_as_deleted(const std::string &key, Error *err) {
  if (!coordinator_.tag_as_deleted(key, Clock::now(), nullptr, err)) {
    ++counters_.store_errors;
    return false;
  }
  ++counters_.tags;
  return true;
}

void Client::set_error_handler(ErrorHandler handler) {
  std::lock_guard<std::mutex> lk(handler_mu_);
  on_error_ = handler ? std::move(handler) : ErrorHandler(print_error);
}

void Client::wait_for_refreshes() { worker_.wait_idle(); }

bool Client::load_and_write(const std::string &key,
                            std::chrono::milliseconds ttl,
                            const std::string &owner, const Loader &loader,
                            std::optional<Bytes> *out, Error *err) {
  std::optional<Bytes> value;
  std::string lerr;
  if (!run_loader(loader, &value, &lerr)) {
    ++counters_.loader_failures;
    // Hand the key to the next caller now instead of after lock_ttl. A
    // mismatch means someone already moved on.
    WriteOutcome released;
    Error release_err;
    if (!coordinator_.release(key, owner, Clock::now(), &released,
                              &release_err))
      ++counters_.store_errors;
    if (err)
      *err = {ErrorCode::LoaderFailed, lerr};
    return false;
  }

  WriteOutcome written = WriteOutcome::Written;
  if (!coordinator_.commit(key, owner, value, ttl, Clock::now(), &written,
                           err)) {
    ++counters_.store_errors;
    return false;
  }
  if (written == WriteOutcome::Stale)
    ++counters_.stale_writes_discarded;
  *out = std::move(value);
  return true;
}

bool Client::run_loader(const Loader &loader, std::optional<Bytes> *out,
                        std::string *err) {
  if (!loader) {
    *err = "no loader";
    return false;
  }
  try {
    std::optional<Bytes> value;
    if (!loader(&value, err)) {
      if (err->empty())
        *err = "loader failed";
      return false;
    }
    *out = std::move(value);
    return true;
  } catch (const std::exception &e) {
    *err = std::string("loader threw: ") + e.what();
    return false;
  } catch (...) {
    // The lock must still be released by the caller, whatever was thrown.
    *err = "loader threw";
    return false;
  }
}

void Client::schedule_refresh(const std::string &key,
                              std::chrono::milliseconds ttl,
                              const std::string &owner, const Loader &loader) {
  const bool queued = worker_.submit([this, key, ttl, owner, loader] {
    ++counters_.background_refreshes;
    std::optional<Bytes> fresh;
    Error e;
    if (!load_and_write(key, ttl, owner, loader, &fresh, &e)) {
      ++counters_.background_failures;
      report_background_error(key, e);
    }
  });
  if (queued)
    return;

  ++counters_.refreshes_dropped;
  WriteOutcome released;
  Error e;
  if (!coordinator_.release(key, owner, Clock::now(), &released, &e)) {
    ++counters_.store_errors;
    report_background_error(key, e);
  }
}

void Client::report_background_error(const std::string &key, const Error &e) {
  ErrorHandler handler;
  {
    std::lock_guard<std::mutex> lk(handler_mu_);
    handler = on_error_;
  }
  handler(key, e);
}

ClientStats Client::stats() const {
  ClientStats s;
  s.fetches = counters_.fetches.load();
  s.hits = counters_.hits.load();
  s.owner_loads = counters_.owner_loads.load();
  s.uncached_loads = counters_.uncached_loads.load();
  s.loader_failures = counters_.loader_failures.load();
  s.stale_served = counters_.stale_served.load();
  s.lock_waits = counters_.lock_waits.load();
  s.retries_exhausted = counters_.retries_exhausted.load();
  s.stale_writes_discarded = counters_.stale_writes_discarded.load();
  s.background_refreshes = counters_.background_refreshes.load();
  s.background_failures = counters_.background_failures.load();
  s.refreshes_dropped = counters_.refreshes_dropped.load();
  s.store_errors = counters_.store_errors.load();
  s.tags = counters_.tags.load();
  return s;
}

std::string Client::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "store:" << store_->name() << "\n";
  os << "consistency:" << (opts_.strong_consistency ? "strong" : "weak")
     << "\n";
  os << "fetches:" << s.fetches << "\n";
  os << "hits:" << s.hits << "\n";
  os << "owner_loads:" << s.owner_loads << "\n";
  os << "uncached_loads:" << s.uncached_loads << "\n";
  os << "loader_failures:" << s.loader_failures << "\n";
  os << "stale_served:" << s.stale_served << "\n";
  os << "lock_waits:" << s.lock_waits << "\n";
  os << "retries_exhausted:" << s.retries_exhausted << "\n";
  os << "stale_writes_discarded:" << s.stale_writes_discarded << "\n";
  os << "background_refreshes:" << s.background_refreshes << "\n";
  os << "background_failures:" << s.background_failures << "\n";
  os << "refreshes_dropped:" << s.refreshes_dropped << "\n";
  os << "refresh_backlog:" << worker_.pending() << "\n";
  os << "store_errors:" << s.store_errors << "\n";
  os << "tags:" << s.tags << "\n";
  return os.str();
}

} // namespace herd_cache
