#include "herd_cache/options.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace herd_cache {
namespace {
bool extract_double(const std::string &text, const std::string &key,
                    double &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = std::stod(m[1].str());
  return true;
}
bool extract_u64(const std::string &text, const std::string &key,
                 std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = static_cast<std::uint64_t>(std::stoull(m[1].str()));
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}

constexpr std::uint64_t kMaxMs = 30ULL * 24 * 60 * 60 * 1000;

std::chrono::milliseconds clamp_ms(std::uint64_t v, std::uint64_t lo) {
  return std::chrono::milliseconds(
      static_cast<std::int64_t>(std::clamp(v, lo, kMaxMs)));
}
} // namespace

bool validate_options(const Options &opts, std::string *err) {
  auto fail = [&](const char *msg) {
    if (err)
      *err = msg;
    return false;
  };
  if (opts.lock_ttl.count() <= 0)
    return fail("lock_ttl must be positive");
  if (opts.lock_ttl_jitter.count() < 0 || opts.lock_retry_jitter.count() < 0)
    return fail("jitter must not be negative");
  if (opts.lock_retry_interval.count() <= 0)
    return fail("lock_retry_interval must be positive");
  if (opts.empty_ttl.count() < 0 || opts.delay.count() < 0)
    return fail("durations must not be negative");
  if (opts.random_expire_adjustment < 0.0 ||
      opts.random_expire_adjustment >= 1.0)
    return fail("random_expire_adjustment must be in [0, 1)");
  if (opts.refresh_threads == 0 || opts.refresh_threads > 64)
    return fail("refresh_threads must be in [1, 64]");
  if (opts.max_pending_refreshes == 0)
    return fail("max_pending_refreshes must be positive");
  return true;
}

bool load_options(const std::string &path, Options *out, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "options file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_options(ss.str(), out, err);
}

bool parse_options(const std::string &text, Options *out, std::string *err) {
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  Options o = *out;
  std::uint64_t u;
  double d;
  bool b;
  try {
    if (extract_bool(text, "strong_consistency", b))
      o.strong_consistency = b;
    if (extract_u64(text, "lock_ttl_ms", u))
      o.lock_ttl = clamp_ms(u, 1);
    if (extract_u64(text, "lock_ttl_jitter_ms", u))
      o.lock_ttl_jitter = clamp_ms(u, 0);
    if (extract_u64(text, "lock_retry_interval_ms", u))
      o.lock_retry_interval = clamp_ms(u, 1);
    if (extract_u64(text, "lock_retry_jitter_ms", u))
      o.lock_retry_jitter = clamp_ms(u, 0);
    if (extract_u64(text, "empty_ttl_ms", u))
      o.empty_ttl = clamp_ms(u, 0);
    if (extract_u64(text, "delay_ms", u))
      o.delay = clamp_ms(u, 0);
    if (extract_u64(text, "max_retries", u))
      o.max_retries = static_cast<std::uint32_t>(
          std::min<std::uint64_t>(u, 1000000));
    if (extract_double(text, "random_expire_adjustment", d))
      o.random_expire_adjustment = std::clamp(d, 0.0, 0.9);
    if (extract_bool(text, "disable_cache_read", b))
      o.disable_cache_read = b;
    if (extract_bool(text, "disable_cache_delete", b))
      o.disable_cache_delete = b;
    if (extract_u64(text, "refresh_threads", u))
      o.refresh_threads =
          static_cast<std::size_t>(std::clamp<std::uint64_t>(u, 1, 64));
    if (extract_u64(text, "max_pending_refreshes", u))
      o.max_pending_refreshes = static_cast<std::size_t>(
          std::clamp<std::uint64_t>(u, 1, 1000000));
  } catch (const std::out_of_range &) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  if (!validate_options(o, err))
    return false;
  *out = o;
  return true;
}

std::string options_to_string(const Options &opts) {
  std::ostringstream os;
  os << "strong_consistency:" << (opts.strong_consistency ? 1 : 0) << "\n";
  os << "lock_ttl_ms:" << opts.lock_ttl.count() << "\n";
  os << "lock_ttl_jitter_ms:" << opts.lock_ttl_jitter.count() << "\n";
  os << "lock_retry_interval_ms:" << opts.lock_retry_interval.count() << "\n";
  os << "lock_retry_jitter_ms:" << opts.lock_retry_jitter.count() << "\n";
  os << "empty_ttl_ms:" << opts.empty_ttl.count() << "\n";
  os << "max_retries:" << opts.max_retries << "\n";
  os << "delay_ms:" << opts.delay.count() << "\n";
  os << "random_expire_adjustment:" << opts.random_expire_adjustment << "\n";
  os << "disable_cache_read:" << (opts.disable_cache_read ? 1 : 0) << "\n";
  os << "disable_cache_delete:" << (opts.disable_cache_delete ? 1 : 0) << "\n";
  os << "refresh_threads:" << opts.refresh_threads << "\n";
  os << "max_pending_refreshes:" << opts.max_pending_refreshes << "\n";
  return os.str();
}

} // namespace herd_cache
