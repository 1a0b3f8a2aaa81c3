#include "herd_cache/random.hpp"

#include <algorithm>
#include <cstdio>

namespace herd_cache {

namespace {
std::mt19937_64 seeded_engine(std::optional<std::uint64_t> seed) {
  if (seed.has_value())
    return std::mt19937_64(*seed);
  // Owner tokens must differ across processes, so use the full device entropy
  // rather than one 32-bit draw.
  std::random_device dev;
  std::seed_seq seq{dev(), dev(), dev(), dev(), dev(), dev(), dev(), dev()};
  return std::mt19937_64(seq);
}
} // namespace

MtRandomSource::MtRandomSource(std::optional<std::uint64_t> seed)
    : rng_(seeded_engine(seed)) {}

double MtRandomSource::next_unit() {
  std::lock_guard<std::mutex> lk(mu_);
  return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
}

std::string MtRandomSource::next_token() {
  std::uint64_t hi, lo;
  {
    std::lock_guard<std::mutex> lk(mu_);
    hi = rng_();
    lo = rng_();
  }
  char buf[33];
  std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                static_cast<unsigned long long>(hi),
                static_cast<unsigned long long>(lo));
  return std::string(buf, 32);
}

std::unique_ptr<IRandomSource>
make_random_source(std::optional<std::uint64_t> seed) {
  return std::make_unique<MtRandomSource>(seed);
}

std::chrono::milliseconds jittered(std::chrono::milliseconds base,
                                   std::chrono::milliseconds range,
                                   IRandomSource &rng) {
  if (range.count() <= 0)
    return base;
  const auto extra = static_cast<std::int64_t>(
      rng.next_unit() * static_cast<double>(range.count()));
  return base +
         std::chrono::milliseconds(std::min<std::int64_t>(extra, range.count() - 1));
}

std::chrono::milliseconds adjusted_ttl(std::chrono::milliseconds ttl,
                                       double adjustment, IRandomSource &rng) {
  if (adjustment <= 0.0)
    return std::max(ttl, std::chrono::milliseconds(1));
  const auto cut = static_cast<std::int64_t>(
      rng.next_unit() * adjustment * static_cast<double>(ttl.count()));
  return std::max(ttl - std::chrono::milliseconds(cut),
                  std::chrono::milliseconds(1));
}

} // namespace herd_cache
