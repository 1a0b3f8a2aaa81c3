#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace herd_cache {

// Source of every random choice the client makes, so tests can pin them.
class IRandomSource {
public:
  virtual ~IRandomSource() = default;
  // Uniform in [0, 1).
  virtual double next_unit() = 0;
  // Fresh fencing token, unique per lock acquisition.
  virtual std::string next_token() = 0;
};

class MtRandomSource final : public IRandomSource {
public:
  explicit MtRandomSource(std::optional<std::uint64_t> seed = std::nullopt);
  double next_unit() override;
  std::string next_token() override;

private:
  std::mutex mu_;
  std::mt19937_64 rng_;
};

std::unique_ptr<IRandomSource>
make_random_source(std::optional<std::uint64_t> seed = std::nullopt);

// base + u * range
std::chrono::milliseconds jittered(std::chrono::milliseconds base,
                                   std::chrono::milliseconds range,
                                   IRandomSource &rng);
// ttl * (1 - u * adjustment), never below 1ms
std::chrono::milliseconds adjusted_ttl(std::chrono::milliseconds ttl,
                                       double adjustment, IRandomSource &rng);

} // namespace herd_cache
