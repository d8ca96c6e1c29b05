#pragma once

#include <cstdint>
#include <mutex>
#include <random>

#include <absl/random/random.h>

namespace horaid {

/**
 * Thread-safe random source for the random layout and for MakeId.
 *
 * Process() is the shared instance; it is created on first use and lives
 * until exit. Tests pass their own seeded instance instead.
 */
class RandomSource {
public:
  RandomSource() = default;
  explicit RandomSource(std::seed_seq &seed) : gen_{seed} {}

  RandomSource(const RandomSource &) = delete;
  RandomSource &operator=(const RandomSource &) = delete;

  static RandomSource &Process();

  // Uniform in [0, 2^24).
  [[nodiscard]] std::uint32_t Next24();

private:
  std::mutex mutex_;
  absl::BitGen gen_;
};

} // namespace horaid
