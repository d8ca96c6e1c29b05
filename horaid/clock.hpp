#pragma once

#include <cstdint>
#include <memory>

#include <absl/status/statusor.h>

#include "layout.hpp"

namespace horaid {

/**
 * Wall-clock source read once per generated Id.
 *
 * Implementations report an unreadable clock as ClockReadError.
 */
class Clock {
public:
  virtual ~Clock() = default;
  Clock(const Clock &) = delete;
  Clock(const Clock &&) = delete;
  Clock &operator=(const Clock &) = delete;
  Clock &operator=(const Clock &&) = delete;

  virtual absl::StatusOr<std::int64_t> NowUnixMillis() = 0;

protected:
  Clock() = default;
};

class SystemClock final : public Clock {
public:
  SystemClock() = default;

  absl::StatusOr<std::int64_t> NowUnixMillis() final;

  // Process-wide instance, created on first use.
  static const std::shared_ptr<Clock> &Shared();
};

// Fails with TimestampRangeError before kEpochMillis or past the 4-byte
// seconds field.
[[nodiscard]] absl::StatusOr<Tick> TickFromUnixMillis(std::int64_t millis);

} // namespace horaid
