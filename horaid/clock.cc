#include "clock.hpp"

#include <limits>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "errors.hpp"

namespace horaid {

absl::StatusOr<std::int64_t> SystemClock::NowUnixMillis() {
  const absl::Time now = absl::Now();
  if (now == absl::InfiniteFuture() or now == absl::InfinitePast()) {
    return ClockReadError("system clock returned a non-finite time");
  }
  return absl::ToUnixMillis(now);
}

const std::shared_ptr<Clock> &SystemClock::Shared() {
  static const std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
  return clock;
}

absl::StatusOr<Tick> TickFromUnixMillis(std::int64_t millis) {
  if (millis < kEpochMillis) {
    return TimestampRangeError(absl::StrCat(
        "clock reads ", millis, " ms, before the epoch at ", kEpochMillis,
        " ms; the device time is incorrect"));
  }

  const std::int64_t since_epoch = millis - kEpochMillis;
  const std::int64_t seconds = since_epoch / 1000;
  if (seconds > std::numeric_limits<std::uint32_t>::max()) {
    return TimestampRangeError(absl::StrCat(
        "clock reads ", millis, " ms, past the 4-byte seconds field"));
  }

  return Tick{static_cast<std::uint32_t>(seconds),
              ScaleMillis(static_cast<std::uint32_t>(since_epoch % 1000))};
}

} // namespace horaid
