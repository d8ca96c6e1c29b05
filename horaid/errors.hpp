#pragma once

#include <absl/status/status.h>
#include <absl/strings/string_view.h>

namespace horaid {

// The time source could not be read.
[[nodiscard]] absl::Status ClockReadError(absl::string_view message);

// The clock reading precedes kEpochMillis or overflows the seconds field.
[[nodiscard]] absl::Status TimestampRangeError(absl::string_view message);

// The clock is behind the last issued tick and that tick is exhausted.
[[nodiscard]] absl::Status ClockRegressionError(absl::string_view message);

[[nodiscard]] bool IsClockReadError(const absl::Status &status) noexcept;
[[nodiscard]] bool IsTimestampRangeError(const absl::Status &status) noexcept;
[[nodiscard]] bool IsClockRegressionError(const absl::Status &status) noexcept;

} // namespace horaid
