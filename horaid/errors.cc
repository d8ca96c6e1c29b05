#include "errors.hpp"

namespace horaid {

absl::Status ClockReadError(absl::string_view message) {
  return absl::UnavailableError(message);
}

absl::Status TimestampRangeError(absl::string_view message) {
  return absl::OutOfRangeError(message);
}

absl::Status ClockRegressionError(absl::string_view message) {
  return absl::FailedPreconditionError(message);
}

bool IsClockReadError(const absl::Status &status) noexcept {
  return absl::IsUnavailable(status);
}

bool IsTimestampRangeError(const absl::Status &status) noexcept {
  return absl::IsOutOfRange(status);
}

bool IsClockRegressionError(const absl::Status &status) noexcept {
  return absl::IsFailedPrecondition(status);
}

} // namespace horaid
