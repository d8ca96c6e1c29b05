#pragma once

#include <cstdint>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "horaid/generator.hpp"

namespace genuid {
// Creates the process generator; fails if called twice or on a bad machine id.
[[nodiscard]] absl::Status InitParameters(std::uint32_t machine_id,
                                          horaid::Layout layout);
[[nodiscard]] absl::StatusOr<horaid::Id> GenerateUID();
} // namespace genuid
