#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <absl/time/time.h>

#include "layout.hpp"

namespace horaid {

/**
 * Immutable 8-byte, time-sortable identifier.
 *
 * Ordering is unsigned big-endian byte comparison, which is the same as
 * comparing ToU64() and comparing ToString().
 */
class Id {
  friend std::ostream &operator<<(std::ostream &os, const Id &id) {
    return os << id.ToString();
  }

public:
  using Bytes = IdBytes;

  constexpr Id() noexcept : bytes_{} {}
  constexpr explicit Id(const Bytes &bytes) noexcept : bytes_{bytes} {}

  [[nodiscard]] static Id FromU64(std::uint64_t value) noexcept;

  // Accepts exactly 16 hex digits, either case.
  [[nodiscard]] static std::optional<Id> FromString(std::string_view text);

  [[nodiscard]] std::uint64_t ToU64() const noexcept;

  // 16 lowercase hex characters, zero-padded.
  [[nodiscard]] std::string ToString() const;

  [[nodiscard]] const Bytes &bytes() const noexcept { return bytes_; }

  [[nodiscard]] std::uint32_t Seconds() const noexcept;
  [[nodiscard]] std::uint8_t Fraction() const noexcept {
    return bytes_[kFractionOffset];
  }
  [[nodiscard]] Tick tick() const noexcept { return {Seconds(), Fraction()}; }

  // Generation time, accurate to one tick.
  [[nodiscard]] absl::Time ToTime() const noexcept;

  friend bool operator==(const Id &a, const Id &b) noexcept {
    return a.bytes_ == b.bytes_;
  }
  friend bool operator!=(const Id &a, const Id &b) noexcept {
    return a.bytes_ != b.bytes_;
  }
  friend bool operator<(const Id &a, const Id &b) noexcept {
    return a.bytes_ < b.bytes_;
  }
  friend bool operator>(const Id &a, const Id &b) noexcept {
    return a.bytes_ > b.bytes_;
  }
  friend bool operator<=(const Id &a, const Id &b) noexcept {
    return a.bytes_ <= b.bytes_;
  }
  friend bool operator>=(const Id &a, const Id &b) noexcept {
    return a.bytes_ >= b.bytes_;
  }

  template <typename H> friend H AbslHashValue(H h, const Id &id) {
    return H::combine(std::move(h), id.ToU64());
  }

private:
  Bytes bytes_;
};

} // namespace horaid

namespace std {
template <> struct hash<horaid::Id> {
  std::size_t operator()(const horaid::Id &id) const noexcept {
    return std::hash<std::uint64_t>{}(id.ToU64());
  }
};
} // namespace std
