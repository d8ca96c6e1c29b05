#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

#include <absl/strings/string_view.h>

namespace horaid {

class Id;

/**
 * Byte layout of an Id, most significant byte first:
 *
 *   offset  0       4         5          6
 *           seconds fraction  machine_id sequence     (kSequence)
 *           seconds fraction  random....... .......   (kRandom)
 *
 * Timestamp fields lead so that byte order, hex order and numeric order all
 * agree with generation order.
 */
enum class Layout { kSequence, kRandom };

// Flag spelling: "sequence" or "random".
bool AbslParseFlag(absl::string_view text, Layout *layout, std::string *error);
std::string AbslUnparseFlag(Layout layout);

constexpr std::size_t kIdSize = 8;

constexpr std::size_t kSecondsOffset = 0;
constexpr std::size_t kSecondsWidth = 4;
constexpr std::size_t kFractionOffset = 4;
constexpr std::size_t kFractionWidth = 1;
constexpr std::size_t kMachineOffset = 5;
constexpr std::size_t kMachineWidth = 1;
constexpr std::size_t kSequenceOffset = 6;
constexpr std::size_t kSequenceWidth = 2;
constexpr std::size_t kRandomOffset = 5;
constexpr std::size_t kRandomWidth = 3;

using IdBytes = std::array<std::uint8_t, kIdSize>;

// Writes the low `width` bytes of value at offset, most significant first.
inline void StoreBigEndian(IdBytes &bytes, std::size_t offset,
                           std::size_t width, std::uint64_t value) noexcept {
  for (std::size_t i = 0; i < width; i++) {
    bytes[offset + i] =
        static_cast<std::uint8_t>(value >> (8 * (width - 1 - i)));
  }
}

[[nodiscard]] inline std::uint64_t LoadBigEndian(const IdBytes &bytes,
                                                 std::size_t offset,
                                                 std::size_t width) noexcept {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < width; i++) {
    value = value << 8 | bytes[offset + i];
  }
  return value;
}

constexpr std::uint32_t kSequenceCapacity = 1U << (8 * kSequenceWidth);
constexpr std::uint32_t kRandomCapacity = 1U << (8 * kRandomWidth);

constexpr std::uint32_t kMaxMachineId = 0xff;

// 2025-01-01T00:00:00Z in Unix milliseconds.
constexpr std::int64_t kEpochMillis = 1735689600000;

[[nodiscard]] constexpr std::uint32_t Capacity(Layout layout) noexcept {
  return layout == Layout::kSequence ? kSequenceCapacity : kRandomCapacity;
}

/**
 * Smallest time step an Id can tell apart: whole seconds since kEpochMillis
 * plus a 1/256 s fraction.
 */
struct Tick {
  std::uint32_t seconds = 0;
  std::uint8_t fraction = 0;

  [[nodiscard]] constexpr std::uint64_t Packed() const noexcept {
    return (static_cast<std::uint64_t>(seconds) << 8) | fraction;
  }

  friend constexpr bool operator==(const Tick &a, const Tick &b) noexcept {
    return a.Packed() == b.Packed();
  }
  friend constexpr bool operator!=(const Tick &a, const Tick &b) noexcept {
    return a.Packed() != b.Packed();
  }
  friend constexpr bool operator<(const Tick &a, const Tick &b) noexcept {
    return a.Packed() < b.Packed();
  }
  friend constexpr bool operator>(const Tick &a, const Tick &b) noexcept {
    return a.Packed() > b.Packed();
  }
  friend constexpr bool operator<=(const Tick &a, const Tick &b) noexcept {
    return a.Packed() <= b.Packed();
  }
  friend constexpr bool operator>=(const Tick &a, const Tick &b) noexcept {
    return a.Packed() >= b.Packed();
  }

  friend std::ostream &operator<<(std::ostream &os, const Tick &tick) {
    return os << tick.seconds << '+' << static_cast<unsigned>(tick.fraction)
              << "/256";
  }
};

// Maps 0..999 ms onto the one-byte fraction, floor(ms * 256 / 1000).
[[nodiscard]] constexpr std::uint8_t ScaleMillis(std::uint32_t millis) noexcept {
  return static_cast<std::uint8_t>((millis % 1000) * 256 / 1000);
}

// Inverse of ScaleMillis, exact only at multiples of 125 ms.
[[nodiscard]] constexpr std::uint32_t
UnscaleFraction(std::uint8_t fraction) noexcept {
  return static_cast<std::uint32_t>(fraction) * 1000 / 256;
}

struct Fields {
  Tick tick;
  std::uint8_t machine_id = 0;
  // Sequence number (kSequence, 16 bits) or random value (kRandom, 24 bits).
  std::uint32_t tail = 0;

  friend bool operator==(const Fields &a, const Fields &b) noexcept {
    return std::tie(a.tick.seconds, a.tick.fraction, a.machine_id, a.tail) ==
           std::tie(b.tick.seconds, b.tick.fraction, b.machine_id, b.tail);
  }
  friend bool operator!=(const Fields &a, const Fields &b) noexcept {
    return not(a == b);
  }
};

// Fields outside their width are masked; kRandom ignores machine_id.
[[nodiscard]] Id Pack(Layout layout, const Fields &fields) noexcept;

// kRandom reports machine_id as 0.
[[nodiscard]] Fields Unpack(Layout layout, const Id &id) noexcept;

} // namespace horaid
