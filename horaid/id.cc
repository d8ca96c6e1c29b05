#include "id.hpp"

#include <absl/strings/str_format.h>

namespace horaid {

namespace {

bool HexDigit(char c, std::uint8_t &value) noexcept {
  if (c >= '0' and c <= '9') {
    value = static_cast<std::uint8_t>(c - '0');
    return true;
  }
  if (c >= 'a' and c <= 'f') {
    value = static_cast<std::uint8_t>(10 + (c - 'a'));
    return true;
  }
  if (c >= 'A' and c <= 'F') {
    value = static_cast<std::uint8_t>(10 + (c - 'A'));
    return true;
  }
  return false;
}

} // namespace

Id Id::FromU64(std::uint64_t value) noexcept {
  Bytes bytes;
  StoreBigEndian(bytes, 0, kIdSize, value);
  return Id{bytes};
}

std::optional<Id> Id::FromString(std::string_view text) {
  if (text.size() != 2 * kIdSize) { return std::nullopt; }

  Bytes bytes;
  for (std::size_t i = 0; i < kIdSize; i++) {
    std::uint8_t high = 0, low = 0;
    if (not HexDigit(text[2 * i], high) or
        not HexDigit(text[2 * i + 1], low)) {
      return std::nullopt;
    }
    bytes[i] = static_cast<std::uint8_t>(high << 4 | low);
  }
  return Id{bytes};
}

std::uint64_t Id::ToU64() const noexcept {
  return LoadBigEndian(bytes_, 0, kIdSize);
}

std::string Id::ToString() const { return absl::StrFormat("%016x", ToU64()); }

std::uint32_t Id::Seconds() const noexcept {
  return static_cast<std::uint32_t>(
      LoadBigEndian(bytes_, kSecondsOffset, kSecondsWidth));
}

absl::Time Id::ToTime() const noexcept {
  return absl::FromUnixMillis(kEpochMillis +
                              static_cast<std::int64_t>(Seconds()) * 1000 +
                              UnscaleFraction(Fraction()));
}

} // namespace horaid
