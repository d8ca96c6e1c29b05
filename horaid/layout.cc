#include "layout.hpp"

#include "id.hpp"

namespace horaid {

bool AbslParseFlag(absl::string_view text, Layout *layout, std::string *error) {
  if (text == "sequence") {
    *layout = Layout::kSequence;
    return true;
  }
  if (text == "random") {
    *layout = Layout::kRandom;
    return true;
  }
  *error = "expected 'sequence' or 'random'";
  return false;
}

std::string AbslUnparseFlag(Layout layout) {
  return layout == Layout::kSequence ? "sequence" : "random";
}

Id Pack(Layout layout, const Fields &fields) noexcept {
  IdBytes bytes{};
  StoreBigEndian(bytes, kSecondsOffset, kSecondsWidth, fields.tick.seconds);
  StoreBigEndian(bytes, kFractionOffset, kFractionWidth, fields.tick.fraction);

  switch (layout) {
  case Layout::kSequence:
    StoreBigEndian(bytes, kMachineOffset, kMachineWidth, fields.machine_id);
    StoreBigEndian(bytes, kSequenceOffset, kSequenceWidth,
                 fields.tail & (kSequenceCapacity - 1));
    break;
  case Layout::kRandom:
    StoreBigEndian(bytes, kRandomOffset, kRandomWidth,
                 fields.tail & (kRandomCapacity - 1));
    break;
  }
  return Id{bytes};
}

Fields Unpack(Layout layout, const Id &id) noexcept {
  const IdBytes &bytes = id.bytes();

  Fields fields;
  fields.tick.seconds = static_cast<std::uint32_t>(
      LoadBigEndian(bytes, kSecondsOffset, kSecondsWidth));
  fields.tick.fraction = static_cast<std::uint8_t>(
      LoadBigEndian(bytes, kFractionOffset, kFractionWidth));

  switch (layout) {
  case Layout::kSequence:
    fields.machine_id = static_cast<std::uint8_t>(
        LoadBigEndian(bytes, kMachineOffset, kMachineWidth));
    fields.tail = static_cast<std::uint32_t>(
        LoadBigEndian(bytes, kSequenceOffset, kSequenceWidth));
    break;
  case Layout::kRandom:
    fields.tail = static_cast<std::uint32_t>(
        LoadBigEndian(bytes, kRandomOffset, kRandomWidth));
    break;
  }
  return fields;
}

} // namespace horaid
