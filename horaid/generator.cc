#include "generator.hpp"

#include <utility>

#include <absl/strings/str_cat.h>

#include "errors.hpp"

namespace horaid {

absl::StatusOr<Generator> Generator::Create(std::uint32_t machine_id,
                                            Options options) {
  if (machine_id > kMaxMachineId) {
    return absl::InvalidArgumentError(absl::StrCat(
        "machine_id=", machine_id, " exceeds ", kMaxMachineId));
  }
  if (not options.clock) {
    return absl::InvalidArgumentError("clock must not be null");
  }
  if (options.random == nullptr) {
    options.random = &RandomSource::Process();
  }

  Generator generator{static_cast<std::uint8_t>(machine_id),
                      std::move(options)};

  // Fail fast on a clock that cannot produce Ids at all.
  absl::StatusOr<Tick> probe = generator.ReadTick();
  if (not probe.ok()) { return probe.status(); }

  return std::move(generator);
}

Generator::Generator(std::uint8_t machine_id, Options &&options) noexcept
    : machine_id_{machine_id}, layout_{options.layout},
      clock_{std::move(options.clock)}, random_{options.random} {}

absl::StatusOr<Tick> Generator::ReadTick() {
  absl::StatusOr<std::int64_t> millis = clock_->NowUnixMillis();
  if (not millis.ok()) { return millis.status(); }
  return TickFromUnixMillis(*millis);
}

std::uint32_t Generator::InitialCounter() {
  return layout_ == Layout::kRandom ? random_->Next24() : 0;
}

void Generator::Adopt(const Tick &tick) {
  last_tick_ = tick;
  counter_ = InitialCounter();
  issued_ = 1;
}

absl::StatusOr<Id> Generator::Next() {
  absl::StatusOr<Tick> tick = ReadTick();
  if (not tick.ok()) { return tick.status(); }

  const std::uint32_t capacity = Capacity(layout_);

  if (*tick > last_tick_) {
    Adopt(*tick);
  } else if (issued_ < capacity) {
    // Same tick, or the clock went back: stay on last_tick_.
    if (issued_ == 0) {
      counter_ = InitialCounter();
    } else {
      counter_ = (counter_ + 1) & (capacity - 1);
    }
    ++issued_;
  } else {
    // last_tick_ is spent; wait for the clock to move past it.
    while (not(*tick > last_tick_)) {
      if (*tick < last_tick_) {
        return ClockRegressionError(absl::StrCat(
            "clock is behind the last issued tick and all ", capacity,
            " ids of that tick are used"));
      }
      tick = ReadTick();
      if (not tick.ok()) { return tick.status(); }
    }
    Adopt(*tick);
  }

  return Pack(layout_, Fields{last_tick_, machine_id_, counter_});
}

absl::StatusOr<std::unique_ptr<SharedGenerator>>
SharedGenerator::Create(std::uint32_t machine_id,
                        Generator::Options options) {
  absl::StatusOr<Generator> generator =
      Generator::Create(machine_id, std::move(options));
  if (not generator.ok()) { return generator.status(); }
  return std::make_unique<SharedGenerator>(*std::move(generator));
}

absl::StatusOr<Id> SharedGenerator::Next() {
  const std::lock_guard<std::mutex> lock{mutex_};
  return generator_.Next();
}

absl::StatusOr<Id> MakeId(std::optional<std::uint8_t> machine_id,
                          Layout layout, Clock &clock, RandomSource &random) {
  absl::StatusOr<std::int64_t> millis = clock.NowUnixMillis();
  if (not millis.ok()) { return millis.status(); }

  absl::StatusOr<Tick> tick = TickFromUnixMillis(*millis);
  if (not tick.ok()) { return tick.status(); }

  Fields fields;
  fields.tick = *tick;
  fields.machine_id = machine_id.value_or(0);
  fields.tail = layout == Layout::kRandom ? random.Next24() : 0;
  return Pack(layout, fields);
}

} // namespace horaid
