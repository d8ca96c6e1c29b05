#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include <absl/status/statusor.h>

#include "clock.hpp"
#include "id.hpp"
#include "layout.hpp"
#include "random.hpp"

namespace horaid {

/**
 * Produces Ids for one machine with monotonic and intra-tick unique output.
 *
 * Policies:
 *  - Clock behind the last tick: the last tick is reused and its counter keeps
 *    advancing, so output never goes backwards.
 *  - Counter exhausted (65536 Ids in one tick for kSequence): spin until the
 *    clock reaches the next tick. If the clock is behind the last tick at
 *    that point, Next() fails with ClockRegressionError instead of waiting
 *    out the jump.
 *
 * Not thread-safe: one owner calls Next(). Use SharedGenerator to share one
 * instance between threads.
 */
class Generator {
public:
  struct Options {
    Layout layout = Layout::kSequence;
    std::shared_ptr<Clock> clock = SystemClock::Shared();
    // Not owned; must outlive the Generator. Null selects Process().
    RandomSource *random = &RandomSource::Process();
  };

  // Fails on machine_id > kMaxMachineId, a null clock, or an unusable clock.
  [[nodiscard]] static absl::StatusOr<Generator> Create(std::uint32_t machine_id,
                                                        Options options);
  [[nodiscard]] static absl::StatusOr<Generator>
  Create(std::uint32_t machine_id) {
    return Create(machine_id, Options{});
  }

  Generator(Generator &&) noexcept = default;
  Generator &operator=(Generator &&) noexcept = default;
  Generator(const Generator &) = delete;
  Generator &operator=(const Generator &) = delete;

  [[nodiscard]] absl::StatusOr<Id> Next();

  [[nodiscard]] std::uint8_t machine_id() const noexcept { return machine_id_; }
  [[nodiscard]] Layout layout() const noexcept { return layout_; }
  [[nodiscard]] Tick last_tick() const noexcept { return last_tick_; }

private:
  Generator(std::uint8_t machine_id, Options &&options) noexcept;

  absl::StatusOr<Tick> ReadTick();
  std::uint32_t InitialCounter();
  void Adopt(const Tick &tick);

  std::uint8_t machine_id_;
  Layout layout_;
  std::shared_ptr<Clock> clock_;
  RandomSource *random_;

  Tick last_tick_;
  std::uint32_t counter_ = 0;
  // Ids handed out in last_tick_; at Capacity(layout_) the tick is spent.
  std::uint32_t issued_ = 0;
};

/**
 * Generator behind a mutex, safe for concurrent Next() calls.
 */
class SharedGenerator {
public:
  explicit SharedGenerator(Generator &&generator)
      : generator_{std::move(generator)} {}

  SharedGenerator(const SharedGenerator &) = delete;
  SharedGenerator(const SharedGenerator &&) = delete;
  SharedGenerator &operator=(const SharedGenerator &) = delete;
  SharedGenerator &operator=(const SharedGenerator &&) = delete;

  [[nodiscard]] static absl::StatusOr<std::unique_ptr<SharedGenerator>>
  Create(std::uint32_t machine_id, Generator::Options options);
  [[nodiscard]] static absl::StatusOr<std::unique_ptr<SharedGenerator>>
  Create(std::uint32_t machine_id) {
    return Create(machine_id, Generator::Options{});
  }

  [[nodiscard]] absl::StatusOr<Id> Next();

  [[nodiscard]] std::uint8_t machine_id() const noexcept {
    return generator_.machine_id();
  }

private:
  std::mutex mutex_;
  Generator generator_;
};

/**
 * Builds one Id from the current time without generator state.
 *
 * kSequence packs machine_id (0 when absent) and sequence 0; kRandom packs
 * 24 random bits. Repeated calls in the same tick can return equal Ids, so
 * this is for low-rate or debugging use only.
 */
[[nodiscard]] absl::StatusOr<Id>
MakeId(std::optional<std::uint8_t> machine_id = std::nullopt,
       Layout layout = Layout::kSequence,
       Clock &clock = *SystemClock::Shared(),
       RandomSource &random = RandomSource::Process());

} // namespace horaid
