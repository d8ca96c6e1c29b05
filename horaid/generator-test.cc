#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <random>
#include <thread>
#include <utility>
#include <vector>

#include <absl/container/flat_hash_set.h>

#include "errors.hpp"
#include "generator.hpp"

namespace {

// Clock under test control. Optionally jumps forward once after a given
// number of reads, to let a spinning Next() observe the next tick.
class FakeClock final : public horaid::Clock {
public:
  explicit FakeClock(std::int64_t millis) : millis_{millis} {}

  absl::StatusOr<std::int64_t> NowUnixMillis() final {
    ++reads_;
    if (not failure_.ok()) { return failure_; }
    if (jump_at_read_ != 0 and reads_ >= jump_at_read_) {
      millis_ += jump_by_;
      jump_at_read_ = 0;
    }
    return millis_;
  }

  void Set(std::int64_t millis) { millis_ = millis; }
  void Advance(std::int64_t millis) { millis_ += millis; }
  void Fail(absl::Status status) { failure_ = std::move(status); }

  void JumpAfterReads(std::size_t reads, std::int64_t millis) {
    jump_at_read_ = reads_ + reads;
    jump_by_ = millis;
  }

  [[nodiscard]] std::size_t reads() const { return reads_; }

private:
  std::int64_t millis_;
  absl::Status failure_;
  std::size_t reads_ = 0;
  std::size_t jump_at_read_ = 0;
  std::int64_t jump_by_ = 0;
};

// 2025-06-05T12:02:34.999Z: seconds 0x00cd01da, fraction 0xff.
constexpr std::int64_t kSampleMillis =
    horaid::kEpochMillis + 0x00cd01daLL * 1000 + 999;

// One tick is 1/256 s; 4 ms always lands in a later tick.
constexpr std::int64_t kTickMillis = 4;

horaid::Generator MakeGenerator(std::uint32_t machine_id,
                                const std::shared_ptr<FakeClock> &clock,
                                horaid::Layout layout =
                                    horaid::Layout::kSequence,
                                horaid::RandomSource *random = nullptr) {
  horaid::Generator::Options options;
  options.layout = layout;
  options.clock = clock;
  options.random = random;
  auto generator = horaid::Generator::Create(machine_id, std::move(options));
  EXPECT_TRUE(generator.ok()) << generator.status();
  return *std::move(generator);
}

horaid::Id MustNext(horaid::Generator &generator) {
  auto id = generator.Next();
  EXPECT_TRUE(id.ok()) << id.status();
  return id.ok() ? *id : horaid::Id{};
}

namespace horaid_std {
class jthread {
public:
  template <class T, class... A>
  explicit jthread(T &&t, A &&...a)
      : t_{std::forward<T>(t), std::forward<A>(a)...} {}

  jthread(const jthread &) = delete;
  jthread &operator=(const jthread &) = delete;

  jthread(jthread &&j) noexcept : t_{std::move(j.t_)} {}
  jthread &operator=(jthread &&j) noexcept {
    t_ = std::move(j.t_);
    return *this;
  }
  ~jthread() {
    if (t_.joinable()) { t_.join(); }
  }

private:
  std::thread t_;
};
} // namespace horaid_std

} // namespace

TEST(GeneratorCreateTest, RejectsWideMachineId) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  horaid::Generator::Options options;
  options.clock = clock;

  const auto generator = horaid::Generator::Create(256, options);
  ASSERT_FALSE(generator.ok());
  EXPECT_TRUE(absl::IsInvalidArgument(generator.status()));

  EXPECT_TRUE(horaid::Generator::Create(255, options).ok());
}

TEST(GeneratorCreateTest, RejectsNullClock) {
  horaid::Generator::Options options;
  options.clock = nullptr;
  const auto generator = horaid::Generator::Create(1, std::move(options));
  ASSERT_FALSE(generator.ok());
  EXPECT_TRUE(absl::IsInvalidArgument(generator.status()));
}

TEST(GeneratorCreateTest, ClockReadFailure) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  clock->Fail(horaid::ClockReadError("no clock"));
  horaid::Generator::Options options;
  options.clock = clock;

  const auto generator = horaid::Generator::Create(1, std::move(options));
  ASSERT_FALSE(generator.ok());
  EXPECT_TRUE(horaid::IsClockReadError(generator.status()));
}

TEST(GeneratorCreateTest, ClockBeforeEpoch) {
  auto clock = std::make_shared<FakeClock>(horaid::kEpochMillis - 1000);
  horaid::Generator::Options options;
  options.clock = clock;

  const auto generator = horaid::Generator::Create(1, std::move(options));
  ASSERT_FALSE(generator.ok());
  EXPECT_TRUE(horaid::IsTimestampRangeError(generator.status()));
}

TEST(GeneratorCreateTest, SystemClockDefaults) {
  auto generator = horaid::Generator::Create(7);
  ASSERT_TRUE(generator.ok()) << generator.status();
  EXPECT_EQ(generator->machine_id(), 7);
  EXPECT_EQ(generator->layout(), horaid::Layout::kSequence);

  auto id = generator->Next();
  ASSERT_TRUE(id.ok()) << id.status();
  EXPECT_EQ(id->bytes()[horaid::kMachineOffset], 7);
}

TEST(GeneratorTest, ConcreteScenario) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(1, clock);

  EXPECT_EQ(MustNext(generator).ToString(), "00cd01daff010000");

  const horaid::Id id = MustNext(generator);
  EXPECT_EQ(id.bytes(), (horaid::Id::Bytes{0x00, 0xcd, 0x01, 0xda, 0xff, 0x01,
                                           0x00, 0x01}));
  EXPECT_EQ(id.ToString(), "00cd01daff010001");
  EXPECT_EQ(id.ToU64(), 0x00cd01daff010001ULL);

  EXPECT_EQ(MustNext(generator).ToString(), "00cd01daff010002");
  EXPECT_EQ(generator.last_tick(), (horaid::Tick{0x00cd01da, 0xff}));
}

TEST(GeneratorTest, SequenceResetsOnNewTick) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(1, clock);

  MustNext(generator);
  MustNext(generator);
  clock->Advance(1);

  const horaid::Id id = MustNext(generator);
  EXPECT_EQ(id.ToString(), "00cd01db00010000");
}

TEST(GeneratorTest, Monotonic) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(3, clock);

  std::mt19937 rng{42};
  std::uniform_int_distribution<int> step{0, 2};

  std::vector<std::pair<horaid::Tick, horaid::Id>> ids;
  for (int i = 0; i < 5000; i++) {
    // Mix same-tick calls with small and tick-sized clock steps.
    const int s = step(rng);
    clock->Advance(s == 0 ? 0 : s == 1 ? 1 : kTickMillis);
    const horaid::Id id = MustNext(generator);
    ids.emplace_back(id.tick(), id);
  }

  for (std::size_t i = 1; i < ids.size(); i++) {
    ASSERT_LT(ids[i - 1].second.ToU64(), ids[i].second.ToU64()) << i;
    ASSERT_LE(ids[i - 1].first, ids[i].first) << i;
  }
}

TEST(GeneratorTest, MonotonicAcrossAdvancingTicks) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(200, clock);

  horaid::Id last = MustNext(generator);
  for (int i = 0; i < 1000; i++) {
    clock->Advance(kTickMillis);
    const horaid::Id id = MustNext(generator);
    ASSERT_GT(id.tick(), last.tick());
    ASSERT_GT(id, last);
    ASSERT_EQ(id.bytes()[horaid::kSequenceOffset], 0);
    ASSERT_EQ(id.bytes()[horaid::kSequenceOffset + 1], 0);
    last = id;
  }
}

TEST(GeneratorTest, FieldIsolation) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto first = MakeGenerator(1, clock);
  auto second = MakeGenerator(2, clock);

  for (int i = 0; i < 10; i++) {
    const horaid::Id a = MustNext(first);
    const horaid::Id b = MustNext(second);

    for (std::size_t pos = 0; pos < horaid::kIdSize; pos++) {
      if (pos == horaid::kMachineOffset) {
        EXPECT_EQ(a.bytes()[pos], 1);
        EXPECT_EQ(b.bytes()[pos], 2);
      } else {
        EXPECT_EQ(a.bytes()[pos], b.bytes()[pos]) << "byte " << pos;
      }
    }
    clock->Advance(i % 2 == 0 ? 0 : kTickMillis);
  }
}

TEST(GeneratorTest, IntraTickUniqueness) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(9, clock);

  std::vector<horaid::Id> ids;
  ids.reserve(horaid::kSequenceCapacity);
  for (std::uint32_t i = 0; i < horaid::kSequenceCapacity; i++) {
    ids.push_back(MustNext(generator));
  }

  for (std::uint32_t i = 0; i < horaid::kSequenceCapacity; i++) {
    const horaid::Fields fields =
        horaid::Unpack(horaid::Layout::kSequence, ids[i]);
    ASSERT_EQ(fields.tick, (horaid::Tick{0x00cd01da, 0xff}));
    ASSERT_EQ(fields.machine_id, 9);
    ASSERT_EQ(fields.tail, i);
  }

  const absl::flat_hash_set<horaid::Id> unique(ids.cbegin(), ids.cend());
  EXPECT_EQ(unique.size(), ids.size());
  EXPECT_TRUE(std::is_sorted(ids.cbegin(), ids.cend()));
}

TEST(GeneratorTest, OverflowWaitsForNextTick) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(1, clock);

  horaid::Id last;
  for (std::uint32_t i = 0; i < horaid::kSequenceCapacity; i++) {
    last = MustNext(generator);
  }
  EXPECT_EQ(last.ToString(), "00cd01daff01ffff");

  // The first read of the next call still sees the spent tick; the clock
  // moves on after a few more reads.
  const std::size_t reads_before = clock->reads();
  clock->JumpAfterReads(5, 1);

  const horaid::Id id = MustNext(generator);
  EXPECT_EQ(clock->reads() - reads_before, 5U);
  EXPECT_EQ(id.ToString(), "00cd01db00010000");
  EXPECT_GT(id, last);
}

TEST(GeneratorTest, RegressionReusesLastTick) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(1, clock);

  const horaid::Id before = MustNext(generator);

  clock->Set(kSampleMillis - 60 * 1000);
  const horaid::Id during = MustNext(generator);
  EXPECT_EQ(during.ToString(), "00cd01daff010001");
  EXPECT_GT(during, before);
  EXPECT_EQ(generator.last_tick(), before.tick());

  clock->Set(kSampleMillis + kTickMillis);
  const horaid::Id after = MustNext(generator);
  EXPECT_EQ(after.ToString(), "00cd01db00010000");
  EXPECT_GT(after, during);
}

TEST(GeneratorTest, RegressionAtCapacityFails) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(1, clock);

  for (std::uint32_t i = 0; i < horaid::kSequenceCapacity; i++) {
    MustNext(generator);
  }

  clock->Set(kSampleMillis - 1000);
  const auto failed = generator.Next();
  ASSERT_FALSE(failed.ok());
  EXPECT_TRUE(horaid::IsClockRegressionError(failed.status()))
      << failed.status();

  // Deterministic: the same clock gives the same answer.
  EXPECT_TRUE(horaid::IsClockRegressionError(generator.Next().status()));

  clock->Set(kSampleMillis + 1);
  const auto recovered = generator.Next();
  ASSERT_TRUE(recovered.ok()) << recovered.status();
  EXPECT_EQ(recovered->ToString(), "00cd01db00010000");
}

TEST(GeneratorTest, RegressionWhileWaitingFails) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(1, clock);

  for (std::uint32_t i = 0; i < horaid::kSequenceCapacity; i++) {
    MustNext(generator);
  }

  clock->JumpAfterReads(3, -5000);
  const auto failed = generator.Next();
  ASSERT_FALSE(failed.ok());
  EXPECT_TRUE(horaid::IsClockRegressionError(failed.status()));
}

TEST(GeneratorTest, ClockReadFailureInNext) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(1, clock);
  MustNext(generator);

  clock->Fail(horaid::ClockReadError("gone"));
  const auto failed = generator.Next();
  ASSERT_FALSE(failed.ok());
  EXPECT_TRUE(horaid::IsClockReadError(failed.status()));

  clock->Fail(absl::OkStatus());
  EXPECT_EQ(MustNext(generator).ToString(), "00cd01daff010001");
}

TEST(GeneratorTest, TimestampRangeFailureInNext) {
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(1, clock);

  clock->Set(horaid::kEpochMillis - 1);
  const auto failed = generator.Next();
  ASSERT_FALSE(failed.ok());
  EXPECT_TRUE(horaid::IsTimestampRangeError(failed.status()));
}

TEST(GeneratorTest, RandomLayout) {
  std::seed_seq seed{1, 2, 3};
  horaid::RandomSource random{seed};
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator =
      MakeGenerator(101, clock, horaid::Layout::kRandom, &random);

  const horaid::Id first = MustNext(generator);
  const horaid::Id second = MustNext(generator);

  const horaid::Fields a = horaid::Unpack(horaid::Layout::kRandom, first);
  const horaid::Fields b = horaid::Unpack(horaid::Layout::kRandom, second);
  EXPECT_EQ(a.tick, (horaid::Tick{0x00cd01da, 0xff}));
  EXPECT_EQ(b.tick, a.tick);
  EXPECT_EQ(b.tail, (a.tail + 1) & (horaid::kRandomCapacity - 1));
  EXPECT_NE(first, second);

  absl::flat_hash_set<horaid::Id> ids{first, second};
  for (int i = 0; i < 100000; i++) { ids.insert(MustNext(generator)); }
  EXPECT_EQ(ids.size(), 100002U);

  clock->Advance(kTickMillis);
  const horaid::Id later = MustNext(generator);
  EXPECT_GT(later.tick(), a.tick);
  EXPECT_GT(later, *std::max_element(ids.cbegin(), ids.cend()));
}

TEST(GeneratorTest, RandomLayoutExhaustsTick) {
  std::seed_seq seed{9};
  horaid::RandomSource random{seed};
  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  auto generator = MakeGenerator(0, clock, horaid::Layout::kRandom, &random);

  // Counting up from the random start wraps at 2^24 and covers every tail.
  std::vector<bool> seen(horaid::kRandomCapacity, false);
  horaid::Id last;
  for (std::uint32_t i = 0; i < horaid::kRandomCapacity; i++) {
    const absl::StatusOr<horaid::Id> id = generator.Next();
    ASSERT_TRUE(id.ok()) << id.status();
    const horaid::Fields fields = horaid::Unpack(horaid::Layout::kRandom, *id);
    ASSERT_EQ(fields.tick, (horaid::Tick{0x00cd01da, 0xff}));
    ASSERT_FALSE(seen[fields.tail]) << i;
    seen[fields.tail] = true;
    last = *id;
  }

  const std::size_t reads_before = clock->reads();
  clock->JumpAfterReads(3, 1);

  const horaid::Id id = MustNext(generator);
  EXPECT_EQ(clock->reads() - reads_before, 3U);
  EXPECT_EQ(id.tick(), (horaid::Tick{0x00cd01db, 0}));
  EXPECT_GT(id, last);
}

TEST(MakeIdTest, SequenceLayout) {
  FakeClock clock{kSampleMillis};

  auto id = horaid::MakeId(5, horaid::Layout::kSequence, clock);
  ASSERT_TRUE(id.ok()) << id.status();
  EXPECT_EQ(id->ToString(), "00cd01daff050000");

  id = horaid::MakeId(std::nullopt, horaid::Layout::kSequence, clock);
  ASSERT_TRUE(id.ok()) << id.status();
  EXPECT_EQ(id->ToString(), "00cd01daff000000");
}

TEST(MakeIdTest, RandomLayout) {
  FakeClock clock{kSampleMillis};
  std::seed_seq seed{7};
  horaid::RandomSource random{seed};

  const auto id = horaid::MakeId(std::nullopt, horaid::Layout::kRandom, clock,
                                 random);
  ASSERT_TRUE(id.ok()) << id.status();
  EXPECT_EQ(id->Seconds(), 0x00cd01daU);
  EXPECT_EQ(id->Fraction(), 0xff);
}

TEST(MakeIdTest, Failures) {
  FakeClock clock{horaid::kEpochMillis - 1};
  EXPECT_TRUE(horaid::IsTimestampRangeError(
      horaid::MakeId(1, horaid::Layout::kSequence, clock).status()));

  clock.Fail(horaid::ClockReadError("gone"));
  EXPECT_TRUE(horaid::IsClockReadError(
      horaid::MakeId(1, horaid::Layout::kSequence, clock).status()));
}

TEST(MakeIdTest, SystemClock) {
  const auto id = horaid::MakeId();
  ASSERT_TRUE(id.ok()) << id.status();
  EXPECT_EQ(id->bytes()[horaid::kMachineOffset], 0);
}

TEST(SharedGeneratorSafeThreadedTest, Unique) {
  auto shared = horaid::SharedGenerator::Create(4);
  ASSERT_TRUE(shared.ok()) << shared.status();
  horaid::SharedGenerator &generator = **shared;

  const std::size_t threads_size = 20;
  const std::size_t per_thread = 5000;
  std::vector<std::vector<horaid::Id>> threads_ids;
  threads_ids.resize(threads_size);
  {
    std::vector<horaid_std::jthread> threads;
    threads.reserve(threads_size);

    for (std::size_t i = 0; i < threads_size; i++) {
      threads.emplace_back(
          [&](const std::size_t i) {
            threads_ids[i].reserve(per_thread);
            for (std::size_t n = 0; n < per_thread; n++) {
              auto id = generator.Next();
              if (id.ok()) { threads_ids[i].push_back(*id); }
            }
          },
          i);
    }
  }

  absl::flat_hash_set<horaid::Id> unique;
  for (const auto &ids : threads_ids) {
    ASSERT_EQ(ids.size(), per_thread);
    // Each thread observes its own calls in generation order.
    ASSERT_TRUE(std::is_sorted(ids.cbegin(), ids.cend()));
    for (const horaid::Id &id : ids) {
      ASSERT_EQ(id.bytes()[horaid::kMachineOffset], 4);
      unique.insert(id);
    }
  }
  EXPECT_EQ(unique.size(), threads_size * per_thread);
}

TEST(SharedGeneratorTest, CreateFailures) {
  EXPECT_TRUE(absl::IsInvalidArgument(
      horaid::SharedGenerator::Create(1000).status()));

  auto clock = std::make_shared<FakeClock>(kSampleMillis);
  horaid::Generator::Options options;
  options.clock = clock;
  auto shared = horaid::SharedGenerator::Create(2, options);
  ASSERT_TRUE(shared.ok()) << shared.status();
  EXPECT_EQ((*shared)->machine_id(), 2);

  auto id = (*shared)->Next();
  ASSERT_TRUE(id.ok()) << id.status();
  EXPECT_EQ(id->ToString(), "00cd01daff020000");
}
