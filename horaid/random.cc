#include "random.hpp"

#include "layout.hpp"

namespace horaid {

RandomSource &RandomSource::Process() {
  static RandomSource source;
  return source;
}

std::uint32_t RandomSource::Next24() {
  const std::lock_guard<std::mutex> lock{mutex_};
  return absl::Uniform<std::uint32_t>(gen_, 0, kRandomCapacity);
}

} // namespace horaid
