#include "genuid.hpp"

#include <memory>
#include <utility>

namespace genuid {

namespace {
std::unique_ptr<horaid::SharedGenerator> generator;
} // namespace

absl::Status InitParameters(std::uint32_t machine_id, horaid::Layout layout) {
  if (generator) {
    return absl::FailedPreconditionError("generator already initialized");
  }

  horaid::Generator::Options options;
  options.layout = layout;
  auto created = horaid::SharedGenerator::Create(machine_id, std::move(options));
  if (not created.ok()) { return created.status(); }

  generator = *std::move(created);
  return absl::OkStatus();
}

absl::StatusOr<horaid::Id> GenerateUID() {
  if (not generator) {
    return absl::FailedPreconditionError("InitParameters was not called");
  }
  return generator->Next();
}

} // namespace genuid
