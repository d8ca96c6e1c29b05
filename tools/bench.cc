#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "horaid/generator.hpp"

ABSL_FLAG(std::size_t, count, 10000000, "Number of ids to generate");
ABSL_FLAG(std::uint32_t, machine_id, 101, "Machine id (0-255)");
ABSL_FLAG(horaid::Layout, layout, horaid::Layout::kSequence,
          "Id layout: sequence or random");
ABSL_FLAG(std::string, format, "string",
          "Form stored per id while timing: string or u64");

namespace {

template <class T, class F>
int Run(horaid::Generator &generator, std::size_t count, F &&convert) {
  std::vector<T> data;
  data.reserve(count);

  const absl::Time start = absl::Now();
  for (std::size_t i = 0; i < count; i++) {
    const absl::StatusOr<horaid::Id> id = generator.Next();
    if (not id.ok()) {
      std::cerr << "Next failed after " << i << " ids: " << id.status()
                << std::endl;
      return EXIT_FAILURE;
    }
    data.push_back(convert(*id));
  }
  const absl::Duration done = absl::Now() - start;

  // Analysis to find duplicates
  absl::flat_hash_map<T, std::uint32_t> seen;
  seen.reserve(count);
  for (const T &id : data) { ++seen[id]; }

  std::size_t duplicates = 0;
  for (const auto &p : seen) {
    if (p.second > 1) { duplicates++; }
  }

  std::cout << "total " << count << ", unique " << seen.size()
            << ", duplicates " << duplicates << " in "
            << absl::FormatDuration(done) << std::endl;
  return duplicates == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace

int main(int argc, char *argv[]) {
  absl::SetProgramUsageMessage(
      "Times repeated Next() calls on one generator and counts duplicates.");
  absl::ParseCommandLine(argc, argv);

  horaid::Generator::Options options;
  options.layout = absl::GetFlag(FLAGS_layout);
  absl::StatusOr<horaid::Generator> generator =
      horaid::Generator::Create(absl::GetFlag(FLAGS_machine_id), options);
  if (not generator.ok()) {
    std::cerr << "Generator::Create failed: " << generator.status()
              << std::endl;
    return EXIT_FAILURE;
  }

  const std::size_t count = absl::GetFlag(FLAGS_count);
  const std::string format = absl::GetFlag(FLAGS_format);
  if (format == "string") {
    return Run<std::string>(*generator, count, [](const horaid::Id &id) {
      return id.ToString();
    });
  }
  if (format == "u64") {
    return Run<std::uint64_t>(*generator, count,
                              [](const horaid::Id &id) { return id.ToU64(); });
  }

  std::cerr << "Invalid format=" << format << std::endl;
  return EXIT_FAILURE;
}
