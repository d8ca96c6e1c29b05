#include <cstdint>
#include <cstdlib>
#include <iostream>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "horaid/generator.hpp"

ABSL_FLAG(std::uint32_t, machine_id, 1, "Machine id (0-255)");
ABSL_FLAG(int, count, 20, "Number of ids to print");
ABSL_FLAG(absl::Duration, interval, absl::Milliseconds(1),
          "Pause between ids");
ABSL_FLAG(horaid::Layout, layout, horaid::Layout::kSequence,
          "Id layout: sequence or random");

int main(int argc, char *argv[]) {
  absl::SetProgramUsageMessage("Prints a few ids with their u64 and time.");
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

  for (int i = 0; i < absl::GetFlag(FLAGS_count); i++) {
    const absl::StatusOr<horaid::Id> id = generator->Next();
    if (not id.ok()) {
      std::cerr << "Next failed: " << id.status() << std::endl;
      return EXIT_FAILURE;
    }
    std::cout << "ID " << *id << ' ' << id->ToU64() << ' '
              << absl::FormatTime("%Y-%m-%d %H:%M:%E3S", id->ToTime(),
                                  absl::UTCTimeZone())
              << std::endl;
    absl::SleepFor(absl::GetFlag(FLAGS_interval));
  }

  return EXIT_SUCCESS;
}
