#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#define CROW_DISABLE_STATIC_DIR
#include <crow_all.h>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/flags/usage_config.h>

#include "gen/genuid.hpp"

ABSL_FLAG(std::uint16_t, port, 8000, "App port");
ABSL_FLAG(std::uint32_t, machine_id, 0,
          "Machine id (0-255) encoded in every uid; unique per instance");
ABSL_FLAG(horaid::Layout, layout, horaid::Layout::kSequence,
          "Id layout: sequence or random");

namespace {

constexpr std::size_t kMaxBatch = 4096;

crow::response Unavailable(const absl::Status &status) {
  return crow::response(
      crow::status::SERVICE_UNAVAILABLE,
      crow::json::wvalue{
          {"errors", crow::json::wvalue::list{std::string{status.message()}}}});
}

} // namespace

/**
 * HoraID API serves time-sorted 8-byte uids over HTTP.
 *
 * Examples:
 *
 * >>> curl localhost:8000/genuid
 * ... {"hex":"00cd01daff010000","uid":57704410318438400}
 *
 * >>> curl localhost:8000/genuid/3
 * ... {"uids":[57704410318438401,57704410318438402,57704410318438403]}
 */
int main(int argc, char *argv[]) {
  absl::FlagsUsageConfig usage_config;
  usage_config.normalize_filename = [](absl::string_view filename) {
    return std::string(filename.substr(filename.rfind("/") + 1));
  };
  usage_config.version_string = []() { return "HoraID API 0.1.0"; };
  absl::SetFlagsUsageConfig(usage_config);
  absl::SetProgramUsageMessage("Serves time-sorted 8-byte uids over HTTP.");
  absl::ParseCommandLine(argc, argv);

  std::cout << "Creating app" << std::endl;

  const absl::Status init = genuid::InitParameters(
      absl::GetFlag(FLAGS_machine_id), absl::GetFlag(FLAGS_layout));
  if (not init.ok()) {
    std::cerr << "InitParameters failed: " << init << std::endl;
    return EXIT_FAILURE;
  }

  crow::SimpleApp app;

  CROW_ROUTE(app, "/")([]() { return "🙂"; });

  CROW_ROUTE(app, "/genuid")
  ([]() {
    const absl::StatusOr<horaid::Id> id = genuid::GenerateUID();
    if (not id.ok()) { return Unavailable(id.status()); }

    return crow::response(crow::status::OK,
                          crow::json::wvalue{{"uid", id->ToU64()},
                                             {"hex", id->ToString()}});
  });

  CROW_ROUTE(app, "/genuid/<uint>")
  ([](std::uint64_t num) {
    if (num > kMaxBatch) {
      return crow::response(
          crow::status::BAD_REQUEST,
          crow::json::wvalue{{"errors", crow::json::wvalue::list{
                                            "Exceeded 4096 limit"}}});
    }

    crow::json::wvalue::list uids;
    uids.reserve(num);
    for (std::uint64_t i = 0; i < num; i++) {
      const absl::StatusOr<horaid::Id> id = genuid::GenerateUID();
      if (not id.ok()) { return Unavailable(id.status()); }
      uids.emplace_back(id->ToU64());
    }

    return crow::response(crow::status::OK, crow::json::wvalue{{"uids", uids}});
  });

  app.port(absl::GetFlag(FLAGS_port)).multithreaded().run();

  return EXIT_SUCCESS;
}
