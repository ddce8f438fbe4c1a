#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/option_parser.hpp"
#include "internal/config/run_context.hpp"
#include "internal/core/points_appender.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/grpc_timeseries_store.hpp"
#include "internal/util/errors.hpp"

using pointzilla::observability::IntField;
using pointzilla::observability::StringField;

namespace {

constexpr int kExitSuccess       = 0;
constexpr int kExitConfiguration = 1;
constexpr int kExitFatal         = 2;
constexpr int kExitTimedOut      = 3;

} // namespace

int main(int argc, char** argv) {
  const std::string program = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "pointzilla";
  const std::vector<std::string> args(argv + 1, argv + argc);

  pointzilla::config::OptionParser parser;

  // ------------------------------------------------------------
  // Parse and validate configuration
  // ------------------------------------------------------------
  pointzilla::config::ParsedCommandLine parsed;
  pointzilla::config::RunContext        context;
  try {
    parsed = parser.Parse(args);
    if (parsed.show_help) {
      std::cout << parser.Usage(program);
      return kExitSuccess;
    }

    pointzilla::observability::InitializeLogging(parsed.config.logging());
    context = pointzilla::config::BuildRunContext(parsed.config);
  } catch (const pointzilla::util::ConfigurationError& e) {
    std::cerr << e.what() << std::endl;
    return kExitConfiguration;
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return kExitFatal;
  }

  // ------------------------------------------------------------
  // Run
  // ------------------------------------------------------------
  int exit_code = kExitSuccess;
  try {
    pointzilla::core::PointsAppender appender(context, pointzilla::store::MakeGrpcStoreFactory());
    const auto result = appender.Run();

    if (result.append_outcome && result.append_outcome->completion == pointzilla::append::AppendCompletion::kTimedOut) {
      exit_code = kExitTimedOut;
    }

    POINTZILLA_LOG_INFO("run finished",
                        {StringField("command", pointzilla::config::ToString(result.command)),
                         IntField("points_generated", static_cast<std::int64_t>(result.points_generated)),
                         IntField("points_delivered", static_cast<std::int64_t>(result.points_delivered)),
                         StringField("completion", result.append_outcome ? pointzilla::append::ToString(result.append_outcome->completion)
                                                                         : pointzilla::append::ToString(pointzilla::append::AppendCompletion::kNotRequested)),
                         StringField("saved_csv", result.saved_csv_path.value_or(""))});
  } catch (const pointzilla::util::ConfigurationError& e) {
    POINTZILLA_LOG_ERROR("Configuration error", {StringField("error", e.what())});
    exit_code = kExitConfiguration;
  } catch (const pointzilla::util::AppendRejected& e) {
    POINTZILLA_LOG_ERROR("Append rejected", {StringField("error", e.what()),
                                             IntField("accepted_points", static_cast<std::int64_t>(e.accepted_points()))});
    exit_code = kExitFatal;
  } catch (const std::exception& e) {
    POINTZILLA_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    exit_code = kExitFatal;
  }

  pointzilla::observability::ShutdownLogging();
  return exit_code;
}
