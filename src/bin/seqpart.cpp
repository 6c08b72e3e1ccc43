#include <iostream>
#include <memory>
#include <optional>

#include <aws/core/Aws.h>
#include <aws/core/utils/logging/ConsoleLogSystem.h>

#include "tool/sequence_tool.hpp"
#include "tool/tool_config.hpp"
#include "utils/assert.hpp"
#include "utils/signal_handler.hpp"

using namespace seqpart;  // NOLINT(google-build-using-namespace)

namespace {

Aws::Utils::Logging::LogLevel VerbosityToLogLevel(int verbosity) {
  if (verbosity <= 0) {
    return Aws::Utils::Logging::LogLevel::Warn;
  }
  return verbosity == 1 ? Aws::Utils::Logging::LogLevel::Info : Aws::Utils::Logging::LogLevel::Debug;
}

}  // namespace

/**
 * The command line interface (CLI) for seqpart, e.g.,
 *   ./seqpart --tool preprocess-object --uri file:///data/genome.fa
 *   ./seqpart --tool partition-object --uri file:///data/genome.fa --num_chunks 8 --count_records
 * Run ./seqpart --help to list all options.
 */
int main(int argc, char** argv) {
  RegisterSignalHandler();
  int exit_code = 0;
  cxxopts::ParseResult parse_result;
  try {
    cxxopts::Options cli_options = ConfigureCliOptions();
    parse_result = cli_options.parse(argc, argv);

    if (parse_result.arguments().empty() || parse_result.count(kHelpOption)) {
      // Print help and terminate.
      std::cout << cli_options.help() << std::endl;
      DeregisterSignalHandler();
      return 0;
    }

    AssertInput(parse_result.count(kToolOption) > 0, "Option --tool is required.");
    const ToolType tool = ToolOptionToEnum(parse_result[kToolOption].as<std::string>());

    Aws::SDKOptions options;
    const Aws::Utils::Logging::LogLevel log_level = VerbosityToLogLevel(parse_result[kVerbosityOption].as<int>());
    options.loggingOptions.logLevel = log_level;
    options.loggingOptions.logger_create_fn = [log_level]() {
      return std::make_shared<Aws::Utils::Logging::ConsoleLogSystem>(log_level);
    };

    Aws::InitAPI(options);
    std::optional<std::string> error_message;
    try {
      switch (tool) {
        case ToolType::kPreprocessObject:
          PreprocessObjectTool(parse_result);
          break;
        case ToolType::kPartitionObject:
          PartitionObjectTool(parse_result);
          break;
        default:
          Fail("The tool '" + parse_result[kToolOption].as<std::string>() + "' is not implemented!");
      }
    } catch (const std::exception& exception) {
      // The SDK must be shut down before the process exits, also on failure.
      error_message = exception.what();
    }
    Aws::ShutdownAPI(options);

    if (error_message.has_value()) {
      std::cerr << *error_message << std::endl;
      exit_code = 1;
    }
  } catch (const std::bad_optional_access& optional_error) {
    std::cerr << "Found no matching tool for name '" + parse_result[kToolOption].as<std::string>() + "'" << std::endl;
    exit_code = 1;
  } catch (const std::exception& exception) {
    // Handle cxxopts exceptions and invalid input.
    std::cerr << exception.what() << std::endl;
    exit_code = 1;
  }
  DeregisterSignalHandler();
  return exit_code;
}
