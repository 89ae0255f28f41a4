#include "main_processor.hpp"

#include "help.hpp"
#include <cstdlib>
#include <stdexcept>

MainProcessor::MainProcessor(BuildEngine &engine, loger::Log &log,
                             std::ostream &out)
    : engine_(engine), log_(log), out_(out) {}

int MainProcessor::main(int argc, char *argv[]) {
  arguments::ArgumentsParser parser;
  arguments::ParseResult result;
  try {
    result = parser.Parse(argc, argv);
  } catch (const arguments::InvalidBooleanError &error) {
    log_.Error("{}", error.what());
    return EXIT_FAILURE;
  } catch (const std::invalid_argument &error) {
    log_.Error("Invalid input: {}", error.what());
    return EXIT_FAILURE;
  }
  return HandleLaunchSettings(result);
}

int MainProcessor::HandleLaunchSettings(const arguments::ParseResult &result) {
  if (result.HasError()) {
    ReportUsageErrors(result);
    PrintHelp(out_);
    return EXIT_FAILURE;
  }

  const auto &settings = result.settings;
  log_.SetVerbosity(settings.verbosity);

  if (settings.show_help) {
    PrintHelp(out_);
    return EXIT_SUCCESS;
  }

  if (settings.show_version) {
    PrintVersion(out_);
    return EXIT_SUCCESS;
  }

  log_.Verbose("Build script: {}", settings.script.string());
  log_.Verbose("Verbosity: {}", utils::verbose::ToString(settings.verbosity));
  for (const auto &[name, value] : settings.arguments) {
    log_.Debug("Argument {}={}", name, value);
  }
  return engine_.Run(settings);
}

void MainProcessor::ReportUsageErrors(const arguments::ParseResult &result) {
  for (const auto &error : result.errors) {
    log_.Error("{}", error.message);
  }
}
