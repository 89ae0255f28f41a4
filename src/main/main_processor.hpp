#pragma once

#include "../loger/log.hpp"
#include "arguments_parser.hpp"
#include "build_engine.hpp"
#include "launch_settings.hpp"

#include <iostream>

/**
 * @brief Class representing the main processor of the program.
 *
 * Parses the command line, reports usage errors, answers help and version
 * requests and otherwise hands the settings to the build engine.
 */
class MainProcessor {
public:
  /**
   * @brief Creates the processor.
   * @param engine The engine running the build script.
   * @param log The diagnostic sink.
   * @param out The stream receiving help and version output.
   */
  MainProcessor(BuildEngine &engine, loger::Log &log,
                std::ostream &out = std::cout);

  /**
   * @brief The main entry point of the program.
   * @param argc The number of command-line arguments.
   * @param argv An array of command-line argument strings.
   * @return The exit status of the program.
   */
  int main(int argc, char *argv[]);

  /**
   * @brief Handles parsed launch settings.
   * @param result The parse result.
   * @return The exit status of the program.
   */
  int HandleLaunchSettings(const arguments::ParseResult &result);

private:
  /**
   * @brief Reports the usage errors of a failed parse.
   * @param result The parse result.
   */
  void ReportUsageErrors(const arguments::ParseResult &result);

  BuildEngine &engine_;
  loger::Log &log_;
  std::ostream &out_;
};
