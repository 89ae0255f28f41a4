#pragma once
#include "launch_settings.hpp"
#include "option_names.hpp"
#include "usage_error.hpp"
#include "../utils/verbose/verbosity.hpp"

#include <string>
#include <vector>

namespace arguments {

/**
 * @brief Outcome of a parse: the settings built so far and the usage
 * errors that were found.
 */
struct ParseResult {
  LaunchSettings settings;
  std::vector<UsageError> errors;

  bool HasError() const { return settings.has_error; }
};

/**
 * @class ArgumentsParser
 * @brief Class responsible for parsing command-line arguments and generating
 * launch settings.
 *
 * The first argument is the build script unless it is an option; every
 * following argument must be an option of the form `-name[=value]` or
 * `--name[=value]`.
 */
class ArgumentsParser {
public:
  /**
   * @brief Parses the command-line arguments and generates launch settings.
   * @param argc The number of command-line arguments, program name included.
   * @param argv The array of command-line arguments.
   * @return The parse result. Check HasError() before using the settings.
   * @throws std::invalid_argument if argv is null while argc is positive.
   * @throws InvalidBooleanError if a flag option has a non boolean value.
   */
  ParseResult Parse(int argc, char **argv) const;

  /**
   * @brief Parses the arguments following the program name.
   * @param args The arguments, program name excluded.
   * @return The parse result. Check HasError() before using the settings.
   * @throws InvalidBooleanError if a flag option has a non boolean value.
   */
  ParseResult Parse(const std::vector<std::string> &args) const;

  /**
   * @brief Checks if an argument is an option token (`-x` or `--x`).
   * @param argument The unquoted argument.
   * @return True for option tokens. Blank arguments are never options.
   */
  static bool IsOption(const std::string &argument);

  /**
   * @brief Parses a flag value.
   * @param name The option name, used for the error message.
   * @param value The option value.
   * @return True for a blank value or "true", false for "false".
   * @throws InvalidBooleanError for any other value.
   */
  static bool ParseBooleanValue(const std::string &name,
                                const std::string &value);

private:
  enum class ParsePhase {
    kScriptOrOption, ///< the first argument, may name the build script
    kOptionsOnly,
  };

  bool ParseOption(const std::string &argument, ParseResult &result) const;
  bool ParseOption(const std::string &name, const std::string &value,
                   ParseResult &result) const;
  void ParseVerbosity(const std::string &value, ParseResult &result) const;

  static void AddError(ParseResult &result, UsageErrorKind kind,
                       std::string message);

  utils::verbose::VerbosityParser verbosity_parser_;
};

} // namespace arguments
