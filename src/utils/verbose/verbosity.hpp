#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace utils::verbose {

/**
 * @brief Amount of information the launcher and the build are allowed to
 * print. Levels are ordered: a message is shown when the configured level
 * is at least the level of the message.
 */
enum class Verbosity {
  kQuiet = 0,
  kMinimal = 1,
  kNormal = 2,
  kVerbose = 3,
  kDiagnostic = 4,
};

/**
 * @brief Returns the display name of a verbosity level ("Normal", ...).
 * @param verbosity The verbosity level.
 * @return The display name.
 */
std::string_view ToString(Verbosity verbosity);

/**
 * @class VerbosityParser
 * @brief Resolves verbosity names given on the command line.
 *
 * Accepts the full level names and their one letter abbreviations,
 * ignoring case: q[uiet], m[inimal], n[ormal], v[erbose], d[iagnostic].
 */
class VerbosityParser {
public:
  /**
   * @brief Resolves a verbosity name.
   * @param value The text to resolve.
   * @return The verbosity level if the text names one, otherwise
   * std::nullopt.
   */
  std::optional<Verbosity> TryParse(std::string_view value) const;

  /**
   * @brief Lists the accepted names for help output.
   * @return The accepted names, e.g. "q[uiet], m[inimal], ...".
   */
  static std::string AcceptedValues();
};

} // namespace utils::verbose
