#pragma once

#include <string_view>

namespace arguments {

/**
 * @brief Effect an option has on the launch settings. Every name on the
 * command line resolves to exactly one kind.
 */
enum class OptionKind {
  kVerbosity,
  kShowDescription,
  kDryRun,
  kHelp,
  kVersion,
  kDebug,
  kMono,
  kBootstrap,
  kPassthrough, ///< not a launcher option, only recorded in the argument map
};

/**
 * @brief Resolves an option name, ignoring case.
 * @param name The option name without its leading dashes.
 * @return The option kind, kPassthrough for names the launcher does not
 * know.
 */
OptionKind ParseOptionKind(std::string_view name);

} // namespace arguments
