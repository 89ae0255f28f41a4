#include "help.hpp"

#include "../utils/verbose/verbosity.hpp"
#include "../version/version.hpp"
#include <fmt/core.h>

void PrintHelp(std::ostream &out) {
  out << fmt::format("Usage: {0} [build-script] [-verbosity=value]\n"
                     "                  [-showdescription] [-dryrun] [..]\n"
                     "\n"
                     "Example: {0}\n"
                     "Example: {0} build.cake -verbosity=quiet\n"
                     "Example: {0} build.cake -showdescription\n"
                     "\n"
                     "Options:\n",
                     version::kName);
  out << fmt::format(
      "    -v, -verbosity=value     Specifies the amount of information to be "
      "displayed.\n"
      "                             ({})\n",
      utils::verbose::VerbosityParser::AcceptedValues());
  out << "    -d, -debug               Performs a debug.\n"
         "    -s, -showdescription     Shows description about tasks.\n"
         "    -dryrun, -noop, -whatif  Performs a dry run.\n"
         "    -ver, -version           Displays version information.\n"
         "    -?, -help                Displays usage information.\n"
         "    -mono                    Uses the Mono compiler rather than the "
         "Roslyn script engine.\n"
         "    -bootstrap               Download/install modules defined by "
         "#module directives.\n"
         "\n"
         "Flags accept an optional value: -name=true or -name=false.\n"
         "Any other -name=value is passed on to the build script.\n";
}

void PrintVersion(std::ostream &out) {
  out << fmt::format("{} version {}\n", version::kName, version::kVersion);
}
