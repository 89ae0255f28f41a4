#include "loger/log.hpp"
#include "main/build_engine.hpp"
#include "main/main_processor.hpp"

#include <cstdlib>
#include <iostream>

namespace {
// Prints what would be built until the script engine is wired in.
class PrintingBuildEngine : public BuildEngine {
public:
  explicit PrintingBuildEngine(loger::Log &log) : log_(log) {}

  int Run(const LaunchSettings &settings) override {
    log_.Information("Script: {}", settings.script.string());
    if (settings.perform_dry_run) {
      log_.Information("Performing dry run.");
    }
    if (settings.show_description) {
      log_.Information("Showing task descriptions.");
    }
    if (settings.perform_debug) {
      log_.Information("Debug mode enabled.");
    }
    if (settings.mono) {
      log_.Information("Using the Mono script engine.");
    }
    if (settings.bootstrap) {
      log_.Information("Bootstrapping modules.");
    }
    return EXIT_SUCCESS;
  }

private:
  loger::Log &log_;
};
} // namespace

int main(int argc, char *argv[]) {
  loger::Log log;
  PrintingBuildEngine engine(log);
  MainProcessor processor(engine, log);
  return processor.main(argc, argv);
}
