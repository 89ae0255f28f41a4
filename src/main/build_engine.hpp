#pragma once

#include "launch_settings.hpp"

/**
 * @brief Runs a build script with the parsed settings.
 */
class BuildEngine {
public:
  virtual ~BuildEngine() = default;

  /**
   * @brief Runs the build.
   * @param settings The parsed launch settings, free of errors.
   * @return The process exit status.
   */
  virtual int Run(const LaunchSettings &settings) = 0;
};
