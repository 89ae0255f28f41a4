#pragma once

#include "../utils/strings/strings.hpp"
#include "../utils/verbose/verbosity.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#ifndef CAKELAUNCH_DEFAULT_SCRIPT
#define CAKELAUNCH_DEFAULT_SCRIPT "./build.cake"
#endif

/// Script used when the command line names none.
inline constexpr std::string_view kDefaultScriptPath = CAKELAUNCH_DEFAULT_SCRIPT;

/**
 * @brief Options collected from the command line.
 */
struct LaunchSettings {
  using ArgumentMap =
      std::map<std::string, std::string, utils::strings::CaseInsensitiveLess>;

  std::filesystem::path script{std::string(kDefaultScriptPath)};
  utils::verbose::Verbosity verbosity = utils::verbose::Verbosity::kNormal;

  bool show_description = false;
  bool perform_dry_run = false;
  bool show_help = false;
  bool show_version = false;
  bool perform_debug = false;
  bool mono = false;
  bool bootstrap = false;

  // every option seen, by name as given; names compare case-insensitively
  ArgumentMap arguments;

  bool has_error = false;

  /**
   * @brief Checks if an option with the given name was supplied.
   * @param name The option name, any case.
   * @return True if the option was supplied.
   */
  bool HasArgument(std::string_view name) const;

  /**
   * @brief Returns the raw value of a supplied option.
   * @param name The option name, any case.
   * @return The value, empty for bare flags, or std::nullopt if the option
   * was not supplied.
   */
  std::optional<std::string> GetArgument(std::string_view name) const;

  /**
   * @brief Records an option value.
   * @param name The option name as given.
   * @param value The raw value.
   * @return False if an option with the same name is already recorded; the
   * map is left unchanged in that case.
   */
  bool AddArgument(const std::string &name, const std::string &value);
};
