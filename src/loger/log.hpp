#pragma once

#include "../utils/verbose/verbosity.hpp"

#include <fmt/core.h>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

/**
 * @brief Namespace containing the diagnostic output of the launcher.
 *
 * The `loger` namespace provides the `Log` sink used for every message the
 * launcher prints: usage errors, warnings and verbose progress output.
 */
namespace loger {

/**
 * @brief Severity attached to a single log message.
 */
enum class LogLevel {
  kError,
  kWarning,
  kInformation,
  kVerbose,
  kDebug,
};

/**
 * @class Log
 * @brief Leveled diagnostic sink formatting its messages with fmt.
 *
 * Errors and warnings are written to the error stream, everything else to
 * the output stream. A message is dropped when the configured verbosity is
 * lower than the verbosity its level requires; errors are never dropped.
 */
class Log {
public:
  /**
   * @brief Creates a sink writing to the given streams.
   * @param out Stream for informational messages.
   * @param err Stream for errors and warnings.
   * @param verbosity Initial verbosity.
   */
  Log(std::ostream &out = std::cout, std::ostream &err = std::cerr,
      utils::verbose::Verbosity verbosity =
          utils::verbose::Verbosity::kNormal);

  utils::verbose::Verbosity GetVerbosity() const;
  void SetVerbosity(utils::verbose::Verbosity verbosity);

  /**
   * @brief Writes an already formatted message.
   * @param level The message level.
   * @param message The message text.
   */
  void Write(LogLevel level, std::string_view message);

  template <typename... Args>
  void Error(fmt::format_string<Args...> format, Args &&...args) {
    Write(LogLevel::kError, fmt::format(format, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void Warning(fmt::format_string<Args...> format, Args &&...args) {
    Write(LogLevel::kWarning,
          fmt::format(format, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void Information(fmt::format_string<Args...> format, Args &&...args) {
    Write(LogLevel::kInformation,
          fmt::format(format, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void Verbose(fmt::format_string<Args...> format, Args &&...args) {
    Write(LogLevel::kVerbose,
          fmt::format(format, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void Debug(fmt::format_string<Args...> format, Args &&...args) {
    Write(LogLevel::kDebug, fmt::format(format, std::forward<Args>(args)...));
  }

private:
  /**
   * @brief Checks if a message of the given level passes the verbosity.
   * @param level The message level.
   * @return True if the message should be written.
   */
  bool IsEnabled(LogLevel level) const;

  std::ostream &out_;
  std::ostream &err_;
  utils::verbose::Verbosity verbosity_;
};

} // namespace loger
