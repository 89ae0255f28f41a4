#pragma once

#include <stdexcept>
#include <string>

namespace arguments {

/**
 * @brief Kind of a recoverable command-line error.
 */
enum class UsageErrorKind {
  kDuplicateArgument,
  kMultipleScripts,
  kInvalidVerbosity,
};

/**
 * @brief A usage error recorded while parsing. The text is meant for the
 * terminal.
 */
struct UsageError {
  UsageErrorKind kind;
  std::string message;
};

/**
 * @brief Thrown when a flag option is given a value other than true/false.
 * Unlike UsageError this aborts the whole parse.
 */
class InvalidBooleanError : public std::runtime_error {
public:
  InvalidBooleanError(const std::string &name, const std::string &value);

  const std::string &GetName() const { return name_; }
  const std::string &GetValue() const { return value_; }

private:
  std::string name_;
  std::string value_;
};

} // namespace arguments
