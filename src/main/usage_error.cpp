#include "usage_error.hpp"

#include <fmt/core.h>

namespace arguments {

InvalidBooleanError::InvalidBooleanError(const std::string &name,
                                         const std::string &value)
    : std::runtime_error(fmt::format(
          "Argument value '{}' of option '{}' is not a valid boolean value.",
          value, name)),
      name_(name), value_(value) {}

} // namespace arguments
