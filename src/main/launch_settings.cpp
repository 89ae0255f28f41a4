#include "launch_settings.hpp"

bool LaunchSettings::HasArgument(std::string_view name) const {
  return arguments.find(name) != arguments.end();
}

std::optional<std::string>
LaunchSettings::GetArgument(std::string_view name) const {
  auto it = arguments.find(name);
  if (it == arguments.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool LaunchSettings::AddArgument(const std::string &name,
                                 const std::string &value) {
  return arguments.emplace(name, value).second;
}
