#include "option_names.hpp"

#include "../utils/strings/strings.hpp"
#include <unordered_map>

namespace arguments {

namespace {
const std::unordered_map<std::string_view, OptionKind> kOptionNames{
    {"v", OptionKind::kVerbosity},
    {"verbosity", OptionKind::kVerbosity},
    {"s", OptionKind::kShowDescription},
    {"showdescription", OptionKind::kShowDescription},
    {"dryrun", OptionKind::kDryRun},
    {"noop", OptionKind::kDryRun},
    {"whatif", OptionKind::kDryRun},
    {"help", OptionKind::kHelp},
    {"?", OptionKind::kHelp},
    {"version", OptionKind::kVersion},
    {"ver", OptionKind::kVersion},
    {"debug", OptionKind::kDebug},
    {"d", OptionKind::kDebug},
    {"mono", OptionKind::kMono},
    {"bootstrap", OptionKind::kBootstrap},
};
} // namespace

OptionKind ParseOptionKind(std::string_view name) {
  auto it = kOptionNames.find(utils::strings::ToLower(name));
  if (it == kOptionNames.end()) {
    return OptionKind::kPassthrough;
  }
  return it->second;
}

} // namespace arguments
