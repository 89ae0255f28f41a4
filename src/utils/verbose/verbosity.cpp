#include "verbosity.hpp"

#include "../strings/strings.hpp"
#include <unordered_map>

namespace utils::verbose {

namespace {
const std::unordered_map<std::string_view, Verbosity> kVerbosityNames{
    {"q", Verbosity::kQuiet},       {"quiet", Verbosity::kQuiet},
    {"m", Verbosity::kMinimal},     {"minimal", Verbosity::kMinimal},
    {"n", Verbosity::kNormal},      {"normal", Verbosity::kNormal},
    {"v", Verbosity::kVerbose},     {"verbose", Verbosity::kVerbose},
    {"d", Verbosity::kDiagnostic},  {"diagnostic", Verbosity::kDiagnostic},
};
} // namespace

std::string_view ToString(Verbosity verbosity) {
  switch (verbosity) {
  case Verbosity::kQuiet:
    return "Quiet";
  case Verbosity::kMinimal:
    return "Minimal";
  case Verbosity::kNormal:
    return "Normal";
  case Verbosity::kVerbose:
    return "Verbose";
  case Verbosity::kDiagnostic:
    return "Diagnostic";
  }
  return "Normal";
}

std::optional<Verbosity> VerbosityParser::TryParse(std::string_view value) const {
  auto it = kVerbosityNames.find(utils::strings::ToLower(value));
  if (it == kVerbosityNames.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string VerbosityParser::AcceptedValues() {
  return "q[uiet], m[inimal], n[ormal], v[erbose], d[iagnostic]";
}

} // namespace utils::verbose
