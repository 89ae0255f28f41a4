#include "arguments_parser.hpp"

#include "../utils/strings/strings.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include <utility>

namespace arguments {

ParseResult ArgumentsParser::Parse(int argc, char **argv) const {
  if (argc > 0 && argv == nullptr) {
    throw std::invalid_argument("argv must not be null");
  }
  std::vector<std::string> args;
  for (int i = 1; i < argc; i++) {
    args.emplace_back(argv[i] ? argv[i] : "");
  }
  return Parse(args);
}

ParseResult ArgumentsParser::Parse(const std::vector<std::string> &args) const {
  ParseResult result;
  if (args.empty()) {
    result.settings.script = std::string(kDefaultScriptPath);
    return result;
  }

  auto phase = ParsePhase::kScriptOrOption;
  for (const auto &argument : args) {
    auto value = utils::strings::UnQuote(argument);

    switch (phase) {
    case ParsePhase::kScriptOrOption: {
      phase = ParsePhase::kOptionsOnly;
      if (IsOption(value)) {
        if (!ParseOption(value, result)) {
          result.settings.has_error = true;
          return result;
        }
        result.settings.script = std::string(kDefaultScriptPath);
        break;
      }
      result.settings.script = value;
      break;
    }
    case ParsePhase::kOptionsOnly: {
      if (!IsOption(value)) {
        AddError(result, UsageErrorKind::kMultipleScripts,
                 "More than one build script specified.");
        return result;
      }
      if (!ParseOption(value, result)) {
        result.settings.has_error = true;
        return result;
      }
      break;
    }
    }
  }
  return result;
}

bool ArgumentsParser::IsOption(const std::string &argument) {
  if (utils::strings::IsBlank(argument)) {
    return false;
  }
  return argument[0] == '-';
}

bool ArgumentsParser::ParseOption(const std::string &argument,
                                  ParseResult &result) const {
  std::string::size_type name_index = argument.rfind("--", 0) == 0 ? 2 : 1;
  auto separator_index = argument.find('=');
  if (separator_index == std::string::npos) {
    return ParseOption(argument.substr(name_index), "", result);
  }
  return ParseOption(
      argument.substr(name_index, separator_index - name_index),
      utils::strings::UnQuote(argument.substr(separator_index + 1)), result);
}

bool ArgumentsParser::ParseOption(const std::string &name,
                                  const std::string &value,
                                  ParseResult &result) const {
  auto &settings = result.settings;
  switch (ParseOptionKind(name)) {
  case OptionKind::kVerbosity:
    ParseVerbosity(value, result);
    break;
  case OptionKind::kShowDescription:
    settings.show_description = ParseBooleanValue(name, value);
    break;
  case OptionKind::kDryRun:
    settings.perform_dry_run = ParseBooleanValue(name, value);
    break;
  case OptionKind::kHelp:
    settings.show_help = ParseBooleanValue(name, value);
    break;
  case OptionKind::kVersion:
    settings.show_version = ParseBooleanValue(name, value);
    break;
  case OptionKind::kDebug:
    settings.perform_debug = ParseBooleanValue(name, value);
    break;
  case OptionKind::kMono:
    settings.mono = ParseBooleanValue(name, value);
    break;
  case OptionKind::kBootstrap:
    settings.bootstrap = ParseBooleanValue(name, value);
    break;
  case OptionKind::kPassthrough:
    break;
  }

  if (!settings.AddArgument(name, value)) {
    AddError(result, UsageErrorKind::kDuplicateArgument,
             fmt::format("Multiple arguments with the same name ({}).", name));
    return false;
  }
  return true;
}

// The only recorded error that does not stop the parse.
void ArgumentsParser::ParseVerbosity(const std::string &value,
                                     ParseResult &result) const {
  auto verbosity = verbosity_parser_.TryParse(value);
  if (!verbosity.has_value()) {
    result.settings.verbosity = utils::verbose::Verbosity::kNormal;
    AddError(result, UsageErrorKind::kInvalidVerbosity,
             fmt::format("The value '{}' is not a valid verbosity. Valid "
                         "values are: {}.",
                         value, utils::verbose::VerbosityParser::AcceptedValues()));
    return;
  }
  result.settings.verbosity = verbosity.value();
}

bool ArgumentsParser::ParseBooleanValue(const std::string &name,
                                        const std::string &value) {
  if (utils::strings::IsBlank(value)) {
    return true;
  }
  if (utils::strings::EqualsIgnoreCase(value, "true")) {
    return true;
  }
  if (utils::strings::EqualsIgnoreCase(value, "false")) {
    return false;
  }
  throw InvalidBooleanError(name, value);
}

void ArgumentsParser::AddError(ParseResult &result, UsageErrorKind kind,
                               std::string message) {
  result.settings.has_error = true;
  result.errors.push_back(UsageError{kind, std::move(message)});
}

} // namespace arguments
