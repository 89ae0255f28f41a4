#include "log.hpp"

namespace loger {

namespace {
utils::verbose::Verbosity RequiredVerbosity(LogLevel level) {
  using utils::verbose::Verbosity;
  switch (level) {
  case LogLevel::kError:
    return Verbosity::kQuiet;
  case LogLevel::kWarning:
    return Verbosity::kMinimal;
  case LogLevel::kInformation:
    return Verbosity::kNormal;
  case LogLevel::kVerbose:
    return Verbosity::kVerbose;
  case LogLevel::kDebug:
    return Verbosity::kDiagnostic;
  }
  return Verbosity::kNormal;
}
} // namespace

Log::Log(std::ostream &out, std::ostream &err,
         utils::verbose::Verbosity verbosity)
    : out_(out), err_(err), verbosity_(verbosity) {}

utils::verbose::Verbosity Log::GetVerbosity() const { return verbosity_; }

void Log::SetVerbosity(utils::verbose::Verbosity verbosity) {
  verbosity_ = verbosity;
}

bool Log::IsEnabled(LogLevel level) const {
  return static_cast<int>(verbosity_) >=
         static_cast<int>(RequiredVerbosity(level));
}

void Log::Write(LogLevel level, std::string_view message) {
  if (!IsEnabled(level)) {
    return;
  }
  switch (level) {
  case LogLevel::kError:
    err_ << fmt::format("Error: {}", message) << std::endl;
    break;
  case LogLevel::kWarning:
    err_ << fmt::format("Warning: {}", message) << std::endl;
    break;
  default:
    out_ << message << std::endl;
    break;
  }
}

} // namespace loger
