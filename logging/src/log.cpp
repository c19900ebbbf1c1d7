#include "log.hpp"

namespace studio::log {

std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept {
  if (name == "off")     return LogLevel::kOff;
  if (name == "fatal")   return LogLevel::kFatal;
  if (name == "error")   return LogLevel::kError;
  if (name == "warn" || name == "warning") return LogLevel::kWarn;
  if (name == "info")    return LogLevel::kInfo;
  if (name == "debug")   return LogLevel::kDebug;
  if (name == "verbose") return LogLevel::kVerbose;
  return std::nullopt;
}

} // namespace studio::log
