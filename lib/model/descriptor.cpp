// envres/model/descriptor.cpp - Descriptor helpers
#include "envres/model/descriptor.hpp"

namespace envres
{

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept
{
  if (text == "DEBUG") return LogLevel::Debug;
  if (text == "INFO") return LogLevel::Info;
  if (text == "WARN") return LogLevel::Warn;
  if (text == "ERROR") return LogLevel::Error;
  return std::nullopt;
}

std::string_view to_string(LogLevel level) noexcept
{
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "INFO";
}

}  // namespace envres
