#pragma once

#include <string>
#include <string_view>

#include "domain/Settings.hpp"

namespace shielded::recv::application::ports
{

enum class LogLevel
{
  trace,
  debug,
  info,
  warn,
  err,
  critical,
  off
};

// Two channels: `app` for lifecycle/configuration, `packet` for per-packet
// decisions taken by the modules.
struct ILogger
{
  virtual ~ILogger() = default;
  virtual void init(const shielded::recv::domain::Settings& s) = 0;
  virtual void app(LogLevel level, const std::string& msg) = 0;
  virtual void packet(LogLevel level, std::string_view msg) = 0;
};

}  // namespace shielded::recv::application::ports
