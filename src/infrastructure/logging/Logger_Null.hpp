#pragma once
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"

namespace shielded::recv::infrastructure::logging
{

// Discards everything. For hosts that wire the chain without logging.
class Logger_Null final : public shielded::recv::application::ports::ILogger
{
 public:
  void init(const shielded::recv::domain::Settings&) override {}
  void app(shielded::recv::application::ports::LogLevel, const std::string&) override {}
  void packet(shielded::recv::application::ports::LogLevel, std::string_view) override {}
};

}  // namespace shielded::recv::infrastructure::logging
