#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

#include "application/ports/ILogger.hpp"
#include "domain/Settings.hpp"

namespace shielded::recv::infrastructure::logging
{

class Logger_Spdlog final : public shielded::recv::application::ports::ILogger
{
 public:
  void init(const shielded::recv::domain::Settings& s) override;

  void app(shielded::recv::application::ports::LogLevel level, const std::string& msg) override;

  void packet(shielded::recv::application::ports::LogLevel level, std::string_view msg) override;

  void set_level(shielded::recv::application::ports::LogLevel level);

 private:
  std::shared_ptr<spdlog::logger> app_;
  std::shared_ptr<spdlog::logger> packet_;

  // Helpers
  static spdlog::level::level_enum map_level(shielded::recv::application::ports::LogLevel l);
};

}  // namespace shielded::recv::infrastructure::logging
