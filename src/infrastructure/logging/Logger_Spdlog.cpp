#include "infrastructure/logging/Logger_Spdlog.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#if defined(_WIN32)
#include <spdlog/sinks/msvc_sink.h>
#endif

#include <boost/filesystem.hpp>
#include <vector>

namespace fs = boost::filesystem;
using shielded::recv::application::ports::LogLevel;

namespace shielded::recv::infrastructure::logging {

namespace {
constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxFiles    = 3;
constexpr const char* kAppName     = "app";
constexpr const char* kPacketName  = "packet";
constexpr const char* kPattern     = "[%Y-%m-%d %H:%M:%S.%e] [%n] %^[%l]%$ %v";

// Console sink shared by both channels, colored per level. Null when disabled.
spdlog::sink_ptr make_console_sink(bool enabled) {
  if (!enabled) return nullptr;
#if defined(_WIN32)
  auto sink = std::make_shared<spdlog::sinks::wincolor_stdout_sink_mt>();
#else
  auto sink = std::make_shared<spdlog::sinks::ansicolor_stdout_sink_mt>();
  sink->set_color(spdlog::level::trace,    "\x1b[90m");
  sink->set_color(spdlog::level::debug,    "\x1b[36m");
  sink->set_color(spdlog::level::info,     "\x1b[32m");
  sink->set_color(spdlog::level::warn,     "\x1b[33m");
  sink->set_color(spdlog::level::err,      "\x1b[31m");
  sink->set_color(spdlog::level::critical, "\x1b[35m");
#endif
  sink->set_level(spdlog::level::debug);
  return sink;
}

// One named channel: an optional rotating file plus the shared sinks.
std::shared_ptr<spdlog::logger> make_channel(const char* name, const fs::path& file, bool save,
                                             const std::vector<spdlog::sink_ptr>& shared) {
  std::vector<spdlog::sink_ptr> sinks;
  if (save) {
    auto f = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file.string(), kMaxFileSize, kMaxFiles);
    f->set_level(spdlog::level::trace);
    sinks.push_back(std::move(f));
  }
  sinks.insert(sinks.end(), shared.begin(), shared.end());

  spdlog::drop(name);
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_pattern(kPattern);
  spdlog::register_logger(logger);
  return logger;
}
}  // namespace

// -------------------------------------------------------------------------------------------------
// map_level
//  - Converts ports::LogLevel to spdlog's native level enum.
// -------------------------------------------------------------------------------------------------
spdlog::level::level_enum Logger_Spdlog::map_level(LogLevel l) {
  switch (l) {
    case LogLevel::trace:    return spdlog::level::trace;
    case LogLevel::debug:    return spdlog::level::debug;
    case LogLevel::info:     return spdlog::level::info;
    case LogLevel::warn:     return spdlog::level::warn;
    case LogLevel::err:      return spdlog::level::err;
    case LogLevel::critical: return spdlog::level::critical;
    case LogLevel::off:      return spdlog::level::off;
  }
  return spdlog::level::info;
}

// -------------------------------------------------------------------------------------------------
// init(settings)
//  - "app" and "packet" channels, each with a rotating file when its save flag is set.
//  - Colored console sink shared by both when settings.showConsole is true.
//  - Synchronous loggers: packets are handled one at a time on the caller's thread.
//  - Calling it again replaces both channels.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::init(const shielded::recv::domain::Settings& s) {
  const fs::path dir = s.logsDir.empty() ? fs::path{"logs"} : fs::path{s.logsDir};
  if (s.saveLog || s.savePacketLog) {
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
  }

  std::vector<spdlog::sink_ptr> shared;
  if (auto console = make_console_sink(s.showConsole)) shared.push_back(console);
#if defined(_WIN32)
  auto msvc_sink = std::make_shared<spdlog::sinks::msvc_sink_mt>();
  msvc_sink->set_level(spdlog::level::debug);
  shared.push_back(msvc_sink);
#endif

  app_ = make_channel(kAppName,
                      dir / (s.appLogFilename.empty() ? "shielded_recv_app.log" : s.appLogFilename),
                      s.saveLog, shared);
  packet_ = make_channel(kPacketName,
                         dir / (s.packetLogFilename.empty() ? "shielded_recv_packet.log"
                                                            : s.packetLogFilename),
                         s.savePacketLog, shared);

  // spdlog maps unknown names to "off"; keep info instead.
  auto level = spdlog::level::from_str(s.logLevel);
  if (level == spdlog::level::off && s.logLevel != "off") level = spdlog::level::info;
  app_->set_level(level);
  packet_->set_level(level);

  // Rejections are warnings on the packet channel; get them on disk right away.
  app_->flush_on(spdlog::level::err);
  packet_->flush_on(spdlog::level::warn);
}

// -------------------------------------------------------------------------------------------------
// app(level, msg)
//  - Lifecycle and configuration messages.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::app(LogLevel level, const std::string& msg) {
  if (app_) app_->log(map_level(level), msg);
}

// -------------------------------------------------------------------------------------------------
// packet(level, msg)
//  - Per-packet decisions taken by the modules.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::packet(LogLevel level, std::string_view msg) {
  if (packet_) packet_->log(map_level(level), msg);
}

// -------------------------------------------------------------------------------------------------
// set_level(level)
//  - Adjusts both channels at runtime.
// -------------------------------------------------------------------------------------------------
void Logger_Spdlog::set_level(LogLevel level) {
  const auto lv = map_level(level);
  if (app_)    app_->set_level(lv);
  if (packet_) packet_->set_level(lv);
}

} // namespace shielded::recv::infrastructure::logging
