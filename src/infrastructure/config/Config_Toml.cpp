#include "infrastructure/config/Config_Toml.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <exception>
#include <fstream>
#include <toml++/toml.hpp>

using shielded::recv::domain::Settings;
namespace fs = boost::filesystem;

namespace shielded::recv::infrastructure::config
{

namespace
{
constexpr const char* kDefaultLogsDir = "logs";
constexpr const char* kDefaultAppLog = "shielded_recv_app.log";
constexpr const char* kDefaultPacketLog = "shielded_recv_packet.log";
constexpr const char* kDefaultLevel = "info";

static const char* b2s(bool b) { return b ? "true" : "false"; }

static void fill_empty_with_defaults(Settings& s)
{
  const Settings d;
  if (s.logsDir.empty()) s.logsDir = kDefaultLogsDir;
  if (s.appLogFilename.empty()) s.appLogFilename = kDefaultAppLog;
  if (s.packetLogFilename.empty()) s.packetLogFilename = kDefaultPacketLog;
  if (s.logLevel.empty()) s.logLevel = kDefaultLevel;
  if (s.chain.addressPrefix.empty()) s.chain.addressPrefix = d.chain.addressPrefix;
  if (s.chain.maspAddress.empty()) s.chain.maspAddress = d.chain.maspAddress;
  if (s.chain.ibcAddress.empty()) s.chain.ibcAddress = d.chain.ibcAddress;
  if (s.chain.relayer.empty()) s.chain.relayer = d.chain.relayer;
}
}  // namespace

void Config_Toml::write_default(const fs::path& path, Settings& s)
{
  if (path.has_parent_path()) fs::create_directories(path.parent_path());
  std::ofstream out(path.string());

  // Header
  out << "# shielded-recv.toml - Auto-generated initial configuration\n"
         "# Edit as needed and run again\n\n";

  // [chain]
  out << "[chain]\n";
  out << "addressPrefix = \"" << s.chain.addressPrefix << "\"\n";
  out << "maspAddress   = \"" << s.chain.maspAddress << "\"\n";
  out << "ibcAddress    = \"" << s.chain.ibcAddress << "\"\n";
  out << "relayer       = \"" << s.chain.relayer << "\"\n\n";

  // [logging]
  out << "[logging]\n";
  out << "showConsole       = " << b2s(s.showConsole) << "\n";
  out << "saveLog           = " << b2s(s.saveLog) << "\n";
  out << "savePacketLog     = " << b2s(s.savePacketLog) << "\n";
  out << "level             = \"" << kDefaultLevel << "\"\n";
  out << "logsDir           = \"" << kDefaultLogsDir << "\"\n";
  out << "appLogFilename    = \"" << kDefaultAppLog << "\"\n";
  out << "packetLogFilename = \"" << kDefaultPacketLog << "\"\n";

  out.close();

  // mirror useful defaults back to Settings
  s.logLevel = kDefaultLevel;
  s.logsDir = kDefaultLogsDir;
  s.appLogFilename = kDefaultAppLog;
  s.packetLogFilename = kDefaultPacketLog;
}

Settings Config_Toml::load_or_create(const std::string& configPath)
{
  Settings s;
  s.configPath = configPath;
  const fs::path path{configPath};

  if (!fs::exists(path))
  {
    write_default(path, s);
    return s;
  }

  toml::table tbl;
  try
  {
    tbl = toml::parse_file(path.string());
  }
  catch (const std::exception&)
  {
    // if parsing fails, recreate with defaults
    write_default(path, s);
    return s;
  }

  // ---------------------------
  // [chain]
  // ---------------------------
  if (auto chain = tbl["chain"].as_table())
  {
    if (auto v = (*chain)["addressPrefix"].value<std::string>()) s.chain.addressPrefix = *v;
    if (auto v = (*chain)["maspAddress"].value<std::string>()) s.chain.maspAddress = *v;
    if (auto v = (*chain)["ibcAddress"].value<std::string>()) s.chain.ibcAddress = *v;
    if (auto v = (*chain)["relayer"].value<std::string>()) s.chain.relayer = *v;
  }

  // ---------------------------
  // [logging]
  // ---------------------------
  if (auto log = tbl["logging"].as_table())
  {
    if (auto v = (*log)["showConsole"].value<bool>()) s.showConsole = *v;
    if (auto v = (*log)["saveLog"].value<bool>()) s.saveLog = *v;
    if (auto v = (*log)["savePacketLog"].value<bool>()) s.savePacketLog = *v;
    if (auto v = (*log)["level"].value<std::string>()) s.logLevel = *v;
    if (auto v = (*log)["logsDir"].value<std::string>()) s.logsDir = *v;
    if (auto v = (*log)["appLogFilename"].value<std::string>()) s.appLogFilename = *v;
    if (auto v = (*log)["packetLogFilename"].value<std::string>()) s.packetLogFilename = *v;
  }

  // fallback defaults if not provided
  fill_empty_with_defaults(s);
  return s;
}

}  // namespace shielded::recv::infrastructure::config
