#include "infrastructure/config/Config_Toml.hpp"
#include "domain/Settings.hpp"
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <fstream>

using shielded::recv::infrastructure::config::Config_Toml;
using shielded::recv::domain::Settings;
namespace fs = boost::filesystem;

static fs::path tmp_file(const std::string& name) {
  auto dir = fs::temp_directory_path() / "shielded-recv-tests";
  fs::create_directories(dir);
  return dir / name;
}

TEST(ConfigToml, CreatesWithDefaultsWhenMissing) {
  auto cfg = tmp_file("missing.toml");
  if (fs::exists(cfg)) fs::remove(cfg);

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_TRUE(fs::exists(cfg));
  EXPECT_EQ(s.configPath, cfg.string());
  EXPECT_EQ(s.chain.addressPrefix, "tnam");
  EXPECT_FALSE(s.chain.maspAddress.empty());
  EXPECT_FALSE(s.chain.ibcAddress.empty());
  EXPECT_FALSE(s.appLogFilename.empty());
  EXPECT_FALSE(s.packetLogFilename.empty());
  EXPECT_FALSE(s.logsDir.empty());
  EXPECT_EQ(s.logLevel, "info");

  // the generated file loads back to the same chain settings
  Settings again = impl.load_or_create(cfg.string());
  EXPECT_EQ(again.chain.maspAddress, s.chain.maspAddress);
  EXPECT_EQ(again.chain.ibcAddress, s.chain.ibcAddress);
  EXPECT_EQ(again.chain.relayer, s.chain.relayer);
}

TEST(ConfigToml, ReadsCustomValues) {
  auto cfg = tmp_file("custom.toml");
  {
    std::ofstream out(cfg.string());
    out << "[chain]\naddressPrefix=\"tpknam\"\nmaspAddress=\"pool\"\nibcAddress=\"ibc\"\n"
           "relayer=\"me\"\n"
           "\n[logging]\nshowConsole=true\nsaveLog=false\nsavePacketLog=false\nlevel=\"debug\"\n"
           "logsDir=\"logs-x\"\nappLogFilename=\"a.log\"\npacketLogFilename=\"p.log\"\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  EXPECT_EQ(s.chain.addressPrefix, "tpknam");
  EXPECT_EQ(s.chain.maspAddress, "pool");
  EXPECT_EQ(s.chain.ibcAddress, "ibc");
  EXPECT_EQ(s.chain.relayer, "me");
  EXPECT_TRUE(s.showConsole);
  EXPECT_FALSE(s.saveLog);
  EXPECT_FALSE(s.savePacketLog);
  EXPECT_EQ(s.logLevel, "debug");
  EXPECT_EQ(s.logsDir, "logs-x");
  EXPECT_EQ(s.appLogFilename, "a.log");
  EXPECT_EQ(s.packetLogFilename, "p.log");
}

TEST(ConfigToml, FallbackWhenSectionMissing) {
  auto cfg = tmp_file("no-logging.toml");
  {
    std::ofstream out(cfg.string());
    out << "[chain]\nmaspAddress=\"\"\n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());

  const Settings d;
  EXPECT_EQ(s.chain.maspAddress, d.chain.maspAddress);
  EXPECT_FALSE(s.logsDir.empty());
  EXPECT_FALSE(s.appLogFilename.empty());
  EXPECT_FALSE(s.packetLogFilename.empty());
}

TEST(ConfigToml, RecreatesUnparsableFile) {
  auto cfg = tmp_file("broken.toml");
  {
    std::ofstream out(cfg.string());
    out << "[chain\nmaspAddress = = \n";
  }

  Config_Toml impl;
  Settings s = impl.load_or_create(cfg.string());
  EXPECT_EQ(s.chain.addressPrefix, "tnam");

  // the rewritten file parses now
  Settings again = impl.load_or_create(cfg.string());
  EXPECT_EQ(again.chain.maspAddress, s.chain.maspAddress);
}
