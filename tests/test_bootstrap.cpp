#include "infrastructure/address/AddressCodec_Bech32m.hpp"
#include "infrastructure/codec/PacketFile_Json.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/ledger/HostLedger_InMemory.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"
#include "application/services/Bootstrap.hpp"
#include "test_support.hpp"
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <fstream>
#include <memory>

namespace infra      = shielded::recv::infrastructure;
namespace app_srv    = shielded::recv::application::services;
namespace t          = shielded::recv::testing;
namespace fs = boost::filesystem;

static fs::path tmp_dir() {
  auto dir = fs::temp_directory_path() / "shielded-recv-bootstrap";
  fs::create_directories(dir);
  return dir;
}

static std::string write_config(const std::string& name) {
  auto path = tmp_dir() / name;
  std::ofstream out(path.string());
  out << "[chain]\naddressPrefix=\"tnam\"\n"
      << "maspAddress=\"" << t::kMasp << "\"\n"
      << "ibcAddress=\"" << t::kIbc << "\"\n"
      << "relayer=\"" << t::kRelayer << "\"\n"
      << "\n[logging]\nshowConsole=false\nsaveLog=true\nsavePacketLog=true\nlevel=\"debug\"\n"
      << "logsDir=\"" << (tmp_dir() / "logs").generic_string() << "\"\n"
      << "appLogFilename=\"app.log\"\npacketLogFilename=\"packet.log\"\n";
  return path.string();
}

static std::string write_packet(const std::string& name, const std::string& receiver,
                                const std::string& memo) {
  auto path = tmp_dir() / name;
  std::ofstream out(path.string());
  const auto data = t::ics20_payload(receiver, memo);
  out << R"({"sequence":7,"source_port":"transfer","source_channel":"channel-0",)"
      << R"("destination_port":"transfer","destination_channel":"channel-1",)"
      << R"("data":)" << std::string(data.begin(), data.end()) << "}";
  return path.string();
}

static app_srv::Bootstrap make_app(infra::config::Config_Toml& cfg, infra::logging::Logger_Spdlog& log,
                                   infra::codec::PacketFile_Json& packets,
                                   infra::ledger::HostLedger_InMemory& ledger) {
  return app_srv::Bootstrap{cfg, log, packets, ledger,
                            [](const shielded::recv::domain::Settings& s) {
                              return std::make_unique<infra::address::AddressCodec_Bech32m>(
                                  s.chain.addressPrefix);
                            }};
}

TEST(Bootstrap, ShieldedReceiveToMaspMintsVoucher) {
  infra::config::Config_Toml cfg_impl;
  infra::logging::Logger_Spdlog log_impl;
  infra::codec::PacketFile_Json packet_impl;
  infra::ledger::HostLedger_InMemory ledger_impl;
  auto app = make_app(cfg_impl, log_impl, packet_impl, ledger_impl);

  const auto report = app.run(write_config("boot.toml"),
                              write_packet("to-masp.json", t::kMasp, t::kDirectiveMemo));

  ASSERT_TRUE(report.ack.has_value());
  EXPECT_EQ(report.ack->as_string(), R"({"result":"AQ=="})");
  ASSERT_FALSE(report.extras.events.empty());
  EXPECT_EQ(report.extras.events.front().kind, "fungible_token_packet");

  infra::address::AddressCodec_Bech32m codec{"tnam"};
  EXPECT_EQ(ledger_impl.balance(codec.decode(t::kMasp), "transfer/channel-1/uatom"),
            shielded::recv::domain::ibc::Amount{100});
  EXPECT_EQ(report.verifiers.count(codec.decode(t::kIbc)), 1u);

  EXPECT_TRUE(fs::exists(tmp_dir() / "logs" / "app.log"));
  EXPECT_TRUE(fs::exists(tmp_dir() / "logs" / "packet.log"));
}

TEST(Bootstrap, ShieldedReceiveToOtherAccountIsRefused) {
  infra::config::Config_Toml cfg_impl;
  infra::logging::Logger_Spdlog log_impl;
  infra::codec::PacketFile_Json packet_impl;
  infra::ledger::HostLedger_InMemory ledger_impl;
  auto app = make_app(cfg_impl, log_impl, packet_impl, ledger_impl);

  const auto report = app.run(write_config("boot.toml"),
                              write_packet("to-bob.json", t::kBob, t::kDirectiveMemo));

  ASSERT_TRUE(report.ack.has_value());
  EXPECT_FALSE(report.ack->is_success());
  EXPECT_NE(report.ack->as_string().find("is not the MASP"), std::string_view::npos);
  EXPECT_TRUE(report.extras.is_empty());
  EXPECT_TRUE(ledger_impl.balances().empty());
  EXPECT_TRUE(report.verifiers.empty());
}

TEST(Bootstrap, PlainTransferReachesTransparentAccount) {
  infra::config::Config_Toml cfg_impl;
  infra::logging::Logger_Spdlog log_impl;
  infra::codec::PacketFile_Json packet_impl;
  infra::ledger::HostLedger_InMemory ledger_impl;
  auto app = make_app(cfg_impl, log_impl, packet_impl, ledger_impl);

  const auto report = app.run(write_config("boot.toml"),
                              write_packet("plain.json", t::kBob, "thanks for lunch"));

  ASSERT_TRUE(report.ack.has_value());
  EXPECT_TRUE(report.ack->is_success());
  infra::address::AddressCodec_Bech32m codec{"tnam"};
  EXPECT_EQ(ledger_impl.balance(codec.decode(t::kBob), "transfer/channel-1/uatom"),
            shielded::recv::domain::ibc::Amount{100});
}

TEST(Bootstrap, MissingPacketFileThrows) {
  infra::config::Config_Toml cfg_impl;
  infra::logging::Logger_Spdlog log_impl;
  infra::codec::PacketFile_Json packet_impl;
  infra::ledger::HostLedger_InMemory ledger_impl;
  auto app = make_app(cfg_impl, log_impl, packet_impl, ledger_impl);

  const auto missing = (tmp_dir() / "does-not-exist.json").string();
  EXPECT_THROW(app.run(write_config("boot.toml"), missing), std::runtime_error);
}
