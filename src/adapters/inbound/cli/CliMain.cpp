#include <exception>
#include <iostream>
#include <memory>

#include "application/services/Bootstrap.hpp"
#include "infrastructure/address/AddressCodec_Bech32m.hpp"
#include "infrastructure/codec/PacketFile_Json.hpp"
#include "infrastructure/config/Config_Toml.hpp"
#include "infrastructure/ledger/HostLedger_InMemory.hpp"
#include "infrastructure/logging/Logger_Spdlog.hpp"

namespace infra = shielded::recv::infrastructure;
namespace app_srv = shielded::recv::application::services;

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: " << argv[0] << " <config.toml> <packet.json>\n";
    return 1;
  }
  const std::string configPath = argv[1];
  const std::string packetPath = argv[2];

  infra::config::Config_Toml          cfg_impl;
  infra::logging::Logger_Spdlog       log_impl;
  infra::codec::PacketFile_Json       packet_impl;
  infra::ledger::HostLedger_InMemory  ledger_impl;

  app_srv::Bootstrap app{cfg_impl, log_impl, packet_impl, ledger_impl,
                         [](const shielded::recv::domain::Settings& s) {
                           return std::make_unique<infra::address::AddressCodec_Bech32m>(
                               s.chain.addressPrefix);
                         }};

  app_srv::RunReport report;
  try {
    report = app.run(configPath, packetPath);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  if (report.ack)
    std::cout << "ack: " << report.ack->as_string() << "\n";
  else
    std::cout << "ack: <none>\n";

  for (const auto& ev : report.extras.events) {
    std::cout << "event " << ev.kind;
    for (const auto& [k, v] : ev.attributes) std::cout << " " << k << "=" << v;
    std::cout << "\n";
  }
  for (const auto& [key, amount] : ledger_impl.balances())
    std::cout << "balance " << key.first << " " << key.second << " " << amount << "\n";
  for (const auto& addr : report.verifiers)
    std::cout << "verifier " << addr << "\n";

  return 0;
}
