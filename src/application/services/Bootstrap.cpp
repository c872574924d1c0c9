#include "application/services/Bootstrap.hpp"

#include <sstream>
#include <utility>

#include "application/services/HostContext.hpp"
#include "application/services/ShieldedRecvModule.hpp"
#include "application/services/TransferModule.hpp"
#include "domain/ibc/Signer.hpp"

namespace shielded::recv::application::services {

using ports::LogLevel;

RunReport Bootstrap::run(const std::string& configPath, const std::string& packetPath) {
  auto s = cfg.load_or_create(configPath);
  log.init(s);

  log.app(LogLevel::info, "shielded-recv started");
  log.app(LogLevel::info, std::string("Config file: ") + s.configPath);
  log.app(LogLevel::info, std::string("MASP address: ") + s.chain.maspAddress);

  std::ostringstream flags;
  flags << "Console: " << b2s(s.showConsole)
        << " | saveLog: " << b2s(s.saveLog)
        << " | savePacketLog: " << b2s(s.savePacketLog)
        << " | level: " << s.logLevel;
  log.app(LogLevel::info, flags.str());

  const auto codec = make_codec(s);
  const domain::Address ibc_account = codec->decode(s.chain.ibcAddress);

  RunReport report;
  HostContext host{ledger, report.verifiers, ibc_account};

  auto transfer = std::make_unique<TransferModule>(host, *codec, log);
  ShieldedRecvModule chain{std::move(transfer), host, *codec, log, s.chain.maspAddress};

  std::ostringstream desc;
  desc << chain;
  log.app(LogLevel::debug, "Chain: " + desc.str());

  const auto packet = packets.load(packetPath);
  log.app(LogLevel::info, "Packet " + std::to_string(packet.sequence) + " " +
                              packet.port_id_on_a.as_str() + "/" + packet.chan_id_on_a.as_str() +
                              " -> " + packet.port_id_on_b.as_str() + "/" +
                              packet.chan_id_on_b.as_str());

  auto [extras, ack] = chain.on_recv_packet_execute(packet, domain::ibc::Signer{s.chain.relayer});
  report.extras = std::move(extras);
  report.ack = std::move(ack);

  if (report.ack)
    log.app(report.ack->is_success() ? LogLevel::info : LogLevel::warn,
            "Acknowledgement: " + std::string(report.ack->as_string()));
  else
    log.app(LogLevel::info, "No synchronous acknowledgement");

  return report;
}

} // namespace shielded::recv::application::services
