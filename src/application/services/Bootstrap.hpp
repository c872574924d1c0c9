#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "application/ports/IAddressCodec.hpp"
#include "application/ports/IConfigProvider.hpp"
#include "application/ports/IHostLedger.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IPacketSource.hpp"
#include "domain/Address.hpp"
#include "domain/ibc/Acknowledgement.hpp"
#include "domain/ibc/ModuleExtras.hpp"

namespace shielded::recv::application::services {

struct RunReport {
  std::optional<domain::ibc::Acknowledgement> ack;
  domain::ibc::ModuleExtras extras;
  domain::VerifierSet verifiers;
};

// Loads settings, starts logging, builds the receive chain
// (ShieldedRecvModule -> TransferModule) over the host ledger and feeds it one
// packet.
struct Bootstrap {
  using CodecFactory =
      std::function<std::unique_ptr<ports::IAddressCodec>(const domain::Settings&)>;

  ports::IConfigProvider& cfg;
  ports::ILogger&         log;
  ports::IPacketSource&   packets;
  ports::IHostLedger&     ledger;
  CodecFactory            make_codec;

  static inline const char* b2s(bool b) { return b ? "true" : "false"; }

  // Throws on configuration / packet file errors and on module failures.
  RunReport run(const std::string& configPath, const std::string& packetPath);
};

} // namespace shielded::recv::application::services
