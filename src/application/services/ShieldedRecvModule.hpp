#pragma once

#include <memory>
#include <string>

#include "application/ports/IAddressCodec.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IOverflowRecvContext.hpp"
#include "application/services/HostContext.hpp"
#include "application/services/MiddlewareModule.hpp"

namespace shielded::recv::application::services
{

// Middleware for packets received after a shielded swap.
//
// The swap result is not known when the transfer is initiated, so the MASP note
// covers only a minimum amount; the overflow-receive middleware deeper in the
// chain shields that target and sends the excess to a transparent overflow
// account, calling back into mint/unescrow below.
//
// This link only checks that a packet carrying a `shielded_recv` directive is
// addressed to the MASP. Every other hook, and every packet without the
// directive, goes to `next` untouched.
class ShieldedRecvModule final : public MiddlewareModule, public ports::IOverflowRecvContext
{
 public:
  ShieldedRecvModule(std::unique_ptr<ports::IModule> next, HostContext& host,
                     const ports::IAddressCodec& codec, ports::ILogger& log,
                     std::string masp_address);

  RecvResult on_recv_packet_execute(const domain::ibc::Packet& packet,
                                    const domain::ibc::Signer& relayer) override;

  // IOverflowRecvContext
  void mint_coins_execute(const domain::ibc::Signer& receiver,
                          const domain::ibc::Coin& coin) override;

  void unescrow_coins_execute(const domain::ibc::Signer& receiver,
                              const domain::ibc::PortId& port,
                              const domain::ibc::ChannelId& channel,
                              const domain::ibc::Coin& coin) override;

  const std::string& masp_address() const noexcept { return masp_address_; }

  void describe(std::ostream& os) const override;

 private:
  domain::Address decode_receiver(const domain::ibc::Signer& receiver) const;
  void log_undecodable_memo(const std::string& memo) const;

  HostContext& host_;
  const ports::IAddressCodec& codec_;
  ports::ILogger& log_;
  std::string masp_address_;
};

}  // namespace shielded::recv::application::services
