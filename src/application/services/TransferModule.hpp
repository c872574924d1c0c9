#pragma once

#include <optional>

#include "application/ports/IAddressCodec.hpp"
#include "application/ports/ILogger.hpp"
#include "application/ports/IModule.hpp"
#include "application/services/HostContext.hpp"

namespace shielded::recv::domain::transfer
{
struct TransferPacketData;  // fwd-decl
}

namespace shielded::recv::application::services
{

// ICS-20 fungible token transfer application: the terminal link of the chain.
//
// Receive: a denom prefixed with the sender's port/channel is coming home and
// is released from escrow; anything else gets this side's prefix and is minted
// as a voucher. Failures are written as error acknowledgements.
// Acknowledgement errors and timeouts refund the sender.
class TransferModule final : public ports::IModule
{
 public:
  static constexpr const char* kVersion = "ics20-1";

  TransferModule(HostContext& host, const ports::IAddressCodec& codec, ports::ILogger& log)
      : host_(host), codec_(codec), log_(log)
  {
  }

  Version on_chan_open_init_validate(
      domain::ibc::Order order, const std::vector<domain::ibc::ConnectionId>& connection_hops,
      const domain::ibc::PortId& port_id, const domain::ibc::ChannelId& channel_id,
      const domain::ibc::Counterparty& counterparty, const Version& version) override;

  std::pair<Extras, Version> on_chan_open_init_execute(
      domain::ibc::Order order, const std::vector<domain::ibc::ConnectionId>& connection_hops,
      const domain::ibc::PortId& port_id, const domain::ibc::ChannelId& channel_id,
      const domain::ibc::Counterparty& counterparty, const Version& version) override;

  Version on_chan_open_try_validate(
      domain::ibc::Order order, const std::vector<domain::ibc::ConnectionId>& connection_hops,
      const domain::ibc::PortId& port_id, const domain::ibc::ChannelId& channel_id,
      const domain::ibc::Counterparty& counterparty, const Version& counterparty_version) override;

  std::pair<Extras, Version> on_chan_open_try_execute(
      domain::ibc::Order order, const std::vector<domain::ibc::ConnectionId>& connection_hops,
      const domain::ibc::PortId& port_id, const domain::ibc::ChannelId& channel_id,
      const domain::ibc::Counterparty& counterparty, const Version& counterparty_version) override;

  void on_chan_open_ack_validate(const domain::ibc::PortId& port_id,
                                 const domain::ibc::ChannelId& channel_id,
                                 const Version& counterparty_version) override;

  Extras on_chan_open_ack_execute(const domain::ibc::PortId& port_id,
                                  const domain::ibc::ChannelId& channel_id,
                                  const Version& counterparty_version) override;

  void on_chan_open_confirm_validate(const domain::ibc::PortId& port_id,
                                     const domain::ibc::ChannelId& channel_id) override;

  Extras on_chan_open_confirm_execute(const domain::ibc::PortId& port_id,
                                      const domain::ibc::ChannelId& channel_id) override;

  void on_chan_close_init_validate(const domain::ibc::PortId& port_id,
                                   const domain::ibc::ChannelId& channel_id) override;

  Extras on_chan_close_init_execute(const domain::ibc::PortId& port_id,
                                    const domain::ibc::ChannelId& channel_id) override;

  void on_chan_close_confirm_validate(const domain::ibc::PortId& port_id,
                                      const domain::ibc::ChannelId& channel_id) override;

  Extras on_chan_close_confirm_execute(const domain::ibc::PortId& port_id,
                                       const domain::ibc::ChannelId& channel_id) override;

  RecvResult on_recv_packet_execute(const domain::ibc::Packet& packet,
                                    const domain::ibc::Signer& relayer) override;

  void on_acknowledgement_packet_validate(const domain::ibc::Packet& packet,
                                          const domain::ibc::Acknowledgement& ack,
                                          const domain::ibc::Signer& relayer) override;

  Extras on_acknowledgement_packet_execute(const domain::ibc::Packet& packet,
                                           const domain::ibc::Acknowledgement& ack,
                                           const domain::ibc::Signer& relayer) override;

  void on_timeout_packet_validate(const domain::ibc::Packet& packet,
                                  const domain::ibc::Signer& relayer) override;

  Extras on_timeout_packet_execute(const domain::ibc::Packet& packet,
                                   const domain::ibc::Signer& relayer) override;

  void describe(std::ostream& os) const override;

 private:
  std::optional<domain::Address> try_decode(const domain::ibc::Signer& s) const;
  void refund(const domain::ibc::Packet& packet, const domain::transfer::TransferPacketData& data);

  HostContext& host_;
  const ports::IAddressCodec& codec_;
  ports::ILogger& log_;
};

}  // namespace shielded::recv::application::services
