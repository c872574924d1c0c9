#pragma once

#include <optional>
#include <ostream>
#include <utility>
#include <vector>

#include "domain/ibc/Acknowledgement.hpp"
#include "domain/ibc/Channel.hpp"
#include "domain/ibc/Identifiers.hpp"
#include "domain/ibc/ModuleExtras.hpp"
#include "domain/ibc/Packet.hpp"
#include "domain/ibc/Signer.hpp"

namespace shielded::recv::application::ports
{

// IBC application callbacks, one per hook the protocol engine drives.
//
// Validate hooks throw domain::ibc::ChannelError / PacketError to reject.
// Execute hooks run after validation succeeded and report what happened
// through ModuleExtras.
struct IModule
{
  using Version = domain::ibc::Version;
  using Extras = domain::ibc::ModuleExtras;
  using RecvResult = std::pair<Extras, std::optional<domain::ibc::Acknowledgement>>;

  virtual ~IModule() = default;

  // ---- channel open handshake ----------------------------------------------
  virtual Version on_chan_open_init_validate(
      domain::ibc::Order order, const std::vector<domain::ibc::ConnectionId>& connection_hops,
      const domain::ibc::PortId& port_id, const domain::ibc::ChannelId& channel_id,
      const domain::ibc::Counterparty& counterparty, const Version& version) = 0;

  virtual std::pair<Extras, Version> on_chan_open_init_execute(
      domain::ibc::Order order, const std::vector<domain::ibc::ConnectionId>& connection_hops,
      const domain::ibc::PortId& port_id, const domain::ibc::ChannelId& channel_id,
      const domain::ibc::Counterparty& counterparty, const Version& version) = 0;

  virtual Version on_chan_open_try_validate(
      domain::ibc::Order order, const std::vector<domain::ibc::ConnectionId>& connection_hops,
      const domain::ibc::PortId& port_id, const domain::ibc::ChannelId& channel_id,
      const domain::ibc::Counterparty& counterparty, const Version& counterparty_version) = 0;

  virtual std::pair<Extras, Version> on_chan_open_try_execute(
      domain::ibc::Order order, const std::vector<domain::ibc::ConnectionId>& connection_hops,
      const domain::ibc::PortId& port_id, const domain::ibc::ChannelId& channel_id,
      const domain::ibc::Counterparty& counterparty, const Version& counterparty_version) = 0;

  virtual void on_chan_open_ack_validate(const domain::ibc::PortId& port_id,
                                         const domain::ibc::ChannelId& channel_id,
                                         const Version& counterparty_version) = 0;

  virtual Extras on_chan_open_ack_execute(const domain::ibc::PortId& port_id,
                                          const domain::ibc::ChannelId& channel_id,
                                          const Version& counterparty_version) = 0;

  virtual void on_chan_open_confirm_validate(const domain::ibc::PortId& port_id,
                                             const domain::ibc::ChannelId& channel_id) = 0;

  virtual Extras on_chan_open_confirm_execute(const domain::ibc::PortId& port_id,
                                              const domain::ibc::ChannelId& channel_id) = 0;

  // ---- channel close -------------------------------------------------------
  virtual void on_chan_close_init_validate(const domain::ibc::PortId& port_id,
                                           const domain::ibc::ChannelId& channel_id) = 0;

  virtual Extras on_chan_close_init_execute(const domain::ibc::PortId& port_id,
                                            const domain::ibc::ChannelId& channel_id) = 0;

  virtual void on_chan_close_confirm_validate(const domain::ibc::PortId& port_id,
                                              const domain::ibc::ChannelId& channel_id) = 0;

  virtual Extras on_chan_close_confirm_execute(const domain::ibc::PortId& port_id,
                                               const domain::ibc::ChannelId& channel_id) = 0;

  // ---- packets -------------------------------------------------------------
  // An absent acknowledgement means it is written asynchronously later.
  virtual RecvResult on_recv_packet_execute(const domain::ibc::Packet& packet,
                                            const domain::ibc::Signer& relayer) = 0;

  virtual void on_acknowledgement_packet_validate(const domain::ibc::Packet& packet,
                                                  const domain::ibc::Acknowledgement& ack,
                                                  const domain::ibc::Signer& relayer) = 0;

  virtual Extras on_acknowledgement_packet_execute(const domain::ibc::Packet& packet,
                                                   const domain::ibc::Acknowledgement& ack,
                                                   const domain::ibc::Signer& relayer) = 0;

  virtual void on_timeout_packet_validate(const domain::ibc::Packet& packet,
                                          const domain::ibc::Signer& relayer) = 0;

  virtual Extras on_timeout_packet_execute(const domain::ibc::Packet& packet,
                                           const domain::ibc::Signer& relayer) = 0;

  // ---- debug ---------------------------------------------------------------
  virtual void describe(std::ostream& os) const = 0;
};

inline std::ostream& operator<<(std::ostream& os, const IModule& m)
{
  m.describe(os);
  return os;
}

}  // namespace shielded::recv::application::ports
