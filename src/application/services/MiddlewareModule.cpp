#include "application/services/MiddlewareModule.hpp"

#include <stdexcept>
#include <utility>

namespace shielded::recv::application::services
{

using namespace shielded::recv::domain::ibc;

MiddlewareModule::MiddlewareModule(std::unique_ptr<ports::IModule> next) : next_(std::move(next))
{
  if (!next_) throw std::invalid_argument("middleware requires a next module");
}

// ---- channel open handshake --------------------------------------------------
MiddlewareModule::Version MiddlewareModule::on_chan_open_init_validate(
    Order order, const std::vector<ConnectionId>& connection_hops, const PortId& port_id,
    const ChannelId& channel_id, const Counterparty& counterparty, const Version& version)
{
  return next_->on_chan_open_init_validate(order, connection_hops, port_id, channel_id,
                                           counterparty, version);
}

std::pair<MiddlewareModule::Extras, MiddlewareModule::Version>
MiddlewareModule::on_chan_open_init_execute(Order order,
                                            const std::vector<ConnectionId>& connection_hops,
                                            const PortId& port_id, const ChannelId& channel_id,
                                            const Counterparty& counterparty,
                                            const Version& version)
{
  return next_->on_chan_open_init_execute(order, connection_hops, port_id, channel_id,
                                          counterparty, version);
}

MiddlewareModule::Version MiddlewareModule::on_chan_open_try_validate(
    Order order, const std::vector<ConnectionId>& connection_hops, const PortId& port_id,
    const ChannelId& channel_id, const Counterparty& counterparty,
    const Version& counterparty_version)
{
  return next_->on_chan_open_try_validate(order, connection_hops, port_id, channel_id,
                                          counterparty, counterparty_version);
}

std::pair<MiddlewareModule::Extras, MiddlewareModule::Version>
MiddlewareModule::on_chan_open_try_execute(Order order,
                                           const std::vector<ConnectionId>& connection_hops,
                                           const PortId& port_id, const ChannelId& channel_id,
                                           const Counterparty& counterparty,
                                           const Version& counterparty_version)
{
  return next_->on_chan_open_try_execute(order, connection_hops, port_id, channel_id,
                                         counterparty, counterparty_version);
}

void MiddlewareModule::on_chan_open_ack_validate(const PortId& port_id,
                                                 const ChannelId& channel_id,
                                                 const Version& counterparty_version)
{
  next_->on_chan_open_ack_validate(port_id, channel_id, counterparty_version);
}

MiddlewareModule::Extras MiddlewareModule::on_chan_open_ack_execute(
    const PortId& port_id, const ChannelId& channel_id, const Version& counterparty_version)
{
  return next_->on_chan_open_ack_execute(port_id, channel_id, counterparty_version);
}

void MiddlewareModule::on_chan_open_confirm_validate(const PortId& port_id,
                                                     const ChannelId& channel_id)
{
  next_->on_chan_open_confirm_validate(port_id, channel_id);
}

MiddlewareModule::Extras MiddlewareModule::on_chan_open_confirm_execute(
    const PortId& port_id, const ChannelId& channel_id)
{
  return next_->on_chan_open_confirm_execute(port_id, channel_id);
}

// ---- channel close -----------------------------------------------------------
void MiddlewareModule::on_chan_close_init_validate(const PortId& port_id,
                                                   const ChannelId& channel_id)
{
  next_->on_chan_close_init_validate(port_id, channel_id);
}

MiddlewareModule::Extras MiddlewareModule::on_chan_close_init_execute(
    const PortId& port_id, const ChannelId& channel_id)
{
  return next_->on_chan_close_init_execute(port_id, channel_id);
}

void MiddlewareModule::on_chan_close_confirm_validate(const PortId& port_id,
                                                      const ChannelId& channel_id)
{
  next_->on_chan_close_confirm_validate(port_id, channel_id);
}

MiddlewareModule::Extras MiddlewareModule::on_chan_close_confirm_execute(
    const PortId& port_id, const ChannelId& channel_id)
{
  return next_->on_chan_close_confirm_execute(port_id, channel_id);
}

// ---- packets -----------------------------------------------------------------
MiddlewareModule::RecvResult MiddlewareModule::on_recv_packet_execute(const Packet& packet,
                                                                      const Signer& relayer)
{
  return next_->on_recv_packet_execute(packet, relayer);
}

void MiddlewareModule::on_acknowledgement_packet_validate(const Packet& packet,
                                                          const Acknowledgement& ack,
                                                          const Signer& relayer)
{
  next_->on_acknowledgement_packet_validate(packet, ack, relayer);
}

MiddlewareModule::Extras MiddlewareModule::on_acknowledgement_packet_execute(
    const Packet& packet, const Acknowledgement& ack, const Signer& relayer)
{
  return next_->on_acknowledgement_packet_execute(packet, ack, relayer);
}

void MiddlewareModule::on_timeout_packet_validate(const Packet& packet, const Signer& relayer)
{
  next_->on_timeout_packet_validate(packet, relayer);
}

MiddlewareModule::Extras MiddlewareModule::on_timeout_packet_execute(const Packet& packet,
                                                                     const Signer& relayer)
{
  return next_->on_timeout_packet_execute(packet, relayer);
}

void MiddlewareModule::describe(std::ostream& os) const
{
  os << "MiddlewareModule { next: " << *next_ << " }";
}

}  // namespace shielded::recv::application::services
