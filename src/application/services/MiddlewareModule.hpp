#pragma once

#include <memory>

#include "application/ports/IModule.hpp"

namespace shielded::recv::application::services
{

// A link in a middleware chain. Every hook is forwarded to `next` unchanged and
// its result returned as is; concrete middlewares override only the hooks they
// intercept.
class MiddlewareModule : public ports::IModule
{
 public:
  // Throws std::invalid_argument when `next` is null.
  explicit MiddlewareModule(std::unique_ptr<ports::IModule> next);

  ports::IModule& next() noexcept { return *next_; }
  const ports::IModule& next() const noexcept { return *next_; }

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
  std::unique_ptr<ports::IModule> next_;
};

}  // namespace shielded::recv::application::services
