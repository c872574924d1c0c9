#include "application/services/TransferModule.hpp"

#include <string>
#include <utility>

#include "application/services/TokenTransferContext.hpp"
#include "domain/ibc/Errors.hpp"
#include "domain/transfer/PacketData.hpp"

namespace shielded::recv::application::services
{

using ports::LogLevel;
using namespace shielded::recv::domain::ibc;
using domain::transfer::TransferPacketData;

namespace
{
constexpr const char* kModuleName = "transfer";
constexpr const char* kPacketEvent = "fungible_token_packet";
constexpr const char* kDenomTraceEvent = "denomination_trace";
constexpr const char* kTimeoutEvent = "timeout";

std::pair<ModuleExtras, std::optional<Acknowledgement>> error_ack(const std::string& msg)
{
  return {ModuleExtras::empty(), Acknowledgement{AcknowledgementStatus::error(StatusValue{msg})}};
}

ModuleEvent packet_event(const TransferPacketData& data)
{
  return ModuleEvent{kPacketEvent,
                     {{"module", kModuleName},
                      {"sender", data.sender.as_str()},
                      {"receiver", data.receiver.as_str()},
                      {"denom", data.token.denom.to_string()},
                      {"amount", data.token.amount.to_string()},
                      {"memo", data.memo}}};
}

void require_unordered(Order order)
{
  if (order != Order::Unordered)
    throw ChannelError(std::string("ICS-20 requires an unordered channel, got ") +
                       to_string(order));
}

void require_version(const Version& v)
{
  if (v.as_str() != TransferModule::kVersion)
    throw ChannelError("unsupported ICS-20 version \"" + v.as_str() + "\", expected \"" +
                       TransferModule::kVersion + "\"");
}

TransferPacketData decode_or_throw(const Packet& packet)
{
  auto data = TransferPacketData::decode(packet.data);
  if (!data) throw PacketError("cannot unmarshal ICS-20 transfer packet data");
  return std::move(*data);
}
}  // namespace

// ---- channel open handshake --------------------------------------------------
TransferModule::Version TransferModule::on_chan_open_init_validate(
    Order order, const std::vector<ConnectionId>& /*connection_hops*/, const PortId& /*port_id*/,
    const ChannelId& /*channel_id*/, const Counterparty& /*counterparty*/, const Version& version)
{
  require_unordered(order);
  if (!version.empty()) require_version(version);
  return Version{kVersion};
}

std::pair<TransferModule::Extras, TransferModule::Version> TransferModule::on_chan_open_init_execute(
    Order /*order*/, const std::vector<ConnectionId>& /*connection_hops*/,
    const PortId& /*port_id*/, const ChannelId& /*channel_id*/,
    const Counterparty& /*counterparty*/, const Version& /*version*/)
{
  return {ModuleExtras::empty(), Version{kVersion}};
}

TransferModule::Version TransferModule::on_chan_open_try_validate(
    Order order, const std::vector<ConnectionId>& /*connection_hops*/, const PortId& /*port_id*/,
    const ChannelId& /*channel_id*/, const Counterparty& /*counterparty*/,
    const Version& counterparty_version)
{
  require_unordered(order);
  require_version(counterparty_version);
  return Version{kVersion};
}

std::pair<TransferModule::Extras, TransferModule::Version> TransferModule::on_chan_open_try_execute(
    Order /*order*/, const std::vector<ConnectionId>& /*connection_hops*/,
    const PortId& /*port_id*/, const ChannelId& /*channel_id*/,
    const Counterparty& /*counterparty*/, const Version& /*counterparty_version*/)
{
  return {ModuleExtras::empty(), Version{kVersion}};
}

void TransferModule::on_chan_open_ack_validate(const PortId& /*port_id*/,
                                               const ChannelId& /*channel_id*/,
                                               const Version& counterparty_version)
{
  require_version(counterparty_version);
}

TransferModule::Extras TransferModule::on_chan_open_ack_execute(const PortId& /*port_id*/,
                                                                const ChannelId& /*channel_id*/,
                                                                const Version& /*version*/)
{
  return ModuleExtras::empty();
}

void TransferModule::on_chan_open_confirm_validate(const PortId& /*port_id*/,
                                                   const ChannelId& /*channel_id*/)
{
}

TransferModule::Extras TransferModule::on_chan_open_confirm_execute(
    const PortId& /*port_id*/, const ChannelId& /*channel_id*/)
{
  return ModuleExtras::empty();
}

// ---- channel close -----------------------------------------------------------
void TransferModule::on_chan_close_init_validate(const PortId& port_id,
                                                 const ChannelId& channel_id)
{
  throw ChannelError("ICS-20 channel " + port_id.as_str() + "/" + channel_id.as_str() +
                     " cannot be closed by the application");
}

TransferModule::Extras TransferModule::on_chan_close_init_execute(
    const PortId& /*port_id*/, const ChannelId& /*channel_id*/)
{
  return ModuleExtras::empty();
}

void TransferModule::on_chan_close_confirm_validate(const PortId& /*port_id*/,
                                                    const ChannelId& /*channel_id*/)
{
}

TransferModule::Extras TransferModule::on_chan_close_confirm_execute(
    const PortId& /*port_id*/, const ChannelId& /*channel_id*/)
{
  return ModuleExtras::empty();
}

// ---- packets -----------------------------------------------------------------
TransferModule::RecvResult TransferModule::on_recv_packet_execute(const Packet& packet,
                                                                  const Signer& /*relayer*/)
{
  const auto data = TransferPacketData::decode(packet.data);
  if (!data) return error_ack("cannot unmarshal ICS-20 transfer packet data");

  const auto receiver = try_decode(data->receiver);
  if (!receiver)
    return error_ack("failed to parse receiver address \"" + data->receiver.as_str() + "\"");

  ModuleExtras extras;
  Coin coin = data->token;
  TokenTransferContext ctx{host_};
  try
  {
    if (coin.denom.has_prefix(packet.port_id_on_a, packet.chan_id_on_a))
    {
      // returning to its origin
      coin.denom.remove_prefix(packet.port_id_on_a, packet.chan_id_on_a);
      ctx.unescrow_coins_execute(*receiver, packet.port_id_on_b, packet.chan_id_on_b, coin);
    }
    else
    {
      coin.denom.add_prefix(packet.port_id_on_b, packet.chan_id_on_b);
      ctx.mint_coins_execute(*receiver, coin);
      extras.events.push_back(
          ModuleEvent{kDenomTraceEvent, {{"denom", coin.denom.to_string()}}});
    }
  }
  catch (const TokenTransferError& e)
  {
    log_.packet(LogLevel::warn,
                "transfer: seq " + std::to_string(packet.sequence) + ": " + e.what());
    return error_ack(e.what());
  }

  auto ev = packet_event(*data);
  ev.attributes.emplace_back("success", "true");
  extras.events.insert(extras.events.begin(), std::move(ev));
  log_.packet(LogLevel::info, "transfer: seq " + std::to_string(packet.sequence) + " credited " +
                                  coin.amount.to_string() + " " + coin.denom.to_string() + " to " +
                                  receiver->to_string());
  return {std::move(extras), Acknowledgement{AcknowledgementStatus::ics20_success()}};
}

void TransferModule::on_acknowledgement_packet_validate(const Packet& packet,
                                                        const Acknowledgement& ack,
                                                        const Signer& /*relayer*/)
{
  if (!AcknowledgementStatus::decode(ack))
    throw PacketError("cannot unmarshal ICS-20 acknowledgement");
  decode_or_throw(packet);
}

TransferModule::Extras TransferModule::on_acknowledgement_packet_execute(
    const Packet& packet, const Acknowledgement& ack, const Signer& /*relayer*/)
{
  const auto status = AcknowledgementStatus::decode(ack);
  if (!status) throw PacketError("cannot unmarshal ICS-20 acknowledgement");
  const auto data = decode_or_throw(packet);

  if (!status->is_successful()) refund(packet, data);

  auto ev = packet_event(data);
  ev.attributes.emplace_back(status->is_successful() ? "success" : "error",
                             status->value().as_str());
  ModuleExtras extras;
  extras.events.push_back(std::move(ev));
  return extras;
}

void TransferModule::on_timeout_packet_validate(const Packet& packet, const Signer& /*relayer*/)
{
  decode_or_throw(packet);
}

TransferModule::Extras TransferModule::on_timeout_packet_execute(const Packet& packet,
                                                                 const Signer& /*relayer*/)
{
  const auto data = decode_or_throw(packet);
  refund(packet, data);

  ModuleExtras extras;
  extras.events.push_back(ModuleEvent{kTimeoutEvent,
                                      {{"module", kModuleName},
                                       {"refund_receiver", data.sender.as_str()},
                                       {"refund_denom", data.token.denom.to_string()},
                                       {"refund_amount", data.token.amount.to_string()},
                                       {"memo", data.memo}}});
  return extras;
}

void TransferModule::refund(const Packet& packet, const TransferPacketData& data)
{
  const auto sender = try_decode(data.sender);
  if (!sender)
    throw PacketError("failed to parse sender address \"" + data.sender.as_str() + "\"");

  TokenTransferContext ctx{host_};
  try
  {
    // Tokens that left through this channel unprefixed were escrowed here;
    // vouchers were burned and are minted back.
    if (!data.token.denom.has_prefix(packet.port_id_on_a, packet.chan_id_on_a))
      ctx.unescrow_coins_execute(*sender, packet.port_id_on_a, packet.chan_id_on_a, data.token);
    else
      ctx.mint_coins_execute(*sender, data.token);
  }
  catch (const TokenTransferError& e)
  {
    throw PacketError(std::string("refund failed: ") + e.what());
  }
  log_.packet(LogLevel::info, "transfer: seq " + std::to_string(packet.sequence) + " refunded " +
                                  data.token.amount.to_string() + " " +
                                  data.token.denom.to_string() + " to " + sender->to_string());
}

std::optional<domain::Address> TransferModule::try_decode(const Signer& s) const
{
  try
  {
    return codec_.decode(s.as_str());
  }
  catch (const domain::AddressError&)
  {
    return std::nullopt;
  }
}

void TransferModule::describe(std::ostream& os) const { os << "TransferModule"; }

}  // namespace shielded::recv::application::services
