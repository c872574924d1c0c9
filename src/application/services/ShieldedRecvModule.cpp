#include "application/services/ShieldedRecvModule.hpp"

#include <span>
#include <utility>

#include "application/services/TokenTransferContext.hpp"
#include "domain/metadata/PacketMetadata.hpp"
#include "domain/metadata/ShieldedRecvError.hpp"
#include "domain/transfer/PacketData.hpp"
#include "shared/hex/Hex.hpp"
#include "shared/json/Json.hpp"
#include "shared/text/Utf8.hpp"

namespace shielded::recv::application::services
{

using ports::LogLevel;
using namespace shielded::recv::domain::ibc;
using domain::metadata::PacketMetadata;
using domain::metadata::ShieldedRecvError;
using domain::transfer::TransferPacketData;

ShieldedRecvModule::ShieldedRecvModule(std::unique_ptr<ports::IModule> next, HostContext& host,
                                       const ports::IAddressCodec& codec, ports::ILogger& log,
                                       std::string masp_address)
    : MiddlewareModule(std::move(next)),
      host_(host),
      codec_(codec),
      log_(log),
      masp_address_(std::move(masp_address))
{
}

ShieldedRecvModule::RecvResult ShieldedRecvModule::on_recv_packet_execute(const Packet& packet,
                                                                          const Signer& relayer)
{
  const auto data = TransferPacketData::decode(packet.data);
  if (!data)
  {
    // not an ICS-20 packet
    log_.packet(LogLevel::trace,
                shared::hex::make_line("shielded-recv: pass-through, non-ICS-20 payload",
                                       std::as_bytes(std::span(packet.data))));
    return next().on_recv_packet_execute(packet, relayer);
  }

  if (!PacketMetadata::from_string(data->memo))
  {
    // not a shielded recv packet
    log_undecodable_memo(data->memo);
    return next().on_recv_packet_execute(packet, relayer);
  }

  if (data->receiver.as_str() != masp_address_)
  {
    const std::string msg = "Shielded receive error: Address " +
                            shared::text::debug_quote(data->receiver.as_str()) +
                            " is not the MASP";
    log_.packet(LogLevel::warn, "seq " + std::to_string(packet.sequence) + " on " +
                                    packet.chan_id_on_b.as_str() + ": " + msg);
    return {ModuleExtras::empty(),
            Acknowledgement{AcknowledgementStatus::error(StatusValue{msg})}};
  }

  log_.packet(LogLevel::debug, "seq " + std::to_string(packet.sequence) + " on " +
                                   packet.chan_id_on_b.as_str() +
                                   ": shielded receive directive accepted");
  return next().on_recv_packet_execute(packet, relayer);
}

// A memo that names the directive but fails to decode is most likely a client
// bug; anything else is just a memo meant for another layer.
void ShieldedRecvModule::log_undecodable_memo(const std::string& memo) const
{
  const auto obj = shared::json::parse_object(memo);
  if (obj && PacketMetadata::is_overflow_receive_msg(*obj))
  {
    log_.packet(LogLevel::warn,
                "shielded-recv: malformed shielded_recv directive ignored: " + memo);
    return;
  }
  log_.packet(LogLevel::debug, "shielded-recv: pass-through, no directive in memo");
}

domain::Address ShieldedRecvModule::decode_receiver(const Signer& receiver) const
{
  try
  {
    return codec_.decode(receiver.as_str());
  }
  catch (const domain::AddressError& e)
  {
    throw ShieldedRecvError::address_decode(e.what());
  }
}

void ShieldedRecvModule::mint_coins_execute(const Signer& receiver, const Coin& coin)
{
  const auto account = decode_receiver(receiver);
  TokenTransferContext ctx{host_};
  try
  {
    ctx.mint_coins_execute(account, coin);
  }
  catch (const TokenTransferError& e)
  {
    throw ShieldedRecvError::token_transfer(e);
  }
}

void ShieldedRecvModule::unescrow_coins_execute(const Signer& receiver, const PortId& port,
                                                const ChannelId& channel, const Coin& coin)
{
  const auto account = decode_receiver(receiver);
  TokenTransferContext ctx{host_};
  try
  {
    ctx.unescrow_coins_execute(account, port, channel, coin);
  }
  catch (const TokenTransferError& e)
  {
    throw ShieldedRecvError::token_transfer(e);
  }
}

void ShieldedRecvModule::describe(std::ostream& os) const
{
  os << "ShieldedRecvModule { next: " << next() << " }";
}

}  // namespace shielded::recv::application::services
