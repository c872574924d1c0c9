#pragma once

#include <cstdint>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "application/ports/IHostLedger.hpp"
#include "application/ports/IModule.hpp"
#include "domain/ibc/Errors.hpp"
#include "domain/transfer/PacketData.hpp"

namespace shielded::recv::testing
{

namespace ibc = shielded::recv::domain::ibc;
namespace ports = shielded::recv::application::ports;

inline constexpr const char* kMasp = "tnam1pcqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqzmefah";
inline constexpr const char* kIbc = "tnam1pvqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqn5xc0x";
inline constexpr const char* kAlice = "tnam1qqqsyqcyq5rqwzqfpg9scrgwpugpzysnzsf7k525";
inline constexpr const char* kBob = "tnam1qz46h2at4w46h2at4w46h2at4w46h2at4vgcj7rm";
inline constexpr const char* kRelayer = "tnam1qqg3zyg3zyg3zyg3zyg3zyg3zyg3zyg3zyznre5j";

inline std::vector<std::uint8_t> bytes_from(const std::string& s)
{
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

// transfer/channel-0 (counterparty) -> transfer/channel-1 (this chain)
inline ibc::Packet make_packet(std::vector<std::uint8_t> data, std::uint64_t seq = 1)
{
  return ibc::Packet{seq,
                     ibc::PortId{"transfer"},
                     ibc::ChannelId{"channel-0"},
                     ibc::PortId{"transfer"},
                     ibc::ChannelId{"channel-1"},
                     std::move(data)};
}

inline std::vector<std::uint8_t> ics20_payload(const std::string& receiver, const std::string& memo,
                                               const std::string& denom = "uatom",
                                               const std::string& amount = "100",
                                               const std::string& sender = "cosmos1sender")
{
  shielded::recv::domain::transfer::TransferPacketData d{
      ibc::Coin{ibc::PrefixedDenom::from_string(denom), ibc::Amount::from_string(amount)},
      ibc::Signer{sender}, ibc::Signer{receiver}, memo};
  return d.encode();
}

inline const char* kDirectiveMemo =
    R"({"shielded_recv":{"overflow_receiver":"alice","target_amount":"100"}})";

// ---------------------------------------------------------------------------
// RecordingModule: answers every hook with a recognizable value and records
// the hook name, so tests can tell whether (and how) it was reached.
// ---------------------------------------------------------------------------
struct RecordingModule final : ports::IModule
{
  std::vector<std::string> calls;

  static Extras marker(const std::string& hook)
  {
    Extras e;
    e.events.push_back(ibc::ModuleEvent{"recorded", {{"hook", hook}}});
    e.log.push_back("next:" + hook);
    return e;
  }

  static RecvResult recv_result()
  {
    return {marker("recv"), ibc::Acknowledgement{bytes_from(R"({"result":"bmV4dA=="})")}};
  }

  int count(const std::string& hook) const
  {
    int n = 0;
    for (const auto& c : calls) n += (c == hook) ? 1 : 0;
    return n;
  }

  Version on_chan_open_init_validate(ibc::Order, const std::vector<ibc::ConnectionId>&,
                                     const ibc::PortId&, const ibc::ChannelId&,
                                     const ibc::Counterparty&, const Version& v) override
  {
    calls.push_back("open_init_validate");
    return Version{"next/" + v.as_str()};
  }

  std::pair<Extras, Version> on_chan_open_init_execute(ibc::Order,
                                                       const std::vector<ibc::ConnectionId>&,
                                                       const ibc::PortId&, const ibc::ChannelId&,
                                                       const ibc::Counterparty&,
                                                       const Version& v) override
  {
    calls.push_back("open_init_execute");
    return {marker("open_init_execute"), Version{"next/" + v.as_str()}};
  }

  Version on_chan_open_try_validate(ibc::Order, const std::vector<ibc::ConnectionId>&,
                                    const ibc::PortId&, const ibc::ChannelId&,
                                    const ibc::Counterparty&, const Version& v) override
  {
    calls.push_back("open_try_validate");
    return Version{"next/" + v.as_str()};
  }

  std::pair<Extras, Version> on_chan_open_try_execute(ibc::Order,
                                                      const std::vector<ibc::ConnectionId>&,
                                                      const ibc::PortId&, const ibc::ChannelId&,
                                                      const ibc::Counterparty&,
                                                      const Version& v) override
  {
    calls.push_back("open_try_execute");
    return {marker("open_try_execute"), Version{"next/" + v.as_str()}};
  }

  void on_chan_open_ack_validate(const ibc::PortId&, const ibc::ChannelId&,
                                 const Version&) override
  {
    calls.push_back("open_ack_validate");
  }

  Extras on_chan_open_ack_execute(const ibc::PortId&, const ibc::ChannelId&,
                                  const Version&) override
  {
    calls.push_back("open_ack_execute");
    return marker("open_ack_execute");
  }

  void on_chan_open_confirm_validate(const ibc::PortId&, const ibc::ChannelId&) override
  {
    calls.push_back("open_confirm_validate");
  }

  Extras on_chan_open_confirm_execute(const ibc::PortId&, const ibc::ChannelId&) override
  {
    calls.push_back("open_confirm_execute");
    return marker("open_confirm_execute");
  }

  void on_chan_close_init_validate(const ibc::PortId&, const ibc::ChannelId&) override
  {
    calls.push_back("close_init_validate");
    throw ibc::ChannelError("next refuses close");
  }

  Extras on_chan_close_init_execute(const ibc::PortId&, const ibc::ChannelId&) override
  {
    calls.push_back("close_init_execute");
    return marker("close_init_execute");
  }

  void on_chan_close_confirm_validate(const ibc::PortId&, const ibc::ChannelId&) override
  {
    calls.push_back("close_confirm_validate");
  }

  Extras on_chan_close_confirm_execute(const ibc::PortId&, const ibc::ChannelId&) override
  {
    calls.push_back("close_confirm_execute");
    return marker("close_confirm_execute");
  }

  RecvResult on_recv_packet_execute(const ibc::Packet&, const ibc::Signer&) override
  {
    calls.push_back("recv");
    return recv_result();
  }

  void on_acknowledgement_packet_validate(const ibc::Packet&, const ibc::Acknowledgement&,
                                          const ibc::Signer&) override
  {
    calls.push_back("ack_validate");
  }

  Extras on_acknowledgement_packet_execute(const ibc::Packet&, const ibc::Acknowledgement&,
                                           const ibc::Signer&) override
  {
    calls.push_back("ack_execute");
    return marker("ack_execute");
  }

  void on_timeout_packet_validate(const ibc::Packet&, const ibc::Signer&) override
  {
    calls.push_back("timeout_validate");
  }

  Extras on_timeout_packet_execute(const ibc::Packet&, const ibc::Signer&) override
  {
    calls.push_back("timeout_execute");
    return marker("timeout_execute");
  }

  void describe(std::ostream& os) const override { os << "RecordingModule"; }
};

// ---------------------------------------------------------------------------
// RecordingLedger: records every mutation; optionally fails them.
// ---------------------------------------------------------------------------
struct RecordingLedger final : ports::IHostLedger
{
  struct Call
  {
    std::string op;
    std::string owner_or_port;
    std::string channel;
    std::string denom;
    std::string amount;
  };

  std::vector<Call> calls;
  bool fail_release = false;

  ibc::Amount balance(const shielded::recv::domain::Address&, const std::string&) const override
  {
    return ibc::Amount{};
  }

  void credit(const shielded::recv::domain::Address& owner, const std::string& denom,
              const ibc::Amount& amount) override
  {
    calls.push_back({"credit", owner.to_string(), "", denom, amount.to_string()});
  }

  void debit(const shielded::recv::domain::Address& owner, const std::string& denom,
             const ibc::Amount& amount) override
  {
    calls.push_back({"debit", owner.to_string(), "", denom, amount.to_string()});
  }

  ibc::Amount escrowed(const ibc::PortId&, const ibc::ChannelId&,
                       const std::string&) const override
  {
    return ibc::Amount{};
  }

  void lock_escrow(const ibc::PortId& port, const ibc::ChannelId& channel,
                   const std::string& denom, const ibc::Amount& amount) override
  {
    calls.push_back({"lock", port.as_str(), channel.as_str(), denom, amount.to_string()});
  }

  void release_escrow(const ibc::PortId& port, const ibc::ChannelId& channel,
                      const std::string& denom, const ibc::Amount& amount) override
  {
    calls.push_back({"release", port.as_str(), channel.as_str(), denom, amount.to_string()});
    if (fail_release)
      throw ibc::TokenTransferError(ibc::TokenTransferErrorCode::InsufficientEscrow, "empty");
  }
};

}  // namespace shielded::recv::testing
