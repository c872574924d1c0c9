#include <gtest/gtest.h>

#include <memory>

#include "application/services/ShieldedRecvModule.hpp"
#include "domain/metadata/ShieldedRecvError.hpp"
#include "infrastructure/address/AddressCodec_Bech32m.hpp"
#include "infrastructure/ledger/HostLedger_InMemory.hpp"
#include "infrastructure/logging/Logger_Null.hpp"
#include "test_support.hpp"

using namespace shielded::recv::domain::ibc;
using shielded::recv::application::ports::IHostLedger;
using shielded::recv::application::ports::IOverflowRecvContext;
using shielded::recv::application::services::HostContext;
using shielded::recv::application::services::ShieldedRecvModule;
using shielded::recv::domain::Address;
using shielded::recv::domain::VerifierSet;
using shielded::recv::domain::metadata::ShieldedRecvError;
using shielded::recv::infrastructure::address::AddressCodec_Bech32m;
using shielded::recv::infrastructure::ledger::HostLedger_InMemory;
using shielded::recv::infrastructure::logging::Logger_Null;
namespace t = shielded::recv::testing;

static Coin coin(const std::string& denom, std::uint64_t amount)
{
  return Coin{PrefixedDenom::from_string(denom), Amount{amount}};
}

namespace
{

template <typename Ledger>
struct Bridge
{
  AddressCodec_Bech32m codec{"tnam"};
  Ledger ledger;
  VerifierSet verifiers;
  Address ibc = codec.decode(t::kIbc);
  HostContext host{ledger, verifiers, ibc};
  Logger_Null log;
  ShieldedRecvModule module{std::make_unique<t::RecordingModule>(), host, codec, log, t::kMasp};

  IOverflowRecvContext& ctx() { return module; }
};

}  // namespace

TEST(OverflowBridge, MintCreditsDecodedAccount) {
  Bridge<HostLedger_InMemory> b;
  b.ctx().mint_coins_execute(Signer{t::kAlice}, coin("transfer/channel-1/uatom", 250));

  const Address alice = b.codec.decode(t::kAlice);
  EXPECT_EQ(b.ledger.balance(alice, "transfer/channel-1/uatom"), Amount{250});
  EXPECT_EQ(b.verifiers, VerifierSet{b.ibc});
}

TEST(OverflowBridge, MintRejectsUndecodableReceiver) {
  Bridge<t::RecordingLedger> b;
  const char* bad[] = {
      "",
      "alice",
      "not-the-pool",
      "tnam1qqqsyqcyq5rqwzqfpg9scrgwpugpzysnzsf7k526",  // checksum
      "tpknam1qqqsyqcyq5rqwzqfpg9scrgwpugpzysnzspq6vp2",  // other prefix
      "tnam1qqqszqgpqyqszqgpqyanv6qw",                   // short payload
  };

  for (const char* receiver : bad) {
    try {
      b.ctx().mint_coins_execute(Signer{receiver}, coin("uatom", 1));
      FAIL() << "accepted " << receiver;
    } catch (const ShieldedRecvError& e) {
      EXPECT_EQ(e.kind(), ShieldedRecvError::Kind::AddressDecode) << receiver;
      EXPECT_FALSE(e.transfer_code().has_value());
      EXPECT_EQ(std::string(e.what()).rfind("Shielded receive error: ", 0), 0u);
    }
  }
  EXPECT_TRUE(b.ledger.calls.empty());
  EXPECT_TRUE(b.verifiers.empty());
}

TEST(OverflowBridge, UnescrowRejectsUndecodableReceiverBeforeTouchingEscrow) {
  Bridge<t::RecordingLedger> b;
  EXPECT_THROW(b.ctx().unescrow_coins_execute(Signer{"bogus"}, PortId{"transfer"},
                                              ChannelId{"channel-1"}, coin("uatom", 5)),
               ShieldedRecvError);
  EXPECT_TRUE(b.ledger.calls.empty());
}

TEST(OverflowBridge, UnescrowForwardsArgumentsUnchanged) {
  Bridge<t::RecordingLedger> b;
  b.ctx().unescrow_coins_execute(Signer{t::kBob}, PortId{"transfer"}, ChannelId{"channel-42"},
                                 coin("transfer/channel-7/uosmo", 900));

  ASSERT_EQ(b.ledger.calls.size(), 2u);
  const auto& release = b.ledger.calls[0];
  EXPECT_EQ(release.op, "release");
  EXPECT_EQ(release.owner_or_port, "transfer");
  EXPECT_EQ(release.channel, "channel-42");
  EXPECT_EQ(release.denom, "transfer/channel-7/uosmo");
  EXPECT_EQ(release.amount, "900");

  const auto& credit = b.ledger.calls[1];
  EXPECT_EQ(credit.op, "credit");
  EXPECT_EQ(credit.owner_or_port, t::kBob);
  EXPECT_EQ(credit.denom, "transfer/channel-7/uosmo");
  EXPECT_EQ(credit.amount, "900");

  EXPECT_EQ(b.verifiers, VerifierSet{b.ibc});
}

TEST(OverflowBridge, UnescrowFailureBecomesTokenTransferError) {
  Bridge<t::RecordingLedger> b;
  b.ledger.fail_release = true;

  try {
    b.ctx().unescrow_coins_execute(Signer{t::kBob}, PortId{"transfer"}, ChannelId{"channel-0"},
                                   coin("uatom", 3));
    FAIL() << "unescrow succeeded";
  } catch (const ShieldedRecvError& e) {
    EXPECT_EQ(e.kind(), ShieldedRecvError::Kind::TokenTransfer);
    ASSERT_TRUE(e.transfer_code().has_value());
    EXPECT_EQ(*e.transfer_code(), TokenTransferErrorCode::InsufficientEscrow);
    EXPECT_NE(std::string(e.what()).find("insufficient escrow"), std::string::npos);
  }
  // nothing credited after the failed release
  ASSERT_EQ(b.ledger.calls.size(), 1u);
  EXPECT_EQ(b.ledger.calls[0].op, "release");
}

TEST(OverflowBridge, UnescrowDrainsEscrowIntoAccount) {
  Bridge<HostLedger_InMemory> b;
  const PortId port{"transfer"};
  const ChannelId chan{"channel-0"};
  b.ledger.lock_escrow(port, chan, "unam", Amount{10});

  b.ctx().unescrow_coins_execute(Signer{t::kAlice}, port, chan, coin("unam", 4));
  EXPECT_EQ(b.ledger.escrowed(port, chan, "unam"), Amount{6});
  EXPECT_EQ(b.ledger.balance(b.codec.decode(t::kAlice), "unam"), Amount{4});

  try {
    b.ctx().unescrow_coins_execute(Signer{t::kAlice}, port, chan, coin("unam", 7));
    FAIL() << "over-release accepted";
  } catch (const ShieldedRecvError& e) {
    EXPECT_EQ(e.transfer_code(), TokenTransferErrorCode::InsufficientEscrow);
  }
  EXPECT_EQ(b.ledger.escrowed(port, chan, "unam"), Amount{6});
}
