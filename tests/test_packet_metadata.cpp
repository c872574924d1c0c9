#include <gtest/gtest.h>

#include "domain/metadata/PacketMetadata.hpp"
#include "infrastructure/address/AddressCodec_Bech32m.hpp"
#include "shared/json/Json.hpp"
#include "test_support.hpp"

using shielded::recv::domain::ibc::Amount;
using shielded::recv::domain::ibc::Signer;
using shielded::recv::domain::metadata::PacketMetadata;
using shielded::recv::domain::metadata::ShieldedRecvMetadata;
namespace json = shielded::recv::shared::json;
namespace t = shielded::recv::testing;

TEST(PacketMetadata, DecodesStringAmount) {
  auto md = PacketMetadata::from_string(t::kDirectiveMemo);
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(md->overflow_receiver().as_str(), "alice");
  EXPECT_EQ(md->target_amount(), Amount{100});
}

TEST(PacketMetadata, DecodesNumericAmount) {
  auto md = PacketMetadata::from_string(
      R"({"shielded_recv":{"overflow_receiver":"bob","target_amount":42}})");
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(md->target_amount(), Amount{42});
}

TEST(PacketMetadata, IgnoresUnknownKeys) {
  auto md = PacketMetadata::from_string(
      R"({"forward":{"port":"transfer"},"shielded_recv":{"overflow_receiver":"bob","target_amount":"7","extra":true}})");
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(md->target_amount(), Amount{7});
}

TEST(PacketMetadata, AcceptsRepeatedKeys) {
  auto md = PacketMetadata::from_string(
      R"({"note":1,"note":2,"shielded_recv":{"overflow_receiver":"bob","x":[],"x":{},"target_amount":"7"}})");
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(md->overflow_receiver().as_str(), "bob");
  EXPECT_EQ(md->target_amount(), Amount{7});

  // the last occurrence of a repeated field is the one decoded
  md = PacketMetadata::from_string(
      R"({"shielded_recv":{"overflow_receiver":"bob","target_amount":"7","target_amount":"9"}})");
  ASSERT_TRUE(md.has_value());
  EXPECT_EQ(md->target_amount(), Amount{9});
}

TEST(PacketMetadata, RejectsMalformedDirectives) {
  const char* bad[] = {
      "",
      "not json",
      "{}",
      "[]",
      R"("shielded_recv")",
      R"({"shielded_recv":null})",
      R"({"shielded_recv":{"target_amount":"1"}})",
      R"({"shielded_recv":{"overflow_receiver":"a"}})",
      R"({"shielded_recv":{"overflow_receiver":7,"target_amount":"1"}})",
      R"({"shielded_recv":{"overflow_receiver":"a","target_amount":"-1"}})",
      R"({"shielded_recv":{"overflow_receiver":"a","target_amount":-1}})",
      R"({"shielded_recv":{"overflow_receiver":"a","target_amount":1.5}})",
      R"({"shielded_recv":{"overflow_receiver":"a","target_amount":"0x10"}})",
      R"({"shielded_recv":{"overflow_receiver":"a","target_amount":""}})",
      R"({"shielded_recv":{"overflow_receiver":"a","target_amount":"1"}} trailing)",
  };
  for (const char* memo : bad) {
    EXPECT_FALSE(PacketMetadata::from_string(memo).has_value()) << memo;
  }
}

TEST(PacketMetadata, RoundTripsLargeAmountsAndOddReceivers) {
  const Amount max = Amount::from_string(
      "115792089237316195423570985008687907853269984665640564039457584007913129639935");
  const std::string receivers[] = {"", "alice", "quote\"and\\slash", "ünïcödé", t::kAlice};
  const Amount amounts[] = {Amount{0}, Amount{1}, Amount{18446744073709551615ull}, max};

  for (const auto& r : receivers) {
    for (const auto& a : amounts) {
      const PacketMetadata md{ShieldedRecvMetadata{Signer{r}, a}};
      const auto back = PacketMetadata::from_string(md.to_string());
      ASSERT_TRUE(back.has_value()) << md.to_string();
      EXPECT_EQ(*back, md);
    }
  }
}

TEST(PacketMetadata, SerializesAmountAsString) {
  const PacketMetadata md{ShieldedRecvMetadata{Signer{"alice"}, Amount{100}}};
  const auto v = md.to_json();
  EXPECT_TRUE(v["shielded_recv"]["target_amount"].isString());
  EXPECT_EQ(v["shielded_recv"]["target_amount"].asString(), "100");
  EXPECT_EQ(v["shielded_recv"]["overflow_receiver"].asString(), "alice");
}

TEST(PacketMetadata, BuildsFromNativeAddress) {
  shielded::recv::infrastructure::address::AddressCodec_Bech32m codec{"tnam"};
  const PacketMetadata md{codec.decode(t::kAlice), Amount{5}};
  EXPECT_EQ(md.overflow_receiver().as_str(), t::kAlice);
  EXPECT_EQ(md.target_amount(), Amount{5});
}

TEST(PacketMetadata, DetectsDirectiveKey) {
  EXPECT_TRUE(PacketMetadata::is_overflow_receive_msg(*json::parse_object(t::kDirectiveMemo)));
  EXPECT_TRUE(PacketMetadata::is_overflow_receive_msg(
      *json::parse_object(R"({"shielded_recv":"garbage"})")));
  EXPECT_FALSE(PacketMetadata::is_overflow_receive_msg(
      *json::parse_object(R"({"forward":{"receiver":"x"}})")));
  EXPECT_FALSE(PacketMetadata::is_overflow_receive_msg(Json::Value("shielded_recv")));
}

TEST(PacketMetadata, StripRemovesOnlyDirective) {
  const auto memo = *json::parse_object(
      R"({"shielded_recv":{"overflow_receiver":"a","target_amount":"1"},"forward":{"port":"transfer","channel":"channel-9"},"note":[1,2,3]})");
  ASSERT_TRUE(PacketMetadata::is_overflow_receive_msg(memo));

  const auto stripped = PacketMetadata::strip_middleware_msg(memo);
  EXPECT_FALSE(stripped.isMember("shielded_recv"));
  ASSERT_EQ(stripped.size(), 2u);
  EXPECT_EQ(stripped["forward"], memo["forward"]);
  EXPECT_EQ(stripped["note"], memo["note"]);
}

TEST(PacketMetadata, StripWithoutDirectiveIsNoop) {
  const auto memo = *json::parse_object(R"({"forward":{"port":"transfer"}})");
  EXPECT_EQ(PacketMetadata::strip_middleware_msg(memo), memo);
}
