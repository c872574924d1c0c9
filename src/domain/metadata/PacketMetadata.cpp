#include "domain/metadata/PacketMetadata.hpp"

#include <utility>

#include "domain/ibc/Errors.hpp"
#include "shared/json/Json.hpp"

namespace shielded::recv::domain::metadata
{

namespace json = shielded::recv::shared::json;

namespace
{
constexpr const char* kOverflowReceiverKey = "overflow_receiver";
constexpr const char* kTargetAmountKey = "target_amount";

std::optional<ibc::Amount> amount_from_json(const Json::Value& v)
{
  if (v.isString())
  {
    try
    {
      return ibc::Amount::from_string(v.asString());
    }
    catch (const ibc::AmountError&)
    {
      return std::nullopt;
    }
  }
  // Integral JSON numbers only; reals and negatives are not amounts.
  if (v.type() == Json::uintValue) return ibc::Amount{v.asUInt64()};
  if (v.type() == Json::intValue && v.asInt64() >= 0)
    return ibc::Amount{static_cast<std::uint64_t>(v.asInt64())};
  return std::nullopt;
}
}  // namespace

PacketMetadata::PacketMetadata(const Address& overflow_receiver, const ibc::Amount& target_amount)
    : shielded_recv_{ibc::Signer{overflow_receiver.to_string()}, target_amount}
{
}

bool PacketMetadata::is_overflow_receive_msg(const Json::Value& memo)
{
  return memo.isObject() && memo.isMember(kMemoKey);
}

Json::Value PacketMetadata::strip_middleware_msg(Json::Value memo)
{
  if (memo.isObject()) memo.removeMember(kMemoKey);
  return memo;
}

std::optional<PacketMetadata> PacketMetadata::from_json(const Json::Value& memo)
{
  if (!is_overflow_receive_msg(memo)) return std::nullopt;

  const Json::Value& inner = memo[kMemoKey];
  if (!inner.isObject()) return std::nullopt;

  const Json::Value& receiver = inner[kOverflowReceiverKey];
  if (!receiver.isString()) return std::nullopt;

  if (!inner.isMember(kTargetAmountKey)) return std::nullopt;
  auto amount = amount_from_json(inner[kTargetAmountKey]);
  if (!amount) return std::nullopt;

  return PacketMetadata{ShieldedRecvMetadata{ibc::Signer{receiver.asString()}, *amount}};
}

std::optional<PacketMetadata> PacketMetadata::from_string(std::string_view memo)
{
  const auto root = json::parse_object(memo);
  if (!root) return std::nullopt;
  return from_json(*root);
}

Json::Value PacketMetadata::to_json() const
{
  Json::Value inner(Json::objectValue);
  inner[kOverflowReceiverKey] = shielded_recv_.overflow_receiver.as_str();
  inner[kTargetAmountKey] = shielded_recv_.target_amount.to_string();

  Json::Value root(Json::objectValue);
  root[kMemoKey] = std::move(inner);
  return root;
}

std::string PacketMetadata::to_string() const { return json::write_compact(to_json()); }

}  // namespace shielded::recv::domain::metadata
