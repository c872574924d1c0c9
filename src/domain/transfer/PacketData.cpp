#include "domain/transfer/PacketData.hpp"

#include <stdexcept>
#include <string_view>

#include "shared/json/Json.hpp"
#include "shared/text/Utf8.hpp"

namespace shielded::recv::domain::transfer
{

namespace json = shielded::recv::shared::json;
using shielded::recv::shared::text::is_valid_utf8;

namespace
{
const Json::Value* string_member(const Json::Value& obj, const char* key)
{
  const Json::Value* v = obj.find(key, key + std::char_traits<char>::length(key));
  if (!v || !v->isString()) return nullptr;
  // \udc00-style escapes decode to surrogate bytes
  return is_valid_utf8(v->asString()) ? v : nullptr;
}
}  // namespace

std::optional<TransferPacketData> TransferPacketData::decode(
    const std::vector<std::uint8_t>& bytes)
{
  const std::string_view text{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
  if (!is_valid_utf8(text)) return std::nullopt;
  const auto root = json::parse_object(text);
  if (!root) return std::nullopt;

  const auto* denom = string_member(*root, "denom");
  const auto* amount = string_member(*root, "amount");
  const auto* sender = string_member(*root, "sender");
  const auto* receiver = string_member(*root, "receiver");
  if (!denom || !amount || !sender || !receiver) return std::nullopt;

  std::string memo;
  if (root->isMember("memo"))
  {
    const auto* m = string_member(*root, "memo");
    if (!m) return std::nullopt;
    memo = m->asString();
  }

  try
  {
    return TransferPacketData{
        ibc::Coin{ibc::PrefixedDenom::from_string(denom->asString()),
                  ibc::Amount::from_string(amount->asString())},
        ibc::Signer{sender->asString()}, ibc::Signer{receiver->asString()}, std::move(memo)};
  }
  catch (const std::invalid_argument&)
  {
    // bad denom or amount text
    return std::nullopt;
  }
}

std::vector<std::uint8_t> TransferPacketData::encode() const
{
  Json::Value root(Json::objectValue);
  root["denom"] = token.denom.to_string();
  root["amount"] = token.amount.to_string();
  root["sender"] = sender.as_str();
  root["receiver"] = receiver.as_str();
  root["memo"] = memo;
  const std::string text = json::write_compact(root);
  return {text.begin(), text.end()};
}

}  // namespace shielded::recv::domain::transfer
