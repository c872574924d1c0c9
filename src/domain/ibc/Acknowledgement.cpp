#include "domain/ibc/Acknowledgement.hpp"

#include <stdexcept>
#include <utility>

#include "shared/json/Json.hpp"

namespace shielded::recv::domain::ibc
{

namespace json = shielded::recv::shared::json;

namespace
{
constexpr const char* kResultKey = "result";
constexpr const char* kErrorKey = "error";
}  // namespace

StatusValue::StatusValue(std::string v) : v_(std::move(v))
{
  if (v_.empty()) throw std::invalid_argument("acknowledgement status value must not be empty");
}

std::optional<AcknowledgementStatus> AcknowledgementStatus::decode(const Acknowledgement& ack)
{
  const auto root = json::parse_object(ack.as_string());
  if (!root || root->size() != 1) return std::nullopt;

  const bool ok = root->isMember(kResultKey);
  const Json::Value& v = ok ? (*root)[kResultKey] : (*root)[kErrorKey];
  if (!v.isString() || v.asString().empty()) return std::nullopt;

  return ok ? success(StatusValue{v.asString()}) : error(StatusValue{v.asString()});
}

Acknowledgement AcknowledgementStatus::to_acknowledgement() const
{
  Json::Value root(Json::objectValue);
  root[success_ ? kResultKey : kErrorKey] = value_.as_str();
  const std::string text = json::write_compact(root);
  return Acknowledgement{std::vector<std::uint8_t>(text.begin(), text.end())};
}

Acknowledgement::Acknowledgement(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes))
{
  if (bytes_.empty()) throw std::invalid_argument("acknowledgement must not be empty");
}

bool Acknowledgement::is_success() const
{
  const auto status = AcknowledgementStatus::decode(*this);
  return status && status->is_successful();
}

}  // namespace shielded::recv::domain::ibc
