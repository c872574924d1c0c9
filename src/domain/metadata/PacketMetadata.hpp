#pragma once

#include <json/value.h>

#include <optional>
#include <string>
#include <string_view>

#include "domain/Address.hpp"
#include "domain/ibc/Amount.hpp"
#include "domain/ibc/Signer.hpp"

namespace shielded::recv::domain::metadata
{

// The overflow address and the amount to deposit in the shielded pool.
struct ShieldedRecvMetadata
{
  ibc::Signer overflow_receiver;
  ibc::Amount target_amount;

  friend bool operator==(const ShieldedRecvMetadata& a, const ShieldedRecvMetadata& b)
  {
    return a.overflow_receiver == b.overflow_receiver && a.target_amount == b.target_amount;
  }
};

// Memo directive of a shielded receive packet:
//   {"shielded_recv": {"overflow_receiver": "<account>", "target_amount": "<u256>"}}
class PacketMetadata
{
 public:
  static constexpr const char* kMemoKey = "shielded_recv";

  explicit PacketMetadata(ShieldedRecvMetadata md) : shielded_recv_(std::move(md)) {}
  PacketMetadata(const Address& overflow_receiver, const ibc::Amount& target_amount);

  // True iff the top-level memo object carries the directive key.
  static bool is_overflow_receive_msg(const Json::Value& memo);

  // Consumes this layer's directive; every other key is kept as is.
  static Json::Value strip_middleware_msg(Json::Value memo);

  // nullopt when the value is not a well-formed directive. Unknown keys are
  // ignored. `target_amount` may be a decimal string or a non-negative integer.
  static std::optional<PacketMetadata> from_json(const Json::Value& memo);
  static std::optional<PacketMetadata> from_string(std::string_view memo);

  const ibc::Signer& overflow_receiver() const noexcept { return shielded_recv_.overflow_receiver; }
  const ibc::Amount& target_amount() const noexcept { return shielded_recv_.target_amount; }

  Json::Value to_json() const;
  std::string to_string() const;

  friend bool operator==(const PacketMetadata& a, const PacketMetadata& b)
  {
    return a.shielded_recv_ == b.shielded_recv_;
  }

 private:
  ShieldedRecvMetadata shielded_recv_;
};

}  // namespace shielded::recv::domain::metadata
