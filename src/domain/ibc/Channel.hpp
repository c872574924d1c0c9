#pragma once

#include <optional>
#include <string>
#include <utility>

#include "domain/ibc/Identifiers.hpp"

namespace shielded::recv::domain::ibc
{

enum class Order
{
  None,
  Unordered,
  Ordered,
};

inline const char* to_string(Order o)
{
  switch (o)
  {
    case Order::None:      return "ORDER_NONE_UNSPECIFIED";
    case Order::Unordered: return "ORDER_UNORDERED";
    case Order::Ordered:   return "ORDER_ORDERED";
  }
  return "ORDER_NONE_UNSPECIFIED";
}

// Application version negotiated during the channel handshake.
class Version
{
 public:
  Version() = default;
  explicit Version(std::string v) : v_(std::move(v)) {}

  bool empty() const noexcept { return v_.empty(); }
  const std::string& as_str() const noexcept { return v_; }

  friend bool operator==(const Version& a, const Version& b) { return a.v_ == b.v_; }
  friend bool operator!=(const Version& a, const Version& b) { return a.v_ != b.v_; }

 private:
  std::string v_;
};

struct Counterparty
{
  PortId port_id;
  std::optional<ChannelId> channel_id;
};

}  // namespace shielded::recv::domain::ibc
