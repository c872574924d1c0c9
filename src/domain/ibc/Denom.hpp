#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "domain/ibc/Amount.hpp"
#include "domain/ibc/Identifiers.hpp"

namespace shielded::recv::domain::ibc
{

struct TracePrefix
{
  PortId port_id;
  ChannelId channel_id;

  friend bool operator==(const TracePrefix& a, const TracePrefix& b)
  {
    return a.port_id == b.port_id && a.channel_id == b.channel_id;
  }
};

// ICS-20 denomination `port/channel/.../base`. The first trace prefix is the
// most recent hop.
class PrefixedDenom
{
 public:
  PrefixedDenom(std::vector<TracePrefix> trace_path, std::string base_denom);

  // Throws DenomError.
  static PrefixedDenom from_string(std::string_view text);

  const std::vector<TracePrefix>& trace_path() const noexcept { return trace_path_; }
  const std::string& base_denom() const noexcept { return base_denom_; }

  bool has_prefix(const PortId& port, const ChannelId& channel) const;
  void remove_prefix(const PortId& port, const ChannelId& channel);
  void add_prefix(const PortId& port, const ChannelId& channel);

  std::string to_string() const;

  friend bool operator==(const PrefixedDenom& a, const PrefixedDenom& b)
  {
    return a.trace_path_ == b.trace_path_ && a.base_denom_ == b.base_denom_;
  }

 private:
  std::vector<TracePrefix> trace_path_;
  std::string base_denom_;
};

struct Coin
{
  PrefixedDenom denom;
  Amount amount;

  friend bool operator==(const Coin& a, const Coin& b)
  {
    return a.denom == b.denom && a.amount == b.amount;
  }
};

inline std::ostream& operator<<(std::ostream& os, const PrefixedDenom& d)
{
  return os << d.to_string();
}

inline std::ostream& operator<<(std::ostream& os, const Coin& c)
{
  return os << c.amount << c.denom;
}

}  // namespace shielded::recv::domain::ibc
