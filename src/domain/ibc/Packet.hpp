#pragma once

#include <cstdint>
#include <vector>

#include "domain/ibc/Identifiers.hpp"

namespace shielded::recv::domain::ibc
{

struct TimeoutHeight
{
  std::uint64_t revision_number{0};
  std::uint64_t revision_height{0};

  bool is_zero() const noexcept { return revision_number == 0 && revision_height == 0; }
};

// Side A sends, side B (this chain, on receive) processes.
struct Packet
{
  std::uint64_t sequence{0};
  PortId port_id_on_a;
  ChannelId chan_id_on_a;
  PortId port_id_on_b;
  ChannelId chan_id_on_b;
  std::vector<std::uint8_t> data;
  TimeoutHeight timeout_height_on_b{};
  std::uint64_t timeout_timestamp_on_b{0};  // ns since epoch, 0 = none
};

}  // namespace shielded::recv::domain::ibc
