#pragma once

#include <string>

#include "domain/ibc/Packet.hpp"

namespace shielded::recv::application::ports
{

struct IPacketSource
{
  virtual ~IPacketSource() = default;

  // Throws std::runtime_error when the packet cannot be read.
  virtual domain::ibc::Packet load(const std::string& path) = 0;
};

}  // namespace shielded::recv::application::ports
