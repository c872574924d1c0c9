#pragma once
#include <string>

#include "application/ports/IPacketSource.hpp"

namespace shielded::recv::infrastructure::codec
{

// Packet description file:
//   {
//     "sequence": 1,
//     "source_port": "transfer", "source_channel": "channel-0",
//     "destination_port": "transfer", "destination_channel": "channel-1",
//     "timeout_height": {"revision_number": 0, "revision_height": 0},   (optional)
//     "timeout_timestamp": 0,                                           (optional)
//     "data": { ...ICS-20 packet data... } | "raw payload text"
//   }
// An object `data` is re-serialized compactly as the payload bytes.
class PacketFile_Json final : public shielded::recv::application::ports::IPacketSource
{
 public:
  shielded::recv::domain::ibc::Packet load(const std::string& path) override;

  // Throws std::runtime_error (or domain::ibc::IdentifierError) on a bad document.
  static shielded::recv::domain::ibc::Packet parse(const std::string& text);
};

}  // namespace shielded::recv::infrastructure::codec
