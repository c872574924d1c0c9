#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/ibc/Denom.hpp"
#include "domain/ibc/Signer.hpp"

namespace shielded::recv::domain::transfer
{

// ICS-20 fungible token packet payload:
//   {"denom": "...", "amount": "...", "sender": "...", "receiver": "...", "memo": "..."}
struct TransferPacketData
{
  ibc::Coin token;
  ibc::Signer sender;
  ibc::Signer receiver;
  std::string memo;

  // nullopt when the bytes are not an ICS-20 packet. Never throws.
  static std::optional<TransferPacketData> decode(const std::vector<std::uint8_t>& bytes);

  std::vector<std::uint8_t> encode() const;
};

}  // namespace shielded::recv::domain::transfer
