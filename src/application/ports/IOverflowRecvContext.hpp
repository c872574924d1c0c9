#pragma once

#include "domain/ibc/Denom.hpp"
#include "domain/ibc/Identifiers.hpp"
#include "domain/ibc/Signer.hpp"

namespace shielded::recv::application::ports
{

// Callbacks used by the overflow-receive middleware once it has split an
// incoming amount into the shielded target and the excess.
//
// Both throw domain::metadata::ShieldedRecvError; a failure aborts the packet.
struct IOverflowRecvContext
{
  virtual ~IOverflowRecvContext() = default;

  virtual void mint_coins_execute(const domain::ibc::Signer& receiver,
                                  const domain::ibc::Coin& coin) = 0;

  virtual void unescrow_coins_execute(const domain::ibc::Signer& receiver,
                                      const domain::ibc::PortId& port,
                                      const domain::ibc::ChannelId& channel,
                                      const domain::ibc::Coin& coin) = 0;
};

}  // namespace shielded::recv::application::ports
