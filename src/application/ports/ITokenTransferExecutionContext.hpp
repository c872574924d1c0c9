#pragma once

#include "domain/Address.hpp"
#include "domain/ibc/Denom.hpp"
#include "domain/ibc/Identifiers.hpp"

namespace shielded::recv::application::ports
{

// ICS-20 ledger primitives. Every operation throws
// domain::ibc::TokenTransferError on failure.
struct ITokenTransferExecutionContext
{
  virtual ~ITokenTransferExecutionContext() = default;

  virtual void mint_coins_execute(const domain::Address& account,
                                  const domain::ibc::Coin& coin) = 0;

  virtual void burn_coins_execute(const domain::Address& account,
                                  const domain::ibc::Coin& coin) = 0;

  virtual void escrow_coins_execute(const domain::Address& from,
                                    const domain::ibc::PortId& port,
                                    const domain::ibc::ChannelId& channel,
                                    const domain::ibc::Coin& coin) = 0;

  virtual void unescrow_coins_execute(const domain::Address& to,
                                      const domain::ibc::PortId& port,
                                      const domain::ibc::ChannelId& channel,
                                      const domain::ibc::Coin& coin) = 0;
};

}  // namespace shielded::recv::application::ports
