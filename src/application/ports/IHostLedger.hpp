#pragma once

#include <string>

#include "domain/Address.hpp"
#include "domain/ibc/Amount.hpp"
#include "domain/ibc/Identifiers.hpp"

namespace shielded::recv::application::ports
{

// Durable balances of the host chain. Denominations are full ICS-20 trace
// strings (`transfer/channel-0/uatom`).
//
// Mutators throw domain::ibc::TokenTransferError. The host rolls back the
// enclosing transaction on failure; implementations do not undo partial work.
struct IHostLedger
{
  virtual ~IHostLedger() = default;

  virtual domain::ibc::Amount balance(const domain::Address& owner,
                                      const std::string& denom) const = 0;
  virtual void credit(const domain::Address& owner, const std::string& denom,
                      const domain::ibc::Amount& amount) = 0;
  virtual void debit(const domain::Address& owner, const std::string& denom,
                     const domain::ibc::Amount& amount) = 0;

  // Per-channel escrow accounts.
  virtual domain::ibc::Amount escrowed(const domain::ibc::PortId& port,
                                       const domain::ibc::ChannelId& channel,
                                       const std::string& denom) const = 0;
  virtual void lock_escrow(const domain::ibc::PortId& port, const domain::ibc::ChannelId& channel,
                           const std::string& denom, const domain::ibc::Amount& amount) = 0;
  virtual void release_escrow(const domain::ibc::PortId& port,
                              const domain::ibc::ChannelId& channel, const std::string& denom,
                              const domain::ibc::Amount& amount) = 0;
};

}  // namespace shielded::recv::application::ports
