#pragma once

#include "application/ports/ITokenTransferExecutionContext.hpp"
#include "application/services/HostContext.hpp"

namespace shielded::recv::application::services
{

// ICS-20 execution context over the shared host ledger. Cheap to construct;
// modules build one per call.
class TokenTransferContext final : public ports::ITokenTransferExecutionContext
{
 public:
  explicit TokenTransferContext(HostContext& host) : host_(host) {}

  void mint_coins_execute(const domain::Address& account, const domain::ibc::Coin& coin) override;

  void burn_coins_execute(const domain::Address& account, const domain::ibc::Coin& coin) override;

  void escrow_coins_execute(const domain::Address& from, const domain::ibc::PortId& port,
                            const domain::ibc::ChannelId& channel,
                            const domain::ibc::Coin& coin) override;

  void unescrow_coins_execute(const domain::Address& to, const domain::ibc::PortId& port,
                              const domain::ibc::ChannelId& channel,
                              const domain::ibc::Coin& coin) override;

 private:
  HostContext& host_;
};

}  // namespace shielded::recv::application::services
