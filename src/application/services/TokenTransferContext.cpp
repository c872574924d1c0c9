#include "application/services/TokenTransferContext.hpp"

#include "domain/ibc/Errors.hpp"

namespace shielded::recv::application::services
{

using domain::Address;
using namespace shielded::recv::domain::ibc;

namespace
{
void require_positive(const Coin& coin)
{
  if (coin.amount.is_zero())
    throw TokenTransferError(TokenTransferErrorCode::InvalidAmount,
                             "zero amount of " + coin.denom.to_string());
}
}  // namespace

// The minter has to authorize the supply change.
void TokenTransferContext::mint_coins_execute(const Address& account, const Coin& coin)
{
  host_.ledger.credit(account, coin.denom.to_string(), coin.amount);
  host_.verifiers.insert(host_.ibc_account);
}

void TokenTransferContext::burn_coins_execute(const Address& account, const Coin& coin)
{
  require_positive(coin);
  host_.ledger.debit(account, coin.denom.to_string(), coin.amount);
  host_.verifiers.insert(account);
}

void TokenTransferContext::escrow_coins_execute(const Address& from, const PortId& port,
                                                const ChannelId& channel, const Coin& coin)
{
  require_positive(coin);
  const auto denom = coin.denom.to_string();
  host_.ledger.debit(from, denom, coin.amount);
  host_.ledger.lock_escrow(port, channel, denom, coin.amount);
  host_.verifiers.insert(from);
}

// Releasing escrow moves funds out of the IBC account.
void TokenTransferContext::unescrow_coins_execute(const Address& to, const PortId& port,
                                                  const ChannelId& channel, const Coin& coin)
{
  const auto denom = coin.denom.to_string();
  host_.ledger.release_escrow(port, channel, denom, coin.amount);
  host_.ledger.credit(to, denom, coin.amount);
  host_.verifiers.insert(host_.ibc_account);
}

}  // namespace shielded::recv::application::services
