#include "infrastructure/ledger/HostLedger_InMemory.hpp"

#include "domain/ibc/Errors.hpp"

using shielded::recv::domain::Address;
using namespace shielded::recv::domain::ibc;

namespace shielded::recv::infrastructure::ledger
{

namespace
{
template <class Map, class Key>
Amount lookup(const Map& m, const Key& k)
{
  const auto it = m.find(k);
  return it == m.end() ? Amount{} : it->second;
}

template <class Map, class Key>
void add(Map& m, const Key& k, const Amount& amount, const std::string& what)
{
  try
  {
    const auto next = lookup(m, k).checked_add(amount);
    if (!next.is_zero()) m[k] = next;
  }
  catch (const AmountError&)
  {
    throw TokenTransferError(TokenTransferErrorCode::Overflow, what);
  }
}

template <class Map, class Key>
void subtract(Map& m, const Key& k, const Amount& amount, TokenTransferErrorCode code,
              const std::string& what)
{
  const auto have = lookup(m, k);
  if (have < amount)
    throw TokenTransferError(code, what + ": have " + have.to_string() + ", need " +
                                       amount.to_string());
  const auto left = have.checked_sub(amount);
  if (left.is_zero())
    m.erase(k);
  else
    m[k] = left;
}
}  // namespace

Amount HostLedger_InMemory::balance(const Address& owner, const std::string& denom) const
{
  return lookup(balances_, BalanceKey{owner, denom});
}

void HostLedger_InMemory::credit(const Address& owner, const std::string& denom,
                                 const Amount& amount)
{
  add(balances_, BalanceKey{owner, denom}, amount,
      "balance of " + owner.to_string() + " in " + denom);
}

void HostLedger_InMemory::debit(const Address& owner, const std::string& denom,
                                const Amount& amount)
{
  subtract(balances_, BalanceKey{owner, denom}, amount, TokenTransferErrorCode::InsufficientFunds,
           owner.to_string() + " in " + denom);
}

Amount HostLedger_InMemory::escrowed(const PortId& port, const ChannelId& channel,
                                     const std::string& denom) const
{
  return lookup(escrows_, EscrowKey{port.as_str(), channel.as_str(), denom});
}

void HostLedger_InMemory::lock_escrow(const PortId& port, const ChannelId& channel,
                                      const std::string& denom, const Amount& amount)
{
  add(escrows_, EscrowKey{port.as_str(), channel.as_str(), denom}, amount,
      "escrow " + port.as_str() + "/" + channel.as_str() + " in " + denom);
}

void HostLedger_InMemory::release_escrow(const PortId& port, const ChannelId& channel,
                                         const std::string& denom, const Amount& amount)
{
  subtract(escrows_, EscrowKey{port.as_str(), channel.as_str(), denom}, amount,
           TokenTransferErrorCode::InsufficientEscrow,
           "escrow " + port.as_str() + "/" + channel.as_str() + " in " + denom);
}

}  // namespace shielded::recv::infrastructure::ledger
