#pragma once

#include <map>
#include <string>
#include <tuple>
#include <utility>

#include "application/ports/IHostLedger.hpp"

namespace shielded::recv::infrastructure::ledger
{

// std::map backed ledger. Zero balances are erased so snapshots stay small.
class HostLedger_InMemory final : public shielded::recv::application::ports::IHostLedger
{
 public:
  using Amount = shielded::recv::domain::ibc::Amount;
  using BalanceKey = std::pair<shielded::recv::domain::Address, std::string>;
  using EscrowKey = std::tuple<std::string, std::string, std::string>;  // port, channel, denom

  Amount balance(const shielded::recv::domain::Address& owner,
                 const std::string& denom) const override;
  void credit(const shielded::recv::domain::Address& owner, const std::string& denom,
              const Amount& amount) override;
  void debit(const shielded::recv::domain::Address& owner, const std::string& denom,
             const Amount& amount) override;

  Amount escrowed(const shielded::recv::domain::ibc::PortId& port,
                  const shielded::recv::domain::ibc::ChannelId& channel,
                  const std::string& denom) const override;
  void lock_escrow(const shielded::recv::domain::ibc::PortId& port,
                   const shielded::recv::domain::ibc::ChannelId& channel, const std::string& denom,
                   const Amount& amount) override;
  void release_escrow(const shielded::recv::domain::ibc::PortId& port,
                      const shielded::recv::domain::ibc::ChannelId& channel,
                      const std::string& denom, const Amount& amount) override;

  const std::map<BalanceKey, Amount>& balances() const noexcept { return balances_; }
  const std::map<EscrowKey, Amount>& escrows() const noexcept { return escrows_; }

 private:
  std::map<BalanceKey, Amount> balances_;
  std::map<EscrowKey, Amount> escrows_;
};

}  // namespace shielded::recv::infrastructure::ledger
