#pragma once

#include "application/ports/IHostLedger.hpp"
#include "domain/Address.hpp"

namespace shielded::recv::application::services
{

// Host state reached by every link of one chain. The host owns all of it and
// guarantees exclusive access while a packet is being processed.
struct HostContext
{
  ports::IHostLedger& ledger;
  domain::VerifierSet& verifiers;
  // Internal account that mints IBC vouchers and holds escrowed tokens.
  const domain::Address& ibc_account;
};

}  // namespace shielded::recv::application::services
