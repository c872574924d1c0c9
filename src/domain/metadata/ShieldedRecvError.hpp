#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "domain/ibc/Errors.hpp"

namespace shielded::recv::domain::metadata
{

// Error raised by the overflow-receive bridge of the shielded receive module.
class ShieldedRecvError : public std::runtime_error
{
 public:
  enum class Kind
  {
    AddressDecode,
    TokenTransfer,
  };

  static ShieldedRecvError address_decode(const std::string& detail)
  {
    return ShieldedRecvError{Kind::AddressDecode, "Shielded receive error: " + detail,
                             std::nullopt};
  }

  static ShieldedRecvError token_transfer(const ibc::TokenTransferError& e)
  {
    return ShieldedRecvError{Kind::TokenTransfer,
                             std::string("Shielded receive error: token transfer failed: ") +
                                 e.what(),
                             e.code()};
  }

  Kind kind() const noexcept { return kind_; }

  // Set for Kind::TokenTransfer.
  std::optional<ibc::TokenTransferErrorCode> transfer_code() const noexcept
  {
    return transfer_code_;
  }

 private:
  ShieldedRecvError(Kind kind, const std::string& msg,
                    std::optional<ibc::TokenTransferErrorCode> code)
      : std::runtime_error(msg), kind_(kind), transfer_code_(code)
  {
  }

  Kind kind_;
  std::optional<ibc::TokenTransferErrorCode> transfer_code_;
};

}  // namespace shielded::recv::domain::metadata
