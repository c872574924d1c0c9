#pragma once

#include <stdexcept>
#include <string>

namespace shielded::recv::domain::ibc
{

// Malformed wire values. These are raised while parsing and are caught by the
// decoders, which report "not applicable" instead.
struct IdentifierError : std::invalid_argument
{
  using std::invalid_argument::invalid_argument;
};

struct DenomError : std::invalid_argument
{
  using std::invalid_argument::invalid_argument;
};

struct AmountError : std::invalid_argument
{
  using std::invalid_argument::invalid_argument;
};

// Raised by channel handshake hooks.
struct ChannelError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// Raised by packet hooks (acknowledgement / timeout).
struct PacketError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

enum class TokenTransferErrorCode
{
  InvalidAmount,
  InsufficientFunds,
  InsufficientEscrow,
  Overflow,
  InvalidAccount,
};

inline const char* to_string(TokenTransferErrorCode c)
{
  switch (c)
  {
    case TokenTransferErrorCode::InvalidAmount:      return "invalid amount";
    case TokenTransferErrorCode::InsufficientFunds:  return "insufficient funds";
    case TokenTransferErrorCode::InsufficientEscrow: return "insufficient escrow";
    case TokenTransferErrorCode::Overflow:           return "amount overflow";
    case TokenTransferErrorCode::InvalidAccount:     return "invalid account";
  }
  return "token transfer error";
}

// Failure of a ledger mutation requested through the token-transfer execution
// context.
class TokenTransferError : public std::runtime_error
{
 public:
  TokenTransferError(TokenTransferErrorCode code, const std::string& detail)
      : std::runtime_error(std::string(to_string(code)) + ": " + detail), code_(code)
  {
  }

  TokenTransferErrorCode code() const noexcept { return code_; }

 private:
  TokenTransferErrorCode code_;
};

}  // namespace shielded::recv::domain::ibc
