#include "domain/ibc/Amount.hpp"

#include <stdexcept>

#include "domain/ibc/Errors.hpp"

namespace shielded::recv::domain::ibc
{

Amount Amount::from_value(const value_type& v)
{
  Amount a;
  a.value_ = v;
  return a;
}

Amount Amount::from_string(std::string_view text)
{
  if (text.empty()) throw AmountError("empty amount");

  value_type v{0};
  try
  {
    for (const char c : text)
    {
      if (c < '0' || c > '9') throw AmountError("invalid digit in amount: " + std::string(text));
      v = v * 10u + static_cast<unsigned>(c - '0');
    }
  }
  catch (const std::overflow_error&)
  {
    throw AmountError("amount exceeds 256 bits: " + std::string(text));
  }
  return from_value(v);
}

Amount Amount::checked_add(const Amount& rhs) const
{
  try
  {
    return from_value(value_ + rhs.value_);
  }
  catch (const std::overflow_error&)
  {
    throw AmountError("amount addition overflows");
  }
}

Amount Amount::checked_sub(const Amount& rhs) const
{
  if (value_ < rhs.value_) throw AmountError("amount subtraction underflows");
  return from_value(value_ - rhs.value_);
}

}  // namespace shielded::recv::domain::ibc
