#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace shielded::recv::domain::ibc
{

// ICS-20 token amount. 256-bit unsigned, rendered as a decimal string on the
// wire. Arithmetic is checked: overflow and underflow raise instead of wrapping.
class Amount
{
 public:
  using value_type = boost::multiprecision::checked_uint256_t;

  Amount() = default;
  explicit Amount(std::uint64_t v) : value_(v) {}

  static Amount from_value(const value_type& v);

  // Accepts ASCII decimal digits only. Throws AmountError.
  static Amount from_string(std::string_view text);

  std::string to_string() const { return value_.str(); }
  const value_type& value() const noexcept { return value_; }
  bool is_zero() const { return value_.is_zero(); }

  // Throw AmountError on overflow / underflow.
  Amount checked_add(const Amount& rhs) const;
  Amount checked_sub(const Amount& rhs) const;

  friend bool operator==(const Amount& a, const Amount& b) { return a.value_ == b.value_; }
  friend bool operator!=(const Amount& a, const Amount& b) { return a.value_ != b.value_; }
  friend bool operator<(const Amount& a, const Amount& b) { return a.value_ < b.value_; }

 private:
  value_type value_{0};
};

inline std::ostream& operator<<(std::ostream& os, const Amount& a) { return os << a.to_string(); }

}  // namespace shielded::recv::domain::ibc
