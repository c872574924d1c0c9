#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace shielded::recv::domain
{

struct AddressError : std::invalid_argument
{
  using std::invalid_argument::invalid_argument;
};

// Native account address: one discriminant byte followed by a 20-byte hash,
// together with its canonical text form.
class Address
{
 public:
  static constexpr std::size_t kPayloadLen = 21;
  using Payload = std::array<std::uint8_t, kPayloadLen>;

  Address(Payload payload, std::string encoded)
      : payload_(payload), encoded_(std::move(encoded))
  {
  }

  const Payload& payload() const noexcept { return payload_; }
  std::uint8_t discriminant() const noexcept { return payload_[0]; }
  const std::string& to_string() const noexcept { return encoded_; }

  friend bool operator==(const Address& a, const Address& b) { return a.payload_ == b.payload_; }
  friend bool operator!=(const Address& a, const Address& b) { return a.payload_ != b.payload_; }
  friend bool operator<(const Address& a, const Address& b) { return a.payload_ < b.payload_; }

 private:
  Payload payload_;
  std::string encoded_;
};

inline std::ostream& operator<<(std::ostream& os, const Address& a) { return os << a.to_string(); }

// Addresses whose validity predicates must run for the current transaction.
using VerifierSet = std::set<Address>;

}  // namespace shielded::recv::domain
