#pragma once

#include <ostream>
#include <string>
#include <utility>

namespace shielded::recv::domain::ibc
{

// Account identifier exactly as carried on the wire. Not validated; decoding
// into a native address is the host's business.
class Signer
{
 public:
  Signer() = default;
  explicit Signer(std::string s) : s_(std::move(s)) {}

  const std::string& as_str() const noexcept { return s_; }

  friend bool operator==(const Signer& a, const Signer& b) { return a.s_ == b.s_; }
  friend bool operator!=(const Signer& a, const Signer& b) { return a.s_ != b.s_; }

 private:
  std::string s_;
};

inline std::ostream& operator<<(std::ostream& os, const Signer& s) { return os << s.as_str(); }

}  // namespace shielded::recv::domain::ibc
