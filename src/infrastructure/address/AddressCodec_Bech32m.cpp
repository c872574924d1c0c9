#include "infrastructure/address/AddressCodec_Bech32m.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using shielded::recv::domain::Address;
using shielded::recv::domain::AddressError;

namespace shielded::recv::infrastructure::address
{

namespace
{
constexpr std::string_view kCharset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
constexpr std::uint32_t kBech32mConst = 0x2bc830a3;
constexpr std::size_t kChecksumLen = 6;
constexpr std::size_t kMaxLen = 90;

std::uint32_t polymod(const std::vector<std::uint8_t>& values)
{
  constexpr std::array<std::uint32_t, 5> gen = {0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd,
                                                0x2a1462b3};
  std::uint32_t chk = 1;
  for (const auto v : values)
  {
    const std::uint32_t top = chk >> 25;
    chk = ((chk & 0x1ffffff) << 5) ^ v;
    for (std::size_t i = 0; i < gen.size(); ++i)
    {
      if ((top >> i) & 1) chk ^= gen[i];
    }
  }
  return chk;
}

std::vector<std::uint8_t> hrp_expand(std::string_view hrp)
{
  std::vector<std::uint8_t> out;
  out.reserve(hrp.size() * 2 + 1);
  for (const char c : hrp) out.push_back(static_cast<std::uint8_t>(c) >> 5);
  out.push_back(0);
  for (const char c : hrp) out.push_back(static_cast<std::uint8_t>(c) & 31);
  return out;
}

// Regroups bits; `pad` allows a zero-filled incomplete trailing group.
std::optional<std::vector<std::uint8_t>> convert_bits(const std::vector<std::uint8_t>& in,
                                                      int from, int to, bool pad)
{
  std::uint32_t acc = 0;
  int bits = 0;
  const std::uint32_t maxv = (1u << to) - 1;
  std::vector<std::uint8_t> out;
  for (const auto v : in)
  {
    if ((v >> from) != 0) return std::nullopt;
    acc = (acc << from) | v;
    bits += from;
    while (bits >= to)
    {
      bits -= to;
      out.push_back(static_cast<std::uint8_t>((acc >> bits) & maxv));
    }
  }
  if (pad)
  {
    if (bits > 0) out.push_back(static_cast<std::uint8_t>((acc << (to - bits)) & maxv));
  }
  else if (bits >= from || ((acc << (to - bits)) & maxv) != 0)
  {
    return std::nullopt;
  }
  return out;
}
}  // namespace

AddressCodec_Bech32m::AddressCodec_Bech32m(std::string hrp) : hrp_(std::move(hrp))
{
  for (auto& c : hrp_) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (hrp_.empty()) throw std::invalid_argument("address prefix must not be empty");
}

Address AddressCodec_Bech32m::decode(std::string_view text) const
{
  const std::string quoted = "\"" + std::string(text) + "\"";
  if (text.size() > kMaxLen) throw AddressError("address too long: " + quoted);

  bool lower = false, upper = false;
  for (const char c : text)
  {
    const auto u = static_cast<unsigned char>(c);
    if (u < 33 || u > 126) throw AddressError("invalid character in address: " + quoted);
    if (std::islower(u)) lower = true;
    if (std::isupper(u)) upper = true;
  }
  if (lower && upper) throw AddressError("mixed-case address: " + quoted);

  std::string s(text);
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  const auto sep = s.rfind('1');
  if (sep == std::string::npos || sep == 0 || sep + 1 + kChecksumLen > s.size())
    throw AddressError("missing bech32m separator or data: " + quoted);

  const std::string_view hrp(s.data(), sep);
  if (hrp != hrp_)
    throw AddressError("unexpected address prefix \"" + std::string(hrp) + "\" in " + quoted +
                       ", expected \"" + hrp_ + "\"");

  std::vector<std::uint8_t> data;
  data.reserve(s.size() - sep - 1);
  for (std::size_t i = sep + 1; i < s.size(); ++i)
  {
    const auto pos = kCharset.find(s[i]);
    if (pos == std::string_view::npos) throw AddressError("invalid bech32m character in " + quoted);
    data.push_back(static_cast<std::uint8_t>(pos));
  }

  auto check = hrp_expand(hrp);
  check.insert(check.end(), data.begin(), data.end());
  if (polymod(check) != kBech32mConst) throw AddressError("invalid bech32m checksum in " + quoted);

  data.resize(data.size() - kChecksumLen);
  const auto bytes = convert_bits(data, 5, 8, false);
  if (!bytes) throw AddressError("invalid bech32m padding in " + quoted);
  if (bytes->size() != Address::kPayloadLen)
    throw AddressError("unexpected address payload length " + std::to_string(bytes->size()) +
                       " in " + quoted);

  Address::Payload payload{};
  std::copy(bytes->begin(), bytes->end(), payload.begin());
  return Address{payload, s};
}

Address AddressCodec_Bech32m::encode(const Address::Payload& payload) const
{
  const auto data = convert_bits(std::vector<std::uint8_t>(payload.begin(), payload.end()), 8, 5,
                                 true);

  auto values = hrp_expand(hrp_);
  values.insert(values.end(), data->begin(), data->end());
  values.insert(values.end(), kChecksumLen, 0);
  const std::uint32_t mod = polymod(values) ^ kBech32mConst;

  std::string out = hrp_ + '1';
  for (const auto v : *data) out += kCharset[v];
  for (std::size_t i = 0; i < kChecksumLen; ++i) out += kCharset[(mod >> (5 * (5 - i))) & 31];
  return Address{payload, out};
}

}  // namespace shielded::recv::infrastructure::address
