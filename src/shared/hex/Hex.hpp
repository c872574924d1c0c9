#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace shielded::recv::shared::hex
{

// -----------------------------------------------------------------------------
// preview(data, limit)
//  - Lower-case hex, two digits per byte, no separators.
//  - At most `limit` bytes are rendered (0 renders everything); a cut preview
//    ends in "..".
// -----------------------------------------------------------------------------
inline std::string preview(std::span<const std::byte> data, std::size_t limit = 64)
{
  constexpr std::string_view digits = "0123456789abcdef";
  const std::size_t shown = (limit == 0 || limit > data.size()) ? data.size() : limit;

  std::string out;
  out.reserve(shown * 2 + 2);
  for (std::size_t i = 0; i < shown; ++i)
  {
    const auto b = std::to_integer<unsigned>(data[i]);
    out += digits[b >> 4];
    out += digits[b & 0x0f];
  }
  if (shown < data.size()) out += "..";
  return out;
}

// "<tag> (<n> bytes): <preview>"
inline std::string make_line(std::string_view tag, std::span<const std::byte> data,
                             std::size_t limit = 32)
{
  std::string line(tag);
  line += " (" + std::to_string(data.size()) + " bytes): ";
  line += preview(data, limit);
  return line;
}

}  // namespace shielded::recv::shared::hex
