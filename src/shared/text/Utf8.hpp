#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace shielded::recv::shared::text
{

namespace detail
{
// Decodes one scalar value at `pos` and advances past it. Overlong forms,
// surrogates and values above U+10FFFF are errors.
inline std::optional<std::uint32_t> next_scalar(std::string_view s, std::size_t& pos)
{
  const auto lead = static_cast<unsigned char>(s[pos]);
  if (lead < 0x80)
  {
    ++pos;
    return lead;
  }

  std::size_t len = 0;
  std::uint32_t cp = 0;
  std::uint32_t min = 0;
  if ((lead & 0xe0) == 0xc0) { len = 2; cp = lead & 0x1f; min = 0x80; }
  else if ((lead & 0xf0) == 0xe0) { len = 3; cp = lead & 0x0f; min = 0x800; }
  else if ((lead & 0xf8) == 0xf0) { len = 4; cp = lead & 0x07; min = 0x10000; }
  else return std::nullopt;

  if (s.size() - pos < len) return std::nullopt;
  for (std::size_t i = 1; i < len; ++i)
  {
    const auto c = static_cast<unsigned char>(s[pos + i]);
    if ((c & 0xc0) != 0x80) return std::nullopt;
    cp = (cp << 6) | (c & 0x3f);
  }
  if (cp < min || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) return std::nullopt;

  pos += len;
  return cp;
}
}  // namespace detail

// True when `s` is well-formed UTF-8.
inline bool is_valid_utf8(std::string_view s)
{
  std::size_t pos = 0;
  while (pos < s.size())
  {
    if (!detail::next_scalar(s, pos)) return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// debug_quote(s)
//  - `s` in double quotes, with `"` and `\` backslash-escaped.
//  - \0 \t \r \n get their short escapes; other control characters (C0, DEL,
//    C1) become \u{hex}, lower-case without padding.
//  - Everything else is copied as-is. A malformed byte is written as \u{fffd}.
// -----------------------------------------------------------------------------
inline std::string debug_quote(std::string_view s)
{
  constexpr std::string_view digits = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 2);
  out += '"';

  std::size_t pos = 0;
  while (pos < s.size())
  {
    const std::size_t start = pos;
    auto cp = detail::next_scalar(s, pos);
    if (!cp)
    {
      pos = start + 1;
      out += "\\u{fffd}";
      continue;
    }

    switch (*cp)
    {
      case '\0': out += "\\0"; continue;
      case '\t': out += "\\t"; continue;
      case '\r': out += "\\r"; continue;
      case '\n': out += "\\n"; continue;
      case '"': out += "\\\""; continue;
      case '\\': out += "\\\\"; continue;
      default: break;
    }

    if (*cp < 0x20 || (*cp >= 0x7f && *cp <= 0x9f))
    {
      out += "\\u{";
      if (*cp >= 0x10) out += digits[*cp >> 4];
      out += digits[*cp & 0x0f];
      out += '}';
      continue;
    }
    out.append(s.substr(start, pos - start));
  }

  out += '"';
  return out;
}

}  // namespace shielded::recv::shared::text
