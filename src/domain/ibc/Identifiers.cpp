#include "domain/ibc/Identifiers.hpp"

#include <cctype>
#include <charconv>
#include <utility>

#include "domain/ibc/Errors.hpp"

namespace shielded::recv::domain::ibc
{

namespace
{
constexpr std::size_t kPortMinLen = 2;
constexpr std::size_t kPortMaxLen = 128;
constexpr std::string_view kPortSpecials = "._+-#[]<>";
constexpr std::string_view kChannelPrefix = "channel-";
constexpr std::string_view kConnectionPrefix = "connection-";

bool is_port_char(char c)
{
  return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
         kPortSpecials.find(c) != std::string_view::npos;
}

// `<prefix><u64>` without leading '+' or sign; the counter must fit in 64 bits.
bool has_counter_suffix(std::string_view id, std::string_view prefix)
{
  if (id.size() <= prefix.size() || id.substr(0, prefix.size()) != prefix) return false;
  const auto digits = id.substr(prefix.size());
  std::uint64_t counter = 0;
  const auto* end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), end, counter);
  return ec == std::errc{} && ptr == end;
}
}  // namespace

// ---------------------------------------------------------------------------
// PortId
// ---------------------------------------------------------------------------
bool PortId::is_valid(std::string_view id)
{
  if (id.size() < kPortMinLen || id.size() > kPortMaxLen) return false;
  for (const char c : id)
  {
    if (!is_port_char(c)) return false;
  }
  return true;
}

PortId::PortId(std::string id) : id_(std::move(id))
{
  if (!is_valid(id_)) throw IdentifierError("invalid port identifier: \"" + id_ + "\"");
}

// ---------------------------------------------------------------------------
// ChannelId
// ---------------------------------------------------------------------------
bool ChannelId::is_valid(std::string_view id) { return has_counter_suffix(id, kChannelPrefix); }

ChannelId::ChannelId(std::string id) : id_(std::move(id))
{
  if (!is_valid(id_)) throw IdentifierError("invalid channel identifier: \"" + id_ + "\"");
}

ChannelId::ChannelId(std::uint64_t counter)
    : id_(std::string(kChannelPrefix) + std::to_string(counter))
{
}

// ---------------------------------------------------------------------------
// ConnectionId
// ---------------------------------------------------------------------------
bool ConnectionId::is_valid(std::string_view id)
{
  return has_counter_suffix(id, kConnectionPrefix);
}

ConnectionId::ConnectionId(std::string id) : id_(std::move(id))
{
  if (!is_valid(id_)) throw IdentifierError("invalid connection identifier: \"" + id_ + "\"");
}

ConnectionId::ConnectionId(std::uint64_t counter)
    : id_(std::string(kConnectionPrefix) + std::to_string(counter))
{
}

}  // namespace shielded::recv::domain::ibc
