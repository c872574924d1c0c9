#include "domain/ibc/Denom.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "domain/ibc/Errors.hpp"

namespace shielded::recv::domain::ibc
{

namespace
{
bool is_blank(std::string_view s)
{
  return std::all_of(s.begin(), s.end(),
                     [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

std::vector<std::string_view> split_slash(std::string_view s)
{
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  for (;;)
  {
    const auto pos = s.find('/', start);
    if (pos == std::string_view::npos)
    {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}
}  // namespace

PrefixedDenom::PrefixedDenom(std::vector<TracePrefix> trace_path, std::string base_denom)
    : trace_path_(std::move(trace_path)), base_denom_(std::move(base_denom))
{
  if (is_blank(base_denom_)) throw DenomError("base denomination is empty");
}

PrefixedDenom PrefixedDenom::from_string(std::string_view text)
{
  const auto parts = split_slash(text);

  // Strip leading {port}/{channel} pairs as long as something remains for the
  // base denomination.
  std::vector<TracePrefix> trace;
  std::size_t i = 0;
  while (i + 2 < parts.size() && PortId::is_valid(parts[i]) && ChannelId::is_valid(parts[i + 1]))
  {
    trace.push_back(TracePrefix{PortId{std::string(parts[i])}, ChannelId{std::string(parts[i + 1])}});
    i += 2;
  }

  std::string base;
  for (std::size_t j = i; j < parts.size(); ++j)
  {
    if (j != i) base += '/';
    base.append(parts[j]);
  }
  return PrefixedDenom{std::move(trace), std::move(base)};
}

bool PrefixedDenom::has_prefix(const PortId& port, const ChannelId& channel) const
{
  return !trace_path_.empty() && trace_path_.front() == TracePrefix{port, channel};
}

void PrefixedDenom::remove_prefix(const PortId& port, const ChannelId& channel)
{
  if (has_prefix(port, channel)) trace_path_.erase(trace_path_.begin());
}

void PrefixedDenom::add_prefix(const PortId& port, const ChannelId& channel)
{
  trace_path_.insert(trace_path_.begin(), TracePrefix{port, channel});
}

std::string PrefixedDenom::to_string() const
{
  std::string out;
  for (const auto& p : trace_path_)
  {
    out += p.port_id.as_str();
    out += '/';
    out += p.channel_id.as_str();
    out += '/';
  }
  out += base_denom_;
  return out;
}

}  // namespace shielded::recv::domain::ibc
