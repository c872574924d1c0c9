#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace shielded::recv::domain::ibc
{

// ICS-24 port identifier.
class PortId
{
 public:
  explicit PortId(std::string id);

  static PortId transfer() { return PortId{"transfer"}; }
  static bool is_valid(std::string_view id);

  const std::string& as_str() const noexcept { return id_; }

  friend bool operator==(const PortId& a, const PortId& b) { return a.id_ == b.id_; }
  friend bool operator!=(const PortId& a, const PortId& b) { return a.id_ != b.id_; }
  friend bool operator<(const PortId& a, const PortId& b) { return a.id_ < b.id_; }

 private:
  std::string id_;
};

// `channel-<n>`
class ChannelId
{
 public:
  explicit ChannelId(std::string id);
  explicit ChannelId(std::uint64_t counter);

  static bool is_valid(std::string_view id);

  const std::string& as_str() const noexcept { return id_; }

  friend bool operator==(const ChannelId& a, const ChannelId& b) { return a.id_ == b.id_; }
  friend bool operator!=(const ChannelId& a, const ChannelId& b) { return a.id_ != b.id_; }
  friend bool operator<(const ChannelId& a, const ChannelId& b) { return a.id_ < b.id_; }

 private:
  std::string id_;
};

// `connection-<n>`
class ConnectionId
{
 public:
  explicit ConnectionId(std::string id);
  explicit ConnectionId(std::uint64_t counter);

  static bool is_valid(std::string_view id);

  const std::string& as_str() const noexcept { return id_; }

  friend bool operator==(const ConnectionId& a, const ConnectionId& b) { return a.id_ == b.id_; }
  friend bool operator!=(const ConnectionId& a, const ConnectionId& b) { return a.id_ != b.id_; }

 private:
  std::string id_;
};

inline std::ostream& operator<<(std::ostream& os, const PortId& p) { return os << p.as_str(); }
inline std::ostream& operator<<(std::ostream& os, const ChannelId& c) { return os << c.as_str(); }
inline std::ostream& operator<<(std::ostream& os, const ConnectionId& c) { return os << c.as_str(); }

}  // namespace shielded::recv::domain::ibc
