#include "infrastructure/codec/PacketFile_Json.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "shared/json/Json.hpp"

using namespace shielded::recv::domain::ibc;
namespace json = shielded::recv::shared::json;

namespace shielded::recv::infrastructure::codec
{

namespace
{
std::string require_string(const Json::Value& root, const char* key)
{
  const Json::Value& v = root[key];
  if (!v.isString())
    throw std::runtime_error(std::string("packet file: missing string \"") + key + "\"");
  return v.asString();
}

std::uint64_t optional_u64(const Json::Value& root, const char* key)
{
  if (!root.isMember(key)) return 0;
  const Json::Value& v = root[key];
  if (!v.isUInt64())
    throw std::runtime_error(std::string("packet file: \"") + key +
                             "\" must be an unsigned integer");
  return v.asUInt64();
}
}  // namespace

Packet PacketFile_Json::parse(const std::string& text)
{
  const auto root = json::parse_object(text);
  if (!root) throw std::runtime_error("packet file: not a JSON object");

  const Json::Value& data = (*root)["data"];
  std::string payload;
  if (data.isObject())
    payload = json::write_compact(data);
  else if (data.isString())
    payload = data.asString();
  else
    throw std::runtime_error("packet file: \"data\" must be an object or a string");

  Packet p{
      optional_u64(*root, "sequence"),
      PortId{require_string(*root, "source_port")},
      ChannelId{require_string(*root, "source_channel")},
      PortId{require_string(*root, "destination_port")},
      ChannelId{require_string(*root, "destination_channel")},
      std::vector<std::uint8_t>(payload.begin(), payload.end()),
  };

  if (root->isMember("timeout_height"))
  {
    const Json::Value& h = (*root)["timeout_height"];
    if (!h.isObject())
      throw std::runtime_error("packet file: \"timeout_height\" must be an object");
    p.timeout_height_on_b.revision_number = optional_u64(h, "revision_number");
    p.timeout_height_on_b.revision_height = optional_u64(h, "revision_height");
  }
  p.timeout_timestamp_on_b = optional_u64(*root, "timeout_timestamp");
  return p;
}

Packet PacketFile_Json::load(const std::string& path)
{
  std::ifstream in(path);
  if (!in.is_open()) throw std::runtime_error("Failed to open packet file: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse(ss.str());
}

}  // namespace shielded::recv::infrastructure::codec
