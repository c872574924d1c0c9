#pragma once

#include <string>
#include <utility>
#include <vector>

namespace shielded::recv::domain::ibc
{

struct ModuleEvent
{
  std::string kind;
  std::vector<std::pair<std::string, std::string>> attributes;

  friend bool operator==(const ModuleEvent& a, const ModuleEvent& b)
  {
    return a.kind == b.kind && a.attributes == b.attributes;
  }
};

// Events and log lines a hook hands back to the protocol engine.
struct ModuleExtras
{
  std::vector<ModuleEvent> events;
  std::vector<std::string> log;

  static ModuleExtras empty() { return {}; }

  bool is_empty() const noexcept { return events.empty() && log.empty(); }

  friend bool operator==(const ModuleExtras& a, const ModuleExtras& b)
  {
    return a.events == b.events && a.log == b.log;
  }
};

}  // namespace shielded::recv::domain::ibc
