#include "mcpbridge/proxy/grant_tools.hpp"

#include "mcpbridge/common/fs.hpp"

namespace mcpbridge::proxy {

GrantToolTable GrantToolTable::builtin() {
  return GrantToolTable(std::vector<std::string>{
      kGetGrantTool,
      "list_calendars",
      "list_events",
      "create_event",
      "update_event",
      "list_messages",
      "list_threads",
      "get_folder_by_id",
      "create_draft",
      "update_draft",
      "send_draft",
      "send_message",
  });
}

GrantToolTable::GrantToolTable(const std::vector<std::string> &tools) {
  for (const auto &tool : tools) {
    const std::string name = common::trim(tool);
    if (!name.empty()) {
      tools_.insert(name);
    }
  }
}

bool GrantToolTable::requires_grant(const std::string &tool) const {
  return tools_.contains(tool);
}

} // namespace mcpbridge::proxy
