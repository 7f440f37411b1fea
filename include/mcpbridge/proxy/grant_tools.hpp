#pragma once

#include <set>
#include <string>
#include <vector>

namespace mcpbridge::proxy {

/// Tool that reports the current account; answered locally when possible.
inline constexpr const char *kGetGrantTool = "get_grant";

/// Immutable set of tools that accept `grant_id` at the top level of their
/// arguments. Tools outside it never get a grant injected: utility tools take
/// none, and tools such as `availability` nest grant ids inside participants.
class GrantToolTable {
public:
  /// get_grant, calendars, events, messages, threads, folders, drafts, send.
  [[nodiscard]] static GrantToolTable builtin();

  explicit GrantToolTable(const std::vector<std::string> &tools);

  [[nodiscard]] bool requires_grant(const std::string &tool) const;
  [[nodiscard]] const std::set<std::string> &tools() const { return tools_; }

private:
  std::set<std::string> tools_;
};

} // namespace mcpbridge::proxy
