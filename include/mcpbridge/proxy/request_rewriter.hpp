#pragma once

#include "mcpbridge/proxy/grant_tools.hpp"
#include "mcpbridge/proxy/session_state.hpp"
#include "mcpbridge/rpc/message.hpp"

#include <string>

namespace mcpbridge::proxy {

/// Adds `arguments.grant_id` = default grant to tool calls on grant-taking
/// tools that name neither `grant_id` nor `identifier`. Everything else is
/// forwarded byte-for-byte.
class RequestRewriter {
public:
  RequestRewriter(const SessionState &state, GrantToolTable tools);

  /// Bytes to send upstream for `message`.
  [[nodiscard]] std::string rewrite(const rpc::InboundMessage &message) const;

  [[nodiscard]] const GrantToolTable &tools() const { return tools_; }

private:
  const SessionState &state_;
  GrantToolTable tools_;
};

} // namespace mcpbridge::proxy
