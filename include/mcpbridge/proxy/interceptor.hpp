#pragma once

#include "mcpbridge/proxy/session_state.hpp"
#include "mcpbridge/rpc/message.hpp"

#include <optional>
#include <string>

namespace mcpbridge::proxy {

inline constexpr const char *kNoAccountsMessage =
    "No authenticated grants found. Please run 'nylas auth login' first.";

/// Answers `get_grant` calls that name no email/identifier from the local
/// account store. Never touches the network.
class LocalCallInterceptor {
public:
  explicit LocalCallInterceptor(const SessionState &state);

  /// The reply when the request was answered locally, nullopt to forward it.
  [[nodiscard]] std::optional<std::string> try_handle(const rpc::Request &request) const;

private:
  const SessionState &state_;
};

} // namespace mcpbridge::proxy
