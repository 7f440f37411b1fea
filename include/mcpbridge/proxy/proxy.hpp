#pragma once

#include "mcpbridge/accounts/store.hpp"
#include "mcpbridge/common/cancel.hpp"
#include "mcpbridge/common/result.hpp"
#include "mcpbridge/http/client.hpp"
#include "mcpbridge/proxy/grant_tools.hpp"
#include "mcpbridge/proxy/interceptor.hpp"
#include "mcpbridge/proxy/line_source.hpp"
#include "mcpbridge/proxy/request_rewriter.hpp"
#include "mcpbridge/proxy/response_rewriter.hpp"
#include "mcpbridge/proxy/session_state.hpp"
#include "mcpbridge/proxy/timezone.hpp"
#include "mcpbridge/proxy/transport.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace mcpbridge::proxy {

struct ProxyOptions {
  std::string endpoint;
  std::string api_key;
  std::uint64_t timeout_ms = 90'000;
  std::optional<std::string> default_grant;
  GrantToolTable grant_tools = GrantToolTable::builtin();
  ZoneSource zone_source = detect_local_zone;
};

/// Bridges newline-delimited JSON-RPC on a local stream to the upstream HTTP
/// endpoint. Strictly one request in flight; replies leave in arrival order.
class Proxy {
public:
  Proxy(ProxyOptions options, std::shared_ptr<http::HttpClient> http_client,
        std::shared_ptr<accounts::AccountStore> account_store = nullptr);

  Proxy(const Proxy &) = delete;
  Proxy &operator=(const Proxy &) = delete;

  /// Processes one inbound line. nullopt means nothing is written back.
  [[nodiscard]] std::optional<std::string> handle_line(const std::string &line,
                                                       const common::CancelSignal &cancel);

  /// Reads until end of input (success) or cancellation (error carrying the
  /// reason). Each reply is written on its own line and flushed.
  [[nodiscard]] common::Status run(LineSource &input, std::ostream &output,
                                   const common::CancelSignal &cancel);

  [[nodiscard]] SessionState &session() { return state_; }
  [[nodiscard]] const SessionState &session() const { return state_; }

private:
  SessionState state_;
  LocalCallInterceptor interceptor_;
  RequestRewriter request_rewriter_;
  ResponseRewriter response_rewriter_;
  UpstreamTransport transport_;
};

} // namespace mcpbridge::proxy
