#pragma once

#include "mcpbridge/common/cancel.hpp"
#include "mcpbridge/common/result.hpp"
#include "mcpbridge/http/client.hpp"
#include "mcpbridge/proxy/session_state.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge::proxy {

inline constexpr const char *kSessionHeader = "Mcp-Session-Id";
inline constexpr const char *kGrantHeader = "X-Nylas-Grant-Id";
inline constexpr const char *kAcceptHeaderValue = "application/json, text/event-stream";

struct TransportOptions {
  std::string endpoint;
  std::string api_key;
  std::uint64_t timeout_ms = 90'000;
};

/// One POST per call to the upstream endpoint.
///
/// Success with nullopt means "nothing to reply" (202 with an empty body, an
/// empty 2xx body, or an event stream without data lines). Transport failures
/// and non-2xx statuses are failures whose message is meant for a JSON-RPC
/// error reply.
class UpstreamTransport {
public:
  UpstreamTransport(TransportOptions options, SessionState &state,
                    std::shared_ptr<http::HttpClient> http_client);

  [[nodiscard]] common::Result<std::optional<std::string>>
  send(const std::string &body, const common::CancelSignal *cancel = nullptr,
       const std::string &method = "");

private:
  [[nodiscard]] http::HeaderMap build_headers() const;
  void capture_session(const http::HttpResponse &response);

  TransportOptions options_;
  std::string auth_header_;
  SessionState &state_;
  std::shared_ptr<http::HttpClient> http_client_;
};

/// Joins SSE data payloads: none -> nullopt, one -> as is, several -> a JSON
/// array in stream order. Fails when a payload of a batch is not valid JSON.
[[nodiscard]] common::Result<std::optional<std::string>>
join_sse_messages(const std::vector<std::string> &messages);

} // namespace mcpbridge::proxy
