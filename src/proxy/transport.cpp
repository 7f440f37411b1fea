#include "mcpbridge/proxy/transport.hpp"

#include "mcpbridge/common/fs.hpp"
#include "mcpbridge/common/json.hpp"
#include "mcpbridge/http/sse.hpp"
#include "mcpbridge/observability/global.hpp"

#include <chrono>

namespace mcpbridge::proxy {

namespace {

using SendResult = common::Result<std::optional<std::string>>;

bool is_success_status(const std::uint16_t status) { return status >= 200 && status < 300; }

} // namespace

SendResult join_sse_messages(const std::vector<std::string> &messages) {
  if (messages.empty()) {
    return SendResult::success(std::nullopt);
  }
  if (messages.size() == 1) {
    return SendResult::success(messages.front());
  }

  std::string batch = "[";
  for (std::size_t i = 0; i < messages.size(); ++i) {
    if (!common::Json::accept(messages[i])) {
      return SendResult::failure("reading SSE: invalid JSON-RPC message in event stream");
    }
    if (i > 0) {
      batch.push_back(',');
    }
    batch += messages[i];
  }
  batch.push_back(']');
  return SendResult::success(std::move(batch));
}

UpstreamTransport::UpstreamTransport(TransportOptions options, SessionState &state,
                                     std::shared_ptr<http::HttpClient> http_client)
    : options_(std::move(options)), auth_header_("Bearer " + options_.api_key), state_(state),
      http_client_(std::move(http_client)) {}

http::HeaderMap UpstreamTransport::build_headers() const {
  http::HeaderMap headers{
      {"Content-Type", "application/json"},
      {"Accept", kAcceptHeaderValue},
      {"Authorization", auth_header_},
  };

  const auto snapshot = state_.snapshot();
  if (snapshot.session_id.has_value()) {
    headers[kSessionHeader] = *snapshot.session_id;
  }
  if (snapshot.default_grant.has_value()) {
    headers[kGrantHeader] = *snapshot.default_grant;
  }
  return headers;
}

void UpstreamTransport::capture_session(const http::HttpResponse &response) {
  const auto session_id = response.header(kSessionHeader);
  if (!session_id.has_value() || session_id->empty()) {
    return;
  }
  if (state_.set_session_id(*session_id)) {
    observability::record_session_captured(*session_id);
  }
}

SendResult UpstreamTransport::send(const std::string &body, const common::CancelSignal *cancel,
                                   const std::string &method) {
  const auto started = std::chrono::steady_clock::now();
  const auto response =
      http_client_->post(options_.endpoint, build_headers(), body, options_.timeout_ms, cancel);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (response.cancelled) {
    observability::record_forward(method, 0, elapsed, false);
    const std::string reason = cancel != nullptr && cancel->stop_requested()
                                   ? cancel->reason()
                                   : response.network_error_message;
    return SendResult::failure("request cancelled: " + reason);
  }
  if (response.timeout) {
    observability::record_forward(method, 0, elapsed, false);
    return SendResult::failure("request timed out after " +
                               std::to_string(options_.timeout_ms) + " ms: " +
                               response.network_error_message);
  }
  if (response.network_error || response.status == 0) {
    observability::record_forward(method, 0, elapsed, false);
    const std::string detail = response.network_error_message.empty()
                                   ? std::string("no response from server")
                                   : response.network_error_message;
    return SendResult::failure("sending request: " + detail);
  }

  capture_session(response);
  const bool success = is_success_status(response.status);
  observability::record_forward(method, response.status, elapsed, success);

  if (response.status == 202 && common::trim(response.body).empty()) {
    return SendResult::success(std::nullopt);
  }
  if (!success) {
    return SendResult::failure("server returned " + std::to_string(response.status) + ": " +
                               response.body);
  }

  if (http::is_event_stream(response.header("content-type").value_or(""))) {
    return join_sse_messages(http::extract_sse_data_lines(response.body));
  }
  if (response.body.empty()) {
    return SendResult::success(std::nullopt);
  }
  return SendResult::success(response.body);
}

} // namespace mcpbridge::proxy
