#include "mcpbridge/proxy/proxy.hpp"

#include "mcpbridge/common/fs.hpp"
#include "mcpbridge/observability/global.hpp"
#include "mcpbridge/rpc/message.hpp"

namespace mcpbridge::proxy {

namespace {

void strip_line_terminators(std::string &text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
}

} // namespace

Proxy::Proxy(ProxyOptions options, std::shared_ptr<http::HttpClient> http_client,
             std::shared_ptr<accounts::AccountStore> account_store)
    : interceptor_(state_), request_rewriter_(state_, std::move(options.grant_tools)),
      response_rewriter_(std::move(options.zone_source)),
      transport_(
          TransportOptions{
              .endpoint = std::move(options.endpoint),
              .api_key = std::move(options.api_key),
              .timeout_ms = options.timeout_ms,
          },
          state_, std::move(http_client)) {
  state_.set_default_grant(std::move(options.default_grant));
  state_.set_account_store(std::move(account_store));
}

std::optional<std::string> Proxy::handle_line(const std::string &line,
                                              const common::CancelSignal &cancel) {
  const rpc::InboundMessage message = rpc::decode_line(line);

  if (message.parsed.has_value()) {
    if (auto local = interceptor_.try_handle(*message.parsed); local.has_value()) {
      return local;
    }
  }

  const std::string outbound = request_rewriter_.rewrite(message);
  const std::string method = message.parsed.has_value() ? message.parsed->method : "";

  auto reply = transport_.send(outbound, &cancel, method);
  if (!reply.ok()) {
    observability::record_error("transport", reply.error());
    return rpc::make_error(message.reply_id(), rpc::kInternalError, reply.error());
  }
  if (!reply.value().has_value()) {
    return std::nullopt;
  }

  std::string body = std::move(*reply.value());
  if (message.parsed.has_value()) {
    body = response_rewriter_.rewrite(method, body);
  }
  return body;
}

common::Status Proxy::run(LineSource &input, std::ostream &output,
                          const common::CancelSignal &cancel) {
  std::uint64_t replies_written = 0;
  while (true) {
    if (cancel.stop_requested()) {
      break;
    }

    auto next = input.next_line(cancel);
    if (!next.ok()) {
      if (cancel.stop_requested()) {
        break;
      }
      observability::record_error("stdin", next.error());
      return common::Status::error(next.error());
    }
    if (!next.value().has_value()) {
      observability::record_shutdown("end of input");
      return common::Status::success();
    }

    const std::string &line = *next.value();
    if (common::trim(line).empty()) {
      continue;
    }

    auto reply = handle_line(line, cancel);
    if (!reply.has_value()) {
      continue;
    }
    strip_line_terminators(*reply);
    output << *reply << '\n';
    output.flush();
    if (!output) {
      observability::record_error("stdout", "writing reply failed");
      return common::Status::error("writing reply failed");
    }
    observability::record_metric(observability::RepliesWrittenMetric{++replies_written});
  }

  const std::string reason = cancel.reason();
  observability::record_shutdown(reason);
  return common::Status::error(reason);
}

} // namespace mcpbridge::proxy
