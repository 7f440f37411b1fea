#include "test_framework.hpp"

#include "mcpbridge/http/sse.hpp"
#include "mcpbridge/proxy/transport.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace proxy = mcpbridge::proxy;
using mcpbridge::testing::MockHttpClient;

proxy::TransportOptions test_options() {
  return proxy::TransportOptions{
      .endpoint = "https://mcp.test.invalid", .api_key = "secret", .timeout_ms = 1234};
}

} // namespace

void register_transport_tests(std::vector<mcpbridge::tests::TestCase> &tests) {
  using mcpbridge::tests::require;

  tests.push_back({"transport_sends_auth_and_accept_headers", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->push_json(200, R"({"jsonrpc":"2.0","id":1,"result":{}})");
                     proxy::SessionState state;
                     proxy::UpstreamTransport transport(test_options(), state, http);

                     const auto reply = transport.send(R"({"id":1})");
                     require(reply.ok(), reply.error());
                     require(reply.value() == std::optional<std::string>(R"({"jsonrpc":"2.0","id":1,"result":{}})"),
                             "body should pass through");
                     const auto &sent = http->last();
                     require(sent.url == "https://mcp.test.invalid", "endpoint mismatch");
                     require(sent.body == R"({"id":1})", "body mismatch");
                     require(sent.timeout_ms == 1234, "timeout mismatch");
                     require(sent.headers.at("Authorization") == "Bearer secret", "auth header");
                     require(sent.headers.at("Accept") == proxy::kAcceptHeaderValue, "accept header");
                     require(sent.headers.at("Content-Type") == "application/json", "content type");
                     require(!sent.headers.contains(proxy::kSessionHeader), "no session yet");
                     require(!sent.headers.contains(proxy::kGrantHeader), "no grant configured");
                   }});

  tests.push_back({"transport_captures_and_replays_session", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     mcpbridge::http::HttpResponse first;
                     first.status = 500;
                     first.body = "oops";
                     first.headers["mcp-session-id"] = "sess-42";
                     http->push_response(first);
                     http->push_json(200, "{}");

                     proxy::SessionState state;
                     state.set_default_grant(std::string("acct-9"));
                     proxy::UpstreamTransport transport(test_options(), state, http);

                     const auto failed = transport.send("{}");
                     require(!failed.ok(), "500 should fail");
                     require(state.session_id() == std::optional<std::string>("sess-42"),
                             "session should be captured even on error statuses");

                     const auto second = transport.send("{}");
                     require(second.ok(), second.error());
                     require(http->last().headers.at(proxy::kSessionHeader) == "sess-42",
                             "session header should be replayed");
                     require(http->last().headers.at(proxy::kGrantHeader) == "acct-9",
                             "grant header expected");
                   }});

  tests.push_back({"transport_accepted_without_body_is_no_reply", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->push_json(202, "");
                     http->push_json(202, R"({"jsonrpc":"2.0","id":4,"result":{}})");
                     proxy::SessionState state;
                     proxy::UpstreamTransport transport(test_options(), state, http);

                     const auto empty = transport.send("{}");
                     require(empty.ok(), empty.error());
                     require(!empty.value().has_value(), "202 with empty body means no reply");

                     const auto with_body = transport.send("{}");
                     require(with_body.ok(), with_body.error());
                     require(with_body.value().has_value(), "202 with a body is returned");
                   }});

  tests.push_back({"transport_non_2xx_carries_body", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->push_json(400, "bad request");
                     proxy::SessionState state;
                     proxy::UpstreamTransport transport(test_options(), state, http);
                     const auto reply = transport.send("{}");
                     require(!reply.ok(), "400 should fail");
                     require(reply.error() == "server returned 400: bad request",
                             "unexpected error: " + reply.error());
                   }});

  tests.push_back({"transport_network_errors_and_cancellation", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     mcpbridge::http::HttpResponse refused;
                     refused.network_error = true;
                     refused.network_error_message = "Couldn't connect to server";
                     http->push_response(refused);
                     mcpbridge::http::HttpResponse cancelled;
                     cancelled.network_error = true;
                     cancelled.cancelled = true;
                     http->push_response(cancelled);

                     proxy::SessionState state;
                     proxy::UpstreamTransport transport(test_options(), state, http);
                     const auto first = transport.send("{}");
                     require(!first.ok(), "network error should fail");
                     require(first.error() == "sending request: Couldn't connect to server",
                             "unexpected error: " + first.error());

                     mcpbridge::common::CancelSignal cancel;
                     cancel.request_stop(std::string("user quit"));
                     const auto second = transport.send("{}", &cancel);
                     require(!second.ok(), "cancellation should fail");
                     require(second.error() == "request cancelled: user quit",
                             "unexpected error: " + second.error());
                   }});

  tests.push_back({"transport_reports_timeouts_separately", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     mcpbridge::http::HttpResponse slow;
                     slow.network_error = true;
                     slow.timeout = true;
                     slow.network_error_message = "Timeout was reached";
                     http->push_response(slow);

                     proxy::SessionState state;
                     auto options = test_options();
                     options.timeout_ms = 1500;
                     proxy::UpstreamTransport transport(options, state, http);
                     const auto reply = transport.send("{}");
                     require(!reply.ok(), "timeout should fail");
                     require(reply.error() == "request timed out after 1500 ms: Timeout was reached",
                             "unexpected error: " + reply.error());
                   }});

  tests.push_back({"transport_event_stream_joins_messages", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->push_sse("event: message\r\ndata: {\"id\":1}\r\n\r\n");
                     http->push_sse(": keepalive\n\n");
                     http->push_sse("data: {\"id\":1}\n\ndata:{\"id\":2}\n\n");
                     http->push_sse("data: {\"id\":1}\n\ndata: not json\n\n");
                     proxy::SessionState state;
                     proxy::UpstreamTransport transport(test_options(), state, http);

                     const auto single = transport.send("{}");
                     require(single.ok(), single.error());
                     require(single.value() == std::optional<std::string>("{\"id\":1}"),
                             "single message should be unwrapped");

                     const auto none = transport.send("{}");
                     require(none.ok(), none.error());
                     require(!none.value().has_value(), "no data lines means no reply");

                     const auto batch = transport.send("{}");
                     require(batch.ok(), batch.error());
                     require(batch.value() == std::optional<std::string>("[{\"id\":1},{\"id\":2}]"),
                             "batch should keep stream order");

                     const auto broken = transport.send("{}");
                     require(!broken.ok(), "invalid payload in a batch should fail");
                   }});

  tests.push_back({"sse_extracts_data_lines", [] {
                     const auto lines = mcpbridge::http::extract_sse_data_lines(
                         "id: 1\ndata:  two spaces\ndata:\ndata: x\r\nretry: 10\n");
                     require(lines.size() == 2, "expected two payloads");
                     require(lines[0] == " two spaces", "only one leading space is stripped");
                     require(lines[1] == "x", "carriage return should be stripped");
                     require(mcpbridge::http::is_event_stream("Text/Event-Stream; charset=utf-8"),
                             "content type match should ignore case and parameters");
                     require(!mcpbridge::http::is_event_stream("application/json"), "json is not SSE");
                   }});
}
