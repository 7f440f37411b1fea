#include "test_framework.hpp"

#include "mcpbridge/rpc/message.hpp"

void register_rpc_tests(std::vector<mcpbridge::tests::TestCase> &tests) {
  using mcpbridge::tests::require;
  namespace rpc = mcpbridge::rpc;
  using rpc::Json;

  tests.push_back({"rpc_parses_tool_call", [] {
                     const auto request = rpc::parse_request(
                         R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"list_events","arguments":{"limit":5}}})");
                     require(request.has_value(), "request should parse");
                     require(request->id == 7, "id mismatch");
                     require(request->is_tool_call(), "should be a tool call");
                     require(request->tool_name == "list_events", "tool name mismatch");
                     require(request->has_argument("limit"), "argument should be present");
                     require(!request->has_argument("grant_id"), "grant_id should be absent");
                   }});

  tests.push_back({"rpc_string_ids_and_missing_params", [] {
                     const auto request = rpc::parse_request(R"({"jsonrpc":"2.0","id":"abc","method":"ping"})");
                     require(request.has_value(), "request should parse");
                     require(request->id == "abc", "string id should be kept");
                     require(!request->is_tool_call(), "ping is not a tool call");
                     require(request->arguments.is_null(), "arguments should be null");
                   }});

  tests.push_back({"rpc_rejects_wrong_field_types", [] {
                     require(!rpc::parse_request("not json at all").has_value(), "plain text");
                     require(!rpc::parse_request("[1,2]").has_value(), "array root");
                     require(!rpc::parse_request(R"({"method":42})").has_value(), "numeric method");
                     require(!rpc::parse_request(R"({"method":"tools/call","params":[1]})").has_value(),
                             "array params");
                     require(!rpc::parse_request(
                                  R"({"method":"tools/call","params":{"name":"x","arguments":"y"}})")
                                  .has_value(),
                             "string arguments");
                   }});

  tests.push_back({"rpc_string_argument_ignores_empty_and_non_strings", [] {
                     const auto request = rpc::parse_request(
                         R"({"method":"tools/call","params":{"name":"get_grant","arguments":{"email":"","n":1,"s":"v"}}})");
                     require(request.has_value(), "request should parse");
                     require(!request->string_argument("email").has_value(), "empty string ignored");
                     require(!request->string_argument("n").has_value(), "number ignored");
                     require(request->string_argument("s") == std::optional<std::string>("v"),
                             "string argument expected");
                   }});

  tests.push_back({"rpc_reply_id_is_null_for_unparsed_lines", [] {
                     const auto message = rpc::decode_line("not json at all");
                     require(!message.parsed.has_value(), "line should not parse");
                     require(message.raw == "not json at all", "raw bytes kept");
                     require(message.reply_id().is_null(), "reply id should be null");
                   }});

  tests.push_back({"rpc_error_envelope_shape", [] {
                     const auto reply = rpc::make_error(Json(3), rpc::kInternalError, "boom");
                     const auto doc = Json::parse(reply);
                     require(doc["jsonrpc"] == "2.0", "version mismatch");
                     require(doc["id"] == 3, "id mismatch");
                     require(doc["error"]["code"] == -32603, "code mismatch");
                     require(doc["error"]["message"] == "boom", "message mismatch");
                     require(!doc.contains("result"), "error replies carry no result");
                   }});

  tests.push_back({"rpc_tool_text_result_flags_application_errors", [] {
                     const auto ok_doc = Json::parse(rpc::make_tool_text_result(Json("x"), "hello"));
                     require(ok_doc["result"]["content"][0]["type"] == "text", "content type");
                     require(ok_doc["result"]["content"][0]["text"] == "hello", "content text");
                     require(!ok_doc["result"].contains("isError"), "no error flag on success");

                     const auto err_doc =
                         Json::parse(rpc::make_tool_text_result(Json(nullptr), "nope", true));
                     require(err_doc["result"]["isError"] == true, "error flag expected");
                     require(!err_doc.contains("error"), "must stay a success envelope");
                     require(err_doc["id"].is_null(), "null id kept");
                   }});

  tests.push_back({"rpc_serialize_keeps_unknown_fields", [] {
                     auto request = rpc::parse_request(
                         R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"t","arguments":{},"_meta":{"progressToken":9}}})");
                     require(request.has_value(), "request should parse");
                     const auto encoded = rpc::serialize_request(*request);
                     require(encoded.ok(), encoded.error());
                     require(encoded.value().find("\"_meta\":{\"progressToken\":9}") != std::string::npos,
                             "unknown params fields should survive");
                   }});
}
