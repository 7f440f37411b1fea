#include "mcpbridge/proxy/interceptor.hpp"

#include "mcpbridge/observability/global.hpp"
#include "mcpbridge/proxy/grant_tools.hpp"

namespace mcpbridge::proxy {

namespace {

bool names_explicit_account(const rpc::Request &request) {
  if (request.string_argument("email").has_value()) {
    return true;
  }
  if (!request.has_argument("identifier")) {
    return false;
  }
  const auto &identifier = request.arguments.at("identifier");
  if (identifier.is_null()) {
    return false;
  }
  return !(identifier.is_string() && identifier.get_ref<const std::string &>().empty());
}

std::optional<accounts::Account> resolve_account(accounts::AccountStore &store,
                                                 const std::optional<std::string> &default_grant) {
  if (default_grant.has_value()) {
    auto account = store.get_account(*default_grant);
    if (account.ok()) {
      return account.value();
    }
    observability::record_error("interceptor", "default grant lookup failed: " + account.error());
  }

  auto listed = store.list_accounts();
  if (!listed.ok()) {
    observability::record_error("interceptor", "listing accounts failed: " + listed.error());
    return std::nullopt;
  }
  if (listed.value().empty()) {
    return std::nullopt;
  }
  return listed.value().front();
}

} // namespace

LocalCallInterceptor::LocalCallInterceptor(const SessionState &state) : state_(state) {}

std::optional<std::string> LocalCallInterceptor::try_handle(const rpc::Request &request) const {
  if (!request.is_tool_call() || request.tool_name != kGetGrantTool) {
    return std::nullopt;
  }
  // Only the remote service can resolve an arbitrary email.
  if (names_explicit_account(request)) {
    return std::nullopt;
  }

  const auto snapshot = state_.snapshot();
  if (snapshot.account_store == nullptr) {
    return std::nullopt;
  }

  const auto account = resolve_account(*snapshot.account_store, snapshot.default_grant);
  observability::record_local_reply(request.tool_name, account.has_value());
  if (!account.has_value()) {
    return rpc::make_tool_text_result(request.id, kNoAccountsMessage, true);
  }

  rpc::Json payload = rpc::Json::object();
  payload["grant_id"] = account->id;
  payload["email"] = account->email;
  payload["provider"] = account->provider;
  return rpc::make_tool_text_result(request.id, common::dump_json(payload));
}

} // namespace mcpbridge::proxy
