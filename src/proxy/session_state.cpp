#include "mcpbridge/proxy/session_state.hpp"

#include <mutex>

namespace mcpbridge::proxy {

void SessionState::set_default_grant(std::optional<std::string> grant_id) {
  if (grant_id.has_value() && grant_id->empty()) {
    grant_id.reset();
  }
  std::unique_lock lock(mutex_);
  default_grant_ = std::move(grant_id);
}

void SessionState::set_account_store(std::shared_ptr<accounts::AccountStore> store) {
  std::unique_lock lock(mutex_);
  account_store_ = std::move(store);
}

bool SessionState::set_session_id(const std::string &session_id) {
  if (session_id.empty()) {
    return false;
  }
  std::unique_lock lock(mutex_);
  if (session_id_ == session_id) {
    return false;
  }
  session_id_ = session_id;
  return true;
}

std::optional<std::string> SessionState::session_id() const {
  std::shared_lock lock(mutex_);
  return session_id_;
}

std::optional<std::string> SessionState::default_grant() const {
  std::shared_lock lock(mutex_);
  return default_grant_;
}

std::shared_ptr<accounts::AccountStore> SessionState::account_store() const {
  std::shared_lock lock(mutex_);
  return account_store_;
}

SessionState::Snapshot SessionState::snapshot() const {
  std::shared_lock lock(mutex_);
  return Snapshot{.session_id = session_id_,
                  .default_grant = default_grant_,
                  .account_store = account_store_};
}

} // namespace mcpbridge::proxy
