#pragma once

#include "mcpbridge/accounts/store.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace mcpbridge::proxy {

/// Mutable per-proxy state behind one reader/writer lock. Every accessor
/// copies under the lock and returns; nothing blocks while holding it.
/// Values may change between two reads (last writer wins).
class SessionState {
public:
  struct Snapshot {
    std::optional<std::string> session_id;
    std::optional<std::string> default_grant;
    std::shared_ptr<accounts::AccountStore> account_store;
  };

  SessionState() = default;
  SessionState(const SessionState &) = delete;
  SessionState &operator=(const SessionState &) = delete;

  /// Startup configuration. An empty grant id clears the default.
  void set_default_grant(std::optional<std::string> grant_id);
  void set_account_store(std::shared_ptr<accounts::AccountStore> store);

  /// Records the upstream session id. Empty ids are ignored. Returns true
  /// when the stored value changed.
  bool set_session_id(const std::string &session_id);

  [[nodiscard]] std::optional<std::string> session_id() const;
  [[nodiscard]] std::optional<std::string> default_grant() const;
  [[nodiscard]] std::shared_ptr<accounts::AccountStore> account_store() const;
  [[nodiscard]] Snapshot snapshot() const;

private:
  mutable std::shared_mutex mutex_;
  std::optional<std::string> session_id_;
  std::optional<std::string> default_grant_;
  std::shared_ptr<accounts::AccountStore> account_store_;
};

} // namespace mcpbridge::proxy
