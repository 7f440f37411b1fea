#pragma once

#include "mcpbridge/common/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace mcpbridge::accounts {

/// An authenticated mailbox/calendar connection ("grant") known locally.
struct Account {
  std::string id;
  std::string email;
  std::string provider;
};

/// Read-only view of the locally persisted accounts. The proxy never writes
/// through this interface and assumes no consistency between two calls.
class AccountStore {
public:
  virtual ~AccountStore() = default;

  [[nodiscard]] virtual common::Result<Account> get_account(const std::string &id) = 0;
  [[nodiscard]] virtual common::Result<Account> get_account_by_email(const std::string &email) = 0;
  /// All accounts in store order; the first entry is the fallback account.
  [[nodiscard]] virtual common::Result<std::vector<Account>> list_accounts() = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace mcpbridge::accounts
