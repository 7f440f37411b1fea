#pragma once

#include "mcpbridge/accounts/store.hpp"

#include <mutex>

namespace mcpbridge::accounts {

class InMemoryAccountStore final : public AccountStore {
public:
  InMemoryAccountStore() = default;
  explicit InMemoryAccountStore(std::vector<Account> accounts);

  void add(Account account);

  [[nodiscard]] common::Result<Account> get_account(const std::string &id) override;
  [[nodiscard]] common::Result<Account> get_account_by_email(const std::string &email) override;
  [[nodiscard]] common::Result<std::vector<Account>> list_accounts() override;
  [[nodiscard]] std::string_view name() const override { return "memory"; }

private:
  std::mutex mutex_;
  std::vector<Account> accounts_;
};

} // namespace mcpbridge::accounts
