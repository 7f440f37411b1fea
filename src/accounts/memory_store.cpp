#include "mcpbridge/accounts/memory_store.hpp"

#include "mcpbridge/common/fs.hpp"

#include <algorithm>

namespace mcpbridge::accounts {

InMemoryAccountStore::InMemoryAccountStore(std::vector<Account> accounts)
    : accounts_(std::move(accounts)) {}

void InMemoryAccountStore::add(Account account) {
  std::lock_guard<std::mutex> lock(mutex_);
  accounts_.push_back(std::move(account));
}

common::Result<Account> InMemoryAccountStore::get_account(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = std::find_if(accounts_.begin(), accounts_.end(),
                               [&](const Account &account) { return account.id == id; });
  if (it == accounts_.end()) {
    return common::Result<Account>::failure("grant not found: " + id);
  }
  return common::Result<Account>::success(*it);
}

common::Result<Account> InMemoryAccountStore::get_account_by_email(const std::string &email) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = std::find_if(accounts_.begin(), accounts_.end(), [&](const Account &account) {
    return common::iequals(account.email, email);
  });
  if (it == accounts_.end()) {
    return common::Result<Account>::failure("no grant for email: " + email);
  }
  return common::Result<Account>::success(*it);
}

common::Result<std::vector<Account>> InMemoryAccountStore::list_accounts() {
  std::lock_guard<std::mutex> lock(mutex_);
  return common::Result<std::vector<Account>>::success(accounts_);
}

} // namespace mcpbridge::accounts
