#pragma once

#include "mcpbridge/accounts/store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace mcpbridge::accounts {

/// Reads accounts from an existing SQLite database opened with
/// SQLITE_OPEN_READONLY. Expected table:
///   grants(grant_id TEXT PRIMARY KEY, email TEXT, provider TEXT, created_at TEXT)
class SqliteAccountStore final : public AccountStore {
public:
  explicit SqliteAccountStore(std::filesystem::path db_path);
  ~SqliteAccountStore() override;

  SqliteAccountStore(const SqliteAccountStore &) = delete;
  SqliteAccountStore &operator=(const SqliteAccountStore &) = delete;

  /// Empty when the database opened and has a readable grants table.
  [[nodiscard]] common::Status open_status() const;

  [[nodiscard]] common::Result<Account> get_account(const std::string &id) override;
  [[nodiscard]] common::Result<Account> get_account_by_email(const std::string &email) override;
  [[nodiscard]] common::Result<std::vector<Account>> list_accounts() override;
  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

private:
  [[nodiscard]] common::Result<std::vector<Account>> query(const char *sql,
                                                           const std::string *bind_text);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace mcpbridge::accounts
