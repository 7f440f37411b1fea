#include "mcpbridge/accounts/sqlite_store.hpp"

namespace mcpbridge::accounts {

namespace {

constexpr const char *kSelectColumns = "SELECT grant_id, IFNULL(email, ''), IFNULL(provider, '') "
                                       "FROM grants";

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

} // namespace

SqliteAccountStore::SqliteAccountStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  const int rc = sqlite3_open_v2(db_path_.string().c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
  if (rc != SQLITE_OK) {
    open_error_ = "unable to open accounts database " + db_path_.string() + ": " +
                  (db_ != nullptr ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    return;
  }
  sqlite3_busy_timeout(db_, 2000);

  sqlite3_stmt *check = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT 1 FROM grants LIMIT 1", -1, &check, nullptr) != SQLITE_OK) {
    open_error_ = "accounts database has no grants table: " + db_path_.string();
  }
  sqlite3_finalize(check);
}

SqliteAccountStore::~SqliteAccountStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteAccountStore::open_status() const {
  if (!open_error_.empty()) {
    return common::Status::error(open_error_);
  }
  return common::Status::success();
}

common::Result<std::vector<Account>> SqliteAccountStore::query(const char *sql,
                                                               const std::string *bind_text) {
  using ListResult = common::Result<std::vector<Account>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr || !open_error_.empty()) {
    return ListResult::failure(open_error_.empty() ? "database is not initialized" : open_error_);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    const std::string message = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return ListResult::failure(message);
  }
  if (bind_text != nullptr) {
    sqlite3_bind_text(stmt, 1, bind_text->c_str(), -1, SQLITE_TRANSIENT);
  }

  std::vector<Account> accounts;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    accounts.push_back(Account{.id = column_text(stmt, 0),
                               .email = column_text(stmt, 1),
                               .provider = column_text(stmt, 2)});
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ListResult::failure(sqlite3_errmsg(db_));
  }
  return ListResult::success(std::move(accounts));
}

common::Result<Account> SqliteAccountStore::get_account(const std::string &id) {
  const std::string sql = std::string(kSelectColumns) + " WHERE grant_id = ?1 LIMIT 1";
  auto rows = query(sql.c_str(), &id);
  if (!rows.ok()) {
    return common::Result<Account>::propagate(rows);
  }
  if (rows.value().empty()) {
    return common::Result<Account>::failure("grant not found: " + id);
  }
  return common::Result<Account>::success(std::move(rows.value().front()));
}

common::Result<Account> SqliteAccountStore::get_account_by_email(const std::string &email) {
  const std::string sql =
      std::string(kSelectColumns) +
      " WHERE email = ?1 COLLATE NOCASE ORDER BY created_at, rowid LIMIT 1";
  auto rows = query(sql.c_str(), &email);
  if (!rows.ok()) {
    return common::Result<Account>::propagate(rows);
  }
  if (rows.value().empty()) {
    return common::Result<Account>::failure("no grant for email: " + email);
  }
  return common::Result<Account>::success(std::move(rows.value().front()));
}

common::Result<std::vector<Account>> SqliteAccountStore::list_accounts() {
  const std::string sql = std::string(kSelectColumns) + " ORDER BY created_at, rowid";
  return query(sql.c_str(), nullptr);
}

} // namespace mcpbridge::accounts
