#include "database.h"
#include "logger.h"

#include <filesystem>
#include <system_error>

SettingsDatabase::SettingsDatabase() : db_(nullptr), is_open_(false) {}

SettingsDatabase::~SettingsDatabase() {
  close();
}

bool SettingsDatabase::initialize(const std::string& db_path) {
  if (is_open_) {
    close();
  }

  std::filesystem::path path(db_path);
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      LOG_ERROR("Failed to create settings directory {}: {}", path.parent_path().u8string(), ec.message());
      return false;
    }
  }

  int rc = sqlite3_open(db_path.c_str(), &db_);
  if (rc != SQLITE_OK) {
    LOG_ERROR("Failed to open settings database {}: {}", db_path, db_ ? sqlite3_errmsg(db_) : "out of memory");
    if (db_) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return false;
  }

  is_open_ = true;
  execute_sql("PRAGMA journal_mode = WAL");

  return create_tables();
}

void SettingsDatabase::close() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
  is_open_ = false;
}

bool SettingsDatabase::is_open() const {
  return is_open_;
}

bool SettingsDatabase::create_tables() {
  const std::string create_table_sql = R"(
        CREATE TABLE IF NOT EXISTS config (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at TEXT DEFAULT CURRENT_TIMESTAMP
        );
    )";

  return execute_sql(create_table_sql);
}

bool SettingsDatabase::drop_tables() {
  return execute_sql("DROP TABLE IF EXISTS config");
}

bool SettingsDatabase::upsert_config_value(const std::string& key, const std::string& value) {
  if (!is_open_) {
    return false;
  }

  const std::string sql = R"(
        INSERT INTO config (key, value, updated_at) VALUES (?, ?, CURRENT_TIMESTAMP)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value, updated_at = CURRENT_TIMESTAMP
    )";

  sqlite3_stmt* stmt;
  if (!prepare_statement(sql, &stmt)) {
    return false;
  }

  bool success = sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK &&
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK;
  if (!success) {
    print_sqlite_error("binding config value");
  }
  else {
    success = sqlite3_step(stmt) == SQLITE_DONE;
    if (!success) {
      print_sqlite_error("upserting config value");
    }
  }

  finalize_statement(stmt);
  return success;
}

bool SettingsDatabase::try_get_config_value(const std::string& key, std::string& out_value) {
  if (!is_open_) {
    return false;
  }

  sqlite3_stmt* stmt;
  if (!prepare_statement("SELECT value FROM config WHERE key = ?", &stmt)) {
    return false;
  }

  bool found = false;
  if (sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
    print_sqlite_error("binding config key");
  }
  else {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
      const unsigned char* text = sqlite3_column_text(stmt, 0);
      out_value = text ? reinterpret_cast<const char*>(text) : "";
      found = true;
    }
    else if (rc != SQLITE_DONE) {
      print_sqlite_error("reading config value");
    }
  }

  finalize_statement(stmt);
  return found;
}

bool SettingsDatabase::delete_config_value(const std::string& key) {
  if (!is_open_) {
    return false;
  }

  sqlite3_stmt* stmt;
  if (!prepare_statement("DELETE FROM config WHERE key = ?", &stmt)) {
    return false;
  }

  bool success = sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK &&
    sqlite3_step(stmt) == SQLITE_DONE;
  if (!success) {
    print_sqlite_error("deleting config value");
  }

  finalize_statement(stmt);
  return success;
}

std::vector<std::pair<std::string, std::string>> SettingsDatabase::get_all_config_values() {
  std::vector<std::pair<std::string, std::string>> values;
  if (!is_open_) {
    return values;
  }

  sqlite3_stmt* stmt;
  if (!prepare_statement("SELECT key, value FROM config ORDER BY key", &stmt)) {
    return values;
  }

  int rc;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    const unsigned char* key = sqlite3_column_text(stmt, 0);
    const unsigned char* value = sqlite3_column_text(stmt, 1);
    values.emplace_back(key ? reinterpret_cast<const char*>(key) : "",
      value ? reinterpret_cast<const char*>(value) : "");
  }
  if (rc != SQLITE_DONE) {
    print_sqlite_error("listing config values");
  }

  finalize_statement(stmt);
  return values;
}

bool SettingsDatabase::execute_sql(const std::string& sql) {
  if (!db_) {
    return false;
  }

  char* error_msg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

  if (rc != SQLITE_OK) {
    LOG_ERROR("SQL error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
    sqlite3_free(error_msg);
    return false;
  }

  return true;
}

bool SettingsDatabase::prepare_statement(const std::string& sql, sqlite3_stmt** stmt) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt, nullptr);
  if (rc != SQLITE_OK) {
    print_sqlite_error("preparing statement");
    return false;
  }
  return true;
}

void SettingsDatabase::finalize_statement(sqlite3_stmt* stmt) {
  if (stmt) {
    sqlite3_finalize(stmt);
  }
}

void SettingsDatabase::print_sqlite_error(const std::string& operation) {
  LOG_ERROR("SQLite error during {}: {}", operation, sqlite3_errmsg(db_));
}
