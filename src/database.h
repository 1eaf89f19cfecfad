#pragma once
#include <sqlite3.h>
#include <string>
#include <vector>
#include <utility>

// Key/value settings store backed by SQLite
class SettingsDatabase {
public:
  SettingsDatabase();
  virtual ~SettingsDatabase();

  SettingsDatabase(const SettingsDatabase&) = delete;
  SettingsDatabase& operator=(const SettingsDatabase&) = delete;

  // Opens (creating when needed) the database file and its tables
  virtual bool initialize(const std::string& db_path = "settings.db");
  void close();
  bool is_open() const;

  bool create_tables();
  bool drop_tables();

  // Configuration operations
  virtual bool upsert_config_value(const std::string& key, const std::string& value);
  virtual bool try_get_config_value(const std::string& key, std::string& out_value);
  bool delete_config_value(const std::string& key);
  std::vector<std::pair<std::string, std::string>> get_all_config_values();

private:
  sqlite3* db_;
  bool is_open_;

  bool execute_sql(const std::string& sql);
  bool prepare_statement(const std::string& sql, sqlite3_stmt** stmt);
  void finalize_statement(sqlite3_stmt* stmt);

  void print_sqlite_error(const std::string& operation);
};
