#include "docchat_core/db/database_manager.hpp"

#include <stdexcept>

namespace docchat_core {

DatabaseManager &DatabaseManager::get_instance() {
  static DatabaseManager instance;
  return instance;
}

void DatabaseManager::initialize(const std::filesystem::path &db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema first, on a single non-pooled connection
  setup_schema(db_path);
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path &db_path) {
  sqlite::database db(db_path.string());
  db << "PRAGMA foreign_keys = ON;";
  db << "PRAGMA journal_mode = WAL;";

  db << R"(
      CREATE TABLE IF NOT EXISTS sessions (
          id TEXT PRIMARY KEY,
          created_at TEXT NOT NULL
      )
    )";

  // seq keeps arrival order within a session
  db << R"(
      CREATE TABLE IF NOT EXISTS messages (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          session_id TEXT NOT NULL,
          seq INTEGER NOT NULL,
          role TEXT NOT NULL,
          content TEXT NOT NULL,
          FOREIGN KEY (session_id) REFERENCES sessions(id) ON DELETE CASCADE,
          UNIQUE (session_id, seq)
      )
    )";
}

}  // namespace docchat_core
