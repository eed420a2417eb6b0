#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docchat_core/db/connection_pool.hpp"

namespace docchat_core {

// Owns the session history database and its connection pool
class DatabaseManager {
 public:
  static DatabaseManager &get_instance();

  // Must be called once at application startup
  void initialize(const std::filesystem::path &db_path, int pool_size);

  // These methods are used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  bool is_initialized() const {
    return is_initialized_;
  }

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

 private:
  DatabaseManager() = default;
  void setup_schema(const std::filesystem::path &db_path);

  std::unique_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
};

}  // namespace docchat_core
