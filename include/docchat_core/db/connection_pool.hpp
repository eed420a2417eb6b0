#pragma once

#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace docchat_core {

// Fixed set of SQLite connections shared by request threads
class ConnectionPool {
 public:
  ConnectionPool(const std::string &db_path, int pool_size);

  // Blocks until a connection is free
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

 private:
  bool shutting_down_ = false;
  std::string db_path_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace docchat_core
