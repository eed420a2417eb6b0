#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "docchat_core/db/database_manager.hpp"
#include "docchat_core/session/session_store.hpp"

namespace docchat_core {

class SessionStoreError : public std::exception {
 public:
  explicit SessionStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// History persisted in the sessions/messages tables of the DatabaseManager
class SqliteSessionStore : public SessionStore {
 public:
  explicit SqliteSessionStore(DatabaseManager &db_manager);

  void create(const std::string &session_id) override;
  bool exists(const std::string &session_id) override;
  std::vector<ChatMessage> get(const std::string &session_id) override;
  void append(const std::string &session_id, const ConversationTurn &turn) override;
  void clear(const std::string &session_id) override;

 private:
  DatabaseManager &db_manager_;

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
};

}  // namespace docchat_core
