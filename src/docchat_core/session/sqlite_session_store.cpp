#include "docchat_core/session/sqlite_session_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "docchat_core/db/pooled_connection.hpp"
#include "docchat_core/db/sqlite_error_utils.hpp"
#include "docchat_core/db/transaction.hpp"
#include "docchat_core/errors.hpp"

namespace docchat_core {

namespace {

bool session_row_exists(sqlite::database &db, const std::string &session_id) {
  bool found = false;
  db << "SELECT 1 FROM sessions WHERE id = ? LIMIT 1" << session_id >> [&](int /*dummy*/) {
    found = true;
  };
  return found;
}

}  // namespace

SqliteSessionStore::SqliteSessionStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::string SqliteSessionStore::time_point_to_string(
    const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct{};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

void SqliteSessionStore::create(const std::string &session_id) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "INSERT OR IGNORE INTO sessions (id, created_at) VALUES (?, ?)" << session_id
          << time_point_to_string(std::chrono::system_clock::now());
  } catch (const sqlite::sqlite_exception &e) {
    throw SessionStoreError(format_db_error("create_session", e));
  }
}

bool SqliteSessionStore::exists(const std::string &session_id) {
  try {
    PooledConnection conn(db_manager_);
    return session_row_exists(*conn, session_id);
  } catch (const sqlite::sqlite_exception &e) {
    throw SessionStoreError(format_db_error("session_exists", e));
  }
}

std::vector<ChatMessage> SqliteSessionStore::get(const std::string &session_id) {
  std::vector<ChatMessage> history;
  try {
    PooledConnection conn(db_manager_);
    if (!session_row_exists(*conn, session_id)) {
      throw SessionNotFoundError("Session not found: " + session_id);
    }
    *conn << "SELECT role, content FROM messages WHERE session_id = ? ORDER BY seq"
          << session_id >>
        [&](std::string role, std::string content) {
          history.push_back({message_role_from_string(role), std::move(content)});
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw SessionStoreError(format_db_error("get_history", e));
  }
  return history;
}

void SqliteSessionStore::append(const std::string &session_id, const ConversationTurn &turn) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    if (!session_row_exists(*conn, session_id)) {
      throw SessionNotFoundError("Session not found: " + session_id);
    }

    long long next_seq = 0;
    *conn << "SELECT COALESCE(MAX(seq), -1) + 1 FROM messages WHERE session_id = ?" << session_id >>
        next_seq;

    *conn << "INSERT INTO messages (session_id, seq, role, content) VALUES (?, ?, ?, ?)"
          << session_id << next_seq << to_string(MessageRole::User) << turn.user_message;
    *conn << "INSERT INTO messages (session_id, seq, role, content) VALUES (?, ?, ?, ?)"
          << session_id << next_seq + 1 << to_string(MessageRole::Assistant)
          << turn.assistant_answer;
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw SessionStoreError(format_db_error("append_turn", e));
  }
}

void SqliteSessionStore::clear(const std::string &session_id) {
  try {
    PooledConnection conn(db_manager_);
    if (!session_row_exists(*conn, session_id)) {
      throw SessionNotFoundError("Session not found: " + session_id);
    }
    *conn << "DELETE FROM messages WHERE session_id = ?" << session_id;
  } catch (const sqlite::sqlite_exception &e) {
    throw SessionStoreError(format_db_error("clear_history", e));
  }
}

}  // namespace docchat_core
