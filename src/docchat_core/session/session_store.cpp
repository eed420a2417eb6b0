#include "docchat_core/session/session_store.hpp"

#include "docchat_core/errors.hpp"

namespace docchat_core {

void InMemorySessionStore::create(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  sessions_.try_emplace(session_id);
}

bool InMemorySessionStore::exists(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  return sessions_.count(session_id) > 0;
}

std::vector<ChatMessage> InMemorySessionStore::get(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw SessionNotFoundError("Session not found: " + session_id);
  }
  return it->second;
}

void InMemorySessionStore::append(const std::string &session_id, const ConversationTurn &turn) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw SessionNotFoundError("Session not found: " + session_id);
  }
  it->second.push_back({MessageRole::User, turn.user_message});
  it->second.push_back({MessageRole::Assistant, turn.assistant_answer});
}

void InMemorySessionStore::clear(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw SessionNotFoundError("Session not found: " + session_id);
  }
  it->second.clear();
}

}  // namespace docchat_core
