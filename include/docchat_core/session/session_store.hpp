#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "docchat_core/types/message.hpp"

namespace docchat_core {

/*
Conversation history keyed by session id. History is append-only; clear()
empties it but keeps the session registered.
*/
class SessionStore {
 public:
  virtual ~SessionStore() = default;

  // Registers the session with an empty history. No-op if it already exists.
  virtual void create(const std::string &session_id) = 0;
  virtual bool exists(const std::string &session_id) = 0;

  // @throw SessionNotFoundError for unknown sessions
  virtual std::vector<ChatMessage> get(const std::string &session_id) = 0;
  virtual void append(const std::string &session_id, const ConversationTurn &turn) = 0;
  virtual void clear(const std::string &session_id) = 0;
};

class InMemorySessionStore : public SessionStore {
 public:
  void create(const std::string &session_id) override;
  bool exists(const std::string &session_id) override;
  std::vector<ChatMessage> get(const std::string &session_id) override;
  void append(const std::string &session_id, const ConversationTurn &turn) override;
  void clear(const std::string &session_id) override;

 private:
  std::mutex mtx_;
  std::unordered_map<std::string, std::vector<ChatMessage>> sessions_;
};

}  // namespace docchat_core
