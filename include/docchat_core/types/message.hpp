#pragma once

#include <string>

namespace docchat_core {

enum class MessageRole { User, Assistant };

std::string to_string(MessageRole role);
MessageRole message_role_from_string(const std::string &str);

struct ChatMessage {
  MessageRole role = MessageRole::User;
  std::string content;
};

inline bool operator==(const ChatMessage &lhs, const ChatMessage &rhs) {
  return lhs.role == rhs.role && lhs.content == rhs.content;
}

struct ConversationTurn {
  std::string user_message;
  std::string assistant_answer;
};

}  // namespace docchat_core
