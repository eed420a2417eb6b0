#include "docchat_core/types/message.hpp"

#include <stdexcept>

namespace docchat_core {

std::string to_string(MessageRole role) {
  switch (role) {
    case MessageRole::User:
      return "user";
    case MessageRole::Assistant:
      return "assistant";
    default:
      return "unknown";
  }
}

MessageRole message_role_from_string(const std::string& str) {
  if (str == "user")
    return MessageRole::User;
  if (str == "assistant")
    return MessageRole::Assistant;
  throw std::invalid_argument("Unknown MessageRole: " + str);
}

}  // namespace docchat_core
