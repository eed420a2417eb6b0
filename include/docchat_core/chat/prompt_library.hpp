#pragma once

#include <map>
#include <string>
#include <vector>

#include "docchat_core/types/message.hpp"

namespace docchat_core {

enum class PromptType { ContextualizeQuestion, ContextQa };

std::string to_string(PromptType type);

const std::string &prompt_template(PromptType type);

// Replaces every {name} placeholder found in values; unknown placeholders are left as they are
std::string render_prompt(const std::string &prompt_template,
                          const std::map<std::string, std::string> &values);

// One "User: ..." / "Assistant: ..." line per message
std::string format_chat_history(const std::vector<ChatMessage> &history);

}  // namespace docchat_core
