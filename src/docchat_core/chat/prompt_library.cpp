#include "docchat_core/chat/prompt_library.hpp"

#include <sstream>

namespace docchat_core {

namespace {

const std::string CONTEXTUALIZE_QUESTION_TEMPLATE =
    "Given a conversation history and the most recent user query, rewrite the query as a "
    "standalone question that makes sense without relying on the previous context.\n"
    "Do not provide an answer. Only reformulate the question if necessary; otherwise, "
    "return it unchanged.\n\n"
    "Conversation history:\n"
    "{chat_history}\n\n"
    "Latest user query: {input}\n\n"
    "Standalone question:";

const std::string CONTEXT_QA_TEMPLATE =
    "You are an assistant designed to answer questions using the provided context. Rely only "
    "on the retrieved information to form your response.\n"
    "If the answer is not found in the context, respond with \"I don't know.\"\n"
    "Keep your answer concise and no longer than three sentences.\n\n"
    "Context:\n"
    "{context}\n\n"
    "Conversation history:\n"
    "{chat_history}\n\n"
    "Question: {input}\n\n"
    "Answer:";

}  // namespace

std::string to_string(PromptType type) {
  switch (type) {
    case PromptType::ContextualizeQuestion:
      return "contextualize_question";
    case PromptType::ContextQa:
      return "context_qa";
  }
  return "context_qa";
}

const std::string &prompt_template(PromptType type) {
  if (type == PromptType::ContextualizeQuestion) {
    return CONTEXTUALIZE_QUESTION_TEMPLATE;
  }
  return CONTEXT_QA_TEMPLATE;
}

std::string render_prompt(const std::string &prompt_template,
                          const std::map<std::string, std::string> &values) {
  std::string result;
  result.reserve(prompt_template.size());

  size_t pos = 0;
  while (pos < prompt_template.size()) {
    const size_t open = prompt_template.find('{', pos);
    if (open == std::string::npos) {
      result.append(prompt_template, pos, std::string::npos);
      break;
    }
    const size_t close = prompt_template.find('}', open + 1);
    if (close == std::string::npos) {
      result.append(prompt_template, pos, std::string::npos);
      break;
    }
    result.append(prompt_template, pos, open - pos);

    const std::string name = prompt_template.substr(open + 1, close - open - 1);
    auto it = values.find(name);
    if (it != values.end()) {
      result += it->second;
    } else {
      result.append(prompt_template, open, close - open + 1);
    }
    pos = close + 1;
  }
  return result;
}

std::string format_chat_history(const std::vector<ChatMessage> &history) {
  std::stringstream ss;
  for (size_t i = 0; i < history.size(); ++i) {
    ss << (history[i].role == MessageRole::User ? "User: " : "Assistant: ")
       << history[i].content;
    if (i + 1 < history.size()) {
      ss << "\n";
    }
  }
  return ss.str();
}

}  // namespace docchat_core
