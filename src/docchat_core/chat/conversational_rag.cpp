#include "docchat_core/chat/conversational_rag.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <iostream>

#include "docchat_core/chat/prompt_library.hpp"
#include "docchat_core/errors.hpp"

namespace docchat_core {

namespace {

bool is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string trim(const std::string &text) {
  const auto first = text.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t\r\n\f\v");
  return text.substr(first, last - first + 1);
}

// Falls back to bytes for text that is not valid UTF-8
size_t code_point_length(const std::string &text) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return text.size();
  }
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string truncate_code_points(const std::string &text, size_t max_code_points) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return text.substr(0, max_code_points);
  }
  auto it = text.begin();
  for (size_t i = 0; i < max_code_points && it != text.end(); ++i) {
    utf8::next(it, text.end());
  }
  return std::string(text.begin(), it);
}

}  // namespace

ConversationalRag::ConversationalRag(std::shared_ptr<VectorIndexManager> index_manager,
                                     std::shared_ptr<EmbeddingProvider> embedding_provider,
                                     std::shared_ptr<LanguageModelProvider> language_model,
                                     RagOptions options)
    : index_manager_(std::move(index_manager)),
      embedding_provider_(std::move(embedding_provider)),
      language_model_(std::move(language_model)),
      options_(options) {
  if (!index_manager_ || !embedding_provider_ || !language_model_) {
    throw ConfigurationError(
        "ConversationalRag requires an index manager, an embedding provider and a language "
        "model");
  }
}

void ConversationalRag::load_retriever(const std::string &session_id, int k, int fetch_k,
                                       float lambda_mult) {
  MmrParams params{.k = k, .fetch_k = fetch_k, .lambda_mult = lambda_mult};
  validate_mmr_params(params);

  std::shared_ptr<VectorIndex> index;
  try {
    index = index_manager_->load(index_manager_->path_for(session_id));
  } catch (const IndexNotFoundError &) {
    throw SessionNotFoundError("No index for session: " + session_id, std::current_exception());
  } catch (const ConfigurationError &) {
    throw SessionNotFoundError("Invalid session id: " + session_id, std::current_exception());
  }

  retriever_ = std::make_unique<MmrRetriever>(index, embedding_provider_, params);
  session_id_ = session_id;
  std::cout << "Retriever loaded for session: " << session_id << " (k=" << k
            << ", fetch_k=" << fetch_k << ", lambda=" << lambda_mult << ")" << std::endl;
}

std::vector<ChatMessage> ConversationalRag::recent_history(
    const std::vector<ChatMessage> &history) const {
  if (history.size() <= options_.history_window) {
    return history;
  }
  return std::vector<ChatMessage>(history.end() - options_.history_window, history.end());
}

std::string ConversationalRag::contextualize(const std::string &message,
                                             const std::vector<ChatMessage> &history) const {
  if (history.empty()) {
    return message;
  }
  const auto prompt = render_prompt(prompt_template(PromptType::ContextualizeQuestion),
                                    {{"chat_history", format_chat_history(recent_history(history))},
                                     {"input", message}});
  const auto rewritten = trim(language_model_->generate(prompt));
  if (rewritten.empty()) {
    return message;
  }
  return rewritten;
}

std::string ConversationalRag::build_context(
    const std::vector<RetrievalCandidate> &candidates) const {
  std::string context;
  size_t used = 0;
  for (const auto &candidate : candidates) {
    const auto &text = candidate.chunk.content;
    const size_t length = code_point_length(text);
    const size_t separator = context.empty() ? 0 : 2;

    if (used + separator + length > options_.max_context_chars) {
      if (context.empty()) {
        context = truncate_code_points(text, options_.max_context_chars);
      }
      break;
    }
    if (!context.empty()) {
      context += "\n\n";
    }
    context += text;
    used += separator + length;
  }
  return context;
}

std::string ConversationalRag::invoke(const std::string &message,
                                      const std::vector<ChatMessage> &history) const {
  if (!retriever_) {
    throw NotInitializedError("Retriever not loaded. Call load_retriever() before invoke().");
  }

  std::string answer;
  try {
    const auto standalone_query = contextualize(message, history);
    const auto candidates = retriever_->retrieve(standalone_query);
    const auto prompt = render_prompt(prompt_template(PromptType::ContextQa),
                                      {{"context", build_context(candidates)},
                                       {"chat_history", format_chat_history(recent_history(history))},
                                       {"input", standalone_query}});
    answer = language_model_->generate(prompt);
  } catch (const std::exception &e) {
    // Everything here runs on provider output, so a dimension mismatch is a
    // provider fault as much as a dropped connection
    std::cerr << "Generation failed for session " << session_id_ << ": " << e.what()
              << std::endl;
    throw GenerationError("Failed to generate answer: " + std::string(e.what()),
                          std::current_exception());
  }

  if (is_blank(answer)) {
    return NO_ANSWER;
  }
  if (code_point_length(answer) > options_.max_answer_chars) {
    throw GenerationError("Invalid chat answer");
  }
  return answer;
}

}  // namespace docchat_core
