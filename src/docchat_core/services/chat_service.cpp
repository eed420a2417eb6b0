#include "docchat_core/services/chat_service.hpp"

#include <iostream>
#include <shared_mutex>

#include "docchat_core/errors.hpp"

namespace docchat_core {

ChatService::ChatService(std::shared_ptr<VectorIndexManager> index_manager,
                         std::shared_ptr<EmbeddingProvider> embedding_provider,
                         std::shared_ptr<LanguageModelProvider> language_model,
                         std::shared_ptr<SessionStore> session_store,
                         std::shared_ptr<SessionLockRegistry> session_locks,
                         ChatOptions options)
    : index_manager_(std::move(index_manager)),
      embedding_provider_(std::move(embedding_provider)),
      language_model_(std::move(language_model)),
      session_store_(std::move(session_store)),
      session_locks_(std::move(session_locks)),
      options_(options) {
  validate_mmr_params(options_.mmr);
}

std::string ChatService::chat(const std::string &session_id, const std::string &message) {
  if (message.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
    throw ConfigurationError("Message cannot be empty");
  }
  if (!session_store_->exists(session_id)) {
    throw SessionNotFoundError(INVALID_SESSION_MESSAGE);
  }

  ConversationalRag rag(index_manager_, embedding_provider_, language_model_, options_.rag);
  {
    auto lock = session_locks_->lock_for(session_id);
    std::shared_lock<std::shared_mutex> read_guard(*lock);
    rag.load_retriever(session_id, options_.mmr.k, options_.mmr.fetch_k,
                       options_.mmr.lambda_mult);
  }

  const auto history = session_store_->get(session_id);
  std::string answer = rag.invoke(message, history);

  session_store_->append(session_id, {.user_message = message, .assistant_answer = answer});
  std::cout << "Chat turn recorded for session: " << session_id << std::endl;
  return answer;
}

std::vector<ChatMessage> ChatService::history(const std::string &session_id) {
  return session_store_->get(session_id);
}

void ChatService::clear_history(const std::string &session_id) {
  session_store_->clear(session_id);
}

}  // namespace docchat_core
