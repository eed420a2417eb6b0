#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docchat_core/chat/conversational_rag.hpp"
#include "docchat_core/session/session_lock_registry.hpp"
#include "docchat_core/session/session_store.hpp"

namespace docchat_core {

struct ChatOptions {
  MmrParams mmr;
  RagOptions rag;
};

/*
Answers chat messages for registered sessions and records each turn in the
session store. The index is only read under the session's shared lock; the
language model runs with no lock held.
*/
class ChatService {
 public:
  static constexpr const char *INVALID_SESSION_MESSAGE =
      "Invalid or expired session_id. Re-upload documents.";

  ChatService(std::shared_ptr<VectorIndexManager> index_manager,
              std::shared_ptr<EmbeddingProvider> embedding_provider,
              std::shared_ptr<LanguageModelProvider> language_model,
              std::shared_ptr<SessionStore> session_store,
              std::shared_ptr<SessionLockRegistry> session_locks,
              ChatOptions options = {});

  /**
   * @throw ConfigurationError for a blank message.
   * @throw SessionNotFoundError for an unknown session.
   * @throw GenerationError if a provider fails; history is left unchanged.
   */
  std::string chat(const std::string &session_id, const std::string &message);

  std::vector<ChatMessage> history(const std::string &session_id);
  void clear_history(const std::string &session_id);

 private:
  std::shared_ptr<VectorIndexManager> index_manager_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<LanguageModelProvider> language_model_;
  std::shared_ptr<SessionStore> session_store_;
  std::shared_ptr<SessionLockRegistry> session_locks_;
  ChatOptions options_;
};

}  // namespace docchat_core
