#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docchat_core/index/vector_index_manager.hpp"
#include "docchat_core/llm/providers.hpp"
#include "docchat_core/retrieval/mmr_retriever.hpp"
#include "docchat_core/types/message.hpp"

namespace docchat_core {

struct RagOptions {
  // Most recent history messages shown to the language model
  size_t history_window = 6;
  // Code points of retrieved text allowed into the answer prompt
  size_t max_context_chars = 8000;
  size_t max_answer_chars = 4096;
};

/**
 * @class ConversationalRag
 * @brief Answers a message against one session's documents.
 *
 * Lifecycle: Uninitialized until load_retriever() succeeds, RetrieverLoaded
 * after. invoke() reads the history it is given and never writes it; the
 * caller appends the turn.
 */
class ConversationalRag {
 public:
  enum class State { Uninitialized, RetrieverLoaded };

  static constexpr const char *NO_ANSWER = "no answer generated.";

  ConversationalRag(std::shared_ptr<VectorIndexManager> index_manager,
                    std::shared_ptr<EmbeddingProvider> embedding_provider,
                    std::shared_ptr<LanguageModelProvider> language_model,
                    RagOptions options = {});

  /**
   * @brief Binds the orchestrator to a session's persisted index.
   * @throw InvalidParameterError for invalid MMR parameters.
   * @throw SessionNotFoundError if the session has no index.
   * @throw IndexCorruptError if the index cannot be trusted.
   */
  void load_retriever(const std::string &session_id, int k = 5, int fetch_k = 20,
                      float lambda_mult = 0.5f);

  /**
   * @throw NotInitializedError before a successful load_retriever().
   * @throw GenerationError when a provider fails or the answer is unusable.
   */
  std::string invoke(const std::string &message, const std::vector<ChatMessage> &history) const;

  State state() const {
    return retriever_ ? State::RetrieverLoaded : State::Uninitialized;
  }
  const std::string &session_id() const {
    return session_id_;
  }

  // Chunk texts in the given order, separated by blank lines, within max_context_chars
  std::string build_context(const std::vector<RetrievalCandidate> &candidates) const;

 private:
  std::string contextualize(const std::string &message,
                            const std::vector<ChatMessage> &history) const;
  std::vector<ChatMessage> recent_history(const std::vector<ChatMessage> &history) const;

  std::shared_ptr<VectorIndexManager> index_manager_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<LanguageModelProvider> language_model_;
  RagOptions options_;

  std::string session_id_;
  std::unique_ptr<MmrRetriever> retriever_;
};

}  // namespace docchat_core
