#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docchat_core/index/vector_index.hpp"
#include "docchat_core/llm/providers.hpp"
#include "docchat_core/types/chunk.hpp"

namespace docchat_core {

// Chunks embedded outside the session write lock, waiting to be committed
struct PendingBatch {
  std::vector<Chunk> chunks;
  std::vector<std::vector<float>> embeddings;
  // Chunks dropped because the index or the batch already had their fingerprint
  size_t skipped = 0;
};

/**
 * @class VectorIndexManager
 * @brief Creates, loads, grows and persists per-session vector indexes.
 *
 * Each session owns <index_root>/<session_id>/. The manager itself holds no
 * per-session state and does no locking; callers serialize writers per
 * session.
 */
class VectorIndexManager {
 public:
  VectorIndexManager(std::filesystem::path index_root,
                     std::shared_ptr<EmbeddingProvider> embedding_provider,
                     IndexOptions options = {});

  /**
   * @brief Loads the session's index, or returns an empty one bound to its path.
   * @throw ConfigurationError for an id that is not a valid session id.
   * @throw IndexCorruptError if persisted data exists but cannot be trusted.
   */
  std::shared_ptr<VectorIndex> create_or_open(const std::string &session_id);

  /**
   * @brief Embeds and stores every chunk whose fingerprint is new, then persists.
   * @return Number of chunks added. Zero when all were already present.
   * @throw IngestionError if embedding fails; the index is left untouched.
   */
  size_t add_documents(VectorIndex &index, const std::vector<Chunk> &chunks);

  // Embeds the chunks absent from the index. Does not modify it.
  PendingBatch prepare(const VectorIndex &index, const std::vector<Chunk> &chunks);

  // Inserts what is still absent and persists. Returns the number inserted.
  size_t commit(VectorIndex &index, PendingBatch batch);

  // @throw IndexStorageError on any I/O failure.
  void persist(VectorIndex &index);

  /**
   * @throw IndexNotFoundError if nothing is stored at path.
   * @throw IndexCorruptError if the stored files disagree or cannot be read.
   */
  std::shared_ptr<VectorIndex> load(const std::filesystem::path &path);

  bool exists(const std::string &session_id) const;
  std::filesystem::path path_for(const std::string &session_id) const;

  EmbeddingProvider &embedding_provider() {
    return *embedding_provider_;
  }
  const IndexOptions &options() const {
    return options_;
  }

 private:
  std::filesystem::path index_root_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  IndexOptions options_;
};

}  // namespace docchat_core
