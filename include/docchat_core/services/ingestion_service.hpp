#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docchat_core/index/vector_index_manager.hpp"
#include "docchat_core/session/session_lock_registry.hpp"
#include "docchat_core/session/session_store.hpp"
#include "docchat_core/splitter/text_splitter.hpp"

namespace docchat_core {

struct IngestionResult {
  std::string session_id;
  size_t documents = 0;
  size_t chunks = 0;
  size_t chunks_added = 0;
};

/*
Splits documents and feeds them into a session's index. Embedding runs with no
lock held; only the commit takes the session's exclusive lock.
*/
class IngestionService {
 public:
  IngestionService(std::shared_ptr<VectorIndexManager> index_manager,
                   std::shared_ptr<TextSplitter> splitter,
                   std::shared_ptr<SessionStore> session_store,
                   std::shared_ptr<SessionLockRegistry> session_locks);

  // Builds the index for a fresh session and registers an empty history for it
  IngestionResult create_session(const std::vector<LoadedDocument> &documents);

  // Same, for an id the caller generated up front (uploads are stored under it)
  // @throw ConfigurationError if the id is invalid or already has an index
  IngestionResult create_session(const std::string &session_id,
                                 const std::vector<LoadedDocument> &documents);

  bool session_exists(const std::string &session_id) const;

  // @throw SessionNotFoundError if the session has no index yet
  IngestionResult add_documents(const std::string &session_id,
                                const std::vector<LoadedDocument> &documents);

 private:
  IngestionResult ingest(const std::string &session_id,
                         const std::vector<LoadedDocument> &documents);

  std::shared_ptr<VectorIndexManager> index_manager_;
  std::shared_ptr<TextSplitter> splitter_;
  std::shared_ptr<SessionStore> session_store_;
  std::shared_ptr<SessionLockRegistry> session_locks_;
};

}  // namespace docchat_core
