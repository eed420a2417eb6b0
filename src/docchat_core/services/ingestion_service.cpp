#include "docchat_core/services/ingestion_service.hpp"

#include <iostream>
#include <mutex>
#include <shared_mutex>

#include "docchat_core/errors.hpp"
#include "docchat_core/session/session_id.hpp"

namespace docchat_core {

IngestionService::IngestionService(std::shared_ptr<VectorIndexManager> index_manager,
                                   std::shared_ptr<TextSplitter> splitter,
                                   std::shared_ptr<SessionStore> session_store,
                                   std::shared_ptr<SessionLockRegistry> session_locks)
    : index_manager_(std::move(index_manager)),
      splitter_(std::move(splitter)),
      session_store_(std::move(session_store)),
      session_locks_(std::move(session_locks)) {}

IngestionResult IngestionService::create_session(const std::vector<LoadedDocument> &documents) {
  return create_session(generate_session_id(), documents);
}

IngestionResult IngestionService::create_session(const std::string &session_id,
                                                 const std::vector<LoadedDocument> &documents) {
  if (!is_valid_session_id(session_id)) {
    throw ConfigurationError("Invalid session id: '" + session_id + "'");
  }
  if (index_manager_->exists(session_id)) {
    throw ConfigurationError("Session already exists: " + session_id);
  }
  IngestionResult result;
  try {
    result = ingest(session_id, documents);
  } catch (const std::exception &) {
    session_locks_->release(session_id);
    throw;
  }
  session_store_->create(session_id);
  std::cout << "Session created: " << session_id << " (" << result.chunks_added
            << " chunks indexed)" << std::endl;
  return result;
}

bool IngestionService::session_exists(const std::string &session_id) const {
  return index_manager_->exists(session_id);
}

IngestionResult IngestionService::add_documents(const std::string &session_id,
                                                const std::vector<LoadedDocument> &documents) {
  if (!index_manager_->exists(session_id)) {
    throw SessionNotFoundError("Session not found: " + session_id);
  }
  auto result = ingest(session_id, documents);
  // Sessions created before a restart of an in-memory store get their history back
  session_store_->create(session_id);
  return result;
}

IngestionResult IngestionService::ingest(const std::string &session_id,
                                         const std::vector<LoadedDocument> &documents) {
  if (documents.empty()) {
    throw ConfigurationError("No documents to ingest");
  }

  IngestionResult result;
  result.session_id = session_id;
  result.documents = documents.size();

  const auto chunks = splitter_->split(documents);
  result.chunks = chunks.size();

  auto lock = session_locks_->lock_for(session_id);

  std::shared_ptr<VectorIndex> snapshot;
  {
    std::shared_lock<std::shared_mutex> read_guard(*lock);
    snapshot = index_manager_->create_or_open(session_id);
  }

  auto batch = index_manager_->prepare(*snapshot, chunks);

  {
    std::unique_lock<std::shared_mutex> write_guard(*lock);
    // Reopen, another writer may have committed while we were embedding
    auto current = index_manager_->create_or_open(session_id);
    result.chunks_added = index_manager_->commit(*current, std::move(batch));
  }

  std::cout << "Ingested " << result.documents << " documents into " << session_id << ": "
            << result.chunks << " chunks, " << result.chunks_added << " new" << std::endl;
  return result;
}

}  // namespace docchat_core
