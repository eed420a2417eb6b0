#include "docchat_core/index/vector_index_manager.hpp"

#include <iostream>
#include <unordered_set>

#include "docchat_core/errors.hpp"
#include "docchat_core/session/session_id.hpp"
#include "docchat_core/splitter/fingerprint.hpp"

namespace docchat_core {

VectorIndexManager::VectorIndexManager(std::filesystem::path index_root,
                                       std::shared_ptr<EmbeddingProvider> embedding_provider,
                                       IndexOptions options)
    : index_root_(std::move(index_root)),
      embedding_provider_(std::move(embedding_provider)),
      options_(options) {
  if (!embedding_provider_) {
    throw ConfigurationError("VectorIndexManager requires an embedding provider");
  }
  if (options_.dimension == 0) {
    throw ConfigurationError("Embedding dimension must be positive");
  }
}

std::filesystem::path VectorIndexManager::path_for(const std::string &session_id) const {
  if (!is_valid_session_id(session_id)) {
    throw ConfigurationError("Invalid session id: '" + session_id + "'");
  }
  return index_root_ / session_id;
}

bool VectorIndexManager::exists(const std::string &session_id) const {
  if (!is_valid_session_id(session_id)) {
    return false;
  }
  const auto path = index_root_ / session_id;
  std::error_code ec;
  return std::filesystem::exists(path / VectorIndex::FAISS_FILE_NAME, ec) ||
         std::filesystem::exists(path / VectorIndex::DOCSTORE_FILE_NAME, ec);
}

std::shared_ptr<VectorIndex> VectorIndexManager::create_or_open(const std::string &session_id) {
  const auto path = path_for(session_id);
  if (exists(session_id)) {
    return load(path);
  }
  return std::make_shared<VectorIndex>(path, options_);
}

std::shared_ptr<VectorIndex> VectorIndexManager::load(const std::filesystem::path &path) {
  std::shared_ptr<VectorIndex> index = VectorIndex::read_from_disk(path, options_);
  std::cout << "Loaded index " << path.filename().string() << " with " << index->size()
            << " chunks" << std::endl;
  return index;
}

PendingBatch VectorIndexManager::prepare(const VectorIndex &index,
                                         const std::vector<Chunk> &chunks) {
  PendingBatch batch;
  std::unordered_set<std::string> seen;
  std::vector<std::string> texts;

  for (const auto &chunk : chunks) {
    Chunk candidate = chunk;
    if (candidate.fingerprint.empty()) {
      candidate.fingerprint = compute_fingerprint(candidate.content);
    }
    if (index.contains(candidate.fingerprint) || !seen.insert(candidate.fingerprint).second) {
      batch.skipped++;
      continue;
    }
    texts.push_back(candidate.content);
    batch.chunks.push_back(std::move(candidate));
  }

  if (texts.empty()) {
    return batch;
  }

  try {
    batch.embeddings = embedding_provider_->embed_batch(texts);
  } catch (const std::exception &e) {
    throw IngestionError("Failed to embed " + std::to_string(texts.size()) +
                             " chunks: " + e.what(),
                         std::current_exception());
  }

  if (batch.embeddings.size() != batch.chunks.size()) {
    throw IngestionError("Embedding provider returned " +
                         std::to_string(batch.embeddings.size()) + " vectors for " +
                         std::to_string(batch.chunks.size()) + " chunks");
  }
  for (const auto &embedding : batch.embeddings) {
    if (embedding.size() != index.dimension()) {
      throw ConfigurationError("Embedding dimension mismatch. Expected " +
                               std::to_string(index.dimension()) + ", got " +
                               std::to_string(embedding.size()));
    }
  }
  return batch;
}

size_t VectorIndexManager::commit(VectorIndex &index, PendingBatch batch) {
  size_t added = 0;
  for (size_t i = 0; i < batch.chunks.size(); ++i) {
    // Another writer may have added the same chunk since prepare()
    if (index.contains(batch.chunks[i].fingerprint)) {
      continue;
    }
    index.insert(std::move(batch.chunks[i]), std::move(batch.embeddings[i]));
    added++;
  }

  if (added > 0 || !index.is_persisted()) {
    persist(index);
  }
  return added;
}

size_t VectorIndexManager::add_documents(VectorIndex &index, const std::vector<Chunk> &chunks) {
  return commit(index, prepare(index, chunks));
}

void VectorIndexManager::persist(VectorIndex &index) {
  index.write_to_disk();
}

}  // namespace docchat_core
