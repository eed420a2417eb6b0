#pragma once

#include <faiss/IndexIDMap.h>

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "docchat_core/types/chunk.hpp"
#include "docchat_core/types/retrieval_candidate.hpp"

namespace docchat_core {

enum class IndexType { HNSW, Flat };

std::string to_string(IndexType type);
IndexType index_type_from_string(const std::string &str);

struct IndexOptions {
  // Used for new indexes; a persisted index keeps the dimension it was built with
  size_t dimension = 1024;
  IndexType type = IndexType::HNSW;
  int hnsw_m = 32;
  int hnsw_ef_construction = 100;
  int hnsw_ef_search = 64;
  int compression_level = 3;
};

struct StoredChunk {
  Chunk chunk;
  std::vector<float> embedding;
};

/**
 * @class VectorIndex
 * @brief One session's embedded chunks: a faiss index plus the chunk payloads.
 *
 * Entry ids are dense: the n-th inserted chunk has id n in faiss, in the
 * entry table and in the docstore. Fingerprints are unique. Vectors are
 * L2-normalized on insert so inner product equals cosine similarity.
 *
 * On disk an index is a directory holding index.faiss and docstore.db.
 * Mutation and persistence go through VectorIndexManager.
 */
class VectorIndex {
 public:
  static constexpr const char *FAISS_FILE_NAME = "index.faiss";
  static constexpr const char *DOCSTORE_FILE_NAME = "docstore.db";

  VectorIndex(std::filesystem::path path, IndexOptions options);
  ~VectorIndex();

  // Disable copy constructor and assignment
  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  // Non-movable, faiss holds raw pointers into our state
  VectorIndex(VectorIndex &&) = delete;
  VectorIndex &operator=(VectorIndex &&) = delete;

  const std::filesystem::path &path() const {
    return path_;
  }
  size_t dimension() const {
    return options_.dimension;
  }
  size_t size() const {
    return entries_.size();
  }
  // Entries inserted since the last persist
  size_t pending_count() const {
    return entries_.size() - persisted_count_;
  }
  bool is_persisted() const {
    return on_disk_ && pending_count() == 0;
  }

  bool contains(const std::string &fingerprint) const;
  const StoredChunk &entry(size_t id) const;

  // Sorted, for comparisons in tests and diagnostics
  std::vector<std::string> fingerprints() const;

  /**
   * @brief Nearest neighbours of the query by cosine similarity.
   * @return Up to fetch_k candidates in descending similarity; ties keep the
   *         order faiss reported them in.
   * @throw ConfigurationError on a query of the wrong dimension.
   */
  std::vector<RetrievalCandidate> search(const std::vector<float> &query_vector,
                                         size_t fetch_k) const;

 private:
  friend class VectorIndexManager;

  void insert(Chunk chunk, std::vector<float> embedding);
  void write_to_disk();
  static std::unique_ptr<VectorIndex> read_from_disk(const std::filesystem::path &path,
                                                     const IndexOptions &options);

  void validate_vector_dimension(const std::vector<float> &vector) const;
  faiss::IndexIDMap *create_base_index() const;
  void apply_search_params();

  std::filesystem::path path_;
  IndexOptions options_;
  std::unique_ptr<faiss::IndexIDMap> faiss_index_;
  std::vector<StoredChunk> entries_;
  std::unordered_map<std::string, size_t> by_fingerprint_;
  size_t persisted_count_ = 0;
  bool on_disk_ = false;
};

}  // namespace docchat_core
