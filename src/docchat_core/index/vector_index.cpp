#include "docchat_core/index/vector_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>
#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>
#include <sqlite_modern_cpp.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <numeric>

#include "docchat_core/db/sqlite_error_utils.hpp"
#include "docchat_core/db/transaction.hpp"
#include "docchat_core/errors.hpp"
#include "docchat_core/services/compression_service.hpp"

namespace docchat_core {

namespace {

std::vector<char> vector_to_blob(const std::vector<float> &vec) {
  std::vector<char> blob(vec.size() * sizeof(float));
  std::memcpy(blob.data(), vec.data(), blob.size());
  return blob;
}

std::vector<float> blob_to_vector(const std::vector<char> &blob) {
  std::vector<float> vec(blob.size() / sizeof(float));
  std::memcpy(vec.data(), blob.data(), vec.size() * sizeof(float));
  return vec;
}

void create_docstore_schema(sqlite::database &db) {
  db << "CREATE TABLE IF NOT EXISTS meta ("
        "key TEXT PRIMARY KEY,"
        "value TEXT NOT NULL"
        ");";
  db << "CREATE TABLE IF NOT EXISTS chunks ("
        "id INTEGER PRIMARY KEY,"
        "fingerprint TEXT NOT NULL UNIQUE,"
        "source_id TEXT NOT NULL,"
        "chunk_index INTEGER NOT NULL,"
        "start_offset INTEGER NOT NULL,"
        "content BLOB NOT NULL,"
        "vector_blob BLOB NOT NULL"
        ");";
}

}  // namespace

std::string to_string(IndexType type) {
  switch (type) {
    case IndexType::HNSW:
      return "hnsw";
    case IndexType::Flat:
      return "flat";
  }
  return "hnsw";
}

IndexType index_type_from_string(const std::string &str) {
  if (str == "hnsw") {
    return IndexType::HNSW;
  }
  if (str == "flat") {
    return IndexType::Flat;
  }
  throw std::invalid_argument("Invalid index type: " + str);
}

VectorIndex::VectorIndex(std::filesystem::path path, IndexOptions options)
    : path_(std::move(path)), options_(options) {
  if (options_.dimension == 0) {
    throw ConfigurationError("Embedding dimension must be positive");
  }
  faiss_index_.reset(create_base_index());
}

VectorIndex::~VectorIndex() = default;

faiss::IndexIDMap *VectorIndex::create_base_index() const {
  const auto d = static_cast<faiss::idx_t>(options_.dimension);
  faiss::Index *base_index = nullptr;
  if (options_.type == IndexType::Flat) {
    base_index = new faiss::IndexFlatIP(d);
  } else {
    auto hnsw = new faiss::IndexHNSWFlat(d, options_.hnsw_m, faiss::METRIC_INNER_PRODUCT);
    hnsw->hnsw.efConstruction = options_.hnsw_ef_construction;
    hnsw->hnsw.efSearch = options_.hnsw_ef_search;
    base_index = hnsw;
  }
  // Wrap with IDMap so ids stay aligned with the docstore
  auto id_map = new faiss::IndexIDMap(base_index);
  id_map->own_fields = true;
  return id_map;
}

void VectorIndex::apply_search_params() {
  if (auto hnsw = dynamic_cast<faiss::IndexHNSW *>(faiss_index_->index)) {
    hnsw->hnsw.efSearch = options_.hnsw_ef_search;
  }
}

bool VectorIndex::contains(const std::string &fingerprint) const {
  return by_fingerprint_.count(fingerprint) > 0;
}

const StoredChunk &VectorIndex::entry(size_t id) const {
  if (id >= entries_.size()) {
    throw std::out_of_range("No entry with id " + std::to_string(id));
  }
  return entries_[id];
}

std::vector<std::string> VectorIndex::fingerprints() const {
  std::vector<std::string> result;
  result.reserve(by_fingerprint_.size());
  for (const auto &[fingerprint, id] : by_fingerprint_) {
    result.push_back(fingerprint);
  }
  std::sort(result.begin(), result.end());
  return result;
}

void VectorIndex::validate_vector_dimension(const std::vector<float> &vector) const {
  if (vector.size() != options_.dimension) {
    throw ConfigurationError("Vector dimension mismatch. Expected " +
                             std::to_string(options_.dimension) + ", got " +
                             std::to_string(vector.size()));
  }
}

void VectorIndex::insert(Chunk chunk, std::vector<float> embedding) {
  validate_vector_dimension(embedding);
  if (contains(chunk.fingerprint)) {
    return;
  }

  faiss::fvec_renorm_L2(options_.dimension, 1, embedding.data());

  const auto id = static_cast<faiss::idx_t>(entries_.size());
  faiss_index_->add_with_ids(1, embedding.data(), &id);

  by_fingerprint_.emplace(chunk.fingerprint, entries_.size());
  entries_.push_back({std::move(chunk), std::move(embedding)});
}

std::vector<RetrievalCandidate> VectorIndex::search(const std::vector<float> &query_vector,
                                                    size_t fetch_k) const {
  validate_vector_dimension(query_vector);
  if (entries_.empty() || fetch_k == 0) {
    return {};
  }

  std::vector<float> query = query_vector;
  faiss::fvec_renorm_L2(options_.dimension, 1, query.data());

  const auto k = static_cast<faiss::idx_t>(std::min(fetch_k, entries_.size()));
  std::vector<float> distances(k);
  std::vector<faiss::idx_t> labels(k);
  faiss_index_->search(1, query.data(), k, distances.data(), labels.data());

  std::vector<RetrievalCandidate> candidates;
  candidates.reserve(k);
  for (faiss::idx_t i = 0; i < k; ++i) {
    const auto label = labels[i];
    // HNSW pads with -1 when it finds fewer than k neighbours
    if (label < 0 || static_cast<size_t>(label) >= entries_.size()) {
      continue;
    }
    const auto &stored = entries_[label];
    RetrievalCandidate candidate;
    candidate.chunk = stored.chunk;
    candidate.embedding = stored.embedding;
    candidate.score =
        faiss::fvec_inner_product(query.data(), stored.embedding.data(), options_.dimension);
    candidates.push_back(std::move(candidate));
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const RetrievalCandidate &a, const RetrievalCandidate &b) {
                     return a.score > b.score;
                   });
  for (size_t i = 0; i < candidates.size(); ++i) {
    candidates[i].fetch_rank = i;
  }
  return candidates;
}

void VectorIndex::write_to_disk() {
  std::error_code ec;
  std::filesystem::create_directories(path_, ec);
  if (ec) {
    throw IndexStorageError("Failed to create index directory " + path_.string() + ": " +
                            ec.message());
  }

  // The faiss file is staged first and moved into place while the docstore
  // transaction is still open. Any failure up to the rename leaves both files
  // as the last successful persist wrote them.
  const auto final_path = path_ / FAISS_FILE_NAME;
  auto tmp_path = final_path;
  tmp_path += ".tmp";
  try {
    faiss::write_index(faiss_index_.get(), tmp_path.c_str());
  } catch (const faiss::FaissException &e) {
    std::filesystem::remove(tmp_path, ec);
    throw IndexStorageError("Failed to write faiss index: " + std::string(e.what()));
  }

  try {
    sqlite::database db((path_ / DOCSTORE_FILE_NAME).string());
    create_docstore_schema(db);

    Transaction tx(db, /*immediate*/ true);
    db << "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)" << "dimension"
       << std::to_string(options_.dimension);
    db << "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?)" << "index_type"
       << to_string(options_.type);

    auto insert_chunk = db << "INSERT OR REPLACE INTO chunks (id, fingerprint, source_id, "
                              "chunk_index, start_offset, content, vector_blob) "
                              "VALUES (?, ?, ?, ?, ?, ?, ?)";
    for (size_t id = persisted_count_; id < entries_.size(); ++id) {
      const auto &stored = entries_[id];
      insert_chunk << static_cast<long long>(id) << stored.chunk.fingerprint
                   << stored.chunk.source_id << stored.chunk.chunk_index
                   << static_cast<long long>(stored.chunk.start_offset)
                   << CompressionService::compress(stored.chunk.content,
                                                   options_.compression_level)
                   << vector_to_blob(stored.embedding);
      insert_chunk++;
    }

    std::filesystem::rename(tmp_path, final_path, ec);
    if (ec) {
      throw IndexStorageError("Failed to move faiss index into place: " + ec.message());
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    std::filesystem::remove(tmp_path, ec);
    throw IndexStorageError(format_db_error("persist_docstore", e));
  } catch (const IndexStorageError &) {
    std::filesystem::remove(tmp_path, ec);
    throw;
  } catch (const CompressionError &e) {
    std::filesystem::remove(tmp_path, ec);
    throw IndexStorageError("Failed to compress chunk content: " + std::string(e.what()));
  }

  persisted_count_ = entries_.size();
  on_disk_ = true;
}

std::unique_ptr<VectorIndex> VectorIndex::read_from_disk(const std::filesystem::path &path,
                                                         const IndexOptions &options) {
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    throw IndexNotFoundError("No index at " + path.string());
  }

  const auto faiss_path = path / FAISS_FILE_NAME;
  const auto docstore_path = path / DOCSTORE_FILE_NAME;
  const bool has_faiss = std::filesystem::exists(faiss_path, ec);
  const bool has_docstore = std::filesystem::exists(docstore_path, ec);
  if (!has_faiss && !has_docstore) {
    throw IndexNotFoundError("No index at " + path.string());
  }
  if (has_faiss != has_docstore) {
    throw IndexCorruptError("Index at " + path.string() + " is missing " +
                            (has_faiss ? DOCSTORE_FILE_NAME : FAISS_FILE_NAME));
  }

  IndexOptions loaded_options = options;
  std::vector<StoredChunk> entries;

  try {
    sqlite::database db(docstore_path.string());

    std::string dimension_value;
    std::string type_value;
    db << "SELECT key, value FROM meta" >> [&](std::string key, std::string value) {
      if (key == "dimension") {
        dimension_value = std::move(value);
      } else if (key == "index_type") {
        type_value = std::move(value);
      }
    };
    if (dimension_value.empty()) {
      throw IndexCorruptError("Docstore at " + path.string() + " has no dimension record");
    }
    try {
      loaded_options.dimension = std::stoul(dimension_value);
      if (!type_value.empty()) {
        loaded_options.type = index_type_from_string(type_value);
      }
    } catch (const std::exception &e) {
      throw IndexCorruptError("Docstore at " + path.string() + " has invalid metadata: " +
                              e.what());
    }
    if (loaded_options.dimension == 0) {
      throw IndexCorruptError("Docstore at " + path.string() + " has a zero dimension");
    }
    if (loaded_options.dimension != options.dimension) {
      std::cerr << "Warning: index at " << path << " was built with dimension "
                << loaded_options.dimension << ", configured dimension is " << options.dimension
                << std::endl;
    }

    const size_t expected_blob_size = loaded_options.dimension * sizeof(float);
    db << "SELECT id, fingerprint, source_id, chunk_index, start_offset, content, vector_blob "
          "FROM chunks ORDER BY id" >>
        [&](long long id, std::string fingerprint, std::string source_id, int chunk_index,
            long long start_offset, std::vector<char> content, std::vector<char> vector_blob) {
          if (id != static_cast<long long>(entries.size())) {
            throw IndexCorruptError("Docstore ids are not contiguous at id " +
                                    std::to_string(id));
          }
          if (vector_blob.size() != expected_blob_size) {
            throw IndexCorruptError("Stored vector for id " + std::to_string(id) + " has " +
                                    std::to_string(vector_blob.size()) + " bytes, expected " +
                                    std::to_string(expected_blob_size));
          }
          StoredChunk stored;
          try {
            stored.chunk.content = CompressionService::decompress(content);
          } catch (const CompressionError &e) {
            throw IndexCorruptError("Stored content for id " + std::to_string(id) +
                                    " is unreadable: " + e.what());
          }
          stored.chunk.fingerprint = std::move(fingerprint);
          stored.chunk.source_id = std::move(source_id);
          stored.chunk.chunk_index = chunk_index;
          stored.chunk.start_offset = static_cast<size_t>(start_offset);
          stored.embedding = blob_to_vector(vector_blob);
          entries.push_back(std::move(stored));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw IndexCorruptError(format_db_error("load_docstore", e));
  }

  std::unique_ptr<faiss::Index> raw_index;
  try {
    raw_index.reset(faiss::read_index(faiss_path.c_str()));
  } catch (const faiss::FaissException &e) {
    throw IndexCorruptError("Failed to read faiss index at " + faiss_path.string() + ": " +
                            e.what());
  }

  auto id_map = dynamic_cast<faiss::IndexIDMap *>(raw_index.get());
  if (!id_map) {
    throw IndexCorruptError("Faiss index at " + faiss_path.string() + " has no id map");
  }
  if (static_cast<size_t>(id_map->d) != loaded_options.dimension) {
    throw IndexCorruptError("Faiss index dimension " + std::to_string(id_map->d) +
                            " does not match docstore dimension " +
                            std::to_string(loaded_options.dimension));
  }
  if (static_cast<size_t>(id_map->ntotal) != entries.size()) {
    throw IndexCorruptError("Faiss index holds " + std::to_string(id_map->ntotal) +
                            " vectors but docstore holds " + std::to_string(entries.size()) +
                            " chunks");
  }
  for (size_t i = 0; i < id_map->id_map.size(); ++i) {
    if (id_map->id_map[i] != static_cast<faiss::idx_t>(i)) {
      throw IndexCorruptError("Faiss id map is out of order at position " + std::to_string(i));
    }
  }

  auto index = std::make_unique<VectorIndex>(path, loaded_options);
  raw_index.release();
  index->faiss_index_.reset(id_map);
  index->apply_search_params();

  for (size_t id = 0; id < entries.size(); ++id) {
    if (!index->by_fingerprint_.emplace(entries[id].chunk.fingerprint, id).second) {
      throw IndexCorruptError("Duplicate fingerprint in docstore: " +
                              entries[id].chunk.fingerprint);
    }
  }
  index->entries_ = std::move(entries);
  index->persisted_count_ = index->entries_.size();
  index->on_disk_ = true;
  return index;
}

}  // namespace docchat_core
