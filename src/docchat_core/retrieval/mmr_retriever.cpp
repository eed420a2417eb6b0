#include "docchat_core/retrieval/mmr_retriever.hpp"

#include "docchat_core/errors.hpp"

namespace docchat_core {

MmrRetriever::MmrRetriever(std::shared_ptr<const VectorIndex> index,
                           std::shared_ptr<EmbeddingProvider> embedding_provider,
                           MmrParams params)
    : index_(std::move(index)),
      embedding_provider_(std::move(embedding_provider)),
      params_(params) {
  validate_mmr_params(params_);
  if (!index_ || !embedding_provider_) {
    throw ConfigurationError("MmrRetriever requires an index and an embedding provider");
  }
}

std::vector<RetrievalCandidate> MmrRetriever::retrieve(const std::string &query) const {
  const auto query_vector = embedding_provider_->embed_query(query);
  const auto pool = index_->search(query_vector, static_cast<size_t>(params_.fetch_k));
  return mmr_select(pool, params_);
}

std::vector<RetrievalCandidate> MmrRetriever::similarity_search(const std::string &query,
                                                                int k) const {
  if (k <= 0) {
    throw InvalidParameterError("k must be positive, got " + std::to_string(k));
  }
  const auto query_vector = embedding_provider_->embed_query(query);
  return index_->search(query_vector, static_cast<size_t>(k));
}

}  // namespace docchat_core
