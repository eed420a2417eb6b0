#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docchat_core/index/vector_index.hpp"
#include "docchat_core/llm/providers.hpp"
#include "docchat_core/retrieval/mmr.hpp"

namespace docchat_core {

// Binds a loaded session index to MMR parameters
class MmrRetriever {
 public:
  // @throw InvalidParameterError for invalid params
  MmrRetriever(std::shared_ptr<const VectorIndex> index,
               std::shared_ptr<EmbeddingProvider> embedding_provider,
               MmrParams params = {});

  // Embeds the query, fetches fetch_k neighbours and re-ranks them with MMR
  std::vector<RetrievalCandidate> retrieve(const std::string &query) const;

  // Plain top-k by similarity, no diversity
  std::vector<RetrievalCandidate> similarity_search(const std::string &query, int k) const;

  const MmrParams &params() const {
    return params_;
  }
  const VectorIndex &index() const {
    return *index_;
  }

 private:
  std::shared_ptr<const VectorIndex> index_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  MmrParams params_;
};

}  // namespace docchat_core
