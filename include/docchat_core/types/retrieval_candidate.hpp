#pragma once

#include <cstddef>
#include <vector>

#include "docchat_core/types/chunk.hpp"

namespace docchat_core {

// Query-time only, never persisted
struct RetrievalCandidate {
  Chunk chunk;
  // Unit-length embedding as stored in the index
  std::vector<float> embedding;
  // Cosine similarity to the query
  float score = 0.0f;
  // Position in the nearest-neighbour fetch, 0 = most similar
  size_t fetch_rank = 0;
};

}  // namespace docchat_core
