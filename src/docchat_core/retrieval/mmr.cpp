#include "docchat_core/retrieval/mmr.hpp"

#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

#include "docchat_core/errors.hpp"

namespace docchat_core {

void validate_mmr_params(const MmrParams &params) {
  if (params.k <= 0) {
    throw InvalidParameterError("k must be positive, got " + std::to_string(params.k));
  }
  if (params.fetch_k < params.k) {
    throw InvalidParameterError("fetch_k (" + std::to_string(params.fetch_k) +
                                ") must be at least k (" + std::to_string(params.k) + ")");
  }
  // NaN fails both comparisons
  if (!(params.lambda_mult >= 0.0f && params.lambda_mult <= 1.0f)) {
    throw InvalidParameterError("lambda_mult must be in [0, 1], got " +
                                std::to_string(params.lambda_mult));
  }
}

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0f;
  }
  const float dot = faiss::fvec_inner_product(a.data(), b.data(), a.size());
  const float norms = std::sqrt(faiss::fvec_norm_L2sqr(a.data(), a.size()) *
                                faiss::fvec_norm_L2sqr(b.data(), b.size()));
  if (norms == 0.0f) {
    return 0.0f;
  }
  return dot / norms;
}

std::vector<RetrievalCandidate> mmr_select(const std::vector<RetrievalCandidate> &pool,
                                           const MmrParams &params) {
  validate_mmr_params(params);

  std::vector<const RetrievalCandidate *> remaining;
  std::unordered_set<std::string> seen;
  for (const auto &candidate : pool) {
    if (seen.insert(candidate.chunk.fingerprint).second) {
      remaining.push_back(&candidate);
    }
  }

  const float lambda = params.lambda_mult;
  const size_t target = std::min(static_cast<size_t>(params.k), remaining.size());

  std::vector<RetrievalCandidate> selected;
  selected.reserve(target);
  // Highest similarity of each remaining candidate to anything selected so far
  std::vector<float> max_sim_to_selected(remaining.size(), 0.0f);

  while (selected.size() < target) {
    size_t best = 0;
    float best_score = -std::numeric_limits<float>::infinity();
    for (size_t i = 0; i < remaining.size(); ++i) {
      const float redundancy = selected.empty() ? 0.0f : max_sim_to_selected[i];
      const float score = lambda * remaining[i]->score - (1.0f - lambda) * redundancy;
      // Pool order is fetch order, so strict comparisons keep the earlier one
      if (score > best_score ||
          (score == best_score && remaining[i]->score > remaining[best]->score)) {
        best = i;
        best_score = score;
      }
    }

    selected.push_back(*remaining[best]);
    remaining.erase(remaining.begin() + best);
    max_sim_to_selected.erase(max_sim_to_selected.begin() + best);

    const auto &picked = selected.back().embedding;
    for (size_t i = 0; i < remaining.size(); ++i) {
      const float sim = cosine_similarity(remaining[i]->embedding, picked);
      if (selected.size() == 1 || sim > max_sim_to_selected[i]) {
        max_sim_to_selected[i] = sim;
      }
    }
  }
  return selected;
}

}  // namespace docchat_core
