#pragma once

#include <vector>

#include "docchat_core/types/retrieval_candidate.hpp"

namespace docchat_core {

struct MmrParams {
  int k = 5;
  int fetch_k = 20;
  float lambda_mult = 0.5f;
};

// @throw InvalidParameterError if k <= 0, fetch_k < k, or lambda_mult is outside [0, 1]
void validate_mmr_params(const MmrParams &params);

/**
 * @brief Greedy Maximal Marginal Relevance selection over a fetched pool.
 *
 * Each round picks the candidate maximizing
 *   lambda * sim(c, q) - (1 - lambda) * max_{s in selected} sim(c, s)
 * with sim(c, q) taken from the candidate score and sim(c, s) the inner
 * product of the stored unit vectors. Ties go to the higher query similarity,
 * then to the earlier fetch position. Candidates sharing a fingerprint are
 * collapsed to their first occurrence before selection.
 *
 * @param pool Candidates in fetch order.
 * @return min(k, distinct candidates) picks in selection order.
 */
std::vector<RetrievalCandidate> mmr_select(const std::vector<RetrievalCandidate> &pool,
                                           const MmrParams &params);

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

}  // namespace docchat_core
