#pragma once

#include <string>
#include <vector>

namespace docchat_core {

/*
Embedding capability. Implementations must be deterministic for identical
input, otherwise re-ingesting the same chunks would not be idempotent.
*/
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> embed(const std::string &text) = 0;
  virtual std::vector<float> embed_query(const std::string &text) = 0;

  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &texts) {
    std::vector<std::vector<float>> vectors;
    vectors.reserve(texts.size());
    for (const auto &text : texts) {
      vectors.push_back(embed(text));
    }
    return vectors;
  }
};

// Text generation capability, used for query rewriting and answer synthesis
class LanguageModelProvider {
 public:
  virtual ~LanguageModelProvider() = default;

  virtual std::string generate(const std::string &prompt) = 0;
};

}  // namespace docchat_core
