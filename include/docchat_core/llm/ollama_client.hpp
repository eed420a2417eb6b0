#pragma once

#include <string>
#include <vector>

#include "docchat_core/llm/providers.hpp"

namespace docchat_core {

class OllamaError : public std::exception {
 public:
  explicit OllamaError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct OllamaSettings {
  std::string url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string chat_model = "llama3.2";
  // Applied to both read and write on every request
  int timeout_seconds = 120;
};

// Embedding and generation backed by a local Ollama server
class OllamaClient : public EmbeddingProvider, public LanguageModelProvider {
 public:
  explicit OllamaClient(const OllamaSettings &settings);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> embed(const std::string &text) override;
  std::vector<float> embed_query(const std::string &text) override;
  std::string generate(const std::string &prompt) override;

  bool is_server_available();

 private:
  OllamaSettings settings_;

  void setup_server_connection();
};

}  // namespace docchat_core
