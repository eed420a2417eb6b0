#include "docchat_core/llm/ollama_client.hpp"

#include <iostream>

#include "ollama.hpp"

namespace docchat_core {

OllamaClient::OllamaClient(const OllamaSettings &settings) : settings_(settings) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(settings_.url);
  ollama::setReadTimeout(settings_.timeout_seconds);
  ollama::setWriteTimeout(settings_.timeout_seconds);

  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + settings_.url);
  }
  std::cout << "Connected to Ollama at " << settings_.url << " (embedding: "
            << settings_.embedding_model << ", chat: " << settings_.chat_model << ")" << std::endl;
}

// The /api/embed endpoint answers with an array of arrays, one per input
std::vector<float> OllamaClient::embed(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(settings_.embedding_model, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw OllamaError("Response does not contain embeddings field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw OllamaError("Embeddings field is not a non-empty array");
    }
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw OllamaError("Embedding generation failed: " + std::string(e.what()));
  }
}

// Same model for documents and queries
std::vector<float> OllamaClient::embed_query(const std::string &text) {
  return embed(text);
}

std::string OllamaClient::generate(const std::string &prompt) {
  try {
    ollama::response response = ollama::generate(settings_.chat_model, prompt);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw OllamaError("Text generation failed: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace docchat_core
