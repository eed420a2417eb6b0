#pragma once

#include <cstdlib>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "docchat_core/errors.hpp"
#include "docchat_core/index/vector_index.hpp"
#include "docchat_core/services/chat_service.hpp"
#include "docchat_core/splitter/text_splitter.hpp"

namespace docchat_api {

class Config {
 public:
  static constexpr const char *DEFAULT_CONFIG_FILE = "docchatrc.json";
  static constexpr const char *CONFIG_PATH_ENV = "DOCCHAT_CONFIG";

  std::string api_base_url;
  std::string index_root;
  std::string upload_dir;

  // Session history
  std::string session_store;
  std::string session_db_path;
  int db_pool_size;

  // Providers
  std::string ollama_url;
  std::string embedding_model;
  std::string chat_model;
  int embedding_dimension;
  int provider_timeout_seconds;

  // Indexing
  std::string index_type;
  int chunk_size;
  int chunk_overlap;

  // Retrieval and answering
  int k;
  int fetch_k;
  double lambda_mult;
  int history_window;
  int max_context_chars;

  // DOCCHAT_CONFIG when set, docchatrc.json otherwise
  static std::string resolve_config_path() {
    const char *env_path = std::getenv(CONFIG_PATH_ENV);
    if (env_path && *env_path) {
      return env_path;
    }
    return DEFAULT_CONFIG_FILE;
  }

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw docchat_core::ConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception &e) {
      throw docchat_core::ConfigurationError(std::string("Failed to parse JSON in config file '") +
                                             filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw docchat_core::ConfigurationError("Config must be a JSON object");
    }

    Config config;
    try {
      // Apply defaults when keys are missing
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:8000"));
      config.index_root = json_config.value("index_root", std::string("./faiss_index"));
      config.upload_dir = json_config.value("upload_dir", std::string("./data"));

      config.session_store = json_config.value("session_store", std::string("sqlite"));
      config.session_db_path =
          json_config.value("session_db_path", std::string("./data/sessions.db"));
      config.db_pool_size = json_config.value("db_pool_size", 4);

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.chat_model = json_config.value("chat_model", std::string("llama3.2"));
      config.embedding_dimension = json_config.value("embedding_dimension", 1024);
      config.provider_timeout_seconds = json_config.value("provider_timeout_seconds", 120);

      config.index_type = json_config.value("index_type", std::string("hnsw"));
      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);

      config.k = json_config.value("k", 5);
      config.fetch_k = json_config.value("fetch_k", 20);
      config.lambda_mult = json_config.value("lambda_mult", 0.5);
      config.history_window = json_config.value("history_window", 6);
      config.max_context_chars = json_config.value("max_context_chars", 8000);
    } catch (const nlohmann::json::type_error &e) {
      throw docchat_core::ConfigurationError(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  docchat_core::SplitterOptions splitter_options() const {
    docchat_core::SplitterOptions options;
    options.chunk_size = chunk_size;
    options.chunk_overlap = chunk_overlap;
    return options;
  }

  docchat_core::IndexOptions index_options() const {
    docchat_core::IndexOptions options;
    options.dimension = static_cast<size_t>(embedding_dimension);
    options.type = docchat_core::index_type_from_string(index_type);
    return options;
  }

  docchat_core::ChatOptions chat_options() const {
    docchat_core::ChatOptions options;
    options.mmr = {.k = k, .fetch_k = fetch_k, .lambda_mult = static_cast<float>(lambda_mult)};
    options.rag.history_window = static_cast<size_t>(history_window);
    options.rag.max_context_chars = static_cast<size_t>(max_context_chars);
    return options;
  }

  // "host:port" split into its parts
  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }
  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    if (api_base_url.empty()) {
      throw docchat_core::ConfigurationError("api_base_url cannot be empty");
    }
    const auto colon = api_base_url.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw docchat_core::ConfigurationError("api_base_url must be host:port, got '" +
                                             api_base_url + "'");
    }
    if (index_root.empty()) {
      throw docchat_core::ConfigurationError("index_root cannot be empty");
    }
    if (upload_dir.empty()) {
      throw docchat_core::ConfigurationError("upload_dir cannot be empty");
    }
    if (session_store != "sqlite" && session_store != "memory") {
      throw docchat_core::ConfigurationError("session_store must be 'sqlite' or 'memory'");
    }
    if (session_store == "sqlite" && session_db_path.empty()) {
      throw docchat_core::ConfigurationError(
          "session_db_path cannot be empty when session_store is 'sqlite'");
    }
    if (db_pool_size <= 0) {
      throw docchat_core::ConfigurationError("db_pool_size must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw docchat_core::ConfigurationError("ollama_url cannot be empty");
    }
    if (embedding_model.empty() || chat_model.empty()) {
      throw docchat_core::ConfigurationError("embedding_model and chat_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw docchat_core::ConfigurationError("embedding_dimension must be greater than 0");
    }
    if (provider_timeout_seconds <= 0) {
      throw docchat_core::ConfigurationError("provider_timeout_seconds must be greater than 0");
    }
    if (index_type != "hnsw" && index_type != "flat") {
      throw docchat_core::ConfigurationError("index_type must be 'hnsw' or 'flat'");
    }
    if (chunk_size <= 0 || chunk_overlap <= 0 || chunk_overlap >= chunk_size) {
      throw docchat_core::ConfigurationError(
          "chunk_size and chunk_overlap must be positive with chunk_overlap < chunk_size");
    }
    if (k <= 0 || fetch_k < k) {
      throw docchat_core::ConfigurationError("k must be positive and fetch_k at least k");
    }
    if (!(lambda_mult >= 0.0 && lambda_mult <= 1.0)) {
      throw docchat_core::ConfigurationError("lambda_mult must be in [0, 1]");
    }
    if (history_window < 0) {
      throw docchat_core::ConfigurationError("history_window cannot be negative");
    }
    if (max_context_chars <= 0) {
      throw docchat_core::ConfigurationError("max_context_chars must be greater than 0");
    }
  }
};

}  // namespace docchat_api
