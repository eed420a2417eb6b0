#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "docchat_api/config.hpp"
#include "docchat_api/routes.hpp"
#include "docchat_api/server.hpp"
#include "docchat_core/db/database_manager.hpp"
#include "docchat_core/index/vector_index_manager.hpp"
#include "docchat_core/llm/ollama_client.hpp"
#include "docchat_core/loaders/document_loader_factory.hpp"
#include "docchat_core/services/chat_service.hpp"
#include "docchat_core/services/ingestion_service.hpp"
#include "docchat_core/session/session_lock_registry.hpp"
#include "docchat_core/session/sqlite_session_store.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main() {
  try {
    const std::string config_path = docchat_api::Config::resolve_config_path();
    docchat_api::Config config = docchat_api::Config::from_file(config_path);

    std::cout << "Starting DocChat API Server..." << std::endl;
    std::cout << "Config: " << config_path << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Index root: " << config.index_root << std::endl;
    std::cout << "Upload dir: " << config.upload_dir << std::endl;
    std::cout << "Session store: " << config.session_store << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (" << config.embedding_dimension
              << " dims)" << std::endl;
    std::cout << "Chat Model: " << config.chat_model << std::endl;

    // Initialize core components
    auto ollama_client = std::make_shared<docchat_core::OllamaClient>(docchat_core::OllamaSettings{
        .url = config.ollama_url,
        .embedding_model = config.embedding_model,
        .chat_model = config.chat_model,
        .timeout_seconds = config.provider_timeout_seconds});

    std::shared_ptr<docchat_core::SessionStore> session_store;
    auto &db_manager = docchat_core::DatabaseManager::get_instance();
    if (config.session_store == "sqlite") {
      std::filesystem::create_directories(
          std::filesystem::path(config.session_db_path).parent_path());
      db_manager.initialize(config.session_db_path, config.db_pool_size);
      session_store = std::make_shared<docchat_core::SqliteSessionStore>(db_manager);
    } else {
      session_store = std::make_shared<docchat_core::InMemorySessionStore>();
    }

    auto index_manager = std::make_shared<docchat_core::VectorIndexManager>(
        config.index_root, ollama_client, config.index_options());
    auto splitter = std::make_shared<docchat_core::TextSplitter>(config.splitter_options());
    auto session_locks = std::make_shared<docchat_core::SessionLockRegistry>();
    auto loader_factory = std::make_shared<docchat_core::DocumentLoaderFactory>();

    auto ingestion_service = std::make_shared<docchat_core::IngestionService>(
        index_manager, splitter, session_store, session_locks);
    auto chat_service = std::make_shared<docchat_core::ChatService>(
        index_manager, ollama_client, ollama_client, session_store, session_locks,
        config.chat_options());

    docchat_api::Server server(config.host(), config.port());
    docchat_api::Routes routes(ingestion_service, chat_service, loader_factory,
                               config.upload_dir);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    if (db_manager.is_initialized()) {
      db_manager.shutdown();
    }

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
