#pragma once
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "server.hpp"

// Forward declarations
namespace docchat_core {
class IngestionService;
class ChatService;
class DocumentLoaderFactory;
struct LoadedDocument;
}  // namespace docchat_core

namespace docchat_api {

class Routes {
 public:
  Routes(std::shared_ptr<docchat_core::IngestionService> ingestion_service,
         std::shared_ptr<docchat_core::ChatService> chat_service,
         std::shared_ptr<docchat_core::DocumentLoaderFactory> loader_factory,
         std::filesystem::path upload_dir);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers, public so they can be driven without a listening socket
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_upload(const crow::request &req);
  crow::response handle_add_documents(const crow::request &req, const std::string &session_id);
  crow::response handle_chat(const crow::request &req);
  crow::response handle_get_history(const crow::request &req, const std::string &session_id);
  crow::response handle_clear_history(const crow::request &req, const std::string &session_id);

  // Status code for an engine error, 500 for anything unrecognised
  static int status_for(const std::exception &e);

 private:
  struct UploadedFile {
    std::string file_name;
    std::string data;
  };

  std::shared_ptr<docchat_core::IngestionService> ingestion_service_;
  std::shared_ptr<docchat_core::ChatService> chat_service_;
  std::shared_ptr<docchat_core::DocumentLoaderFactory> loader_factory_;
  std::filesystem::path upload_dir_;

  // Helper methods
  std::vector<UploadedFile> extract_uploaded_files(const crow::request &req);
  // Writes the supported files under upload_dir/<session_id>/ and returns their paths
  std::vector<std::filesystem::path> save_uploads(const std::string &session_id,
                                                  const std::vector<UploadedFile> &files);
  // Removes files saved for a request that failed, and the session dir if it is left empty
  void discard_uploads(const std::string &session_id,
                       const std::vector<std::filesystem::path> &saved);
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_exception_response(const std::string &handler, const std::exception &e);
};

}  // namespace docchat_api
