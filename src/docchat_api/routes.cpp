#include "docchat_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "docchat_core/errors.hpp"
#include "docchat_core/loaders/document_loader_factory.hpp"
#include "docchat_core/loaders/upload_storage.hpp"
#include "docchat_core/services/chat_service.hpp"
#include "docchat_core/services/ingestion_service.hpp"
#include "docchat_core/session/session_id.hpp"

namespace docchat_api {

Routes::Routes(std::shared_ptr<docchat_core::IngestionService> ingestion_service,
               std::shared_ptr<docchat_core::ChatService> chat_service,
               std::shared_ptr<docchat_core::DocumentLoaderFactory> loader_factory,
               std::filesystem::path upload_dir)
    : ingestion_service_(std::move(ingestion_service)),
      chat_service_(std::move(chat_service)),
      loader_factory_(std::move(loader_factory)),
      upload_dir_(std::move(upload_dir)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoints
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // New session from uploaded files
  CROW_ROUTE(app, "/upload").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_upload(req);
  });

  // More files for an existing session
  CROW_ROUTE(app, "/sessions/<string>/documents")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req,
                                              const std::string &session_id) {
        return handle_add_documents(req, session_id);
      });

  CROW_ROUTE(app, "/chat").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_chat(req);
  });

  CROW_ROUTE(app, "/sessions/<string>/history")
  ([this](const crow::request &req, const std::string &session_id) {
    return handle_get_history(req, session_id);
  });

  CROW_ROUTE(app, "/sessions/<string>/history")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req,
                                                const std::string &session_id) {
        return handle_clear_history(req, session_id);
      });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request & /*req*/) {
  nlohmann::json response;
  response["status"] = "ok";
  response["service"] = "docchat";
  return create_json_response(response);
}

crow::response Routes::handle_upload(const crow::request &req) {
  try {
    auto files = extract_uploaded_files(req);
    if (files.empty()) {
      return create_json_response(create_error_response("No files uploaded"), 400);
    }

    const std::string session_id = docchat_core::generate_session_id();
    std::cout << "Upload of " << files.size() << " files for new session " << session_id
              << std::endl;

    const auto saved = save_uploads(session_id, files);
    docchat_core::IngestionResult result;
    try {
      auto documents = loader_factory_->load_documents(saved);
      if (documents.empty()) {
        discard_uploads(session_id, saved);
        return create_json_response(create_error_response("No supported documents uploaded"),
                                    400);
      }
      result = ingestion_service_->create_session(session_id, documents);
    } catch (const std::exception &) {
      discard_uploads(session_id, saved);
      throw;
    }

    nlohmann::json response;
    response["session_id"] = result.session_id;
    response["indexed"] = true;
    response["chunks_added"] = result.chunks_added;
    response["message"] = "Indexing complete with MMR";
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_upload", e);
  }
}

crow::response Routes::handle_add_documents(const crow::request &req,
                                            const std::string &session_id) {
  try {
    if (!docchat_core::is_valid_session_id(session_id)) {
      return create_json_response(create_error_response("Invalid session id"), 400);
    }
    // Checked before anything is written under the upload dir
    if (!ingestion_service_->session_exists(session_id)) {
      return create_json_response(create_error_response("Session not found: " + session_id),
                                  404);
    }
    auto files = extract_uploaded_files(req);
    if (files.empty()) {
      return create_json_response(create_error_response("No files uploaded"), 400);
    }

    const auto saved = save_uploads(session_id, files);
    docchat_core::IngestionResult result;
    try {
      auto documents = loader_factory_->load_documents(saved);
      if (documents.empty()) {
        discard_uploads(session_id, saved);
        return create_json_response(create_error_response("No supported documents uploaded"),
                                    400);
      }
      result = ingestion_service_->add_documents(session_id, documents);
    } catch (const std::exception &) {
      discard_uploads(session_id, saved);
      throw;
    }

    nlohmann::json response;
    response["session_id"] = result.session_id;
    response["chunks_added"] = result.chunks_added;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_add_documents", e);
  }
}

crow::response Routes::handle_chat(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    const std::string session_id = json_body.value("session_id", "");
    const std::string message = json_body.value("message", "");

    if (message.find_first_not_of(" \t\r\n") == std::string::npos) {
      return create_json_response(create_error_response("Message cannot be empty"), 400);
    }

    std::cout << "Chat request for session: " << session_id << std::endl;
    std::string answer = chat_service_->chat(session_id, message);

    nlohmann::json response;
    response["answer"] = answer;
    return create_json_response(response);
  } catch (const docchat_core::SessionNotFoundError &) {
    return create_json_response(
        create_error_response(docchat_core::ChatService::INVALID_SESSION_MESSAGE), 400);
  } catch (const std::exception &e) {
    return create_exception_response("handle_chat", e);
  }
}

crow::response Routes::handle_get_history(const crow::request & /*req*/,
                                          const std::string &session_id) {
  try {
    auto history = chat_service_->history(session_id);
    nlohmann::json messages = nlohmann::json::array();
    for (const auto &message : history) {
      nlohmann::json message_json;
      message_json["role"] = docchat_core::to_string(message.role);
      message_json["content"] = message.content;
      messages.push_back(message_json);
    }

    nlohmann::json response;
    response["session_id"] = session_id;
    response["messages"] = messages;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_get_history", e);
  }
}

crow::response Routes::handle_clear_history(const crow::request & /*req*/,
                                            const std::string &session_id) {
  try {
    chat_service_->clear_history(session_id);
    nlohmann::json response;
    response["session_id"] = session_id;
    response["cleared"] = true;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return create_exception_response("handle_clear_history", e);
  }
}

int Routes::status_for(const std::exception &e) {
  if (dynamic_cast<const docchat_core::ConfigurationError *>(&e) ||
      dynamic_cast<const docchat_core::InvalidParameterError *>(&e) ||
      dynamic_cast<const docchat_core::DocumentLoaderError *>(&e) ||
      dynamic_cast<const nlohmann::json::exception *>(&e)) {
    return 400;
  }
  if (dynamic_cast<const docchat_core::IndexNotFoundError *>(&e) ||
      dynamic_cast<const docchat_core::SessionNotFoundError *>(&e)) {
    return 404;
  }
  if (dynamic_cast<const docchat_core::GenerationError *>(&e) ||
      dynamic_cast<const docchat_core::IngestionError *>(&e)) {
    return 502;
  }
  return 500;
}

std::vector<Routes::UploadedFile> Routes::extract_uploaded_files(const crow::request &req) {
  std::vector<UploadedFile> files;
  crow::multipart::message multipart(req);
  for (const auto &part : multipart.parts) {
    const auto &disposition = part.get_header_object("Content-Disposition");
    auto file_name = disposition.params.find("filename");
    if (file_name == disposition.params.end() || file_name->second.empty()) {
      continue;
    }
    files.push_back({file_name->second, part.body});
  }
  return files;
}

std::vector<std::filesystem::path> Routes::save_uploads(const std::string &session_id,
                                                       const std::vector<UploadedFile> &files) {
  const auto target_dir = upload_dir_ / session_id;
  std::vector<std::filesystem::path> saved;
  try {
    for (const auto &file : files) {
      if (!loader_factory_->is_supported(file.file_name)) {
        std::cerr << "Warning: unsupported file skipped: " << file.file_name << std::endl;
        continue;
      }
      saved.push_back(docchat_core::save_uploaded_file(target_dir, file.file_name, file.data));
    }
  } catch (const std::exception &) {
    discard_uploads(session_id, saved);
    throw;
  }
  return saved;
}

void Routes::discard_uploads(const std::string &session_id,
                             const std::vector<std::filesystem::path> &saved) {
  std::error_code ec;
  for (const auto &path : saved) {
    if (!std::filesystem::remove(path, ec) && ec) {
      std::cerr << "Warning: could not remove upload " << path << ": " << ec.message()
                << std::endl;
    }
  }
  const auto session_dir = upload_dir_ / session_id;
  if (std::filesystem::is_directory(session_dir, ec) &&
      std::filesystem::is_empty(session_dir, ec)) {
    std::filesystem::remove(session_dir, ec);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

crow::response Routes::create_exception_response(const std::string &handler,
                                                 const std::exception &e) {
  const int status = status_for(e);
  std::cerr << "Exception in " << handler << " (" << status << "): " << e.what() << std::endl;
  if (auto error = dynamic_cast<const docchat_core::DocChatError *>(&e)) {
    const auto cause = error->cause_message();
    if (!cause.empty()) {
      std::cerr << "  caused by: " << cause << std::endl;
    }
  }
  return create_json_response(create_error_response(e.what()), status);
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["detail"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace docchat_api
