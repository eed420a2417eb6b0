#include "docchat_cli/cli_handler.hpp"
#include <filesystem>
#include <iostream>
#include <memory>

namespace docchat_cli {

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "upload" || command == "u") {
        options.command = Command::Upload;
        for (int i = 2; i < argc; ++i) {
            options.file_paths.push_back(argv[i]);
        }
        if (options.file_paths.empty()) {
            throw CliError("Upload command requires at least one file. Usage: upload <file>...");
        }
    } else if (command == "add" || command == "a") {
        options.command = Command::Add;
        if (argc < 4) {
            throw CliError("Add command requires a session id and files. Usage: add <session_id> <file>...");
        }
        options.session_id = argv[2];
        for (int i = 3; i < argc; ++i) {
            options.file_paths.push_back(argv[i]);
        }
    } else if (command == "chat" || command == "c") {
        options.command = Command::Chat;
        if (argc < 4) {
            throw CliError("Chat command requires a session id and a message. Usage: chat <session_id> <message>");
        }
        options.session_id = argv[2];
        // Unquoted messages arrive as several arguments
        for (int i = 3; i < argc; ++i) {
            if (!options.message.empty()) {
                options.message += " ";
            }
            options.message += argv[i];
        }
    } else if (command == "history" || command == "hist") {
        options.command = Command::History;
        if (argc < 3) {
            throw CliError("History command requires a session id. Usage: history <session_id> [--clear]");
        }
        options.session_id = argv[2];
        for (int i = 3; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--clear") {
                options.command = Command::ClearHistory;
            } else {
                throw CliError("Unknown option for history: " + flag);
            }
        }
    } else if (command == "health") {
        options.command = Command::Health;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    try {
        switch (options.command) {
            case Command::Upload:
                handle_upload_command(options);
                break;
            case Command::Add:
                handle_add_command(options);
                break;
            case Command::Chat:
                handle_chat_command(options);
                break;
            case Command::History:
                handle_history_command(options);
                break;
            case Command::ClearHistory:
                handle_clear_history_command(options);
                break;
            case Command::Health:
                handle_health_command(options);
                break;
            case Command::Help:
                print_help();
                break;
        }
    } catch (const CliError& e) {
        print_error(e.what());
        return 1;
    } catch (const nlohmann::json::exception& e) {
        print_error("Unexpected response from server: " + std::string(e.what()));
        return 1;
    }
    return 0;
}

void CliHandler::handle_upload_command(const CliOptions& options) {
    std::cout << "Uploading " << options.file_paths.size() << " file(s)..." << std::endl;
    nlohmann::json response = make_multipart_request("/upload", options.file_paths);
    std::cout << "Session: " << response["session_id"].get<std::string>() << std::endl;
    std::cout << "Chunks indexed: " << response["chunks_added"].get<long long>() << std::endl;
}

void CliHandler::handle_add_command(const CliOptions& options) {
    std::cout << "Adding " << options.file_paths.size() << " file(s) to " << options.session_id
              << "..." << std::endl;
    nlohmann::json response =
        make_multipart_request("/sessions/" + options.session_id + "/documents", options.file_paths);
    std::cout << "Chunks added: " << response["chunks_added"].get<long long>() << std::endl;
}

void CliHandler::handle_chat_command(const CliOptions& options) {
    nlohmann::json request_data = {
        {"session_id", options.session_id},
        {"message", options.message}
    };
    nlohmann::json response = make_post_request("/chat", request_data);
    std::cout << response["answer"].get<std::string>() << std::endl;
}

void CliHandler::handle_history_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/sessions/" + options.session_id + "/history");
    print_history_response(response);
}

void CliHandler::handle_clear_history_command(const CliOptions& options) {
    make_delete_request("/sessions/" + options.session_id + "/history");
    std::cout << "History cleared for " << options.session_id << std::endl;
}

void CliHandler::handle_health_command(const CliOptions& /*options*/) {
    nlohmann::json response = make_get_request("/health");
    print_json_response(response);
}

nlohmann::json CliHandler::perform_request(std::string& response_buffer) {
    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        std::string detail;
        auto body = nlohmann::json::parse(response_buffer, nullptr, /*allow_exceptions*/ false);
        if (body.is_object() && body.contains("detail") && body["detail"].is_string()) {
            detail = ": " + body["detail"].get<std::string>();
        }
        throw CliError("HTTP request failed with status code " + std::to_string(http_code) + detail);
    }

    return nlohmann::json::parse(response_buffer);
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    return perform_request(response_buffer);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = data.dump();
    std::string response_buffer;

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), curl_slist_free_all);

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());

    return perform_request(response_buffer);
}

nlohmann::json CliHandler::make_multipart_request(const std::string& endpoint,
                                                  const std::vector<std::string>& file_paths) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    for (const auto& path : file_paths) {
        if (!std::filesystem::is_regular_file(path)) {
            throw CliError("File not found: " + path);
        }
    }

    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    std::unique_ptr<curl_mime, decltype(&curl_mime_free)> mime(curl_mime_init(curl_handle_),
                                                                curl_mime_free);
    for (const auto& path : file_paths) {
        curl_mimepart* part = curl_mime_addpart(mime.get());
        curl_mime_name(part, "files");
        curl_mime_filedata(part, path.c_str());
    }

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_MIMEPOST, mime.get());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    return perform_request(response_buffer);
}

nlohmann::json CliHandler::make_delete_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string response_buffer;

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, "DELETE");
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    return perform_request(response_buffer);
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

std::string CliHandler::build_url(const std::string& endpoint) const {
    std::string base = api_base_url_;
    if (base.find("://") == std::string::npos) {
        base = "http://" + base;
    }
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (!endpoint.empty() && endpoint.front() != '/') {
        return base + "/" + endpoint;
    }
    return base + endpoint;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_history_response(const nlohmann::json& response) {
    std::cout << "\n=== History: " << response["session_id"].get<std::string>() << " ===" << std::endl;
    const auto& messages = response["messages"];
    if (!messages.is_array() || messages.empty()) {
        std::cout << "No messages yet." << std::endl;
        return;
    }
    for (const auto& message : messages) {
        std::cout << "[" << message["role"].get<std::string>() << "] "
                  << message["content"].get<std::string>() << std::endl;
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
DocChat CLI - Chat with your documents

Usage: docchat <command> [arguments]

Commands:
  upload, u <file>...                Start a new session from .txt/.md files
  add, a <session_id> <file>...      Add files to an existing session
  chat, c <session_id> <message>     Ask a question about the session's documents
  history <session_id> [--clear]     Show (or clear) the session's conversation
  health                             Check that the server is up
  help, h                            Show this help

Environment:
  API_BASE_URL    Server address (default: http://127.0.0.1:8000)
)" << std::endl;
}

}  // namespace docchat_cli
