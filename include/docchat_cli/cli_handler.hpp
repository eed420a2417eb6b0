#pragma once

#include <string>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace docchat_cli
{

  enum class Command
  {
    Upload,
    Add,
    Chat,
    History,
    ClearHistory,
    Health,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string session_id;
    std::string message;
    std::vector<std::string> file_paths;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command, returns the process exit code
    int execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

    // Joins the base URL and endpoint, adding http:// when no scheme is given
    std::string build_url(const std::string &endpoint) const;

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    void handle_upload_command(const CliOptions &options);
    void handle_add_command(const CliOptions &options);
    void handle_chat_command(const CliOptions &options);
    void handle_history_command(const CliOptions &options);
    void handle_clear_history_command(const CliOptions &options);
    void handle_health_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json make_multipart_request(const std::string &endpoint,
                                          const std::vector<std::string> &file_paths);
    nlohmann::json make_delete_request(const std::string &endpoint);
    // Runs the configured handle and parses the body, throwing on transport or HTTP errors
    nlohmann::json perform_request(std::string &response_buffer);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_history_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    void print_help();
  };

}
