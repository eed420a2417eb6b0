#pragma once
#include <crow.h>

#include <future>
#include <string>

namespace docchat_api {
class Server {
 public:
  Server(const std::string &host, int port);
  ~Server() = default;

  // Disable move and copy operations since crow::SimpleApp doesn't support them
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Runs the app on a background thread
  void start();

  // Blocks until the server thread has exited
  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  int port_;
  std::future<void> server_thread_future_;
  bool running_ = false;
};
}  // namespace docchat_api
