#pragma once
#include <crow.h>
#include <crow/middlewares/cors.h>

#include <future>
#include <string>

namespace finbot_api {

using App = crow::App<crow::CORSHandler>;

class Server {
 public:
  Server(const std::string &host, int port, int num_workers = 4);
  ~Server() = default;

  // Disable move and copy operations since crow::App doesn't support them
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  App &get_app() {
    return app_;
  }

  void start();

  void stop();

  bool is_running() const {
    return running_;
  }

 private:
  App app_;
  std::string host_;
  int port_;
  int num_workers_;
  std::future<void> server_thread_future_;  // Manages the server thread
  bool running_ = false;
};

}  // namespace finbot_api
