#include "finbot_api/server.hpp"

namespace finbot_api {
Server::Server(const std::string &host, int port, int num_workers)
    : host_(host),
      port_(port),
      num_workers_(num_workers),
      running_(false) {
  // The browser widget is served from another origin
  app_.get_middleware<crow::CORSHandler>().global().origin("*").headers("Content-Type");
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this] {
    // One request thread per worker; each query blocks its thread on the model calls
    app_.port(port_).bindaddr(host_).concurrency(static_cast<std::uint16_t>(num_workers_)).run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}
}  // namespace finbot_api
