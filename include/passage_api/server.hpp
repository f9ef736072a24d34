#pragma once
#include <crow.h>

#include <cstdint>
#include <future>
#include <string>

namespace passage_api {

struct ListenAddress {
  std::string host;
  std::uint16_t port;
};

// Parses the "host:port" form used by the api_base_url setting.
// Throws std::invalid_argument on a missing host or a port outside 1..65535.
ListenAddress parse_listen_address(const std::string &address);

class Server {
 public:
  Server(const std::string &host, int port);
  explicit Server(const ListenAddress &address);
  ~Server() = default;

  // crow::SimpleApp is neither copyable nor movable
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  // Serves on a background thread with Crow's worker pool
  void start();

  // Blocks until the background thread has exited. Rethrows whatever ended it.
  void stop();

  bool is_running() const {
    return running_;
  }

  const std::string &host() const {
    return host_;
  }
  std::uint16_t port() const {
    return port_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  std::uint16_t port_;
  std::future<void> serve_result_;
  bool running_ = false;
};
}  // namespace passage_api
