#include "passage_api/server.hpp"

#include <stdexcept>

namespace passage_api {

ListenAddress parse_listen_address(const std::string &address) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    throw std::invalid_argument("Listen address must have the form host:port, got '" + address +
                                "'");
  }
  const std::string port_text = address.substr(colon + 1);
  if (port_text.empty() || port_text.find_first_not_of("0123456789") != std::string::npos ||
      port_text.size() > 5) {
    throw std::invalid_argument("Invalid port in listen address '" + address + "'");
  }
  const int port = std::stoi(port_text);
  if (port < 1 || port > 65535) {
    throw std::invalid_argument("Port out of range in listen address '" + address + "'");
  }
  return ListenAddress{address.substr(0, colon), static_cast<std::uint16_t>(port)};
}

Server::Server(const std::string &host, int port) : host_(host), running_(false) {
  if (port < 1 || port > 65535) {
    throw std::invalid_argument("Port out of range: " + std::to_string(port));
  }
  port_ = static_cast<std::uint16_t>(port);
}

Server::Server(const ListenAddress &address) : Server(address.host, address.port) {}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  serve_result_ = std::async(std::launch::async, [this] {
    app_.port(port_).bindaddr(host_).multithreaded().run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  running_ = false;

  if (serve_result_.valid()) {
    serve_result_.get();
  }
}
}  // namespace passage_api
