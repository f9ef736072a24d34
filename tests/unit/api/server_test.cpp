#include "passage_api/server.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace passage_api {

TEST(ListenAddressTest, ParsesHostAndPort) {
  ListenAddress address = parse_listen_address("127.0.0.1:3030");
  EXPECT_EQ(address.host, "127.0.0.1");
  EXPECT_EQ(address.port, 3030);

  address = parse_listen_address("0.0.0.0:65535");
  EXPECT_EQ(address.host, "0.0.0.0");
  EXPECT_EQ(address.port, 65535);
}

TEST(ListenAddressTest, RejectsMalformedAddresses) {
  EXPECT_THROW(parse_listen_address("localhost"), std::invalid_argument);
  EXPECT_THROW(parse_listen_address(":3030"), std::invalid_argument);
  EXPECT_THROW(parse_listen_address("localhost:"), std::invalid_argument);
  EXPECT_THROW(parse_listen_address("localhost:http"), std::invalid_argument);
  EXPECT_THROW(parse_listen_address("localhost:0"), std::invalid_argument);
  EXPECT_THROW(parse_listen_address("localhost:70000"), std::invalid_argument);
  EXPECT_THROW(parse_listen_address("localhost:-1"), std::invalid_argument);
}

TEST(ServerTest, KeepsParsedAddressAndStartsStopped) {
  Server server(parse_listen_address("127.0.0.1:3031"));
  EXPECT_EQ(server.host(), "127.0.0.1");
  EXPECT_EQ(server.port(), 3031);
  EXPECT_FALSE(server.is_running());
  // Stopping a server that never started is a no-op
  EXPECT_NO_THROW(server.stop());
}

TEST(ServerTest, RejectsPortOutOfRange) {
  EXPECT_THROW(Server("127.0.0.1", 0), std::invalid_argument);
  EXPECT_THROW(Server("127.0.0.1", 70000), std::invalid_argument);
}

}  // namespace passage_api
