/**
 * @file test_server.cpp
 * @brief Loopback tests of the TCP front end
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <thread>
#include <vector>

#include "hssim/protocol.hpp"
#include "hssim/server.hpp"
#include "memory_stream.hpp"

using namespace hssim;
using hssim::test::request_bytes;

namespace
{

ServerConfig loopback_config()
{
  ServerConfig config;
  config.host = "127.0.0.1";
  config.port = 0;  // ephemeral
  return config;
}

/**
 * @brief Minimal blocking client speaking the socket protocol
 */
class Client
{
 public:
  explicit Client(uint16_t port) : fd_(::socket(AF_INET, SOCK_STREAM, 0))
  {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    connected_ = fd_ >= 0 && ::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
  }

  ~Client()
  {
    close();
  }

  bool connected() const
  {
    return connected_;
  }

  void close()
  {
    if (fd_ >= 0)
    {
      ::close(fd_);
      fd_ = -1;
    }
  }

  bool send_bytes(const std::vector<uint8_t>& bytes)
  {
    size_t off = 0;
    while (off < bytes.size())
    {
      const ssize_t n = ::send(fd_, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
      if (n <= 0)
      {
        return false;
      }
      off += static_cast<size_t>(n);
    }
    return true;
  }

  /**
   * @brief Send a request and collect the complete reply (header + payload)
   */
  std::vector<uint8_t> call(uint8_t type, uint8_t device_id, uint32_t sequence,
                            const std::vector<uint8_t>& payload)
  {
    if (!send_bytes(request_bytes(type, device_id, sequence, payload)))
    {
      return {};
    }

    std::vector<uint8_t> reply(HEADER_SIZE);
    if (!recv_exact(reply.data(), HEADER_SIZE))
    {
      return {};
    }
    const size_t len = static_cast<size_t>(reply[2] | (reply[3] << 8));
    reply.resize(HEADER_SIZE + len);
    if (len > 0 && !recv_exact(reply.data() + HEADER_SIZE, len))
    {
      return {};
    }
    return reply;
  }

 private:
  bool recv_exact(uint8_t* data, size_t len)
  {
    size_t got = 0;
    while (got < len)
    {
      const ssize_t n = ::recv(fd_, data + got, len - got, 0);
      if (n <= 0)
      {
        return false;
      }
      got += static_cast<size_t>(n);
    }
    return true;
  }

  int fd_;
  bool connected_;
};

}  // namespace

TEST_CASE("Server over loopback")
{
  Server server(loopback_config());
  REQUIRE(server.open() == Status::OK);
  REQUIRE(server.port() != 0);

  SUBCASE("One client session")
  {
    Status session_status = Status::OK;
    std::thread worker([&server, &session_status] { session_status = server.serve_one(); });

    {
      Client client(server.port());
      REQUIRE(client.connected());

      CHECK(client.call(0x01, 0x00, 1, {0x40, 0x42, 0x0F, 0x00, 0x00, 0x00, 0x10}) ==
            request_bytes(0x80, 0x00, 1, {}));
      CHECK(client.call(0x03, 0x00, 2, {0x20, 0x00}) == request_bytes(0x80, 0x00, 2, {0x00, 0x00}));
      CHECK(client.call(0x03, 0x00, 3, {0x00, 0x00}) == request_bytes(0x80, 0x00, 3, {0x21, 0x6A}));
      CHECK(client.call(0x07, 0x01, 4, {}) == request_bytes(0x80, 0x01, 4, {0x01, 0x00}));
      CHECK(client.call(0x05, 0x00, 5, {0x00, 0x03}) ==
            request_bytes(0x80, 0x00, 5, {0x00, 0x00, 0x00}));
    }

    worker.join();
    CHECK(session_status == Status::END_OF_STREAM);
  }

  SUBCASE("Device state carries over to the next client until INIT")
  {
    std::thread worker(
        [&server]
        {
          (void)server.serve_one();
          (void)server.serve_one();
        });

    {
      Client first(server.port());
      REQUIRE(first.connected());
      // WRITE CTRL1 = 0x11
      first.call(0x03, 0x00, 1, {0x40, 0x44});
    }

    {
      Client second(server.port());
      REQUIRE(second.connected());
      CHECK(second.call(0x03, 0x00, 1, {0x00, 0x00}) == request_bytes(0x80, 0x00, 1, {0x00, 0x44}));

      second.call(0x01, 0x00, 2, {});
      CHECK(second.call(0x03, 0x00, 3, {0x00, 0x00, 0x00, 0x00}) ==
            request_bytes(0x80, 0x00, 3, {0x00, 0x00, 0x00, 0x00}));
    }

    worker.join();
    CHECK(server.device().registers().read(static_cast<uint8_t>(Register::CTRL1)) == 0x00);
  }

  SUBCASE("Truncated request ends the session")
  {
    Status session_status = Status::OK;
    std::thread worker([&server, &session_status] { session_status = server.serve_one(); });

    {
      Client client(server.port());
      REQUIRE(client.connected());
      std::vector<uint8_t> bytes = request_bytes(0x03, 0x00, 1, {0x20, 0x00});
      bytes.pop_back();
      CHECK(client.send_bytes(bytes));
    }

    worker.join();
    CHECK(session_status == Status::TRUNCATED);
  }
}

TEST_CASE("Port already in use")
{
  Server first(loopback_config());
  REQUIRE(first.open() == Status::OK);

  ServerConfig config = loopback_config();
  config.port = first.port();
  Server second(config);
  CHECK(second.open() == Status::BIND_FAILED);
}
