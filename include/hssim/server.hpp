/**
 * @file server.hpp
 * @brief TCP front end of the simulator
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "hssim/config.hpp"
#include "hssim/device.hpp"
#include "hssim/log.hpp"
#include "hssim/message.hpp"

namespace hssim
{

/**
 * @brief Stream over a connected socket
 *
 * Owns the descriptor and closes it on destruction.
 */
class SocketStream : public Stream
{
 public:
  explicit SocketStream(int fd) : fd_(fd) {}
  ~SocketStream() override;

  SocketStream(const SocketStream&) = delete;
  SocketStream& operator=(const SocketStream&) = delete;

  long read(uint8_t* data, size_t len) override;
  bool write_all(const uint8_t* data, size_t len) override;

 private:
  int fd_;
};

/**
 * @brief Listener serving one client at a time
 *
 * The server owns the single simulated device. Each accepted connection
 * gets a fresh Session (empty handle table) bound to that device and is
 * served to completion before the next accept, so the device is never
 * touched by two clients at once. Register state therefore carries over
 * between connections until a client sends INIT.
 */
class Server
{
 public:
  /**
   * @param config Bind address and port; port 0 picks an ephemeral port
   * @param log    Diagnostic sink (may be empty)
   */
  Server(const ServerConfig& config, LogFn log = LogFn());
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * @brief Resolve, bind and listen
   *
   * @return OK, RESOLVE_FAILED, BIND_FAILED or LISTEN_FAILED
   */
  Status open();

  /**
   * @brief Accept one client and serve it until it disconnects
   *
   * @return Final status of the session, or IO_ERROR if accept failed
   */
  Status serve_one();

  /**
   * @brief Serve clients forever
   *
   * Session and accept failures are logged and do not stop the loop.
   */
  void run();

  /**
   * @brief Port actually bound (valid after open())
   */
  uint16_t port() const
  {
    return bound_port_;
  }

  /**
   * @brief Simulated device shared by all sessions
   */
  Device& device()
  {
    return device_;
  }

 private:
  ServerConfig config_;  ///< Bind address and port
  LogFn log_;            ///< Diagnostic sink
  Device device_;        ///< Simulated device
  int listen_fd_;        ///< Listening socket, -1 when closed
  uint16_t bound_port_;  ///< Port reported by getsockname()
};

}  // namespace hssim
