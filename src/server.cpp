/**
 * @file server.cpp
 * @brief TCP front end implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "hssim/server.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "hssim/session.hpp"

namespace hssim
{

namespace
{

const char* const TAG = "SPI-SERVER";

}  // namespace

/* ========================================================================= */
/* SocketStream                                                              */
/* ========================================================================= */

SocketStream::~SocketStream()
{
  if (fd_ >= 0)
  {
    ::close(fd_);
  }
}

long SocketStream::read(uint8_t* data, size_t len)
{
  for (;;)
  {
    const ssize_t n = ::recv(fd_, data, len, 0);
    if (n < 0 && errno == EINTR)
    {
      continue;
    }
    return static_cast<long>(n);
  }
}

bool SocketStream::write_all(const uint8_t* data, size_t len)
{
  size_t off = 0;
  while (off < len)
  {
    const ssize_t n = ::send(fd_, data + off, len - off, MSG_NOSIGNAL);
    if (n < 0)
    {
      if (errno == EINTR)
      {
        continue;
      }
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

/* ========================================================================= */
/* Server                                                                    */
/* ========================================================================= */

Server::Server(const ServerConfig& config, LogFn log)
    : config_(config), log_(log), device_(log), listen_fd_(-1), bound_port_(0)
{
}

Server::~Server()
{
  if (listen_fd_ >= 0)
  {
    ::close(listen_fd_);
  }
}

Status Server::open()
{
  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  hints.ai_flags = AI_PASSIVE;

  const std::string port_text = std::to_string(config_.port);
  addrinfo* result = nullptr;
  const int rc = ::getaddrinfo(config_.host.c_str(), port_text.c_str(), &hints, &result);
  if (rc != 0)
  {
    logf(log_, LogLevel::ERROR, TAG, "ERROR: Failed to resolve %s:%u: %s", config_.host.c_str(),
         static_cast<unsigned>(config_.port), ::gai_strerror(rc));
    return Status::RESOLVE_FAILED;
  }

  Status status = Status::BIND_FAILED;
  for (addrinfo* ptr = result; ptr != nullptr; ptr = ptr->ai_next)
  {
    const int fd = ::socket(ptr->ai_family, ptr->ai_socktype, ptr->ai_protocol);
    if (fd < 0)
    {
      continue;
    }

    const int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0)
    {
      logf(log_, LogLevel::WARN, TAG, "SO_REUSEADDR not set: %s", std::strerror(errno));
    }

    if (::bind(fd, ptr->ai_addr, ptr->ai_addrlen) < 0)
    {
      logf(log_, LogLevel::ERROR, TAG, "ERROR: bind %s:%u failed: %s", config_.host.c_str(),
           static_cast<unsigned>(config_.port), std::strerror(errno));
      ::close(fd);
      continue;
    }

    if (::listen(fd, 1) < 0)
    {
      logf(log_, LogLevel::ERROR, TAG, "ERROR: listen failed: %s", std::strerror(errno));
      ::close(fd);
      status = Status::LISTEN_FAILED;
      continue;
    }

    listen_fd_ = fd;
    status = Status::OK;
    break;
  }
  ::freeaddrinfo(result);

  if (status != Status::OK)
  {
    return status;
  }

  sockaddr_in bound;
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0)
  {
    bound_port_ = ntohs(bound.sin_port);
  }
  else
  {
    bound_port_ = config_.port;
  }

  logf(log_, LogLevel::INFO, TAG, "Listening on %s:%u", config_.host.c_str(),
       static_cast<unsigned>(bound_port_));
  return Status::OK;
}

Status Server::serve_one()
{
  logf(log_, LogLevel::INFO, TAG, "Waiting for connection...");

  sockaddr_in peer;
  socklen_t peer_len = sizeof(peer);
  int fd = -1;
  do
  {
    fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len);
  } while (fd < 0 && errno == EINTR);

  if (fd < 0)
  {
    logf(log_, LogLevel::ERROR, TAG, "ERROR: accept failed: %s", std::strerror(errno));
    return Status::IO_ERROR;
  }

  char peer_text[INET_ADDRSTRLEN] = "?";
  ::inet_ntop(AF_INET, &peer.sin_addr, peer_text, sizeof(peer_text));
  logf(log_, LogLevel::INFO, TAG, "Client connected from %s:%u", peer_text,
       static_cast<unsigned>(ntohs(peer.sin_port)));

  SocketStream stream(fd);
  Session session(device_, log_);
  const Status status = session.serve(stream);

  logf(log_, LogLevel::INFO, TAG, "Client disconnected");
  return status;
}

void Server::run()
{
  for (;;)
  {
    (void)serve_one();
  }
}

}  // namespace hssim
