/**
 * @file config.cpp
 * @brief Server configuration and command line parsing
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "hssim/config.hpp"

#include <cerrno>
#include <cstdlib>

namespace hssim
{

bool parse_port(const char* text, uint16_t& port)
{
  if (text == nullptr || *text == '\0')
  {
    return false;
  }

  errno = 0;
  char* end = nullptr;
  const unsigned long value = std::strtoul(text, &end, 10);
  if (errno != 0 || *end != '\0' || *text == '-' || value == 0 || value > 0xFFFF)
  {
    return false;
  }

  port = static_cast<uint16_t>(value);
  return true;
}

Status parse_args(int argc, const char* const* argv, const EnvFn& env, ServerConfig& config,
                  std::string& error)
{
  const EnvFn lookup = env ? env : EnvFn([](const char* name) { return std::getenv(name); });

  bool host_given = false;
  bool port_given = false;

  for (int i = 1; i < argc; ++i)
  {
    const std::string arg = argv[i];

    if (arg == "--host" && i + 1 < argc)
    {
      config.host = argv[++i];
      host_given = true;
    }
    else if (arg == "--port" && i + 1 < argc)
    {
      if (!parse_port(argv[++i], config.port))
      {
        error = std::string("invalid port: ") + argv[i];
        return Status::BAD_OPTION;
      }
      port_given = true;
    }
    else if (arg == "--quiet")
    {
      config.quiet = true;
    }
    else if (arg == "--help" || arg == "-h")
    {
      return Status::HELP_REQUESTED;
    }
    else
    {
      error = "unknown arg: " + arg;
      return Status::BAD_OPTION;
    }
  }

  if (!host_given)
  {
    if (const char* value = lookup(ENV_HOST))
    {
      config.host = value;
    }
  }

  if (!port_given)
  {
    if (const char* value = lookup(ENV_PORT))
    {
      if (!parse_port(value, config.port))
      {
        error = std::string("invalid ") + ENV_PORT + ": " + value;
        return Status::BAD_OPTION;
      }
    }
  }

  return Status::OK;
}

const char* usage()
{
  return "usage: hssim-server [--host <addr>] [--port <n>] [--quiet] [--help]\n"
         "  --host   bind address (default 127.0.0.1, env HAL_SPI_SOCKET_HOST)\n"
         "  --port   TCP port (default 9000, env HAL_SPI_SOCKET_PORT)\n"
         "  --quiet  only log lifecycle events\n";
}

}  // namespace hssim
