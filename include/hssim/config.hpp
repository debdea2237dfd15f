/**
 * @file config.hpp
 * @brief Server configuration and command line parsing
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "hssim/protocol.hpp"

namespace hssim
{

/**
 * @brief Environment variable overriding the bind address
 *
 * Same name the HAL socket client reads, so one setting serves both ends.
 */
constexpr const char* ENV_HOST = "HAL_SPI_SOCKET_HOST";

/**
 * @brief Environment variable overriding the port
 */
constexpr const char* ENV_PORT = "HAL_SPI_SOCKET_PORT";

/**
 * @brief Runtime configuration of the simulator server
 */
struct ServerConfig
{
  std::string host = DEFAULT_HOST;  ///< Bind address
  uint16_t port = DEFAULT_PORT;     ///< TCP port
  bool quiet = false;               ///< Drop per-transaction diagnostics
};

/**
 * @brief Environment lookup, returns nullptr for unset variables
 */
using EnvFn = std::function<const char*(const char* name)>;

/**
 * @brief Parse a TCP port number
 *
 * @param text Decimal port text
 * @param port Output port
 * @return false unless @p text is a number in 1..65535
 */
bool parse_port(const char* text, uint16_t& port);

/**
 * @brief Fill a configuration from command line and environment
 *
 * Recognized options: --host <addr>, --port <n>, --quiet, --help.
 * Environment variables are consulted only for options not given on the
 * command line.
 *
 * @param argc   Argument count
 * @param argv   Argument vector (argv[0] is skipped)
 * @param env    Environment lookup (std::getenv when empty)
 * @param config Output configuration, starts from defaults
 * @param error  Description of the first offending argument
 * @return OK, HELP_REQUESTED or BAD_OPTION
 */
Status parse_args(int argc, const char* const* argv, const EnvFn& env, ServerConfig& config,
                  std::string& error);

/**
 * @brief Usage text for --help and option errors
 */
const char* usage();

}  // namespace hssim
