/**
 * @file main.cpp
 * @brief hssim-server entry point
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstdio>
#include <string>

#include "hssim/config.hpp"
#include "hssim/log.hpp"
#include "hssim/protocol.hpp"
#include "hssim/server.hpp"

int main(int argc, char** argv)
{
  hssim::ServerConfig config;
  std::string error;

  const hssim::Status parsed = hssim::parse_args(argc, argv, hssim::EnvFn(), config, error);
  if (parsed == hssim::Status::HELP_REQUESTED)
  {
    std::fputs(hssim::usage(), stdout);
    return 0;
  }
  if (parsed != hssim::Status::OK)
  {
    std::fprintf(stderr, "hssim-server: %s\n%s", error.c_str(), hssim::usage());
    return 2;
  }

  std::printf("============================================================\n");
  std::printf("SPI HAL Socket Server - TLE92104 Simulation\n");
  std::printf("============================================================\n");
  std::printf("Host: %s\n", config.host.c_str());
  std::printf("Port: %u\n", static_cast<unsigned>(config.port));
  std::printf("Simulated device: TLE92104 (ID=0x%02X)\n", hssim::DEVICE_ID);
  std::printf("Press Ctrl+C to stop\n");
  std::printf("============================================================\n");
  std::fflush(stdout);

  const hssim::LogFn log =
      hssim::make_stderr_logger(config.quiet ? hssim::LogLevel::INFO : hssim::LogLevel::DEBUG);

  hssim::Server server(config, log);
  const hssim::Status status = server.open();
  if (status != hssim::Status::OK)
  {
    std::fprintf(stderr, "hssim-server: %s\n", hssim::status_message(status));
    return 1;
  }

  server.run();
  return 0;
}
