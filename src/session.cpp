/**
 * @file session.cpp
 * @brief Per-connection message dispatcher implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "hssim/session.hpp"

#include <utility>
#include <variant>

#include "frame.hpp"

namespace hssim
{

namespace
{

const char* const TAG = "SPI-SERVER";

template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

Session::Session(Device& device, LogFn log) : device_(device), configs_(), log_(std::move(log))
{
}

std::vector<uint8_t> Session::handle(const Message& msg)
{
  const uint8_t id = msg.header.device_id;
  const Request request = parse_request(msg);

  return std::visit(
      Overloaded{
          [&](const InitRequest& req) { return handle_init(id, req); },
          [&](const DeinitRequest&) { return handle_deinit(id); },
          [&](const TransferRequest& req) { return handle_transfer(req); },
          [&](const SendRequest& req) { return handle_send(req); },
          [&](const ReceiveRequest& req) { return handle_receive(req); },
          [&](const SetConfigRequest& req) { return handle_set_config(id, req); },
          [&](const GetStatusRequest&) { return handle_get_status(); },
          [&](const UnknownRequest& req) { return handle_unknown(req); },
      },
      request);
}

Status Session::serve(Stream& stream)
{
  for (;;)
  {
    Message msg;
    Status status = internal::read_message(stream, msg);
    if (status != Status::OK)
    {
      if (status != Status::END_OF_STREAM)
      {
        logf(log_, LogLevel::ERROR, TAG, "Client error: %s", status_message(status));
      }
      return status;
    }

    const std::vector<uint8_t> reply = handle(msg);

    status = internal::write_response(stream, msg.header.device_id, msg.header.sequence, reply);
    if (status != Status::OK)
    {
      logf(log_, LogLevel::ERROR, TAG, "Client error: %s", status_message(status));
      return status;
    }
  }
}

const DeviceConfig* Session::config(uint8_t device_id) const
{
  const auto it = configs_.find(device_id);
  return it == configs_.end() ? nullptr : &it->second;
}

std::vector<uint8_t> Session::handle_init(uint8_t device_id, const InitRequest& req)
{
  if (req.config)
  {
    configs_[device_id] = *req.config;
    logf(log_, LogLevel::INFO, TAG, "Device %u initialized: %luHz, mode=%u, %u-bit",
         static_cast<unsigned>(device_id), static_cast<unsigned long>(req.config->baudrate),
         static_cast<unsigned>(req.config->mode), static_cast<unsigned>(req.config->data_bits));
  }

  // Power-cycles the simulated device even without a configuration block
  device_.reset();
  return {};
}

std::vector<uint8_t> Session::handle_deinit(uint8_t device_id)
{
  if (configs_.erase(device_id) > 0)
  {
    logf(log_, LogLevel::INFO, TAG, "Device %u deinitialized", static_cast<unsigned>(device_id));
  }
  return {};
}

std::vector<uint8_t> Session::handle_transfer(const TransferRequest& req)
{
  std::vector<uint8_t> rx;
  device_.transfer(req.data.data(), req.data.size(), rx);
  return rx;
}

std::vector<uint8_t> Session::handle_send(const SendRequest& req)
{
  std::vector<uint8_t> discarded;
  device_.transfer(req.data.data(), req.data.size(), discarded);
  return {};
}

std::vector<uint8_t> Session::handle_receive(const ReceiveRequest& req)
{
  if (!req.length)
  {
    return {};
  }
  return std::vector<uint8_t>(*req.length, 0x00);
}

std::vector<uint8_t> Session::handle_set_config(uint8_t device_id, const SetConfigRequest& req)
{
  if (!req.config)
  {
    return {};
  }

  const auto it = configs_.find(device_id);
  if (it == configs_.end())
  {
    return {};
  }

  it->second.baudrate = req.config->baudrate;
  it->second.mode = req.config->mode;
  it->second.bit_order = req.config->bit_order;
  it->second.data_bits = req.config->data_bits;
  logf(log_, LogLevel::INFO, TAG, "Device %u reconfigured", static_cast<unsigned>(device_id));
  return {};
}

std::vector<uint8_t> Session::handle_get_status()
{
  return {0x01, 0x00};
}

std::vector<uint8_t> Session::handle_unknown(const UnknownRequest& req)
{
  logf(log_, LogLevel::WARN, TAG, "Unknown message type: 0x%02X", static_cast<unsigned>(req.type));
  return {};
}

}  // namespace hssim
