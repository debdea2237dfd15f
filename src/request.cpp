/**
 * @file request.cpp
 * @brief Request decoding
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "hssim/request.hpp"

namespace hssim
{

std::optional<DeviceConfig> parse_config(const uint8_t* data, size_t len)
{
  if (data == nullptr || len < CONFIG_PAYLOAD_SIZE)
  {
    return std::nullopt;
  }

  DeviceConfig config;
  config.baudrate = static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
                    (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
  config.mode = data[4];
  config.bit_order = data[5];
  config.data_bits = data[6];
  config.initialized = true;
  return config;
}

Request parse_request(const Message& msg)
{
  const std::vector<uint8_t>& payload = msg.payload;

  switch (static_cast<MessageType>(msg.header.type))
  {
    case MessageType::INIT:
      return InitRequest{parse_config(payload.data(), payload.size())};

    case MessageType::DEINIT:
      return DeinitRequest{};

    case MessageType::TRANSFER:
      return TransferRequest{payload};

    case MessageType::SEND:
      return SendRequest{payload};

    case MessageType::RECEIVE:
      if (payload.size() < 2)
      {
        return ReceiveRequest{std::nullopt};
      }
      // Big-endian, unlike the header length
      return ReceiveRequest{static_cast<uint16_t>((payload[0] << 8) | payload[1])};

    case MessageType::SET_CONFIG:
      return SetConfigRequest{parse_config(payload.data(), payload.size())};

    case MessageType::GET_STATUS:
      return GetStatusRequest{};

    default:
      return UnknownRequest{msg.header.type};
  }
}

}  // namespace hssim
