/**
 * @file request.hpp
 * @brief Typed requests decoded from socket messages
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "hssim/message.hpp"

namespace hssim
{

/**
 * @brief SPI configuration of one logical device handle
 */
struct DeviceConfig
{
  uint32_t baudrate;   ///< Clock frequency in Hz
  uint8_t mode;        ///< SPI mode 0..3 (CPOL/CPHA)
  uint8_t bit_order;   ///< 0 = MSB first, 1 = LSB first
  uint8_t data_bits;   ///< Word size
  bool initialized;    ///< Set once INIT succeeded
};

/**
 * @brief INIT: configuration is absent when the payload is shorter than 7 bytes
 */
struct InitRequest
{
  std::optional<DeviceConfig> config;
};

struct DeinitRequest
{
};

struct TransferRequest
{
  std::vector<uint8_t> data;
};

struct SendRequest
{
  std::vector<uint8_t> data;
};

/**
 * @brief RECEIVE: length is absent when the payload is shorter than 2 bytes
 */
struct ReceiveRequest
{
  std::optional<uint16_t> length;
};

struct SetConfigRequest
{
  std::optional<DeviceConfig> config;
};

struct GetStatusRequest
{
};

/**
 * @brief Any type code not listed in MessageType (including RESPONSE)
 */
struct UnknownRequest
{
  uint8_t type;
};

/**
 * @brief One decoded request
 */
using Request = std::variant<InitRequest, DeinitRequest, TransferRequest, SendRequest,
                             ReceiveRequest, SetConfigRequest, GetStatusRequest, UnknownRequest>;

/**
 * @brief Parse the 7-byte configuration block
 *
 * [BAUD_0..BAUD_3 (u32 LE)][MODE][BIT_ORDER][DATA_BITS], extra bytes ignored.
 *
 * @param data Payload bytes
 * @param len  Payload length
 * @return Parsed configuration (initialized = true), or nothing if len < 7
 */
std::optional<DeviceConfig> parse_config(const uint8_t* data, size_t len);

/**
 * @brief Classify a message by its type code
 */
Request parse_request(const Message& msg);

}  // namespace hssim
