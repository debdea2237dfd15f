/**
 * @file message.hpp
 * @brief Socket message and byte stream abstraction
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "hssim/protocol.hpp"

namespace hssim
{

/**
 * @brief Decoded message header
 */
struct MessageHeader
{
  uint8_t type;       ///< MessageType code, kept raw so unknown types survive
  uint8_t device_id;  ///< Logical device handle
  uint16_t length;    ///< Payload length
  uint32_t sequence;  ///< Sequence number
};

/**
 * @brief Complete message: header plus exactly header.length payload bytes
 */
struct Message
{
  MessageHeader header;
  std::vector<uint8_t> payload;
};

/**
 * @brief Ordered, reliable byte stream of one session
 *
 * Implemented over a connected socket by the server and over memory
 * buffers by the tests.
 */
class Stream
{
 public:
  virtual ~Stream() = default;

  /**
   * @brief Read up to @p len bytes
   *
   * May return fewer bytes than requested.
   *
   * @return Number of bytes read, 0 when the peer closed the stream,
   *         negative on I/O error
   */
  virtual long read(uint8_t* data, size_t len) = 0;

  /**
   * @brief Write all @p len bytes
   *
   * @return true on success, false on I/O error
   */
  virtual bool write_all(const uint8_t* data, size_t len) = 0;
};

}  // namespace hssim
