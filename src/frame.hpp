/**
 * @file frame.hpp
 * @brief Message framing over a byte stream (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "hssim/message.hpp"
#include "hssim/protocol.hpp"

namespace hssim
{
namespace internal
{

/**
 * @brief Encode a message header
 *
 * Generates [TYPE][DEV_ID][LEN_L][LEN_H][SEQ_0..SEQ_3] at the end of @p out.
 *
 * @param header Header fields
 * @param out    Output buffer, bytes are appended
 */
void encode_header(const MessageHeader& header, std::vector<uint8_t>& out);

/**
 * @brief Decode a message header
 *
 * @param data Exactly HEADER_SIZE bytes
 * @return Decoded fields
 */
MessageHeader decode_header(const uint8_t* data);

/**
 * @brief Read exactly @p len bytes
 *
 * Retries short reads until the count is reached or the peer closes.
 *
 * @param stream Source stream
 * @param data   Destination buffer
 * @param len    Number of bytes to read
 * @return OK, END_OF_STREAM if the peer closed before the first byte,
 *         TRUNCATED if it closed after some bytes, IO_ERROR on failure
 */
Status read_exact(Stream& stream, uint8_t* data, size_t len);

/**
 * @brief Read one complete message
 *
 * A clean close between messages yields END_OF_STREAM. A close inside the
 * header or payload yields TRUNCATED.
 *
 * @param stream Source stream
 * @param msg    Output message (valid only when OK is returned)
 * @return OK, END_OF_STREAM, TRUNCATED or IO_ERROR
 */
Status read_message(Stream& stream, Message& msg);

/**
 * @brief Encode a complete reply
 *
 * [0x80][DEV_ID][LEN_L][LEN_H][SEQ...][DATA...]
 *
 * @param device_id Device handle of the request
 * @param sequence  Sequence number of the request
 * @param payload   Reply payload (at most 0xFFFF bytes)
 * @param out       Output buffer, replaced with the encoded reply
 * @return false if the payload does not fit the 16-bit length field
 */
bool encode_reply(uint8_t device_id, uint32_t sequence, const std::vector<uint8_t>& payload,
                  std::vector<uint8_t>& out);

/**
 * @brief Write a reply as one buffer
 *
 * @return OK, INVALID_ARG if the payload is too long, IO_ERROR on failure
 */
Status write_response(Stream& stream, uint8_t device_id, uint32_t sequence,
                      const std::vector<uint8_t>& payload);

}  // namespace internal
}  // namespace hssim
