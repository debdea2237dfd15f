/**
 * @file frame.cpp
 * @brief Message framing implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "frame.hpp"

namespace hssim
{
namespace internal
{

void encode_header(const MessageHeader& header, std::vector<uint8_t>& out)
{
  out.push_back(header.type);
  out.push_back(header.device_id);
  out.push_back(static_cast<uint8_t>(header.length & 0xFF));         // LEN_L
  out.push_back(static_cast<uint8_t>((header.length >> 8) & 0xFF));  // LEN_H
  out.push_back(static_cast<uint8_t>(header.sequence & 0xFF));
  out.push_back(static_cast<uint8_t>((header.sequence >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>((header.sequence >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((header.sequence >> 24) & 0xFF));
}

MessageHeader decode_header(const uint8_t* data)
{
  MessageHeader header;
  header.type = data[0];
  header.device_id = data[1];
  header.length = static_cast<uint16_t>(data[2] | (data[3] << 8));
  header.sequence = static_cast<uint32_t>(data[4]) | (static_cast<uint32_t>(data[5]) << 8) |
                    (static_cast<uint32_t>(data[6]) << 16) | (static_cast<uint32_t>(data[7]) << 24);
  return header;
}

Status read_exact(Stream& stream, uint8_t* data, size_t len)
{
  size_t got = 0;

  while (got < len)
  {
    const long n = stream.read(data + got, len - got);
    if (n < 0)
    {
      return Status::IO_ERROR;
    }
    if (n == 0)
    {
      return got == 0 ? Status::END_OF_STREAM : Status::TRUNCATED;
    }
    got += static_cast<size_t>(n);
  }

  return Status::OK;
}

Status read_message(Stream& stream, Message& msg)
{
  uint8_t raw[HEADER_SIZE];

  Status status = read_exact(stream, raw, sizeof(raw));
  if (status != Status::OK)
  {
    return status;
  }

  msg.header = decode_header(raw);
  msg.payload.assign(msg.header.length, 0);

  if (msg.header.length > 0)
  {
    status = read_exact(stream, msg.payload.data(), msg.payload.size());

    // The header is already consumed, so a close here is mid-message
    if (status == Status::END_OF_STREAM)
    {
      return Status::TRUNCATED;
    }
  }

  return status;
}

bool encode_reply(uint8_t device_id, uint32_t sequence, const std::vector<uint8_t>& payload,
                  std::vector<uint8_t>& out)
{
  if (payload.size() > 0xFFFF)
  {
    return false;
  }

  out.clear();
  out.reserve(HEADER_SIZE + payload.size());

  MessageHeader header;
  header.type = static_cast<uint8_t>(MessageType::RESPONSE);
  header.device_id = device_id;
  header.length = static_cast<uint16_t>(payload.size());
  header.sequence = sequence;

  encode_header(header, out);
  out.insert(out.end(), payload.begin(), payload.end());

  return true;
}

Status write_response(Stream& stream, uint8_t device_id, uint32_t sequence,
                      const std::vector<uint8_t>& payload)
{
  std::vector<uint8_t> out;
  if (!encode_reply(device_id, sequence, payload, out))
  {
    return Status::INVALID_ARG;
  }

  return stream.write_all(out.data(), out.size()) ? Status::OK : Status::IO_ERROR;
}

}  // namespace internal
}  // namespace hssim
