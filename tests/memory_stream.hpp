/**
 * @file memory_stream.hpp
 * @brief In-memory Stream for tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "hssim/message.hpp"

namespace hssim
{
namespace test
{

/**
 * @brief Stream reading from a fixed buffer and recording writes
 *
 * read() returns at most chunk bytes per call to exercise the
 * retry-until-complete path. After the input is exhausted it reports
 * end of stream, or an I/O error when fail_at_end is set.
 */
class MemoryStream : public Stream
{
 public:
  explicit MemoryStream(std::vector<uint8_t> input, size_t chunk = 3)
      : input_(std::move(input)), pos_(0), chunk_(chunk)
  {
  }

  long read(uint8_t* data, size_t len) override
  {
    if (pos_ >= input_.size())
    {
      return fail_at_end ? -1 : 0;
    }
    const size_t n = std::min(std::min(len, chunk_), input_.size() - pos_);
    std::copy(input_.begin() + pos_, input_.begin() + pos_ + n, data);
    pos_ += n;
    return static_cast<long>(n);
  }

  bool write_all(const uint8_t* data, size_t len) override
  {
    if (fail_writes)
    {
      return false;
    }
    output.insert(output.end(), data, data + len);
    return true;
  }

  std::vector<uint8_t> output;
  bool fail_at_end = false;
  bool fail_writes = false;

 private:
  std::vector<uint8_t> input_;
  size_t pos_;
  size_t chunk_;
};

/**
 * @brief Encode a request message
 */
inline std::vector<uint8_t> request_bytes(uint8_t type, uint8_t device_id, uint32_t sequence,
                                          const std::vector<uint8_t>& payload)
{
  std::vector<uint8_t> out = {
      type,
      device_id,
      static_cast<uint8_t>(payload.size() & 0xFF),
      static_cast<uint8_t>((payload.size() >> 8) & 0xFF),
      static_cast<uint8_t>(sequence & 0xFF),
      static_cast<uint8_t>((sequence >> 8) & 0xFF),
      static_cast<uint8_t>((sequence >> 16) & 0xFF),
      static_cast<uint8_t>((sequence >> 24) & 0xFF),
  };
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

}  // namespace test
}  // namespace hssim
