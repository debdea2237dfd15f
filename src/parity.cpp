/**
 * @file parity.cpp
 * @brief SPI command frame codec implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "parity.hpp"

#include "hssim/protocol.hpp"

namespace hssim
{
namespace internal
{

uint8_t parity_of14(uint16_t bits14)
{
  uint16_t temp = bits14 & 0x3FFF;
  uint8_t parity = 0;

  for (int bit = 0; bit < 14; ++bit)
  {
    parity ^= static_cast<uint8_t>(temp & 1);
    temp >>= 1;
  }

  return parity;
}

uint16_t encode_response(uint8_t addr, uint8_t data)
{
  uint16_t frame = static_cast<uint16_t>(((addr & 0x0F) << ADDR_SHIFT) |
                                         (static_cast<uint16_t>(data) << DATA_SHIFT));

  const uint8_t parity = parity_of14(static_cast<uint16_t>(frame >> DATA_SHIFT));
  frame |= static_cast<uint16_t>(parity << PARITY_BIT);

  return frame;
}

CommandFields decode_command(uint16_t frame)
{
  CommandFields fields;
  fields.cmd = static_cast<uint8_t>((frame >> CMD_SHIFT) & 0x03);
  fields.addr = static_cast<uint8_t>((frame >> ADDR_SHIFT) & 0x0F);
  fields.data = static_cast<uint8_t>((frame >> DATA_SHIFT) & 0xFF);
  return fields;
}

}  // namespace internal
}  // namespace hssim
