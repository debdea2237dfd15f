/**
 * @file parity.hpp
 * @brief SPI command frame codec (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>

namespace hssim
{
namespace internal
{

/**
 * @brief Fields of a decoded 16-bit command frame
 */
struct CommandFields
{
  uint8_t cmd;   ///< Raw 2-bit command code (0..3)
  uint8_t addr;  ///< 4-bit register address
  uint8_t data;  ///< 8-bit data
};

/**
 * @brief Even parity over the low 14 bits
 *
 * @param bits14 Value whose bits 13..0 are reduced
 * @return 1 if an odd number of those bits is set, 0 otherwise
 */
uint8_t parity_of14(uint16_t bits14);

/**
 * @brief Build a reply frame
 *
 * CMD and RESERVED are zero, PARITY makes bits 15..1 even.
 *
 * @param addr Register address (masked to 4 bits)
 * @param data Register value
 * @return 16-bit reply frame
 */
uint16_t encode_response(uint8_t addr, uint8_t data);

/**
 * @brief Split a command frame into its fields
 *
 * The parity bit of the incoming frame is not checked.
 */
CommandFields decode_command(uint16_t frame);

}  // namespace internal
}  // namespace hssim
