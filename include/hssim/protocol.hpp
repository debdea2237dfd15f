/**
 * @file protocol.hpp
 * @brief HSSIM protocol definitions
 *
 * Socket message framing and 16-bit SPI command frame layout of the
 * simulated 4-channel high-side switch (TLE92104-class device).
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace hssim
{

/* ========================================================================= */
/* Message framing constants                                                 */
/* ========================================================================= */

/**
 * @brief Size of the fixed message header in bytes
 */
constexpr size_t HEADER_SIZE = 8;

/**
 * @brief Default bind address of the simulator server
 */
constexpr const char* DEFAULT_HOST = "127.0.0.1";

/**
 * @brief Default TCP port of the simulator server
 */
constexpr uint16_t DEFAULT_PORT = 9000;

/* ========================================================================= */
/* Message structure                                                         */
/* ========================================================================= */

/**
 * Message format (all multi-byte header fields little-endian):
 *
 * [TYPE][DEV_ID][LEN_L][LEN_H][SEQ_0][SEQ_1][SEQ_2][SEQ_3][DATA...]
 *
 * - TYPE:   1 byte  (request type, or 0x80 in every reply)
 * - DEV_ID: 1 byte  (logical SPI device handle, echoed in the reply)
 * - LEN:    2 bytes (payload length)
 * - SEQ:    4 bytes (sequence number, echoed in the reply)
 * - DATA:   LEN bytes
 *
 * There is no start marker and no checksum; the stream is assumed reliable.
 */

/**
 * @brief Message type codes
 */
enum class MessageType : uint8_t
{
  /**
   * @brief Initialize a logical device
   *
   * DATA: [BAUD (u32 LE)][MODE][BIT_ORDER][DATA_BITS], extra bytes ignored.
   * Always re-creates the simulated device, even when DATA is short.
   *
   * Response: empty
   */
  INIT = 0x01,

  /**
   * @brief Forget a logical device
   *
   * Response: empty
   */
  DEINIT = 0x02,

  /**
   * @brief Full-duplex transfer
   *
   * DATA: sequence of 16-bit command frames, MSB first.
   *
   * Response: one 16-bit reply frame per command frame, same length as DATA
   */
  TRANSFER = 0x03,

  /**
   * @brief Transmit only
   *
   * Same device effect as TRANSFER, reply frames are dropped.
   *
   * Response: empty
   */
  SEND = 0x04,

  /**
   * @brief Receive only
   *
   * DATA: [LEN_H][LEN_L] requested length, big-endian (unlike the header).
   *
   * Response: LEN zero bytes
   */
  RECEIVE = 0x05,

  /**
   * @brief Reconfigure an initialized device
   *
   * DATA: same layout as INIT. The simulated device is not touched.
   *
   * Response: empty
   */
  SET_CONFIG = 0x06,

  /**
   * @brief Query status
   *
   * Response: [0x01][0x00]
   */
  GET_STATUS = 0x07,

  /**
   * @brief Type tag of every reply
   */
  RESPONSE = 0x80,
};

/**
 * @brief Length of the INIT / SET_CONFIG configuration block
 */
constexpr size_t CONFIG_PAYLOAD_SIZE = 7;

/* ========================================================================= */
/* SPI command frame                                                         */
/* ========================================================================= */

/**
 * Command frame format (16 bits, bit 15 first on the wire):
 *
 * [CMD(2)][ADDR(4)][DATA(8)][PARITY(1)][RESERVED(1)]
 *
 * - CMD:      00 = read, 01 = write, anything else is unknown
 * - ADDR:     register address
 * - DATA:     write data (ignored for reads)
 * - PARITY:   even parity over bits 15..2 (never checked on input)
 * - RESERVED: 0
 *
 * Reply frames always carry CMD = 00 and the address/data of the previous
 * transaction.
 */
constexpr unsigned CMD_SHIFT = 14;
constexpr unsigned ADDR_SHIFT = 10;
constexpr unsigned DATA_SHIFT = 2;
constexpr unsigned PARITY_BIT = 1;

/**
 * @brief Command codes carried in the CMD field
 */
enum class Command : uint8_t
{
  READ = 0x00,
  WRITE = 0x01,
};

/* ========================================================================= */
/* Register map                                                              */
/* ========================================================================= */

/**
 * @brief Register addresses of the simulated device
 *
 * Addresses 0x09..0x0F are unmapped and read as zero.
 */
enum class Register : uint8_t
{
  CTRL1 = 0x00,
  CTRL2 = 0x01,
  CTRL3 = 0x02,
  CFG = 0x03,
  DIAG = 0x04,
  WDG = 0x05,
  ICR = 0x06,
  HWCR = 0x07,
  DEVID = 0x08,
};

/**
 * @brief Number of addressable register slots (4-bit address)
 */
constexpr size_t REGISTER_SLOTS = 16;

/**
 * @brief Number of mapped registers
 */
constexpr size_t MAPPED_REGISTERS = 9;

/**
 * @brief Fixed content of the DEVID register
 */
constexpr uint8_t DEVICE_ID = 0x5A;

/**
 * @brief Watchdog writes between two "serviced" diagnostics
 */
constexpr uint32_t WATCHDOG_REPORT_INTERVAL = 10;

/* ========================================================================= */
/* Status codes                                                              */
/* ========================================================================= */

/**
 * @brief Result codes of framing, transport and configuration calls
 */
enum class Status : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "hssim/errors.def"
#undef ERR
};

/**
 * @brief Human readable text of a status code
 */
const char* status_message(Status status);

}  // namespace hssim
