/**
 * @file device.hpp
 * @brief Simulated high-side switch: register file and SPI pipeline
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "hssim/log.hpp"
#include "hssim/protocol.hpp"

namespace hssim
{

/**
 * @brief Register storage of the simulated device
 *
 * Sixteen 8-bit slots indexed by the 4-bit address. Slots 0x09..0x0F are
 * unmapped: they are never written and always read as zero. DEVID is
 * read-only and always holds DEVICE_ID.
 */
class RegisterFile
{
 public:
  RegisterFile();

  /**
   * @brief Read a register
   *
   * @param addr Register address (masked to 4 bits)
   * @return Stored value, 0 for unmapped addresses
   */
  uint8_t read(uint8_t addr) const;

  /**
   * @brief Write a register
   *
   * @param addr  Register address (masked to 4 bits)
   * @param value New value
   * @return false if the write was ignored (DEVID or unmapped address)
   */
  bool write(uint8_t addr, uint8_t value);

  /**
   * @brief Restore power-on values
   */
  void reset();

 private:
  std::array<uint8_t, REGISTER_SLOTS> regs_;
};

/**
 * @brief Register transaction result held between two SPI frames
 */
struct PendingResponse
{
  uint8_t addr;
  uint8_t data;
};

/**
 * @brief SPI front end of the simulated device
 *
 * Models the one-frame response latency of the real part: the reply shifted
 * out while frame N is shifted in carries the result of frame N-1. The first
 * reply after construction or reset() encodes address 0, data 0.
 *
 * Example:
 * @code
 * Device dev;
 * dev.process(0x2000);           // READ DEVID, returns 0x0000
 * uint16_t r = dev.process(0);   // returns 0x216A (DEVID = 0x5A)
 * @endcode
 */
class Device
{
 public:
  /**
   * @brief Construct a device in power-on state
   *
   * @param log Diagnostic sink (may be empty)
   */
  explicit Device(LogFn log = LogFn());

  /**
   * @brief Shift one 16-bit command frame through the device
   *
   * @param frame Command frame
   * @return Reply frame describing the previous transaction
   */
  uint16_t process(uint16_t frame);

  /**
   * @brief Run a byte buffer through the device as big-endian frames
   *
   * Buffers shorter than two bytes are copied unchanged. A trailing odd
   * byte is not shifted in and is answered with 0x00, so the reply always
   * has the length of the request.
   *
   * @param tx  Transmitted bytes (may be nullptr if len == 0)
   * @param len Number of bytes
   * @param rx  Output buffer, replaced with the reply bytes
   */
  void transfer(const uint8_t* tx, size_t len, std::vector<uint8_t>& rx);

  /**
   * @brief Return to power-on state
   *
   * Restores register defaults, clears the pending response and the
   * watchdog counter.
   */
  void reset();

  /**
   * @brief Number of accepted writes to the WDG register
   */
  uint32_t watchdog_count() const
  {
    return wdg_count_;
  }

  /**
   * @brief Result that the next process() call will return
   */
  PendingResponse pending() const
  {
    return pending_;
  }

  /**
   * @brief Register file, for inspection
   */
  const RegisterFile& registers() const
  {
    return regs_;
  }

 private:
  void handle_read(uint8_t addr);
  void handle_write(uint8_t addr, uint8_t data);

  RegisterFile regs_;        ///< Register storage
  PendingResponse pending_;  ///< Result of the last transaction
  uint32_t wdg_count_;       ///< Accepted WDG writes
  LogFn log_;                ///< Diagnostic sink
};

/**
 * @brief Name of a register for diagnostics
 *
 * @return Register mnemonic, or "UNMAPPED" for 0x09..0x0F
 */
const char* register_name(uint8_t addr);

}  // namespace hssim
