/**
 * @file hssim.h
 * @brief HSSIM C API
 *
 * C-compatible interface to the simulated high-side switch, for HAL
 * simulation back ends that run the device in-process instead of talking
 * to hssim-server over a socket.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Device constants                                                          */
  /* ========================================================================= */

  /** @brief Content of the read-only DEVID register */
#define HSSIM_DEVICE_ID 0x5A

  /* ========================================================================= */
  /* Register addresses                                                        */
  /* ========================================================================= */

  typedef enum
  {
    HSSIM_REG_CTRL1 = 0x00, /**< Output control 1 */
    HSSIM_REG_CTRL2 = 0x01, /**< Output control 2 */
    HSSIM_REG_CTRL3 = 0x02, /**< Output control 3 */
    HSSIM_REG_CFG = 0x03,   /**< Configuration */
    HSSIM_REG_DIAG = 0x04,  /**< Diagnosis */
    HSSIM_REG_WDG = 0x05,   /**< Watchdog */
    HSSIM_REG_ICR = 0x06,   /**< Input control */
    HSSIM_REG_HWCR = 0x07,  /**< Hardware configuration */
    HSSIM_REG_DEVID = 0x08, /**< Device identity (read-only) */
  } hssim_register_t;

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) HSSIM_ERR_##name = val,
#include "hssim/errors.def"
#undef ERR
  } hssim_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* hssim_strerror(hssim_error_t err);

  /* ========================================================================= */
  /* Device handle                                                             */
  /* ========================================================================= */

  /** @brief Opaque handle to a simulated device */
  typedef struct HssimDevice HssimDevice;

  /**
   * @brief Diagnostic callback
   *
   * @param user User-defined context pointer
   * @param tag  Component tag
   * @param text NUL-terminated message without newline
   */
  typedef void (*hssim_log_fn)(void* user, const char* tag, const char* text);

  /* ========================================================================= */
  /* Lifecycle functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Create a device in power-on state
   *
   * @param log  Diagnostic callback (NULL for silence)
   * @param user User context pointer passed to @p log
   * @return Device handle, or NULL on allocation failure
   */
  HssimDevice* hssim_device_create(hssim_log_fn log, void* user);

  /**
   * @brief Destroy a device
   * @param dev Device handle (NULL-safe)
   */
  void hssim_device_destroy(HssimDevice* dev);

  /**
   * @brief Return to power-on state
   *
   * Same effect as an INIT message on the socket protocol.
   *
   * @param dev Device handle
   * @return HSSIM_ERR_OK, or HSSIM_ERR_INVALID_ARG for a NULL handle
   */
  hssim_error_t hssim_device_reset(HssimDevice* dev);

  /* ========================================================================= */
  /* SPI functions                                                             */
  /* ========================================================================= */

  /**
   * @brief Shift one 16-bit command frame
   *
   * @param dev   Device handle
   * @param frame Command frame
   * @param reply Receives the reply frame (result of the previous frame)
   * @return HSSIM_ERR_OK, or HSSIM_ERR_INVALID_ARG
   */
  hssim_error_t hssim_device_process(HssimDevice* dev, uint16_t frame, uint16_t* reply);

  /**
   * @brief Full-duplex byte transfer
   *
   * Bytes are taken as big-endian 16-bit frames. A trailing odd byte is
   * answered with 0x00; a single byte is echoed.
   *
   * @param dev     Device handle
   * @param tx_data Bytes to shift in
   * @param rx_data Buffer of @p length bytes for the reply
   * @param length  Number of bytes
   * @return HSSIM_ERR_OK, or HSSIM_ERR_INVALID_ARG
   */
  hssim_error_t hssim_device_transfer(HssimDevice* dev, const uint8_t* tx_data, uint8_t* rx_data,
                                      size_t length);

  /* ========================================================================= */
  /* Inspection functions                                                      */
  /* ========================================================================= */

  /**
   * @brief Read a register without disturbing the SPI pipeline
   *
   * @param dev  Device handle
   * @param addr Register address
   * @return Register value, 0 for unmapped addresses or a NULL handle
   */
  uint8_t hssim_device_peek(const HssimDevice* dev, uint8_t addr);

  /**
   * @brief Number of accepted watchdog register writes since reset
   *
   * @param dev Device handle
   * @return Count, 0 for a NULL handle
   */
  uint32_t hssim_device_watchdog_count(const HssimDevice* dev);

#ifdef __cplusplus
} /* extern "C" */
#endif
