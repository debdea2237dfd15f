/**
 * @file c_api.cpp
 * @brief HSSIM C API implementation
 *
 * C wrapper for the C++ Device class.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <new>
#include <string>
#include <vector>

#include "hssim/device.hpp"
#include "hssim/hssim.h"

using namespace hssim;

/* ========================================================================= */
/* Internal wrapper structure                                                */
/* ========================================================================= */

struct HssimDevice
{
  Device device;

  HssimDevice(hssim_log_fn log, void* user)
      : device(log == nullptr ? LogFn()
                              : LogFn([log, user](LogLevel, const char* tag, const std::string& text)
                                      { log(user, tag, text.c_str()); }))
  {
  }
};

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* hssim_strerror(hssim_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case HSSIM_ERR_##name:    \
    return msg;
#include "hssim/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Lifecycle functions                                                       */
/* ========================================================================= */

HssimDevice* hssim_device_create(hssim_log_fn log, void* user)
{
  return new (std::nothrow) HssimDevice(log, user);
}

void hssim_device_destroy(HssimDevice* dev)
{
  delete dev;
}

hssim_error_t hssim_device_reset(HssimDevice* dev)
{
  if (dev == nullptr)
  {
    return HSSIM_ERR_INVALID_ARG;
  }

  dev->device.reset();
  return HSSIM_ERR_OK;
}

/* ========================================================================= */
/* SPI functions                                                             */
/* ========================================================================= */

hssim_error_t hssim_device_process(HssimDevice* dev, uint16_t frame, uint16_t* reply)
{
  if (dev == nullptr || reply == nullptr)
  {
    return HSSIM_ERR_INVALID_ARG;
  }

  *reply = dev->device.process(frame);
  return HSSIM_ERR_OK;
}

hssim_error_t hssim_device_transfer(HssimDevice* dev, const uint8_t* tx_data, uint8_t* rx_data,
                                    size_t length)
{
  if (dev == nullptr || (length > 0 && (tx_data == nullptr || rx_data == nullptr)))
  {
    return HSSIM_ERR_INVALID_ARG;
  }

  std::vector<uint8_t> rx;
  dev->device.transfer(tx_data, length, rx);
  for (size_t i = 0; i < rx.size(); ++i)
  {
    rx_data[i] = rx[i];
  }
  return HSSIM_ERR_OK;
}

/* ========================================================================= */
/* Inspection functions                                                      */
/* ========================================================================= */

uint8_t hssim_device_peek(const HssimDevice* dev, uint8_t addr)
{
  if (dev == nullptr)
  {
    return 0;
  }
  return dev->device.registers().read(addr);
}

uint32_t hssim_device_watchdog_count(const HssimDevice* dev)
{
  if (dev == nullptr)
  {
    return 0;
  }
  return dev->device.watchdog_count();
}
