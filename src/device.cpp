/**
 * @file device.cpp
 * @brief Simulated high-side switch implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "hssim/device.hpp"

#include <utility>

#include "parity.hpp"

namespace hssim
{

namespace
{

const char* const TAG = "TLE92104-SIM";

bool is_mapped(uint8_t addr)
{
  return addr < MAPPED_REGISTERS;
}

}  // namespace

/* ========================================================================= */
/* RegisterFile                                                              */
/* ========================================================================= */

RegisterFile::RegisterFile() : regs_()
{
  reset();
}

uint8_t RegisterFile::read(uint8_t addr) const
{
  addr &= 0x0F;
  return is_mapped(addr) ? regs_[addr] : 0x00;
}

bool RegisterFile::write(uint8_t addr, uint8_t value)
{
  addr &= 0x0F;
  if (addr == static_cast<uint8_t>(Register::DEVID) || !is_mapped(addr))
  {
    return false;
  }

  regs_[addr] = value;
  return true;
}

void RegisterFile::reset()
{
  regs_.fill(0x00);
  regs_[static_cast<uint8_t>(Register::DEVID)] = DEVICE_ID;
}

/* ========================================================================= */
/* Device                                                                    */
/* ========================================================================= */

Device::Device(LogFn log) : regs_(), pending_{0, 0}, wdg_count_(0), log_(std::move(log))
{
  logf(log_, LogLevel::INFO, TAG, "Initialized. Device ID=0x%02X", DEVICE_ID);
}

uint16_t Device::process(uint16_t frame)
{
  // Reply carries the previous transaction, captured before anything changes
  const uint16_t reply = internal::encode_response(pending_.addr, pending_.data);

  const internal::CommandFields fields = internal::decode_command(frame);

  switch (fields.cmd)
  {
    case static_cast<uint8_t>(Command::READ):
      handle_read(fields.addr);
      break;

    case static_cast<uint8_t>(Command::WRITE):
      handle_write(fields.addr, fields.data);
      break;

    default:
      logf(log_, LogLevel::WARN, TAG, "Unknown CMD=0x%X", fields.cmd);
      pending_ = PendingResponse{0, 0};
      break;
  }

  return reply;
}

void Device::handle_read(uint8_t addr)
{
  pending_ = PendingResponse{addr, regs_.read(addr)};
  logf(log_, LogLevel::DEBUG, TAG, "READ  %s[0x%X] -> 0x%02X", register_name(addr), addr,
       pending_.data);
}

void Device::handle_write(uint8_t addr, uint8_t data)
{
  const uint8_t old_value = regs_.read(addr);

  if (regs_.write(addr, data))
  {
    logf(log_, LogLevel::DEBUG, TAG, "WRITE %s[0x%X] = 0x%02X (was 0x%02X)", register_name(addr),
         addr, data, old_value);

    if (addr == static_cast<uint8_t>(Register::WDG))
    {
      ++wdg_count_;
      if (wdg_count_ % WATCHDOG_REPORT_INTERVAL == 0)
      {
        logf(log_, LogLevel::INFO, TAG, "Watchdog serviced %u times",
             static_cast<unsigned>(wdg_count_));
      }
    }
  }
  else if (addr == static_cast<uint8_t>(Register::DEVID))
  {
    logf(log_, LogLevel::WARN, TAG, "WRITE to read-only DEVID register ignored");
  }
  else
  {
    logf(log_, LogLevel::WARN, TAG, "WRITE to unmapped register 0x%X ignored", addr);
  }

  // Read back, so a rejected write reports the unchanged value
  pending_ = PendingResponse{addr, regs_.read(addr)};
}

void Device::transfer(const uint8_t* tx, size_t len, std::vector<uint8_t>& rx)
{
  rx.clear();

  if (len < 2)
  {
    if (len > 0 && tx != nullptr)
    {
      rx.insert(rx.end(), tx, tx + len);
    }
    return;
  }

  rx.reserve(len);

  for (size_t i = 0; i + 1 < len; i += 2)
  {
    const uint16_t tx_frame = static_cast<uint16_t>((tx[i] << 8) | tx[i + 1]);
    const uint16_t rx_frame = process(tx_frame);
    rx.push_back(static_cast<uint8_t>((rx_frame >> 8) & 0xFF));
    rx.push_back(static_cast<uint8_t>(rx_frame & 0xFF));
  }

  if (len % 2 != 0)
  {
    rx.push_back(0x00);
  }
}

void Device::reset()
{
  regs_.reset();
  pending_ = PendingResponse{0, 0};
  wdg_count_ = 0;
  logf(log_, LogLevel::INFO, TAG, "Initialized. Device ID=0x%02X", DEVICE_ID);
}

const char* register_name(uint8_t addr)
{
  switch (static_cast<Register>(addr & 0x0F))
  {
    case Register::CTRL1:
      return "CTRL1";
    case Register::CTRL2:
      return "CTRL2";
    case Register::CTRL3:
      return "CTRL3";
    case Register::CFG:
      return "CFG";
    case Register::DIAG:
      return "DIAG";
    case Register::WDG:
      return "WDG";
    case Register::ICR:
      return "ICR";
    case Register::HWCR:
      return "HWCR";
    case Register::DEVID:
      return "DEVID";
    default:
      return "UNMAPPED";
  }
}

}  // namespace hssim
