/**
 * @file session.hpp
 * @brief Per-connection message dispatcher
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "hssim/device.hpp"
#include "hssim/log.hpp"
#include "hssim/message.hpp"
#include "hssim/request.hpp"

namespace hssim
{

/**
 * @brief One client connection
 *
 * Holds the table of configured device handles and dispatches requests to
 * the simulated device. All handles share the same Device; there is no
 * per-handle register file.
 *
 * Example usage:
 * @code
 * Device device(make_stderr_logger());
 * Session session(device, make_stderr_logger());
 * Status end = session.serve(stream);  // until the peer closes
 * @endcode
 */
class Session
{
 public:
  /**
   * @brief Construct a session bound to a device
   *
   * @param device Simulated device, must outlive the session
   * @param log    Diagnostic sink (may be empty)
   */
  explicit Session(Device& device, LogFn log = LogFn());

  /**
   * @brief Handle one message
   *
   * @param msg Complete request message
   * @return Reply payload (possibly empty)
   */
  std::vector<uint8_t> handle(const Message& msg);

  /**
   * @brief Read, handle and answer messages until the stream ends
   *
   * @param stream Connected stream
   * @return END_OF_STREAM on a clean close, TRUNCATED or IO_ERROR otherwise
   */
  Status serve(Stream& stream);

  /**
   * @brief Look up a configured device handle
   *
   * @return Configuration, or nullptr if the handle is not initialized
   */
  const DeviceConfig* config(uint8_t device_id) const;

  /**
   * @brief Number of configured device handles
   */
  size_t device_count() const
  {
    return configs_.size();
  }

 private:
  std::vector<uint8_t> handle_init(uint8_t device_id, const InitRequest& req);
  std::vector<uint8_t> handle_deinit(uint8_t device_id);
  std::vector<uint8_t> handle_transfer(const TransferRequest& req);
  std::vector<uint8_t> handle_send(const SendRequest& req);
  std::vector<uint8_t> handle_receive(const ReceiveRequest& req);
  std::vector<uint8_t> handle_set_config(uint8_t device_id, const SetConfigRequest& req);
  std::vector<uint8_t> handle_get_status();
  std::vector<uint8_t> handle_unknown(const UnknownRequest& req);

  Device& device_;                             ///< Shared simulated device
  std::map<uint8_t, DeviceConfig> configs_;    ///< Configured handles
  LogFn log_;                                  ///< Diagnostic sink
};

}  // namespace hssim
