/**
 * @file status.cpp
 * @brief Status code text
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "hssim/protocol.hpp"

namespace hssim
{

const char* status_message(Status status)
{
  switch (status)
  {
#define ERR(name, val, msg) \
  case Status::name:        \
    return msg;
#include "hssim/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

}  // namespace hssim
