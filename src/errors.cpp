/**
 * @file errors.cpp
 * @brief Error message strings
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mcp2221/protocol.hpp"

namespace mcp2221
{

const char* error_message(ErrorCode err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case ErrorCode::name:     \
    return msg;
#include "mcp2221/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

}  // namespace mcp2221
