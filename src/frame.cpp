/**
 * @file frame.cpp
 * @brief Frame encoding/validation implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "frame.hpp"

#include <algorithm>

namespace mcp2221
{
namespace internal
{

ErrorCode build_command(uint8_t opcode, const uint8_t* payload, size_t len, Frame& out)
{
  if (len > MAX_PAYLOAD_SIZE)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  out.fill(0);
  out[0] = opcode;

  if (len > 0 && payload != nullptr)
  {
    std::copy(payload, payload + len, out.begin() + 1);
  }

  return ErrorCode::OK;
}

ErrorCode verify_opcode(const uint8_t* data, size_t received, uint8_t expected_opcode)
{
  if (received == 0 || data == nullptr)
  {
    return ErrorCode::EMPTY_RESPONSE;
  }

  if (data[0] != expected_opcode)
  {
    return ErrorCode::OPCODE_MISMATCH;
  }

  return ErrorCode::OK;
}

ErrorCode parse_response(const uint8_t* data, size_t received, uint8_t expected_opcode)
{
  const ErrorCode err = verify_opcode(data, received, expected_opcode);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  // A one-byte report carries no status; treat it as malformed
  if (received < 2)
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  if (data[1] != 0x00)
  {
    return ErrorCode::COMMAND_FAILED;
  }

  return ErrorCode::OK;
}

}  // namespace internal
}  // namespace mcp2221
