/**
 * @file frame.hpp
 * @brief Command/response frame encoding and validation (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "mcp2221/protocol.hpp"

namespace mcp2221
{
namespace internal
{

/**
 * @brief Build a command frame
 *
 * Generates a zero-padded 64-byte frame: [OPCODE][PAYLOAD...][0x00...]
 *
 * @param opcode  Command opcode
 * @param payload Payload bytes (can be nullptr if len == 0)
 * @param len     Payload length in bytes
 * @param out     Output frame
 * @return ErrorCode::OK, or INVALID_PARAMETER if len exceeds MAX_PAYLOAD_SIZE
 */
ErrorCode build_command(uint8_t opcode, const uint8_t* payload, size_t len, Frame& out);

inline ErrorCode build_command(Command cmd, const uint8_t* payload, size_t len, Frame& out)
{
  return build_command(static_cast<uint8_t>(cmd), payload, len, out);
}

/**
 * @brief Check that a response answers the expected command
 *
 * @param data            Response bytes
 * @param received        Number of bytes received
 * @param expected_opcode Opcode of the request
 * @return EMPTY_RESPONSE, OPCODE_MISMATCH or OK
 */
ErrorCode verify_opcode(const uint8_t* data, size_t received, uint8_t expected_opcode);

/**
 * @brief Validate a response frame
 *
 * Same checks as verify_opcode(), plus STATUS (byte 1) must be zero.
 *
 * @return EMPTY_RESPONSE, OPCODE_MISMATCH, COMMAND_FAILED or OK
 */
ErrorCode parse_response(const uint8_t* data, size_t received, uint8_t expected_opcode);

/** @brief Read a little-endian 16-bit field */
inline uint16_t read_le16(const uint8_t* p)
{
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

}  // namespace internal
}  // namespace mcp2221
