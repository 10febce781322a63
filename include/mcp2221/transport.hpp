/**
 * @file transport.hpp
 * @brief HID transport interface consumed by the driver
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "mcp2221/protocol.hpp"

namespace mcp2221
{

/**
 * @brief Description of one enumerated HID device
 *
 * Only @c path is needed to open a device; the other fields are informative.
 */
struct DeviceInfo
{
  std::string path;
  uint16_t vendor_id = 0;
  uint16_t product_id = 0;
  std::string serial_number;
  std::string manufacturer;
  std::string product;
  int interface_number = -1;
};

/**
 * @brief Blocking HID report transport
 *
 * Contract: write() sends one 64-byte report, read() blocks until one report
 * arrives. Report-ID prefixing required by some hosts is the implementation's
 * business. Failures are reported as ErrorCode::IO_ERROR (or OPEN_FAILED for
 * open()).
 */
class Transport
{
 public:
  virtual ~Transport() = default;

  /**
   * @brief Open the device at @p info.path
   * @return ErrorCode::OK or ErrorCode::OPEN_FAILED
   */
  virtual ErrorCode open(const DeviceInfo& info) = 0;

  /** @brief Close the device (no-op when closed) */
  virtual void close() = 0;

  virtual bool is_open() const = 0;

  /**
   * @brief Send one report
   *
   * @param data Report bytes (FRAME_SIZE, without report ID)
   * @param len  Number of bytes
   */
  virtual ErrorCode write(const uint8_t* data, size_t len) = 0;

  /**
   * @brief Receive one report, blocking
   *
   * @param data     Destination buffer
   * @param len      Buffer size
   * @param received Number of bytes stored (0 for an empty report)
   */
  virtual ErrorCode read(uint8_t* data, size_t len, size_t& received) = 0;
};

}  // namespace mcp2221
