/**
 * @file hid_transport.hpp
 * @brief hidapi-backed Transport and device discovery
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "mcp2221/transport.hpp"

struct hid_device_;

namespace mcp2221
{

/**
 * @brief List the HID devices matching a vendor/product ID pair
 *
 * Every interface of a matching device is reported separately.
 */
std::vector<DeviceInfo> find_devices(uint16_t vendor_id = DEFAULT_VENDOR_ID,
                                     uint16_t product_id = DEFAULT_PRODUCT_ID);

/**
 * @brief Transport over the system HID stack (hidapi)
 *
 * On Windows every report is prefixed with report ID 0 on write. hidapi is
 * initialised by the first instance and released (hid_exit()) when the last
 * one is destroyed. Not thread-safe.
 */
class HidTransport : public Transport
{
 public:
  HidTransport();
  ~HidTransport() override;

  HidTransport(const HidTransport&) = delete;
  HidTransport& operator=(const HidTransport&) = delete;

  ErrorCode open(const DeviceInfo& info) override;
  void close() override;
  bool is_open() const override;
  ErrorCode write(const uint8_t* data, size_t len) override;
  ErrorCode read(uint8_t* data, size_t len, size_t& received) override;

 private:
  hid_device_* handle_;
  bool initialized_;
};

}  // namespace mcp2221
