/**
 * @file hid_transport.cpp
 * @brief hidapi-backed Transport and device discovery
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mcp2221/hid_transport.hpp"

#include <hidapi.h>

#include <string>

#include "utf.hpp"

namespace mcp2221
{

namespace
{

/* Live HidTransport objects; hidapi is initialised for the first and shut
   down with the last. */
size_t hid_users = 0;

std::string narrow(const wchar_t* in)
{
  std::string out;
  if (in == nullptr)
  {
    return out;
  }

  // wchar_t is UTF-32 on POSIX and UTF-16 on Windows
  for (const wchar_t* p = in; *p != 0; ++p)
  {
    uint32_t cp = static_cast<uint32_t>(*p);
    if (sizeof(wchar_t) == 2 && cp >= 0xD800 && cp <= 0xDBFF && p[1] >= 0xDC00 && p[1] <= 0xDFFF)
    {
      cp = 0x10000 + ((cp - 0xD800) << 10) + (static_cast<uint32_t>(p[1]) - 0xDC00);
      ++p;
    }
    internal::append_utf8(out, cp);
  }
  return out;
}

}  // namespace

std::vector<DeviceInfo> find_devices(uint16_t vendor_id, uint16_t product_id)
{
  std::vector<DeviceInfo> result;

  hid_device_info* list = hid_enumerate(vendor_id, product_id);
  for (hid_device_info* cur = list; cur != nullptr; cur = cur->next)
  {
    DeviceInfo info;
    info.path = cur->path != nullptr ? cur->path : "";
    info.vendor_id = cur->vendor_id;
    info.product_id = cur->product_id;
    info.serial_number = narrow(cur->serial_number);
    info.manufacturer = narrow(cur->manufacturer_string);
    info.product = narrow(cur->product_string);
    info.interface_number = cur->interface_number;
    result.push_back(info);
  }
  hid_free_enumeration(list);

  return result;
}

HidTransport::HidTransport() : handle_(nullptr), initialized_(false)
{
  if (hid_users > 0 || hid_init() == 0)
  {
    ++hid_users;
    initialized_ = true;
  }
}

HidTransport::~HidTransport()
{
  close();

  if (initialized_ && --hid_users == 0)
  {
    hid_exit();
  }
}

ErrorCode HidTransport::open(const DeviceInfo& info)
{
  if (handle_ != nullptr)
  {
    return ErrorCode::ALREADY_OPEN;
  }

  if (!initialized_)
  {
    return ErrorCode::OPEN_FAILED;
  }

  handle_ = hid_open_path(info.path.c_str());
  if (handle_ == nullptr)
  {
    return ErrorCode::OPEN_FAILED;
  }

  // Reads block until a report arrives
  if (hid_set_nonblocking(handle_, 0) != 0)
  {
    close();
    return ErrorCode::OPEN_FAILED;
  }

  return ErrorCode::OK;
}

void HidTransport::close()
{
  if (handle_ != nullptr)
  {
    hid_close(handle_);
    handle_ = nullptr;
  }
}

bool HidTransport::is_open() const
{
  return handle_ != nullptr;
}

ErrorCode HidTransport::write(const uint8_t* data, size_t len)
{
  if (handle_ == nullptr)
  {
    return ErrorCode::NOT_CONNECTED;
  }

  if (len > FRAME_SIZE)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  // Report ID 0 is mandatory on Windows and must not be sent elsewhere
  uint8_t report[FRAME_SIZE + 1] = {0};
#ifdef _WIN32
  const size_t prefix = 1;
#else
  const size_t prefix = 0;
#endif
  for (size_t i = 0; i < len; ++i)
  {
    report[prefix + i] = data[i];
  }

  const int written = hid_write(handle_, report, prefix + len);
  if (written < 0)
  {
    return ErrorCode::IO_ERROR;
  }

  return ErrorCode::OK;
}

ErrorCode HidTransport::read(uint8_t* data, size_t len, size_t& received)
{
  received = 0;
  if (handle_ == nullptr)
  {
    return ErrorCode::NOT_CONNECTED;
  }

  const int count = hid_read(handle_, data, len);
  if (count < 0)
  {
    return ErrorCode::IO_ERROR;
  }

  received = static_cast<size_t>(count);
  return ErrorCode::OK;
}

}  // namespace mcp2221
