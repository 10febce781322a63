/**
 * @file mcp2221_c_api.cpp
 * @brief MCP2221 C API implementation
 *
 * C wrapper for the C++ Device class.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <new>
#include <string>
#include <vector>

#include "mcp2221/device.hpp"
#include "mcp2221/mcp2221.h"

using namespace mcp2221;

namespace
{

/**
 * @brief Transport forwarding to the caller's C callbacks
 */
class CallbackTransport : public Transport
{
 public:
  CallbackTransport(mcp2221_write_fn write_fn, mcp2221_read_fn read_fn, void* user)
      : write_fn_(write_fn), read_fn_(read_fn), user_(user), open_(false)
  {
  }

  ErrorCode open(const DeviceInfo&) override
  {
    open_ = true;
    return ErrorCode::OK;
  }

  void close() override
  {
    open_ = false;
  }

  bool is_open() const override
  {
    return open_;
  }

  ErrorCode write(const uint8_t* data, size_t len) override
  {
    return write_fn_(user_, data, len) == 0 ? ErrorCode::OK : ErrorCode::IO_ERROR;
  }

  ErrorCode read(uint8_t* data, size_t len, size_t& received) override
  {
    received = 0;
    return read_fn_(user_, data, len, &received) == 0 ? ErrorCode::OK : ErrorCode::IO_ERROR;
  }

 private:
  mcp2221_write_fn write_fn_;
  mcp2221_read_fn read_fn_;
  void* user_;
  bool open_;
};

mcp2221_error_t to_c(ErrorCode err)
{
  return static_cast<mcp2221_error_t>(err);
}

}  // namespace

/* ========================================================================= */
/* Internal wrapper structure                                                */
/* ========================================================================= */

struct MCP2221
{
  CallbackTransport transport;
  Device device;
  mcp2221_warning_fn warning_fn;
  void* warning_user;

  MCP2221(mcp2221_write_fn write_fn, mcp2221_read_fn read_fn, void* user,
          const std::string& password)
      : transport(write_fn, read_fn, user),
        device(transport, password),
        warning_fn(nullptr),
        warning_user(nullptr)
  {
  }

  /** @brief Forward a Device warning to the C handler */
  static void forward_warning(void* user, ErrorCode code, const char* message)
  {
    MCP2221* dev = static_cast<MCP2221*>(user);
    dev->warning_fn(dev->warning_user, to_c(code), message);
  }
};

/* ========================================================================= */
/* Error message strings                                                     */
/* ========================================================================= */

const char* mcp2221_strerror(mcp2221_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case MCP2221_ERR_##name:  \
    return msg;
#include "mcp2221/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

/* ========================================================================= */
/* Lifecycle functions                                                       */
/* ========================================================================= */

MCP2221* mcp2221_create(mcp2221_write_fn write_fn, mcp2221_read_fn read_fn, void* user,
                        const char* password)
{
  if (write_fn == nullptr || read_fn == nullptr)
  {
    return nullptr;
  }

  const std::string pw = password != nullptr ? password : "";
  if (pw.size() > MAX_PASSWORD_LENGTH)
  {
    return nullptr;
  }

  return new (std::nothrow) MCP2221(write_fn, read_fn, user, pw);
}

void mcp2221_destroy(MCP2221* dev)
{
  delete dev;
}

mcp2221_error_t mcp2221_open(MCP2221* dev)
{
  if (dev == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }
  return to_c(dev->device.open(DeviceInfo()));
}

void mcp2221_close(MCP2221* dev)
{
  if (dev)
  {
    dev->device.close();
  }
}

int mcp2221_is_open(const MCP2221* dev)
{
  return dev != nullptr && dev->device.is_open() ? 1 : 0;
}

mcp2221_error_t mcp2221_set_memory_target(MCP2221* dev, mcp2221_memory_t mem)
{
  if (dev == nullptr || (mem != MCP2221_MEM_SRAM && mem != MCP2221_MEM_FLASH))
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }

  dev->device.set_default_memory_target(static_cast<MemoryType>(mem));
  return MCP2221_ERR_OK;
}

mcp2221_error_t mcp2221_set_warning_handler(MCP2221* dev, mcp2221_warning_fn fn, void* user)
{
  if (dev == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }

  dev->warning_fn = fn;
  dev->warning_user = user;
  if (fn == nullptr)
  {
    dev->device.set_warning_handler(&Device::log_warning);
  }
  else
  {
    dev->device.set_warning_handler(&MCP2221::forward_warning, dev);
  }
  return MCP2221_ERR_OK;
}

/* ========================================================================= */
/* Operation functions                                                       */
/* ========================================================================= */

mcp2221_error_t mcp2221_gpio_read_direction(MCP2221* dev, size_t pin,
                                            mcp2221_gpio_direction_t* value)
{
  if (dev == nullptr || value == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }

  GpioDirection dir = GpioDirection::NOT_SET;
  const ErrorCode err = dev->device.gpio_read_direction(pin, dir);
  if (err == ErrorCode::OK)
  {
    *value = static_cast<mcp2221_gpio_direction_t>(dir);
  }
  return to_c(err);
}

mcp2221_error_t mcp2221_gpio_write_direction(MCP2221* dev, size_t pin,
                                             mcp2221_gpio_direction_t value)
{
  if (dev == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }
  return to_c(dev->device.gpio_write_direction(pin, static_cast<GpioDirection>(value)));
}

mcp2221_error_t mcp2221_gpio_read_value(MCP2221* dev, size_t pin, int* value)
{
  if (dev == nullptr || value == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }

  bool v = false;
  const ErrorCode err = dev->device.gpio_read_value(pin, v);
  if (err == ErrorCode::OK)
  {
    *value = v ? 1 : 0;
  }
  return to_c(err);
}

mcp2221_error_t mcp2221_gpio_write_value(MCP2221* dev, size_t pin, int value)
{
  if (dev == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }
  return to_c(dev->device.gpio_write_value(pin, value != 0));
}

mcp2221_error_t mcp2221_read_adc(MCP2221* dev, size_t channel, uint16_t* value)
{
  if (dev == nullptr || value == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }
  return to_c(dev->device.read_adc(channel, *value));
}

mcp2221_error_t mcp2221_write_dac(MCP2221* dev, uint8_t value)
{
  if (dev == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }
  return to_c(dev->device.write_dac(value));
}

mcp2221_error_t mcp2221_i2c_read_speed(MCP2221* dev, uint32_t* speed)
{
  if (dev == nullptr || speed == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }
  return to_c(dev->device.i2c_read_speed(*speed));
}

mcp2221_error_t mcp2221_i2c_write_speed(MCP2221* dev, uint32_t speed)
{
  if (dev == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }

  I2cSpeedResponse response = I2cSpeedResponse::NO_OP;
  return to_c(dev->device.i2c_write_speed(speed, response));
}

mcp2221_error_t mcp2221_i2c_write(MCP2221* dev, uint8_t address, const uint8_t* data,
                                  size_t len, mcp2221_i2c_mode_t mode)
{
  if (dev == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }
  return to_c(dev->device.i2c_write_data(address, data, len, static_cast<I2cMode>(mode)));
}

mcp2221_error_t mcp2221_i2c_read(MCP2221* dev, uint8_t address, uint8_t* out, size_t len,
                                 mcp2221_i2c_mode_t mode)
{
  if (dev == nullptr || (out == nullptr && len > 0))
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }

  std::vector<uint8_t> data;
  const ErrorCode err = dev->device.i2c_read_data(address, len, data, static_cast<I2cMode>(mode));
  if (err == ErrorCode::OK)
  {
    for (size_t i = 0; i < data.size() && i < len; ++i)
    {
      out[i] = data[i];
    }
  }
  return to_c(err);
}

mcp2221_error_t mcp2221_read_firmware_version(MCP2221* dev, char* out, size_t size)
{
  if (dev == nullptr || out == nullptr || size == 0)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }

  std::string version;
  const ErrorCode err = dev->device.read_firmware_version(version);
  if (err != ErrorCode::OK)
  {
    return to_c(err);
  }

  if (version.size() >= size)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }

  version.copy(out, version.size());
  out[version.size()] = '\0';
  return MCP2221_ERR_OK;
}

mcp2221_error_t mcp2221_reset(MCP2221* dev)
{
  if (dev == nullptr)
  {
    return MCP2221_ERR_INVALID_PARAMETER;
  }
  return to_c(dev->device.reset_chip());
}
