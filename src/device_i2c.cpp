/**
 * @file device_i2c.cpp
 * @brief I2C engine configuration, status and data transfer
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <algorithm>

#include "decode.hpp"
#include "frame.hpp"
#include "mcp2221/device.hpp"

namespace mcp2221
{

namespace
{

/* STATUS sub-commands */
constexpr uint8_t STATUS_CANCEL_TRANSFER = 0x10;
constexpr uint8_t STATUS_SET_SPEED = 0x20;

/* STATUS response fields */
constexpr size_t STATUS_CANCEL_RESPONSE = 2;
constexpr size_t STATUS_SPEED_RESPONSE = 3;
constexpr size_t STATUS_REQUESTED_LENGTH = 9;
constexpr size_t STATUS_TRANSFERRED_LENGTH = 11;
constexpr size_t STATUS_BUFFER_COUNTER = 13;
constexpr size_t STATUS_SPEED_DIVISOR = 14;
constexpr size_t STATUS_SLAVE_ADDRESS = 16;
constexpr size_t STATUS_SCL = 22;
constexpr size_t STATUS_SDA = 23;
constexpr size_t STATUS_PENDING_VALUE = 25;

constexpr uint8_t I2C_SPEED_DIVISOR_OFFSET = 3;

/* I2C_GET_DATA response: [40][STATUS][xx][LEN][DATA...] */
constexpr size_t GET_DATA_LENGTH = 3;
constexpr size_t GET_DATA_OFFSET = 4;

ErrorCode check_transfer(uint8_t address, size_t length)
{
  if (address > I2C_MAX_ADDRESS || length > I2C_MAX_TRANSFER_LENGTH)
  {
    return ErrorCode::INVALID_PARAMETER;
  }
  return ErrorCode::OK;
}

bool is_mode(I2cMode mode)
{
  return mode == I2cMode::START || mode == I2cMode::REPEATED_START || mode == I2cMode::NO_STOP;
}

}  // namespace

/* ========================================================================= */
/* Engine configuration                                                      */
/* ========================================================================= */

ErrorCode Device::i2c_cancel_transfer(I2cCancelResponse& response)
{
  Frame frame;
  const ErrorCode err = command(Command::STATUS, {0x00, STATUS_CANCEL_TRANSFER}, frame);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return internal::decode(frame[STATUS_CANCEL_RESPONSE], response) ? ErrorCode::OK
                                                                    : ErrorCode::INVALID_RESPONSE;
}

ErrorCode Device::i2c_read_speed(uint32_t& speed)
{
  Frame frame;
  const ErrorCode err = read_status(frame);
  if (err == ErrorCode::OK)
  {
    speed = I2C_CLOCK_HZ / (frame[STATUS_SPEED_DIVISOR] + I2C_SPEED_DIVISOR_OFFSET);
  }
  return err;
}

ErrorCode Device::i2c_write_speed(uint32_t speed, I2cSpeedResponse& response)
{
  if (speed < I2C_MIN_SPEED_HZ || speed > I2C_MAX_SPEED_HZ)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  const uint8_t divisor = static_cast<uint8_t>(I2C_CLOCK_HZ / speed - I2C_SPEED_DIVISOR_OFFSET);

  Frame frame;
  const ErrorCode err = command(Command::STATUS, {0x00, 0x00, STATUS_SET_SPEED, divisor}, frame);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return internal::decode(frame[STATUS_SPEED_RESPONSE], response) ? ErrorCode::OK
                                                                   : ErrorCode::INVALID_RESPONSE;
}

/* ========================================================================= */
/* Engine status                                                             */
/* ========================================================================= */

ErrorCode Device::i2c_requested_transfer_length(uint16_t& value)
{
  Frame frame;
  const ErrorCode err = read_status(frame);
  if (err == ErrorCode::OK)
  {
    value = internal::read_le16(&frame[STATUS_REQUESTED_LENGTH]);
  }
  return err;
}

ErrorCode Device::i2c_already_transferred_length(uint16_t& value)
{
  Frame frame;
  const ErrorCode err = read_status(frame);
  if (err == ErrorCode::OK)
  {
    value = internal::read_le16(&frame[STATUS_TRANSFERRED_LENGTH]);
  }
  return err;
}

ErrorCode Device::i2c_internal_buffer_counter(uint8_t& value)
{
  Frame frame;
  const ErrorCode err = read_status(frame);
  if (err == ErrorCode::OK)
  {
    value = frame[STATUS_BUFFER_COUNTER];
  }
  return err;
}

ErrorCode Device::i2c_slave_address(uint16_t& value)
{
  Frame frame;
  const ErrorCode err = read_status(frame);
  if (err == ErrorCode::OK)
  {
    value = internal::read_le16(&frame[STATUS_SLAVE_ADDRESS]);
  }
  return err;
}

ErrorCode Device::i2c_scl_state(bool& value)
{
  Frame frame;
  const ErrorCode err = read_status(frame);
  if (err == ErrorCode::OK)
  {
    value = frame[STATUS_SCL] != 0;
  }
  return err;
}

ErrorCode Device::i2c_sda_state(bool& value)
{
  Frame frame;
  const ErrorCode err = read_status(frame);
  if (err == ErrorCode::OK)
  {
    value = frame[STATUS_SDA] != 0;
  }
  return err;
}

ErrorCode Device::i2c_has_pending_value(uint8_t& value)
{
  Frame frame;
  const ErrorCode err = read_status(frame);
  if (err == ErrorCode::OK)
  {
    value = frame[STATUS_PENDING_VALUE];
  }
  return err;
}

/* ========================================================================= */
/* Data transfer                                                             */
/* ========================================================================= */

ErrorCode Device::i2c_request(const Frame& cmd)
{
  // The engine answers BUSY until it can take the request
  for (;;)
  {
    Frame response;
    const ErrorCode err = exchange(cmd, response);
    if (err != ErrorCode::OK)
    {
      return err;
    }

    if (response[1] == 0x00)
    {
      return ErrorCode::OK;
    }

    if (response[1] != I2C_STATUS_BUSY)
    {
      last_status_ = response[1];
      return ErrorCode::COMMAND_FAILED;
    }
  }
}

ErrorCode Device::i2c_write_data(uint8_t address, const uint8_t* data, size_t len, I2cMode mode)
{
  ErrorCode err = check_transfer(address, len);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (!is_mode(mode) || (data == nullptr && len > 0))
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  // Frame: [MODE][LEN_L][LEN_H][ADDR << 1][DATA...]; every chunk carries the
  // total transfer length
  size_t offset = 0;
  while (offset < len)
  {
    const size_t chunk = std::min(len - offset, I2C_CHUNK_SIZE);

    std::vector<uint8_t> payload = {static_cast<uint8_t>(len & 0xFF),
                                    static_cast<uint8_t>((len >> 8) & 0xFF),
                                    static_cast<uint8_t>(address << 1)};
    payload.insert(payload.end(), data + offset, data + offset + chunk);

    Frame cmd;
    err = internal::build_command(static_cast<uint8_t>(mode), payload.data(), payload.size(), cmd);
    if (err != ErrorCode::OK)
    {
      return err;
    }

    err = i2c_request(cmd);
    if (err != ErrorCode::OK)
    {
      return err;
    }

    offset += chunk;
  }

  return ErrorCode::OK;
}

ErrorCode Device::i2c_read_data(uint8_t address, size_t length, std::vector<uint8_t>& out,
                                I2cMode mode)
{
  ErrorCode err = check_transfer(address, length);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (mode != I2cMode::START && mode != I2cMode::REPEATED_START)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  out.clear();
  if (length == 0)
  {
    return ErrorCode::OK;
  }

  // Read opcodes follow their write counterparts
  const uint8_t request[] = {static_cast<uint8_t>(length & 0xFF),
                             static_cast<uint8_t>((length >> 8) & 0xFF),
                             static_cast<uint8_t>((address << 1) | 0x01)};

  Frame cmd;
  err = internal::build_command(static_cast<uint8_t>(static_cast<uint8_t>(mode) + 1), request,
                                sizeof(request), cmd);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  err = i2c_request(cmd);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  Frame fetch;
  err = internal::build_command(Command::I2C_GET_DATA, nullptr, 0, fetch);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  while (out.size() < length)
  {
    Frame response;
    err = exchange(fetch, response);
    if (err != ErrorCode::OK)
    {
      return err;
    }

    if (response[1] == I2C_STATUS_READ_ERROR)
    {
      return ErrorCode::I2C_SLAVE_NO_RESPONSE;
    }

    if (response[GET_DATA_LENGTH] == I2C_DATA_LENGTH_ERROR)
    {
      return ErrorCode::I2C_SLAVE_ERROR;
    }

    if (response[1] != 0x00)
    {
      last_status_ = response[1];
      return ErrorCode::COMMAND_FAILED;
    }

    const size_t count = std::min<size_t>({response[GET_DATA_LENGTH], FRAME_SIZE - GET_DATA_OFFSET,
                                           length - out.size()});
    out.insert(out.end(), response.begin() + GET_DATA_OFFSET,
               response.begin() + GET_DATA_OFFSET + count);
  }

  return ErrorCode::OK;
}

}  // namespace mcp2221
