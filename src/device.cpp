/**
 * @file device.cpp
 * @brief Device session lifecycle and protocol exchange
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mcp2221/device.hpp"

#include <cstdio>

#include "frame.hpp"
#include "registers.hpp"

namespace mcp2221
{

Device::Device(Transport& transport, const std::string& password)
    : transport_(transport),
      state_(State::CLOSED),
      open_result_(ErrorCode::NOT_CONNECTED),
      password_(password),
      mem_target_(MemoryType::SRAM),
      last_status_(0),
      warning_fn_(&Device::log_warning),
      warning_user_(nullptr)
{
}

Device::Device(Transport& transport, const DeviceInfo& info, const std::string& password)
    : Device(transport, password)
{
  open_result_ = open(info);
}

Device::~Device()
{
  close();
}

ErrorCode Device::open(const DeviceInfo& info)
{
  if (state_ != State::CLOSED)
  {
    return ErrorCode::ALREADY_OPEN;
  }

  // Flash writes would otherwise fail only after their read-back went out
  if (password_.size() > MAX_PASSWORD_LENGTH)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  if (transport_.open(info) != ErrorCode::OK)
  {
    return ErrorCode::OPEN_FAILED;
  }

  state_ = State::SANITIZING_PINS;

  if (sanitize_pins() != ErrorCode::OK)
  {
    transport_.close();
    state_ = State::CLOSED;
    return ErrorCode::OPEN_FAILED;
  }

  state_ = State::OPEN;
  return ErrorCode::OK;
}

void Device::close()
{
  if (state_ != State::CLOSED)
  {
    transport_.close();
    state_ = State::CLOSED;
  }
}

void Device::log_warning(void*, ErrorCode code, const char* message)
{
  std::fprintf(stderr, "mcp2221: warning 0x%02X: %s\n", static_cast<unsigned>(code), message);
}

void Device::set_warning_handler(WarningFn fn, void* user)
{
  warning_fn_ = fn;
  warning_user_ = user;
}

ErrorCode Device::sanitize_pins()
{
  // Some pin function combinations leave the ADC returning undefined values.
  // Toggling GPIO inputs and ADC inputs once and restoring them clears it.
  std::vector<uint8_t> pins;
  ErrorCode err = read_sram(SramSubcode::GP_SETTINGS, pins);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  Frame cmd;
  Frame response;

  err = internal::build_gp_designation(internal::sanitized_pin_settings(pins), cmd);
  if (err == ErrorCode::OK)
  {
    err = transact(cmd, response);
  }
  if (err != ErrorCode::OK)
  {
    return err;
  }

  err = internal::build_gp_designation(pins, cmd);
  if (err == ErrorCode::OK)
  {
    err = transact(cmd, response);
  }
  return err;
}

ErrorCode Device::exchange(const Frame& cmd, Frame& response)
{
  if (state_ == State::CLOSED || !transport_.is_open())
  {
    return ErrorCode::NOT_CONNECTED;
  }

  if (transport_.write(cmd.data(), cmd.size()) != ErrorCode::OK)
  {
    return ErrorCode::IO_ERROR;
  }

  response.fill(0);
  size_t received = 0;
  if (transport_.read(response.data(), response.size(), received) != ErrorCode::OK)
  {
    return ErrorCode::IO_ERROR;
  }

  return internal::verify_opcode(response.data(), received, cmd[0]);
}

ErrorCode Device::transact(const Frame& cmd, Frame& response)
{
  const ErrorCode err = exchange(cmd, response);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (internal::parse_response(response.data(), response.size(), cmd[0]) ==
      ErrorCode::COMMAND_FAILED)
  {
    last_status_ = response[1];
    return ErrorCode::COMMAND_FAILED;
  }

  return ErrorCode::OK;
}

ErrorCode Device::command(Command cmd, const std::vector<uint8_t>& payload, Frame& response)
{
  Frame frame;
  const ErrorCode err = internal::build_command(cmd, payload.data(), payload.size(), frame);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return transact(frame, response);
}

ErrorCode Device::read_status(Frame& response)
{
  return command(Command::STATUS, {}, response);
}

void Device::warn(ErrorCode code)
{
  if (warning_fn_ != nullptr)
  {
    warning_fn_(warning_user_, code, error_message(code));
  }
}

ErrorCode Device::read_firmware_version(std::string& value)
{
  Frame response;
  const ErrorCode err = read_status(response);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  value.assign(response.begin() + 46, response.begin() + 50);
  return ErrorCode::OK;
}

ErrorCode Device::reset_chip()
{
  if (state_ != State::OPEN)
  {
    return ErrorCode::NOT_CONNECTED;
  }

  static const std::vector<uint8_t> RESET_KEY = {0xAB, 0xCD, 0xEF};

  Frame response;
  ErrorCode err = command(Command::RESET, RESET_KEY, response);

  // The chip disconnects as it resets; a failing transport is the expected
  // outcome, and the session cannot be used either way.
  if (err == ErrorCode::IO_ERROR || err == ErrorCode::EMPTY_RESPONSE)
  {
    err = ErrorCode::OK;
  }

  close();
  return err;
}

}  // namespace mcp2221
