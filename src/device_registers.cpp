/**
 * @file device_registers.cpp
 * @brief SRAM and flash register access
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "mcp2221/device.hpp"
#include "frame.hpp"
#include "registers.hpp"

namespace mcp2221
{

ErrorCode Device::read_flash(FlashSubcode code, std::vector<uint8_t>& out)
{
  Frame response;
  const ErrorCode err = command(Command::READ_FLASH, {static_cast<uint8_t>(code)}, response);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return internal::extract_flash_block(response, out);
}

ErrorCode Device::read_sram(SramSubcode code, std::vector<uint8_t>& out)
{
  // GET_SRAM always returns both blocks
  Frame response;
  const ErrorCode err = command(Command::GET_SRAM, {}, response);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return internal::extract_sram_block(response, code, out);
}

ErrorCode Device::read_flash_bits(FlashSubcode code, size_t byte,
                                  const std::vector<uint8_t>& bits, std::vector<bool>& out)
{
  ErrorCode err = internal::check_bit_access(byte, bits);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  std::vector<uint8_t> image;
  err = read_flash(code, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return internal::read_bits(image, byte, bits, out);
}

ErrorCode Device::read_sram_bits(SramSubcode code, size_t byte, const std::vector<uint8_t>& bits,
                                 std::vector<bool>& out)
{
  ErrorCode err = internal::check_bit_access(byte, bits);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  std::vector<uint8_t> image;
  err = read_sram(code, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return internal::read_bits(image, byte, bits, out);
}

ErrorCode Device::write_flash_bits(FlashSubcode code, size_t byte,
                                   const std::vector<uint8_t>& bits,
                                   const std::vector<bool>& values)
{
  ErrorCode err = internal::check_bit_access(byte, bits);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (bits.size() != values.size())
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  // Read-modify-write: bits outside the request keep their flash value
  std::vector<uint8_t> image;
  err = read_flash(code, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  err = internal::patch_bits(image, byte, bits, values);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return write_flash_block(code, image);
}

ErrorCode Device::write_flash_block(FlashSubcode code, const std::vector<uint8_t>& image)
{
  if (password_.size() > MAX_PASSWORD_LENGTH)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  Frame cmd;
  ErrorCode err = internal::build_flash_write(code, image, password_, cmd);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  Frame response;
  return transact(cmd, response);
}

ErrorCode Device::write_sram(SramSubcode code, size_t byte, uint8_t value)
{
  if (state_ != State::OPEN)
  {
    return ErrorCode::NOT_CONNECTED;
  }

  // SET_SRAM also assigns the GP pins: rebuild their current state first so
  // that the write leaves them as they are.
  Frame gpio_state;
  ErrorCode err = command(Command::GET_GPIO, {}, gpio_state);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  std::vector<uint8_t> sram_gp;
  err = read_sram(SramSubcode::GP_SETTINGS, sram_gp);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  Frame cmd;
  err = internal::build_sram_write(gpio_state, sram_gp, code, byte, value, cmd);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  Frame response;
  return transact(cmd, response);
}

ErrorCode Device::read_sram_byte(SramSubcode code, size_t byte, uint8_t& value)
{
  std::vector<uint8_t> image;
  const ErrorCode err = read_sram(code, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (byte >= image.size())
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  value = image[byte];
  return ErrorCode::OK;
}

ErrorCode Device::read_chip_field(std::optional<MemoryType> mem, size_t byte,
                                  const std::vector<uint8_t>& bits, uint8_t& value)
{
  // Chip-Settings bit positions are the same in both images
  std::vector<bool> result;
  const ErrorCode err = resolve_target(mem) == MemoryType::SRAM
                            ? read_sram_bits(SramSubcode::CHIP_SETTINGS, byte, bits, result)
                            : read_flash_bits(FlashSubcode::CHIP_SETTINGS, byte, bits, result);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  value = internal::bits_to_value(result);
  return ErrorCode::OK;
}

ErrorCode Device::read_flash_flag(size_t byte, uint8_t bit, bool& value)
{
  std::vector<bool> result;
  const ErrorCode err = read_flash_bits(FlashSubcode::CHIP_SETTINGS, byte, {bit}, result);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  value = result[0];
  return ErrorCode::OK;
}

ErrorCode Device::write_flash_flag(size_t byte, uint8_t bit, bool value)
{
  return write_flash_bits(FlashSubcode::CHIP_SETTINGS, byte, {bit}, {value});
}

ErrorCode Device::write_chip_settings_word(size_t byte, uint16_t value)
{
  std::vector<uint8_t> image;
  ErrorCode err = read_flash(FlashSubcode::CHIP_SETTINGS, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (byte + 1 >= image.size())
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  image[byte] = static_cast<uint8_t>(value & 0xFF);
  image[byte + 1] = static_cast<uint8_t>(value >> 8);
  return write_flash_block(FlashSubcode::CHIP_SETTINGS, image);
}

}  // namespace mcp2221
