/**
 * @file registers.cpp
 * @brief SRAM/flash register image access implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "registers.hpp"

#include <algorithm>

#include "utf.hpp"

namespace mcp2221
{
namespace internal
{

namespace
{

/* SET_SRAM frame layout */
constexpr size_t SRAM_CHIP_SETTINGS_OFFSET = 2;
constexpr size_t SRAM_CHIP_SETTINGS_COUNT = 5;
constexpr size_t SRAM_ALTER_GP_OFFSET = 7;
constexpr size_t SRAM_GP_OFFSET = 8;

/* GP-Settings byte: [7:5] unused, [4] value, [3] direction, [2:0] function */
constexpr uint8_t GP_VALUE_SHIFT = 4;
constexpr uint8_t GP_DIRECTION_SHIFT = 3;
constexpr uint8_t GP_DIRECTION_INPUT = 0x08;
constexpr uint8_t GP_FUNCTION_GPIO = 0x00;
constexpr uint8_t GP_FUNCTION_ADC = 0x02;

/* GET_GPIO response: per pin n, value at 2 + 2n, direction at 3 + 2n */
constexpr size_t GPIO_STATE_OFFSET = 2;

constexpr uint8_t USB_STRING_DESCRIPTOR_TYPE = 0x03;
constexpr size_t USB_STRING_FULL_BLOCK = 60;

}  // namespace

ErrorCode check_bit_access(size_t byte, const std::vector<uint8_t>& bits)
{
  if (byte > MAX_REGISTER_BYTE)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  for (const uint8_t bit : bits)
  {
    if (bit > MAX_REGISTER_BIT)
    {
      return ErrorCode::INVALID_PARAMETER;
    }
  }

  return ErrorCode::OK;
}

ErrorCode read_bits(const std::vector<uint8_t>& image, size_t byte,
                    const std::vector<uint8_t>& bits, std::vector<bool>& out)
{
  const ErrorCode err = check_bit_access(byte, bits);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (byte >= image.size())
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  out.clear();
  for (const uint8_t bit : bits)
  {
    out.push_back(((image[byte] >> bit) & 0x01) != 0);
  }

  return ErrorCode::OK;
}

ErrorCode patch_bits(std::vector<uint8_t>& image, size_t byte, const std::vector<uint8_t>& bits,
                     const std::vector<bool>& values)
{
  const ErrorCode err = check_bit_access(byte, bits);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (bits.size() != values.size())
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  if (byte >= image.size())
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  for (size_t i = 0; i < bits.size(); ++i)
  {
    const uint8_t mask = static_cast<uint8_t>(1u << bits[i]);
    image[byte] = static_cast<uint8_t>(image[byte] & ~mask);
    if (values[i])
    {
      image[byte] = static_cast<uint8_t>(image[byte] | mask);
    }
  }

  return ErrorCode::OK;
}

uint8_t bits_to_value(const std::vector<bool>& bits)
{
  uint8_t value = 0;
  for (size_t i = 0; i < bits.size() && i < 8; ++i)
  {
    if (bits[i])
    {
      value = static_cast<uint8_t>(value | (1u << i));
    }
  }
  return value;
}

std::vector<bool> value_to_bits(uint8_t value, size_t width)
{
  std::vector<bool> bits;
  for (size_t i = 0; i < width && i < 8; ++i)
  {
    bits.push_back(((value >> i) & 0x01) != 0);
  }
  return bits;
}

ErrorCode extract_flash_block(const Frame& response, std::vector<uint8_t>& out)
{
  const size_t len = std::min<size_t>(response[2], FRAME_SIZE - BLOCK_DATA_OFFSET);
  out.assign(response.begin() + BLOCK_DATA_OFFSET, response.begin() + BLOCK_DATA_OFFSET + len);
  return ErrorCode::OK;
}

ErrorCode extract_sram_block(const Frame& response, SramSubcode code, std::vector<uint8_t>& out)
{
  size_t offset = BLOCK_DATA_OFFSET;
  size_t len = response[2];

  if (code == SramSubcode::GP_SETTINGS)
  {
    offset = BLOCK_DATA_OFFSET + response[2];
    len = response[3];
  }

  if (offset > FRAME_SIZE)
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  len = std::min(len, FRAME_SIZE - offset);
  out.assign(response.begin() + offset, response.begin() + offset + len);
  return ErrorCode::OK;
}

ErrorCode build_flash_write(FlashSubcode code, const std::vector<uint8_t>& image,
                            const std::string& password, Frame& out)
{
  const bool with_password = code == FlashSubcode::CHIP_SETTINGS;
  const size_t total = 2 + image.size() + (with_password ? password.size() : 0);
  if (total > FRAME_SIZE)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  out.fill(0);
  out[0] = static_cast<uint8_t>(Command::WRITE_FLASH);
  out[1] = static_cast<uint8_t>(code);
  std::copy(image.begin(), image.end(), out.begin() + 2);

  if (with_password)
  {
    std::copy(password.begin(), password.end(), out.begin() + 2 + image.size());
  }

  return ErrorCode::OK;
}

ErrorCode build_sram_write(const Frame& gpio_state, const std::vector<uint8_t>& sram_gp,
                           SramSubcode code, size_t byte, uint8_t value, Frame& out)
{
  const size_t limit =
      code == SramSubcode::CHIP_SETTINGS ? SRAM_CHIP_SETTINGS_COUNT : GPIO_PIN_COUNT;
  if (byte >= limit)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  if (sram_gp.size() < GPIO_PIN_COUNT)
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  out.fill(0);
  out[0] = static_cast<uint8_t>(Command::SET_SRAM);

  for (size_t n = 0; n < GPIO_PIN_COUNT; ++n)
  {
    const uint8_t pin_value = gpio_state[GPIO_STATE_OFFSET + 2 * n];
    const uint8_t pin_direction = gpio_state[GPIO_STATE_OFFSET + 2 * n + 1];

    if (pin_value <= 1)
    {
      out[SRAM_GP_OFFSET + n] =
          static_cast<uint8_t>((pin_value << GP_VALUE_SHIFT) + (pin_direction << GP_DIRECTION_SHIFT));
    }
    else
    {
      out[SRAM_GP_OFFSET + n] = sram_gp[n];
    }
  }

  if (code == SramSubcode::CHIP_SETTINGS)
  {
    out[SRAM_CHIP_SETTINGS_OFFSET + byte] = value;
  }
  else
  {
    out[SRAM_ALTER_GP_OFFSET] = SRAM_ENABLE_BIT;
    out[SRAM_GP_OFFSET + byte] = value;
  }

  return ErrorCode::OK;
}

ErrorCode build_gp_designation(const std::vector<uint8_t>& pins, Frame& out)
{
  if (pins.size() < GPIO_PIN_COUNT)
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  out.fill(0);
  out[0] = static_cast<uint8_t>(Command::SET_SRAM);
  out[SRAM_ALTER_GP_OFFSET] = SRAM_ENABLE_BIT;
  std::copy(pins.begin(), pins.begin() + GPIO_PIN_COUNT, out.begin() + SRAM_GP_OFFSET);
  return ErrorCode::OK;
}

std::vector<uint8_t> sanitized_pin_settings(const std::vector<uint8_t>& pins)
{
  std::vector<uint8_t> tmp(GPIO_PIN_COUNT, 0x00);
  if (pins.size() < GPIO_PIN_COUNT)
  {
    return pins;
  }

  // Pin 0 has no ADC function
  tmp[0] = pins[0];

  for (size_t n = 1; n < GPIO_PIN_COUNT; ++n)
  {
    const uint8_t function = pins[n] & 0x03;

    if (function == GP_FUNCTION_GPIO && (pins[n] & GP_DIRECTION_INPUT))
    {
      tmp[n] = GP_FUNCTION_ADC;
    }
    else if (function == GP_FUNCTION_ADC)
    {
      tmp[n] = GP_FUNCTION_GPIO | GP_DIRECTION_INPUT;
    }
    else
    {
      tmp[n] = pins[n];
    }
  }

  return tmp;
}

void build_gpio_set(size_t pin, bool alter_value, uint8_t value, bool alter_direction,
                    uint8_t direction, Frame& out)
{
  out.fill(0);
  out[0] = static_cast<uint8_t>(Command::SET_GPIO);

  const size_t base = 2 + 4 * pin;
  out[base + 0] = alter_value ? 0x01 : 0x00;
  out[base + 1] = alter_value ? value : 0x00;
  out[base + 2] = alter_direction ? 0x01 : 0x00;
  out[base + 3] = alter_direction ? direction : 0x00;
}

ErrorCode build_usb_string_write(FlashSubcode code, const std::string& value, Frame& out)
{
  if (code != FlashSubcode::USB_MANUFACTURER && code != FlashSubcode::USB_PRODUCT &&
      code != FlashSubcode::USB_SERIAL_NUMBER)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  std::u16string units;
  if (!utf8_to_utf16(value, units) || units.size() > MAX_USB_STRING_LENGTH)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  out.fill(0);
  out[0] = static_cast<uint8_t>(Command::WRITE_FLASH);
  out[1] = static_cast<uint8_t>(code);
  out[2] = static_cast<uint8_t>(2 * units.size() + 2);
  out[3] = USB_STRING_DESCRIPTOR_TYPE;

  size_t pos = 4;
  for (const char16_t unit : units)
  {
    out[pos++] = static_cast<uint8_t>(unit & 0xFF);
    out[pos++] = static_cast<uint8_t>((unit >> 8) & 0xFF);
  }

  return ErrorCode::OK;
}

std::string decode_usb_string(const std::vector<uint8_t>& block)
{
  size_t len = block.size();
  if (len < USB_STRING_FULL_BLOCK)
  {
    len = len >= 2 ? len - 2 : 0;
  }

  std::u16string units;
  for (size_t i = 0; i + 1 < len; i += 2)
  {
    units.push_back(static_cast<char16_t>(block[i] | (block[i + 1] << 8)));
  }

  return utf16_to_utf8(units);
}

}  // namespace internal
}  // namespace mcp2221
