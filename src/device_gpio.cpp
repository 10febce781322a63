/**
 * @file device_gpio.cpp
 * @brief GPIO pin functions, runtime direction/value and power-up state
 *
 * GP-Settings byte (flash and SRAM, one per pin):
 *
 * - [4]   value (power-up value in flash)
 * - [3]   direction (1 = input)
 * - [2:0] pin function
 *
 * Runtime direction and value go through SET_GPIO/GET_GPIO instead, which do
 * not touch the SRAM image.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "decode.hpp"
#include "mcp2221/device.hpp"
#include "registers.hpp"

namespace mcp2221
{

namespace
{

constexpr uint8_t GP_BIT_VALUE = 4;
constexpr uint8_t GP_BIT_DIRECTION = 3;

/* GET_GPIO response: per pin n, value at 2 + 2n, direction at 3 + 2n */
constexpr size_t GPIO_VALUE_OFFSET = 2;
constexpr size_t GPIO_DIRECTION_OFFSET = 3;

/* GET_SRAM response offsets of the DAC and ADC reference bytes */
constexpr size_t SRAM_DAC_VREF_OFFSET = 6;
constexpr size_t SRAM_ADC_VREF_OFFSET = 7;

ErrorCode check_pin(size_t pin)
{
  return pin < GPIO_PIN_COUNT ? ErrorCode::OK : ErrorCode::INVALID_PARAMETER;
}

bool is_direction(GpioDirection value)
{
  return value == GpioDirection::OUTPUT || value == GpioDirection::INPUT;
}

template <typename T>
ErrorCode read_pin_function(ErrorCode err, uint8_t raw, T& out)
{
  if (err != ErrorCode::OK)
  {
    return err;
  }
  return internal::decode(raw, out) ? ErrorCode::OK : ErrorCode::INVALID_RESPONSE;
}

template <typename T>
bool is_pin_function(T value)
{
  T tmp{};
  return internal::decode(static_cast<uint8_t>(value), tmp);
}

}  // namespace

/* ========================================================================= */
/* Power-up state (flash)                                                    */
/* ========================================================================= */

ErrorCode Device::gpio_read_powerup_value(size_t pin, bool& value)
{
  ErrorCode err = check_pin(pin);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  std::vector<bool> bits;
  err = read_flash_bits(FlashSubcode::GP_SETTINGS, pin, {GP_BIT_VALUE}, bits);
  if (err == ErrorCode::OK)
  {
    value = bits[0];
  }
  return err;
}

ErrorCode Device::gpio_write_powerup_value(size_t pin, bool value)
{
  const ErrorCode err = check_pin(pin);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return write_flash_bits(FlashSubcode::GP_SETTINGS, pin, {GP_BIT_VALUE}, {value});
}

ErrorCode Device::gpio_read_powerup_direction(size_t pin, GpioDirection& value)
{
  ErrorCode err = check_pin(pin);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  std::vector<bool> bits;
  err = read_flash_bits(FlashSubcode::GP_SETTINGS, pin, {GP_BIT_DIRECTION}, bits);
  if (err == ErrorCode::OK)
  {
    value = bits[0] ? GpioDirection::INPUT : GpioDirection::OUTPUT;
  }
  return err;
}

ErrorCode Device::gpio_write_powerup_direction(size_t pin, GpioDirection value)
{
  ErrorCode err = check_pin(pin);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (!is_direction(value))
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  // Function code 0 is GPIO on every pin
  err = gpio_write_function(pin, 0x00, MemoryType::FLASH);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return write_flash_bits(FlashSubcode::GP_SETTINGS, pin, {GP_BIT_DIRECTION},
                          {value == GpioDirection::INPUT});
}

/* ========================================================================= */
/* Pin function                                                              */
/* ========================================================================= */

ErrorCode Device::gpio_read_function(size_t pin, uint8_t& value, std::optional<MemoryType> mem)
{
  ErrorCode err = check_pin(pin);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  std::vector<bool> bits;
  err = resolve_target(mem) == MemoryType::SRAM
            ? read_sram_bits(SramSubcode::GP_SETTINGS, pin, {0, 1, 2}, bits)
            : read_flash_bits(FlashSubcode::GP_SETTINGS, pin, {0, 1, 2}, bits);
  if (err == ErrorCode::OK)
  {
    value = internal::bits_to_value(bits);
  }
  return err;
}

ErrorCode Device::gpio_write_function(size_t pin, uint8_t value, std::optional<MemoryType> mem)
{
  ErrorCode err = check_pin(pin);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (resolve_target(mem) == MemoryType::FLASH)
  {
    return write_flash_bits(FlashSubcode::GP_SETTINGS, pin, {0, 1, 2},
                            internal::value_to_bits(value, 3));
  }

  // Changing a pin function clears the DAC/ADC references; keep them
  Frame sram;
  err = command(Command::GET_SRAM, {}, sram);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  // GET_SRAM does not reflect SET_GPIO changes; take the live pin state
  Frame gpio;
  err = command(Command::GET_GPIO, {}, gpio);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  const uint8_t pin_value = gpio[GPIO_VALUE_OFFSET + 2 * pin];
  const uint8_t pin_direction = gpio[GPIO_DIRECTION_OFFSET + 2 * pin];
  if (pin_value <= 1)
  {
    value = static_cast<uint8_t>(value + (pin_value << GP_BIT_VALUE) +
                                 (pin_direction << GP_BIT_DIRECTION));
  }

  err = write_sram(SramSubcode::GP_SETTINGS, pin, value);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  const uint8_t dac_vref =
      static_cast<uint8_t>(SRAM_ENABLE_BIT | (sram[SRAM_DAC_VREF_OFFSET] >> 5));
  const uint8_t adc_vref =
      static_cast<uint8_t>(SRAM_ENABLE_BIT | ((sram[SRAM_ADC_VREF_OFFSET] >> 2) & 0x07));

  Frame response;
  return command(Command::SET_SRAM, {0x00, 0x00, dac_vref, 0x00, adc_vref}, response);
}

ErrorCode Device::gpio0_read_function(Gpio0Function& value, std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = gpio_read_function(0, raw, mem);
  return read_pin_function(err, raw, value);
}

ErrorCode Device::gpio0_write_function(Gpio0Function value, std::optional<MemoryType> mem)
{
  if (!is_pin_function(value))
  {
    return ErrorCode::INVALID_PARAMETER;
  }
  return gpio_write_function(0, static_cast<uint8_t>(value), mem);
}

ErrorCode Device::gpio1_read_function(Gpio1Function& value, std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = gpio_read_function(1, raw, mem);
  return read_pin_function(err, raw, value);
}

ErrorCode Device::gpio1_write_function(Gpio1Function value, std::optional<MemoryType> mem)
{
  if (!is_pin_function(value))
  {
    return ErrorCode::INVALID_PARAMETER;
  }
  return gpio_write_function(1, static_cast<uint8_t>(value), mem);
}

ErrorCode Device::gpio2_read_function(Gpio2Function& value, std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = gpio_read_function(2, raw, mem);
  return read_pin_function(err, raw, value);
}

ErrorCode Device::gpio2_write_function(Gpio2Function value, std::optional<MemoryType> mem)
{
  if (!is_pin_function(value))
  {
    return ErrorCode::INVALID_PARAMETER;
  }
  return gpio_write_function(2, static_cast<uint8_t>(value), mem);
}

ErrorCode Device::gpio3_read_function(Gpio3Function& value, std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = gpio_read_function(3, raw, mem);
  return read_pin_function(err, raw, value);
}

ErrorCode Device::gpio3_write_function(Gpio3Function value, std::optional<MemoryType> mem)
{
  if (!is_pin_function(value))
  {
    return ErrorCode::INVALID_PARAMETER;
  }
  return gpio_write_function(3, static_cast<uint8_t>(value), mem);
}

/* ========================================================================= */
/* Runtime direction / value                                                 */
/* ========================================================================= */

ErrorCode Device::gpio_read_direction(size_t pin, GpioDirection& value)
{
  ErrorCode err = check_pin(pin);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  Frame response;
  err = command(Command::GET_GPIO, {}, response);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  const uint8_t raw = response[GPIO_DIRECTION_OFFSET + 2 * pin];
  return internal::decode(raw, value) ? ErrorCode::OK : ErrorCode::INVALID_RESPONSE;
}

ErrorCode Device::gpio_write_direction(size_t pin, GpioDirection value)
{
  const ErrorCode err = check_pin(pin);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (!is_direction(value))
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  Frame cmd;
  Frame response;
  internal::build_gpio_set(pin, false, 0, true, static_cast<uint8_t>(value), cmd);
  return transact(cmd, response);
}

ErrorCode Device::gpio_read_value(size_t pin, bool& value)
{
  ErrorCode err = check_pin(pin);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  Frame response;
  err = command(Command::GET_GPIO, {}, response);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  const uint8_t raw = response[GPIO_VALUE_OFFSET + 2 * pin];
  if (raw == GPIO_VALUE_NOT_SET)
  {
    warn(ErrorCode::PIN_NOT_GPIO);
  }

  value = raw != 0;
  return ErrorCode::OK;
}

ErrorCode Device::gpio_write_value(size_t pin, bool value)
{
  const ErrorCode err = check_pin(pin);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  Frame cmd;
  Frame response;
  internal::build_gpio_set(pin, true, value ? 0x01 : 0x00, false, 0, cmd);
  return transact(cmd, response);
}

}  // namespace mcp2221
