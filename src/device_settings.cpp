/**
 * @file device_settings.cpp
 * @brief Chip settings, USB identity, password, interrupt and ADC/DAC access
 *
 * Chip-Settings image (flash and SRAM read-back):
 *
 * - byte 0: [7] CDC enum, [6] UART RX LED, [5] UART TX LED, [4] I2C LED,
 *           [3] suspend level, [2] USB configured level, [1:0] security
 * - byte 1: [4:3] clock duty cycle, [2:0] clock frequency
 * - byte 2: [7:6] DAC Vref, [5] DAC Vref source, [4:0] DAC power-up value
 * - byte 3: [6] falling edge, [5] rising edge, [4:3] ADC Vref, [2] ADC source
 * - bytes 4-7: VID, PID (little-endian, flash only)
 * - byte 8: [6] self-powered, [5] remote wake-up (flash only)
 * - byte 9: USB current / 2 mA (flash only)
 *
 * SRAM writes use the SET_SRAM layout instead: one byte per setting group
 * with bit 7 as "apply" flag.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "decode.hpp"
#include "frame.hpp"
#include "mcp2221/device.hpp"
#include "registers.hpp"

namespace mcp2221
{

namespace
{

/* SET_SRAM Chip-Settings byte indices */
constexpr size_t SRAM_SET_CLOCK = 0;
constexpr size_t SRAM_SET_DAC_VREF = 1;
constexpr size_t SRAM_SET_DAC_VALUE = 2;
constexpr size_t SRAM_SET_ADC_VREF = 3;
constexpr size_t SRAM_SET_INTERRUPT = 4;

/* SET_SRAM interrupt byte values */
constexpr uint8_t INTERRUPT_FALLING_ENABLE = 0x98;
constexpr uint8_t INTERRUPT_FALLING_DISABLE = 0x90;
constexpr uint8_t INTERRUPT_RISING_ENABLE = 0x86;
constexpr uint8_t INTERRUPT_RISING_DISABLE = 0x84;
constexpr uint8_t INTERRUPT_CLEAR_FLAG = 0x81;

/* Status report offsets */
constexpr size_t STATUS_INTERRUPT_FLAG = 24;
constexpr size_t STATUS_ADC_DATA = 50;

constexpr uint8_t DAC_VALUE_MASK = 0x1F;

template <typename T>
ErrorCode decode_field(ErrorCode err, uint8_t raw, T& out)
{
  if (err != ErrorCode::OK)
  {
    return err;
  }
  return internal::decode(raw, out) ? ErrorCode::OK : ErrorCode::INVALID_RESPONSE;
}

}  // namespace

/* ========================================================================= */
/* Chip settings (flash)                                                     */
/* ========================================================================= */

ErrorCode Device::read_cdc_sn_enumeration_enable(bool& value)
{
  return read_flash_flag(0, 7, value);
}

ErrorCode Device::write_cdc_sn_enumeration_enable(bool value)
{
  return write_flash_flag(0, 7, value);
}

ErrorCode Device::read_led_idle_uart_rx_level(bool& value)
{
  return read_flash_flag(0, 6, value);
}

ErrorCode Device::write_led_idle_uart_rx_level(bool value)
{
  return write_flash_flag(0, 6, value);
}

ErrorCode Device::read_led_idle_uart_tx_level(bool& value)
{
  return read_flash_flag(0, 5, value);
}

ErrorCode Device::write_led_idle_uart_tx_level(bool value)
{
  return write_flash_flag(0, 5, value);
}

ErrorCode Device::read_led_idle_i2c_level(bool& value)
{
  return read_flash_flag(0, 4, value);
}

ErrorCode Device::write_led_idle_i2c_level(bool value)
{
  return write_flash_flag(0, 4, value);
}

ErrorCode Device::read_suspend_mode_logic_level(bool& value)
{
  return read_flash_flag(0, 3, value);
}

ErrorCode Device::write_suspend_mode_logic_level(bool value)
{
  return write_flash_flag(0, 3, value);
}

ErrorCode Device::read_usb_configured_logic_level(bool& value)
{
  return read_flash_flag(0, 2, value);
}

ErrorCode Device::write_usb_configured_logic_level(bool value)
{
  return write_flash_flag(0, 2, value);
}

ErrorCode Device::read_security_option(SecurityOption& value)
{
  uint8_t raw = 0;
  const ErrorCode err = read_chip_field(MemoryType::FLASH, 0, {0, 1}, raw);
  return decode_field(err, raw, value);
}

ErrorCode Device::write_security_option(SecurityOption value)
{
  if (value > SecurityOption::PERMANENTLY_LOCKED)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  return write_flash_bits(FlashSubcode::CHIP_SETTINGS, 0, {0, 1},
                          internal::value_to_bits(static_cast<uint8_t>(value), 2));
}

/* ========================================================================= */
/* Chip settings (SRAM or flash)                                             */
/* ========================================================================= */

ErrorCode Device::read_clock_output_frequency(ClockFrequency& value,
                                              std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = read_chip_field(mem, 1, {0, 1, 2}, raw);
  return decode_field(err, raw, value);
}

ErrorCode Device::write_clock_output_frequency(ClockFrequency value,
                                               std::optional<MemoryType> mem)
{
  const uint8_t raw = static_cast<uint8_t>(value);
  if (raw < 0x01 || raw > 0x07)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  if (resolve_target(mem) == MemoryType::FLASH)
  {
    return write_flash_bits(FlashSubcode::CHIP_SETTINGS, 1, {0, 1, 2},
                            internal::value_to_bits(raw, 3));
  }

  // Keep the duty cycle bits
  uint8_t current = 0;
  const ErrorCode err = read_sram_byte(SramSubcode::CHIP_SETTINGS, 1, current);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return write_sram(SramSubcode::CHIP_SETTINGS, SRAM_SET_CLOCK,
                    static_cast<uint8_t>(SRAM_ENABLE_BIT | raw | (current & 0x18)));
}

ErrorCode Device::read_clock_output_duty_cycle(ClockDutyCycle& value,
                                               std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = read_chip_field(mem, 1, {3, 4}, raw);
  return decode_field(err, raw, value);
}

ErrorCode Device::write_clock_output_duty_cycle(ClockDutyCycle value,
                                                std::optional<MemoryType> mem)
{
  const uint8_t raw = static_cast<uint8_t>(value);
  if (raw > 0x03)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  if (resolve_target(mem) == MemoryType::FLASH)
  {
    return write_flash_bits(FlashSubcode::CHIP_SETTINGS, 1, {3, 4},
                            internal::value_to_bits(raw, 2));
  }

  // Keep the frequency bits
  uint8_t current = 0;
  const ErrorCode err = read_sram_byte(SramSubcode::CHIP_SETTINGS, 1, current);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return write_sram(SramSubcode::CHIP_SETTINGS, SRAM_SET_CLOCK,
                    static_cast<uint8_t>(SRAM_ENABLE_BIT | (raw << 3) | (current & 0x07)));
}

ErrorCode Device::read_adc_reference_voltage(ReferenceVoltageValue& value,
                                             std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = read_chip_field(mem, 3, {3, 4}, raw);
  return decode_field(err, raw, value);
}

ErrorCode Device::write_adc_reference_voltage(ReferenceVoltageValue value,
                                              std::optional<MemoryType> mem)
{
  const uint8_t raw = static_cast<uint8_t>(value);
  if (raw > 0x03)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  if (resolve_target(mem) == MemoryType::FLASH)
  {
    return write_flash_bits(FlashSubcode::CHIP_SETTINGS, 3, {3, 4},
                            internal::value_to_bits(raw, 2));
  }

  // SET_SRAM ADC byte: [2:1] Vref, [0] source
  uint8_t current = 0;
  const ErrorCode err = read_sram_byte(SramSubcode::CHIP_SETTINGS, 3, current);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return write_sram(SramSubcode::CHIP_SETTINGS, SRAM_SET_ADC_VREF,
                    static_cast<uint8_t>(SRAM_ENABLE_BIT | (raw << 1) | ((current >> 2) & 0x01)));
}

ErrorCode Device::read_adc_reference_source(ReferenceVoltageSource& value,
                                            std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = read_chip_field(mem, 3, {2}, raw);
  return decode_field(err, raw, value);
}

ErrorCode Device::write_adc_reference_source(ReferenceVoltageSource value,
                                             std::optional<MemoryType> mem)
{
  const uint8_t raw = static_cast<uint8_t>(value);
  if (raw > 0x01)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  if (resolve_target(mem) == MemoryType::FLASH)
  {
    return write_flash_bits(FlashSubcode::CHIP_SETTINGS, 3, {2}, {raw != 0});
  }

  uint8_t current = 0;
  const ErrorCode err = read_sram_byte(SramSubcode::CHIP_SETTINGS, 3, current);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return write_sram(SramSubcode::CHIP_SETTINGS, SRAM_SET_ADC_VREF,
                    static_cast<uint8_t>(SRAM_ENABLE_BIT | raw | ((current >> 2) & 0x06)));
}

ErrorCode Device::read_dac_reference_voltage(ReferenceVoltageValue& value,
                                             std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = read_chip_field(mem, 2, {6, 7}, raw);
  return decode_field(err, raw, value);
}

ErrorCode Device::write_dac_reference_voltage(ReferenceVoltageValue value,
                                              std::optional<MemoryType> mem)
{
  const uint8_t raw = static_cast<uint8_t>(value);
  if (raw > 0x03)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  if (resolve_target(mem) == MemoryType::FLASH)
  {
    return write_flash_bits(FlashSubcode::CHIP_SETTINGS, 2, {6, 7},
                            internal::value_to_bits(raw, 2));
  }

  // SET_SRAM DAC byte: [2:1] Vref, [0] source
  uint8_t current = 0;
  const ErrorCode err = read_sram_byte(SramSubcode::CHIP_SETTINGS, 2, current);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return write_sram(SramSubcode::CHIP_SETTINGS, SRAM_SET_DAC_VREF,
                    static_cast<uint8_t>(SRAM_ENABLE_BIT | (raw << 1) | ((current >> 5) & 0x01)));
}

ErrorCode Device::read_dac_reference_source(ReferenceVoltageSource& value,
                                            std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = read_chip_field(mem, 2, {5}, raw);
  return decode_field(err, raw, value);
}

ErrorCode Device::write_dac_reference_source(ReferenceVoltageSource value,
                                             std::optional<MemoryType> mem)
{
  const uint8_t raw = static_cast<uint8_t>(value);
  if (raw > 0x01)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  if (resolve_target(mem) == MemoryType::FLASH)
  {
    return write_flash_bits(FlashSubcode::CHIP_SETTINGS, 2, {5}, {raw != 0});
  }

  uint8_t current = 0;
  const ErrorCode err = read_sram_byte(SramSubcode::CHIP_SETTINGS, 2, current);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  return write_sram(SramSubcode::CHIP_SETTINGS, SRAM_SET_DAC_VREF,
                    static_cast<uint8_t>(SRAM_ENABLE_BIT | raw | ((current >> 5) & 0x06)));
}

ErrorCode Device::read_interrupt_on_falling_edge(bool& value, std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = read_chip_field(mem, 3, {6}, raw);
  if (err == ErrorCode::OK)
  {
    value = raw != 0;
  }
  return err;
}

ErrorCode Device::write_interrupt_on_falling_edge(bool value, std::optional<MemoryType> mem)
{
  if (resolve_target(mem) == MemoryType::FLASH)
  {
    return write_flash_bits(FlashSubcode::CHIP_SETTINGS, 3, {6}, {value});
  }

  return write_sram(SramSubcode::CHIP_SETTINGS, SRAM_SET_INTERRUPT,
                    value ? INTERRUPT_FALLING_ENABLE : INTERRUPT_FALLING_DISABLE);
}

ErrorCode Device::read_interrupt_on_rising_edge(bool& value, std::optional<MemoryType> mem)
{
  uint8_t raw = 0;
  const ErrorCode err = read_chip_field(mem, 3, {5}, raw);
  if (err == ErrorCode::OK)
  {
    value = raw != 0;
  }
  return err;
}

ErrorCode Device::write_interrupt_on_rising_edge(bool value, std::optional<MemoryType> mem)
{
  if (resolve_target(mem) == MemoryType::FLASH)
  {
    return write_flash_bits(FlashSubcode::CHIP_SETTINGS, 3, {5}, {value});
  }

  return write_sram(SramSubcode::CHIP_SETTINGS, SRAM_SET_INTERRUPT,
                    value ? INTERRUPT_RISING_ENABLE : INTERRUPT_RISING_DISABLE);
}

/* ========================================================================= */
/* USB identity                                                              */
/* ========================================================================= */

ErrorCode Device::read_usb_vid(uint16_t& value)
{
  std::vector<uint8_t> image;
  const ErrorCode err = read_flash(FlashSubcode::CHIP_SETTINGS, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (image.size() < 6)
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  value = internal::read_le16(&image[4]);
  return ErrorCode::OK;
}

ErrorCode Device::write_usb_vid(uint16_t value)
{
  return write_chip_settings_word(4, value);
}

ErrorCode Device::read_usb_pid(uint16_t& value)
{
  std::vector<uint8_t> image;
  const ErrorCode err = read_flash(FlashSubcode::CHIP_SETTINGS, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (image.size() < 8)
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  value = internal::read_le16(&image[6]);
  return ErrorCode::OK;
}

ErrorCode Device::write_usb_pid(uint16_t value)
{
  return write_chip_settings_word(6, value);
}

ErrorCode Device::read_usb_self_powered_attribute(bool& value)
{
  return read_flash_flag(8, 6, value);
}

ErrorCode Device::write_usb_self_powered_attribute(bool value)
{
  return write_flash_flag(8, 6, value);
}

ErrorCode Device::read_usb_remote_wake_up_attribute(bool& value)
{
  return read_flash_flag(8, 5, value);
}

ErrorCode Device::write_usb_remote_wake_up_attribute(bool value)
{
  return write_flash_flag(8, 5, value);
}

ErrorCode Device::read_usb_current(uint16_t& milliamps)
{
  std::vector<uint8_t> image;
  const ErrorCode err = read_flash(FlashSubcode::CHIP_SETTINGS, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (image.size() < 10)
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  milliamps = static_cast<uint16_t>(image[9] * 2);
  return ErrorCode::OK;
}

ErrorCode Device::write_usb_current(uint16_t milliamps)
{
  if (milliamps > MAX_USB_CURRENT_MA)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  std::vector<uint8_t> image;
  const ErrorCode err = read_flash(FlashSubcode::CHIP_SETTINGS, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  if (image.size() < 10)
  {
    return ErrorCode::INVALID_RESPONSE;
  }

  image[9] = static_cast<uint8_t>(milliamps / 2);
  return write_flash_block(FlashSubcode::CHIP_SETTINGS, image);
}

ErrorCode Device::read_usb_string(FlashSubcode code, std::string& value)
{
  std::vector<uint8_t> block;
  const ErrorCode err = read_flash(code, block);
  if (err == ErrorCode::OK)
  {
    value = internal::decode_usb_string(block);
  }
  return err;
}

ErrorCode Device::write_usb_string(FlashSubcode code, const std::string& value)
{
  Frame cmd;
  const ErrorCode err = internal::build_usb_string_write(code, value, cmd);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  Frame response;
  return transact(cmd, response);
}

ErrorCode Device::read_usb_manufacturer_descriptor(std::string& value)
{
  return read_usb_string(FlashSubcode::USB_MANUFACTURER, value);
}

ErrorCode Device::write_usb_manufacturer_descriptor(const std::string& value)
{
  return write_usb_string(FlashSubcode::USB_MANUFACTURER, value);
}

ErrorCode Device::read_usb_product_descriptor(std::string& value)
{
  return read_usb_string(FlashSubcode::USB_PRODUCT, value);
}

ErrorCode Device::write_usb_product_descriptor(const std::string& value)
{
  return write_usb_string(FlashSubcode::USB_PRODUCT, value);
}

ErrorCode Device::read_usb_serial_number_descriptor(std::string& value)
{
  return read_usb_string(FlashSubcode::USB_SERIAL_NUMBER, value);
}

ErrorCode Device::write_usb_serial_number_descriptor(const std::string& value)
{
  return write_usb_string(FlashSubcode::USB_SERIAL_NUMBER, value);
}

ErrorCode Device::read_chip_factory_serial_number(std::string& value)
{
  std::vector<uint8_t> block;
  const ErrorCode err = read_flash(FlashSubcode::CHIP_FACTORY_SERIAL, block);
  if (err == ErrorCode::OK)
  {
    value.assign(block.begin(), block.end());
  }
  return err;
}

ErrorCode Device::write_chip_factory_serial_number(const std::string& value)
{
  if (value.size() > MAX_FACTORY_SERIAL_LENGTH)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  // [B1][05][LEN][0x03][ASCII...]
  std::vector<uint8_t> payload = {static_cast<uint8_t>(FlashSubcode::CHIP_FACTORY_SERIAL),
                                  static_cast<uint8_t>(value.size()), 0x03};
  payload.insert(payload.end(), value.begin(), value.end());

  Frame response;
  return command(Command::WRITE_FLASH, payload, response);
}

/* ========================================================================= */
/* Flash access password                                                     */
/* ========================================================================= */

ErrorCode Device::write_flash_access_password(const std::string& password)
{
  if (password.size() > MAX_PASSWORD_LENGTH)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  std::vector<uint8_t> image;
  const ErrorCode err = read_flash(FlashSubcode::CHIP_SETTINGS, image);
  if (err != ErrorCode::OK)
  {
    return err;
  }

  // The new password travels in the password field of this very write
  password_ = password;
  return write_flash_block(FlashSubcode::CHIP_SETTINGS, image);
}

ErrorCode Device::unlock(const std::string& password)
{
  if (password.size() > MAX_PASSWORD_LENGTH)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  std::vector<uint8_t> payload = {0x00};
  payload.insert(payload.end(), password.begin(), password.end());

  Frame response;
  const ErrorCode err = command(Command::UNLOCK, payload, response);
  if (err == ErrorCode::OK)
  {
    password_ = password;
  }
  return err;
}

/* ========================================================================= */
/* Interrupt                                                                 */
/* ========================================================================= */

ErrorCode Device::read_interrupt_flag(bool& value)
{
  Frame response;
  const ErrorCode err = read_status(response);
  if (err == ErrorCode::OK)
  {
    value = response[STATUS_INTERRUPT_FLAG] != 0;
  }
  return err;
}

ErrorCode Device::clear_interrupt_flag()
{
  return write_sram(SramSubcode::CHIP_SETTINGS, SRAM_SET_INTERRUPT, INTERRUPT_CLEAR_FLAG);
}

/* ========================================================================= */
/* ADC / DAC                                                                 */
/* ========================================================================= */

ErrorCode Device::read_adc(size_t channel, uint16_t& value)
{
  if (channel >= ADC_CHANNEL_COUNT)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  Frame response;
  const ErrorCode err = read_status(response);
  if (err == ErrorCode::OK)
  {
    value = internal::read_le16(&response[STATUS_ADC_DATA + 2 * channel]);
  }
  return err;
}

ErrorCode Device::write_dac(uint8_t value)
{
  return write_sram(SramSubcode::CHIP_SETTINGS, SRAM_SET_DAC_VALUE,
                    static_cast<uint8_t>(SRAM_ENABLE_BIT | (value & DAC_VALUE_MASK)));
}

ErrorCode Device::read_dac_powerup_value(uint8_t& value)
{
  return read_chip_field(MemoryType::FLASH, 2, {0, 1, 2, 3, 4}, value);
}

ErrorCode Device::write_dac_powerup_value(uint8_t value)
{
  if (value > DAC_VALUE_MASK)
  {
    return ErrorCode::INVALID_PARAMETER;
  }

  return write_flash_bits(FlashSubcode::CHIP_SETTINGS, 2, {0, 1, 2, 3, 4},
                          internal::value_to_bits(value, 5));
}

}  // namespace mcp2221
