/**
 * @file device.hpp
 * @brief MCP2221 device session and feature API
 *
 * Typed access to the MCP2221/MCP2221A USB-HID bridge: chip settings, USB
 * identity, GPIO, ADC/DAC, I2C transfers and interrupts, built on a strictly
 * half-duplex 64-byte command/response protocol.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mcp2221/protocol.hpp"
#include "mcp2221/transport.hpp"

namespace mcp2221
{

/**
 * @brief One MCP2221 chip behind a HID transport
 *
 * Every operation is one or more blocking write-then-read exchanges. Results
 * are returned through out-parameters; the return value is ErrorCode::OK or
 * the reason the operation failed. Parameters are validated before anything
 * is sent.
 *
 * Settings that exist both in SRAM (volatile, active now) and in flash
 * (applied at power-up) take an optional MemoryType; without it the session
 * default is used (initially SRAM).
 *
 * A session is not thread-safe. Use one session per device.
 *
 * Example usage:
 * @code
 * mcp2221::HidTransport hid;
 * auto devices = mcp2221::find_devices();
 * mcp2221::Device dev(hid);
 *
 * if (!devices.empty() && dev.open(devices[0]) == mcp2221::ErrorCode::OK) {
 *   uint16_t adc = 0;
 *   dev.gpio1_write_function(mcp2221::Gpio1Function::ADC1);
 *   dev.read_adc(1, adc);
 * }
 * @endcode
 */
class Device
{
 public:
  /**
   * @brief Warning callback function type
   *
   * Receives non-fatal conditions (e.g. ErrorCode::PIN_NOT_GPIO). The
   * operation that raised the warning still completes.
   *
   * @param user    User context pointer passed to set_warning_handler()
   * @param code    Warning code
   * @param message Human-readable description
   */
  using WarningFn = void (*)(void* user, ErrorCode code, const char* message);

  /**
   * @brief Construct a closed session
   *
   * @param transport HID transport (must outlive the session)
   * @param password  Flash access password (max. 8 bytes)
   */
  explicit Device(Transport& transport, const std::string& password = "");

  /**
   * @brief Construct and open a session
   *
   * The outcome of the implicit open() is available from open_result().
   */
  Device(Transport& transport, const DeviceInfo& info, const std::string& password = "");

  ~Device();

  Device(const Device&) = delete;
  Device& operator=(const Device&) = delete;

  /* ----------------------------------------------------------------------- */
  /* Session                                                                 */
  /* ----------------------------------------------------------------------- */

  /**
   * @brief Open the device and settle its pin state
   *
   * After the transport opens, GPIO inputs and ADC inputs on pins 1 to 3 are
   * swapped and restored once, which clears undefined ADC readings left by
   * some pin configurations. If this fails the transport is closed again.
   *
   * @return OK, ALREADY_OPEN, OPEN_FAILED, or INVALID_PARAMETER if the
   *         session password is longer than MAX_PASSWORD_LENGTH (nothing is
   *         sent then)
   */
  ErrorCode open(const DeviceInfo& info);

  /** @brief Close the device (idempotent) */
  void close();

  bool is_open() const
  {
    return state_ == State::OPEN;
  }

  ErrorCode open_result() const
  {
    return open_result_;
  }

  /** @brief STATUS byte of the last response that reported COMMAND_FAILED */
  uint8_t last_status() const
  {
    return last_status_;
  }

  MemoryType default_memory_target() const
  {
    return mem_target_;
  }

  void set_default_memory_target(MemoryType mem)
  {
    mem_target_ = mem;
  }

  /**
   * @brief Replace the warning handler
   *
   * A new session logs warnings to stderr (log_warning()). Passing nullptr
   * discards them.
   */
  void set_warning_handler(WarningFn fn, void* user = nullptr);

  /** @brief Default warning handler: one line on stderr */
  static void log_warning(void* user, ErrorCode code, const char* message);

  /* ----------------------------------------------------------------------- */
  /* Chip settings (flash)                                                   */
  /* ----------------------------------------------------------------------- */

  ErrorCode read_cdc_sn_enumeration_enable(bool& value);
  ErrorCode write_cdc_sn_enumeration_enable(bool value);

  /** @brief Level of the UART RX LED signal while no RX transfer is ongoing */
  ErrorCode read_led_idle_uart_rx_level(bool& value);
  ErrorCode write_led_idle_uart_rx_level(bool value);

  /** @brief Level of the UART TX LED signal while no TX transfer is ongoing */
  ErrorCode read_led_idle_uart_tx_level(bool& value);
  ErrorCode write_led_idle_uart_tx_level(bool value);

  /** @brief Level of the I2C LED signal while no I2C transfer is ongoing */
  ErrorCode read_led_idle_i2c_level(bool& value);
  ErrorCode write_led_idle_i2c_level(bool value);

  /** @brief Level of the suspend signal when the chip is NOT suspended */
  ErrorCode read_suspend_mode_logic_level(bool& value);
  ErrorCode write_suspend_mode_logic_level(bool value);

  /** @brief Level of the USB-configured signal after enumeration */
  ErrorCode read_usb_configured_logic_level(bool& value);
  ErrorCode write_usb_configured_logic_level(bool value);

  ErrorCode read_security_option(SecurityOption& value);

  /**
   * @brief Write chip security option
   *
   * SecurityOption::PERMANENTLY_LOCKED makes the flash read-only forever.
   */
  ErrorCode write_security_option(SecurityOption value);

  /* ----------------------------------------------------------------------- */
  /* Chip settings (SRAM or flash)                                           */
  /* ----------------------------------------------------------------------- */

  /** @brief Frequency of the clock output on GPIO 1 */
  ErrorCode read_clock_output_frequency(ClockFrequency& value,
                                        std::optional<MemoryType> mem = std::nullopt);
  ErrorCode write_clock_output_frequency(ClockFrequency value,
                                         std::optional<MemoryType> mem = std::nullopt);

  ErrorCode read_clock_output_duty_cycle(ClockDutyCycle& value,
                                         std::optional<MemoryType> mem = std::nullopt);
  ErrorCode write_clock_output_duty_cycle(ClockDutyCycle value,
                                          std::optional<MemoryType> mem = std::nullopt);

  ErrorCode read_adc_reference_voltage(ReferenceVoltageValue& value,
                                       std::optional<MemoryType> mem = std::nullopt);
  ErrorCode write_adc_reference_voltage(ReferenceVoltageValue value,
                                        std::optional<MemoryType> mem = std::nullopt);

  ErrorCode read_adc_reference_source(ReferenceVoltageSource& value,
                                      std::optional<MemoryType> mem = std::nullopt);
  ErrorCode write_adc_reference_source(ReferenceVoltageSource value,
                                       std::optional<MemoryType> mem = std::nullopt);

  ErrorCode read_dac_reference_voltage(ReferenceVoltageValue& value,
                                       std::optional<MemoryType> mem = std::nullopt);
  ErrorCode write_dac_reference_voltage(ReferenceVoltageValue value,
                                        std::optional<MemoryType> mem = std::nullopt);

  ErrorCode read_dac_reference_source(ReferenceVoltageSource& value,
                                      std::optional<MemoryType> mem = std::nullopt);
  ErrorCode write_dac_reference_source(ReferenceVoltageSource value,
                                       std::optional<MemoryType> mem = std::nullopt);

  ErrorCode read_interrupt_on_falling_edge(bool& value,
                                           std::optional<MemoryType> mem = std::nullopt);
  ErrorCode write_interrupt_on_falling_edge(bool value,
                                            std::optional<MemoryType> mem = std::nullopt);

  ErrorCode read_interrupt_on_rising_edge(bool& value,
                                          std::optional<MemoryType> mem = std::nullopt);
  ErrorCode write_interrupt_on_rising_edge(bool value,
                                           std::optional<MemoryType> mem = std::nullopt);

  /* ----------------------------------------------------------------------- */
  /* USB identity (flash)                                                    */
  /* ----------------------------------------------------------------------- */

  ErrorCode read_usb_vid(uint16_t& value);
  ErrorCode write_usb_vid(uint16_t value);

  ErrorCode read_usb_pid(uint16_t& value);
  ErrorCode write_usb_pid(uint16_t value);

  ErrorCode read_usb_self_powered_attribute(bool& value);
  ErrorCode write_usb_self_powered_attribute(bool value);

  ErrorCode read_usb_remote_wake_up_attribute(bool& value);
  ErrorCode write_usb_remote_wake_up_attribute(bool value);

  /** @brief USB current requested during enumeration, in mA (2 mA steps) */
  ErrorCode read_usb_current(uint16_t& milliamps);
  ErrorCode write_usb_current(uint16_t milliamps);

  ErrorCode read_usb_manufacturer_descriptor(std::string& value);
  ErrorCode write_usb_manufacturer_descriptor(const std::string& value);

  ErrorCode read_usb_product_descriptor(std::string& value);
  ErrorCode write_usb_product_descriptor(const std::string& value);

  ErrorCode read_usb_serial_number_descriptor(std::string& value);
  ErrorCode write_usb_serial_number_descriptor(const std::string& value);

  ErrorCode read_chip_factory_serial_number(std::string& value);
  ErrorCode write_chip_factory_serial_number(const std::string& value);

  /* ----------------------------------------------------------------------- */
  /* Flash access password                                                   */
  /* ----------------------------------------------------------------------- */

  /**
   * @brief Store a new flash access password
   *
   * Protection becomes active once the security option is set to
   * SecurityOption::PASSWORD_PROTECTED. The password is cached in the session
   * and sent with every later Chip-Settings flash write.
   */
  ErrorCode write_flash_access_password(const std::string& password);

  /** @brief Send the password to unlock flash writes and cache it */
  ErrorCode unlock(const std::string& password);

  /* ----------------------------------------------------------------------- */
  /* Interrupt                                                               */
  /* ----------------------------------------------------------------------- */

  ErrorCode read_interrupt_flag(bool& value);
  ErrorCode clear_interrupt_flag();

  /* ----------------------------------------------------------------------- */
  /* I2C                                                                     */
  /* ----------------------------------------------------------------------- */

  ErrorCode i2c_cancel_transfer(I2cCancelResponse& response);

  ErrorCode i2c_read_speed(uint32_t& speed);

  /**
   * @brief Set the I2C bus speed
   *
   * @param speed    Speed in Hz, I2C_MIN_SPEED_HZ to I2C_MAX_SPEED_HZ
   * @param response Chip acknowledgement
   */
  ErrorCode i2c_write_speed(uint32_t speed, I2cSpeedResponse& response);

  ErrorCode i2c_requested_transfer_length(uint16_t& value);
  ErrorCode i2c_already_transferred_length(uint16_t& value);
  ErrorCode i2c_internal_buffer_counter(uint8_t& value);
  ErrorCode i2c_slave_address(uint16_t& value);
  ErrorCode i2c_scl_state(bool& value);
  ErrorCode i2c_sda_state(bool& value);

  /**
   * @brief Raw "pending value" byte of the status report
   *
   * Observed values are 0, 1 and 2; their meaning is not documented.
   */
  ErrorCode i2c_has_pending_value(uint8_t& value);

  /**
   * @brief Write data to a 7-bit I2C address
   *
   * Data is sent in chunks of up to 60 bytes; each chunk is retried while the
   * I2C engine reports busy.
   */
  ErrorCode i2c_write_data(uint8_t address, const uint8_t* data, size_t len,
                           I2cMode mode = I2cMode::START);

  ErrorCode i2c_write_data(uint8_t address, const std::vector<uint8_t>& data,
                           I2cMode mode = I2cMode::START)
  {
    return i2c_write_data(address, data.data(), data.size(), mode);
  }

  /**
   * @brief Read data from a 7-bit I2C address
   *
   * I2cMode::NO_STOP is not allowed.
   *
   * @return I2C_SLAVE_NO_RESPONSE if the slave did not answer,
   *         I2C_SLAVE_ERROR if it reported an error
   */
  ErrorCode i2c_read_data(uint8_t address, size_t length, std::vector<uint8_t>& out,
                          I2cMode mode = I2cMode::START);

  /* ----------------------------------------------------------------------- */
  /* GPIO                                                                    */
  /* ----------------------------------------------------------------------- */

  ErrorCode gpio_read_powerup_value(size_t pin, bool& value);
  ErrorCode gpio_write_powerup_value(size_t pin, bool value);

  ErrorCode gpio_read_powerup_direction(size_t pin, GpioDirection& value);

  /**
   * @brief Write the power-up direction of a pin
   *
   * The pin's flash function is set to GPIO first, since a direction is only
   * meaningful for a GPIO pin.
   */
  ErrorCode gpio_write_powerup_direction(size_t pin, GpioDirection value);

  ErrorCode gpio0_read_function(Gpio0Function& value, std::optional<MemoryType> mem = std::nullopt);
  ErrorCode gpio0_write_function(Gpio0Function value, std::optional<MemoryType> mem = std::nullopt);
  ErrorCode gpio1_read_function(Gpio1Function& value, std::optional<MemoryType> mem = std::nullopt);
  ErrorCode gpio1_write_function(Gpio1Function value, std::optional<MemoryType> mem = std::nullopt);
  ErrorCode gpio2_read_function(Gpio2Function& value, std::optional<MemoryType> mem = std::nullopt);
  ErrorCode gpio2_write_function(Gpio2Function value, std::optional<MemoryType> mem = std::nullopt);
  ErrorCode gpio3_read_function(Gpio3Function& value, std::optional<MemoryType> mem = std::nullopt);
  ErrorCode gpio3_write_function(Gpio3Function value, std::optional<MemoryType> mem = std::nullopt);

  ErrorCode gpio_read_direction(size_t pin, GpioDirection& value);
  ErrorCode gpio_write_direction(size_t pin, GpioDirection value);

  /**
   * @brief Read the current value of a pin
   *
   * A pin not assigned to GPIO reports a placeholder; this raises the
   * PIN_NOT_GPIO warning and @p value is set to true.
   */
  ErrorCode gpio_read_value(size_t pin, bool& value);
  ErrorCode gpio_write_value(size_t pin, bool value);

  /* ----------------------------------------------------------------------- */
  /* ADC / DAC                                                               */
  /* ----------------------------------------------------------------------- */

  /** @brief Read ADC channel 0 to 2 */
  ErrorCode read_adc(size_t channel, uint16_t& value);

  /** @brief Write the DAC output (low 5 bits of @p value) */
  ErrorCode write_dac(uint8_t value);

  ErrorCode read_dac_powerup_value(uint8_t& value);
  ErrorCode write_dac_powerup_value(uint8_t value);

  /* ----------------------------------------------------------------------- */
  /* Other                                                                   */
  /* ----------------------------------------------------------------------- */

  ErrorCode read_firmware_version(std::string& value);

  /**
   * @brief Reset the chip
   *
   * The chip drops off the bus, so the session is closed afterwards and the
   * device has to be enumerated again. The transport failure caused by the
   * disconnect is expected and not reported.
   */
  ErrorCode reset_chip();

 private:
  /**
   * @brief Session state machine
   */
  enum class State
  {
    CLOSED,           // No transport open
    SANITIZING_PINS,  // Transport open, pin state being settled
    OPEN,             // Ready for operations
  };

  /* Protocol exchange (device.cpp) */
  ErrorCode exchange(const Frame& cmd, Frame& response);
  ErrorCode transact(const Frame& cmd, Frame& response);
  ErrorCode command(Command cmd, const std::vector<uint8_t>& payload, Frame& response);
  ErrorCode read_status(Frame& response);
  ErrorCode sanitize_pins();
  void warn(ErrorCode code);

  /* Register access (device_registers.cpp) */
  ErrorCode read_flash(FlashSubcode code, std::vector<uint8_t>& out);
  ErrorCode read_sram(SramSubcode code, std::vector<uint8_t>& out);
  ErrorCode read_flash_bits(FlashSubcode code, size_t byte, const std::vector<uint8_t>& bits,
                            std::vector<bool>& out);
  ErrorCode read_sram_bits(SramSubcode code, size_t byte, const std::vector<uint8_t>& bits,
                           std::vector<bool>& out);
  ErrorCode write_flash_bits(FlashSubcode code, size_t byte, const std::vector<uint8_t>& bits,
                             const std::vector<bool>& values);
  ErrorCode write_flash_block(FlashSubcode code, const std::vector<uint8_t>& image);
  ErrorCode write_sram(SramSubcode code, size_t byte, uint8_t value);
  ErrorCode read_sram_byte(SramSubcode code, size_t byte, uint8_t& value);

  MemoryType resolve_target(std::optional<MemoryType> mem) const
  {
    return mem ? *mem : mem_target_;
  }

  ErrorCode read_chip_field(std::optional<MemoryType> mem, size_t byte,
                            const std::vector<uint8_t>& bits, uint8_t& value);
  ErrorCode read_flash_flag(size_t byte, uint8_t bit, bool& value);
  ErrorCode write_flash_flag(size_t byte, uint8_t bit, bool value);
  ErrorCode write_chip_settings_word(size_t byte, uint16_t value);
  ErrorCode read_usb_string(FlashSubcode code, std::string& value);
  ErrorCode write_usb_string(FlashSubcode code, const std::string& value);

  /* I2C (device_i2c.cpp) */
  ErrorCode i2c_request(const Frame& cmd);

  /* GPIO helpers (device_gpio.cpp) */
  ErrorCode gpio_read_function(size_t pin, uint8_t& value, std::optional<MemoryType> mem);
  ErrorCode gpio_write_function(size_t pin, uint8_t value, std::optional<MemoryType> mem);

  Transport& transport_;
  State state_;
  ErrorCode open_result_;
  std::string password_;
  MemoryType mem_target_;
  uint8_t last_status_;
  WarningFn warning_fn_;
  void* warning_user_;
};

}  // namespace mcp2221
