/**
 * @file test_device.cpp
 * @brief Device session and feature tests against a scripted transport
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <string>
#include <vector>

#include "mcp2221/device.hpp"
#include "mock_transport.hpp"

using namespace mcp2221;
using mcp2221::test::MockTransport;

namespace
{

DeviceInfo test_device_info()
{
  DeviceInfo info;
  info.path = "/dev/hidraw0";
  info.vendor_id = DEFAULT_VENDOR_ID;
  info.product_id = DEFAULT_PRODUCT_ID;
  return info;
}

/** @brief Open @p dev and forget the frames sent while opening */
void open_device(MockTransport& mock, Device& dev)
{
  REQUIRE(dev.open(test_device_info()) == ErrorCode::OK);
  mock.written.clear();
}

struct WarningLog
{
  std::vector<ErrorCode> codes;

  static void record(void* user, ErrorCode code, const char*)
  {
    static_cast<WarningLog*>(user)->codes.push_back(code);
  }
};

}  // namespace

/* ========================================================================= */
/* Session Tests                                                             */
/* ========================================================================= */

TEST_CASE("Session open")
{
  MockTransport mock;
  Device dev(mock);

  CHECK_FALSE(dev.is_open());
  CHECK(dev.default_memory_target() == MemoryType::SRAM);

  SUBCASE("Open settles the pin state")
  {
    REQUIRE(dev.open(test_device_info()) == ErrorCode::OK);
    CHECK(dev.is_open());
    CHECK(mock.opened_path == "/dev/hidraw0");

    // GET_SRAM, then temporary and original designations
    REQUIRE(mock.written.size() == 3);
    CHECK(mock.written[0][0] == 0x61);
    CHECK(mock.written[1][0] == 0x60);
    CHECK(mock.written[1][7] == 0x80);
    CHECK(mock.written[1][11] == 0x02);  // pin 3 GPIO input -> ADC
    CHECK(mock.written[2][7] == 0x80);
    CHECK(mock.written[2][8] == 0x00);
    CHECK(mock.written[2][11] == 0x08);
  }

  SUBCASE("Device that never answers")
  {
    mock.empty_reply = true;
    CHECK(dev.open(test_device_info()) == ErrorCode::OPEN_FAILED);
    CHECK_FALSE(dev.is_open());
    CHECK_FALSE(mock.is_open());
  }

  SUBCASE("Transport cannot open")
  {
    mock.fail_open = true;
    CHECK(dev.open(test_device_info()) == ErrorCode::OPEN_FAILED);
    CHECK(mock.written.empty());
  }

  SUBCASE("Open twice")
  {
    REQUIRE(dev.open(test_device_info()) == ErrorCode::OK);
    CHECK(dev.open(test_device_info()) == ErrorCode::ALREADY_OPEN);
  }

  SUBCASE("Close is idempotent")
  {
    REQUIRE(dev.open(test_device_info()) == ErrorCode::OK);
    dev.close();
    dev.close();
    CHECK_FALSE(dev.is_open());
    CHECK_FALSE(mock.is_open());
  }
}

TEST_CASE("Session opened by the constructor")
{
  MockTransport mock;
  Device dev(mock, test_device_info());

  CHECK(dev.open_result() == ErrorCode::OK);
  CHECK(dev.is_open());
}

TEST_CASE("Password longer than the flash field")
{
  MockTransport mock;
  Device dev(mock, "123456789");

  CHECK(dev.open(test_device_info()) == ErrorCode::INVALID_PARAMETER);
  CHECK_FALSE(dev.is_open());
  CHECK_FALSE(mock.is_open());
  CHECK(dev.write_cdc_sn_enumeration_enable(true) == ErrorCode::NOT_CONNECTED);
  CHECK(mock.written.empty());

  Device opened(mock, test_device_info(), "123456789");
  CHECK(opened.open_result() == ErrorCode::INVALID_PARAMETER);
  CHECK(mock.written.empty());
}

TEST_CASE("Operations on a closed session")
{
  MockTransport mock;
  Device dev(mock);

  uint16_t adc = 0;
  CHECK(dev.read_adc(0, adc) == ErrorCode::NOT_CONNECTED);
  CHECK(dev.write_dac(1) == ErrorCode::NOT_CONNECTED);
  CHECK(dev.reset_chip() == ErrorCode::NOT_CONNECTED);
  CHECK(mock.written.empty());
}

TEST_CASE("Protocol failures")
{
  MockTransport mock;
  Device dev(mock);
  open_device(mock, dev);
  uint16_t adc = 0;

  SUBCASE("Opcode mismatch")
  {
    mock.enqueue(0x51);
    CHECK(dev.read_adc(0, adc) == ErrorCode::OPCODE_MISMATCH);
  }

  SUBCASE("Command failed")
  {
    mock.reply(0x10)[1] = 0x01;
    CHECK(dev.read_adc(0, adc) == ErrorCode::COMMAND_FAILED);
    CHECK(dev.last_status() == 0x01);
  }

  SUBCASE("Empty response")
  {
    mock.empty_reply = true;
    CHECK(dev.read_adc(0, adc) == ErrorCode::EMPTY_RESPONSE);
  }

  SUBCASE("Transport failure")
  {
    mock.fail_write = true;
    CHECK(dev.read_adc(0, adc) == ErrorCode::IO_ERROR);
  }
}

/* ========================================================================= */
/* Status / ADC / DAC Tests                                                  */
/* ========================================================================= */

TEST_CASE("Status report fields")
{
  MockTransport mock;
  Device dev(mock);
  open_device(mock, dev);

  Frame& status = mock.reply(0x10);

  SUBCASE("ADC channel")
  {
    status[52] = 0x1F;
    status[53] = 0x00;
    uint16_t value = 0;
    REQUIRE(dev.read_adc(1, value) == ErrorCode::OK);
    CHECK(value == 31);
    CHECK(mock.written[0][0] == 0x10);
  }

  SUBCASE("ADC channel out of range")
  {
    uint16_t value = 0;
    CHECK(dev.read_adc(3, value) == ErrorCode::INVALID_PARAMETER);
    CHECK(mock.written.empty());
  }

  SUBCASE("Firmware version")
  {
    status[46] = '1';
    status[47] = '.';
    status[48] = '2';
    status[49] = '0';
    std::string version;
    REQUIRE(dev.read_firmware_version(version) == ErrorCode::OK);
    CHECK(version == "1.20");
  }

  SUBCASE("Interrupt flag")
  {
    status[24] = 0x01;
    bool flag = false;
    REQUIRE(dev.read_interrupt_flag(flag) == ErrorCode::OK);
    CHECK(flag);
  }

  SUBCASE("I2C engine state")
  {
    status[9] = 0x34;
    status[10] = 0x12;
    status[13] = 7;
    status[16] = 0xA0;
    status[22] = 1;
    status[25] = 2;

    uint16_t length = 0;
    REQUIRE(dev.i2c_requested_transfer_length(length) == ErrorCode::OK);
    CHECK(length == 0x1234);

    uint8_t counter = 0;
    REQUIRE(dev.i2c_internal_buffer_counter(counter) == ErrorCode::OK);
    CHECK(counter == 7);

    uint16_t address = 0;
    REQUIRE(dev.i2c_slave_address(address) == ErrorCode::OK);
    CHECK(address == 0xA0);

    bool scl = false;
    bool sda = true;
    REQUIRE(dev.i2c_scl_state(scl) == ErrorCode::OK);
    REQUIRE(dev.i2c_sda_state(sda) == ErrorCode::OK);
    CHECK(scl);
    CHECK_FALSE(sda);

    uint8_t pending = 0;
    REQUIRE(dev.i2c_has_pending_value(pending) == ErrorCode::OK);
    CHECK(pending == 2);
  }
}

TEST_CASE("SRAM setting encodings")
{
  MockTransport mock;
  Device dev(mock);
  open_device(mock, dev);

  // Zeroed SRAM settings, pins in GPIO mode
  Frame& sram = mock.reply(0x61);
  for (size_t i = 4; i < FRAME_SIZE; ++i)
  {
    sram[i] = 0;
  }

  SUBCASE("DAC value")
  {
    REQUIRE(dev.write_dac(31) == ErrorCode::OK);
    REQUIRE(mock.opcodes() == std::vector<uint8_t>{0x51, 0x61, 0x60});
    CHECK(mock.written.back()[4] == 0x9F);
    CHECK(mock.written.back()[7] == 0x00);
  }

  SUBCASE("Clock duty cycle")
  {
    REQUIRE(dev.write_clock_output_duty_cycle(ClockDutyCycle::PERCENT_75) == ErrorCode::OK);
    CHECK(mock.written.back()[2] == 0x98);
  }

  SUBCASE("Clock frequency keeps the duty cycle")
  {
    sram[5] = 0x10;
    REQUIRE(dev.write_clock_output_frequency(ClockFrequency::CLOCK_375KHZ) == ErrorCode::OK);
    CHECK(mock.written.back()[2] == 0x97);
  }

  SUBCASE("DAC reference")
  {
    REQUIRE(dev.write_dac_reference_voltage(ReferenceVoltageValue::VOLTAGE_4_096V) ==
            ErrorCode::OK);
    CHECK(mock.written.back()[3] == 0x86);
    REQUIRE(dev.write_dac_reference_source(ReferenceVoltageSource::INTERNAL) == ErrorCode::OK);
    CHECK(mock.written.back()[3] == 0x81);
  }

  SUBCASE("ADC reference")
  {
    REQUIRE(dev.write_adc_reference_voltage(ReferenceVoltageValue::VOLTAGE_4_096V) ==
            ErrorCode::OK);
    CHECK(mock.written.back()[5] == 0x86);
    REQUIRE(dev.write_adc_reference_source(ReferenceVoltageSource::INTERNAL) == ErrorCode::OK);
    CHECK(mock.written.back()[5] == 0x81);
  }

  SUBCASE("Interrupt edges")
  {
    REQUIRE(dev.write_interrupt_on_falling_edge(true) == ErrorCode::OK);
    CHECK(mock.written.back()[6] == 0x98);
    REQUIRE(dev.write_interrupt_on_falling_edge(false) == ErrorCode::OK);
    CHECK(mock.written.back()[6] == 0x90);
    REQUIRE(dev.write_interrupt_on_rising_edge(true) == ErrorCode::OK);
    CHECK(mock.written.back()[6] == 0x86);
    REQUIRE(dev.write_interrupt_on_rising_edge(false) == ErrorCode::OK);
    CHECK(mock.written.back()[6] == 0x84);
    REQUIRE(dev.clear_interrupt_flag() == ErrorCode::OK);
    CHECK(mock.written.back()[6] == 0x81);
  }

  SUBCASE("Read-back from SRAM")
  {
    sram[5] = 0b00011000;
    ClockDutyCycle duty = ClockDutyCycle::PERCENT_0;
    REQUIRE(dev.read_clock_output_duty_cycle(duty) == ErrorCode::OK);
    CHECK(duty == ClockDutyCycle::PERCENT_75);

    sram[6] = 0b11000000;
    ReferenceVoltageValue vref = ReferenceVoltageValue::OFF;
    REQUIRE(dev.read_dac_reference_voltage(vref) == ErrorCode::OK);
    CHECK(vref == ReferenceVoltageValue::VOLTAGE_4_096V);

    sram[7] = 1 << 6;
    bool falling = false;
    REQUIRE(dev.read_interrupt_on_falling_edge(falling) == ErrorCode::OK);
    CHECK(falling);
  }

  SUBCASE("Undefined code in SRAM")
  {
    sram[5] = 0x00;  // frequency 0 is not a clock setting
    ClockFrequency freq = ClockFrequency::CLOCK_24MHZ;
    CHECK(dev.read_clock_output_frequency(freq) == ErrorCode::INVALID_RESPONSE);
  }
}

/* ========================================================================= */
/* Flash Tests                                                               */
/* ========================================================================= */

TEST_CASE("Flash Chip-Settings writes")
{
  MockTransport mock;
  Device dev(mock, "secret");
  open_device(mock, dev);
  mock.reply(0xB0) = test::flash_chip_settings_reply();

  SUBCASE("Password is appended and other bits are kept")
  {
    REQUIRE(dev.write_cdc_sn_enumeration_enable(false) == ErrorCode::OK);
    REQUIRE(mock.opcodes() == std::vector<uint8_t>{0xB0, 0xB1});

    const Frame& cmd = mock.written[1];
    CHECK(cmd[1] == 0x00);
    CHECK(cmd[2] == 0x7C);  // 124 with bit 7 already clear
    CHECK(cmd[3] == 18);
    CHECK(cmd[11] == 50);
    CHECK(std::string(cmd.begin() + 12, cmd.begin() + 18) == "secret");
    CHECK(cmd[18] == 0x00);
  }

  SUBCASE("Unlock replaces the cached password")
  {
    REQUIRE(dev.unlock("abc") == ErrorCode::OK);
    CHECK(mock.written[0][0] == 0xB2);
    CHECK(mock.written[0][1] == 0x00);
    CHECK(mock.written[0][2] == 'a');

    REQUIRE(dev.write_usb_vid(0x1234) == ErrorCode::OK);
    const Frame& cmd = mock.written.back();
    CHECK(cmd[6] == 0x34);
    CHECK(cmd[7] == 0x12);
    CHECK(std::string(cmd.begin() + 12, cmd.begin() + 15) == "abc");
    CHECK(cmd[15] == 0x00);
  }

  SUBCASE("Password length")
  {
    CHECK(dev.unlock("123456789") == ErrorCode::INVALID_PARAMETER);
    CHECK(dev.write_flash_access_password("123456789") == ErrorCode::INVALID_PARAMETER);
    CHECK(mock.written.empty());
  }

  SUBCASE("USB identity")
  {
    uint16_t vid = 0;
    uint16_t pid = 0;
    REQUIRE(dev.read_usb_vid(vid) == ErrorCode::OK);
    REQUIRE(dev.read_usb_pid(pid) == ErrorCode::OK);
    CHECK(vid == 0x04D8);
    CHECK(pid == 0x00DD);

    uint16_t current = 0;
    REQUIRE(dev.read_usb_current(current) == ErrorCode::OK);
    CHECK(current == 100);
    CHECK(dev.write_usb_current(512) == ErrorCode::INVALID_PARAMETER);

    bool self_powered = false;
    REQUIRE(dev.read_usb_self_powered_attribute(self_powered) == ErrorCode::OK);
    CHECK_FALSE(self_powered);
  }

  SUBCASE("Flash targets of dual-space settings")
  {
    REQUIRE(dev.write_clock_output_frequency(ClockFrequency::CLOCK_375KHZ, MemoryType::FLASH) ==
            ErrorCode::OK);
    CHECK(mock.written.back()[0] == 0xB1);
    CHECK(mock.written.back()[3] == 0x17);

    dev.set_default_memory_target(MemoryType::FLASH);
    REQUIRE(dev.write_interrupt_on_rising_edge(false) == ErrorCode::OK);
    CHECK(mock.written.back()[0] == 0xB1);
    CHECK(mock.written.back()[5] == 0x4C);
  }

  SUBCASE("Undefined security option")
  {
    mock.reply(0xB0)[4] = 0x03;
    SecurityOption option = SecurityOption::UNSECURED;
    CHECK(dev.read_security_option(option) == ErrorCode::INVALID_RESPONSE);
  }
}

TEST_CASE("USB string descriptors")
{
  MockTransport mock;
  Device dev(mock);
  open_device(mock, dev);

  SUBCASE("Read")
  {
    Frame& block = mock.reply(0xB0);
    block[2] = 8;
    block[4] = 'M';
    block[6] = 'C';
    block[8] = 'P';
    block[10] = 0x03;

    std::string value;
    REQUIRE(dev.read_usb_product_descriptor(value) == ErrorCode::OK);
    CHECK(value == "MCP");
    CHECK(mock.written[0][1] == 0x03);
  }

  SUBCASE("Write")
  {
    REQUIRE(dev.write_usb_manufacturer_descriptor("Acme") == ErrorCode::OK);
    const Frame& cmd = mock.written.back();
    CHECK(cmd[0] == 0xB1);
    CHECK(cmd[1] == 0x02);
    CHECK(cmd[2] == 10);
    CHECK(cmd[3] == 0x03);
    CHECK(cmd[4] == 'A');
  }

  SUBCASE("Too long")
  {
    CHECK(dev.write_usb_serial_number_descriptor(std::string(31, 'x')) ==
          ErrorCode::INVALID_PARAMETER);
    CHECK(mock.written.empty());
  }

  SUBCASE("Factory serial")
  {
    REQUIRE(dev.write_chip_factory_serial_number("SN01") == ErrorCode::OK);
    const Frame& cmd = mock.written.back();
    CHECK(cmd[1] == 0x05);
    CHECK(cmd[2] == 4);
    CHECK(cmd[3] == 0x03);
    CHECK(cmd[4] == 'S');
    CHECK(dev.write_chip_factory_serial_number(std::string(61, 'x')) ==
          ErrorCode::INVALID_PARAMETER);
  }
}

/* ========================================================================= */
/* I2C Tests                                                                 */
/* ========================================================================= */

TEST_CASE("I2C speed")
{
  MockTransport mock;
  Device dev(mock);
  open_device(mock, dev);
  I2cSpeedResponse response = I2cSpeedResponse::NO_OP;

  SUBCASE("Divisor")
  {
    mock.reply(0x10)[3] = 0x20;
    REQUIRE(dev.i2c_write_speed(100000, response) == ErrorCode::OK);
    CHECK(response == I2cSpeedResponse::SPEED_CONSIDERED);

    const Frame& cmd = mock.written[0];
    CHECK(cmd[0] == 0x10);
    CHECK(cmd[1] == 0x00);
    CHECK(cmd[2] == 0x00);
    CHECK(cmd[3] == 0x20);
    CHECK(cmd[4] == 117);
  }

  SUBCASE("Bounds")
  {
    CHECK(dev.i2c_write_speed(46333, response) == ErrorCode::OK);
    CHECK(dev.i2c_write_speed(4000000, response) == ErrorCode::OK);
    CHECK(dev.i2c_write_speed(46332, response) == ErrorCode::INVALID_PARAMETER);
    CHECK(dev.i2c_write_speed(4000001, response) == ErrorCode::INVALID_PARAMETER);
    CHECK(mock.written.size() == 2);
  }

  SUBCASE("Read back")
  {
    mock.reply(0x10)[14] = 117;
    uint32_t speed = 0;
    REQUIRE(dev.i2c_read_speed(speed) == ErrorCode::OK);
    CHECK(speed == 100000);
  }

  SUBCASE("Cancel")
  {
    mock.reply(0x10)[2] = 0x10;
    I2cCancelResponse cancel = I2cCancelResponse::NO_OP;
    REQUIRE(dev.i2c_cancel_transfer(cancel) == ErrorCode::OK);
    CHECK(cancel == I2cCancelResponse::MARKED_FOR_CANCELLATION);
    CHECK(mock.written[0][2] == 0x10);
  }
}

TEST_CASE("I2C write")
{
  MockTransport mock;
  Device dev(mock);
  open_device(mock, dev);

  SUBCASE("Chunks of 60 bytes")
  {
    std::vector<uint8_t> data(500);
    for (size_t i = 0; i < data.size(); ++i)
    {
      data[i] = static_cast<uint8_t>(i);
    }

    REQUIRE(dev.i2c_write_data(0x50, data) == ErrorCode::OK);
    REQUIRE(mock.written.size() == 9);
    for (const Frame& cmd : mock.written)
    {
      CHECK(cmd[0] == 0x90);
      CHECK(cmd[1] == 0xF4);
      CHECK(cmd[2] == 0x01);
      CHECK(cmd[3] == 0xA0);
    }
    CHECK(mock.written[1][4] == 60);
    CHECK(mock.written[8][4] == static_cast<uint8_t>(480));
    CHECK(mock.written[8][23] == static_cast<uint8_t>(499));
    CHECK(mock.written[8][24] == 0x00);
  }

  SUBCASE("Busy engine is retried")
  {
    mock.enqueue(0x92)[1] = I2C_STATUS_BUSY;
    mock.enqueue(0x92)[1] = I2C_STATUS_BUSY;
    REQUIRE(dev.i2c_write_data(0x20, {0x01, 0x02}, I2cMode::REPEATED_START) == ErrorCode::OK);
    CHECK(mock.written.size() == 3);
  }

  SUBCASE("Other failure status")
  {
    mock.enqueue(0x94)[1] = 0x02;
    CHECK(dev.i2c_write_data(0x20, {0x01}, I2cMode::NO_STOP) == ErrorCode::COMMAND_FAILED);
    CHECK(dev.last_status() == 0x02);
  }

  SUBCASE("Invalid parameters")
  {
    CHECK(dev.i2c_write_data(0x80, {0x01}) == ErrorCode::INVALID_PARAMETER);
    CHECK(dev.i2c_write_data(0x20, std::vector<uint8_t>(0x10000)) ==
          ErrorCode::INVALID_PARAMETER);
    CHECK(mock.written.empty());
  }
}

TEST_CASE("I2C read")
{
  MockTransport mock;
  Device dev(mock);
  open_device(mock, dev);
  std::vector<uint8_t> data;

  SUBCASE("Request then fetch")
  {
    Frame& fetch = mock.reply(0x40);
    fetch[3] = 4;
    fetch[4] = 0xDE;
    fetch[5] = 0xAD;
    fetch[6] = 0xBE;
    fetch[7] = 0xEF;

    REQUIRE(dev.i2c_read_data(0x50, 4, data) == ErrorCode::OK);
    CHECK(data == std::vector<uint8_t>{0xDE, 0xAD, 0xBE, 0xEF});

    REQUIRE(mock.opcodes() == std::vector<uint8_t>{0x91, 0x40});
    CHECK(mock.written[0][1] == 4);
    CHECK(mock.written[0][2] == 0);
    CHECK(mock.written[0][3] == 0xA1);
  }

  SUBCASE("Long read takes several fetches")
  {
    mock.reply(0x40)[3] = 60;
    REQUIRE(dev.i2c_read_data(0x50, 100, data, I2cMode::REPEATED_START) == ErrorCode::OK);
    CHECK(data.size() == 100);
    CHECK(mock.opcodes() == std::vector<uint8_t>{0x93, 0x40, 0x40});
  }

  SUBCASE("Slave did not answer")
  {
    mock.reply(0x40)[1] = I2C_STATUS_READ_ERROR;
    CHECK(dev.i2c_read_data(0x50, 4, data) == ErrorCode::I2C_SLAVE_NO_RESPONSE);
  }

  SUBCASE("Slave reported an error")
  {
    mock.reply(0x40)[3] = I2C_DATA_LENGTH_ERROR;
    CHECK(dev.i2c_read_data(0x50, 4, data) == ErrorCode::I2C_SLAVE_ERROR);
  }

  SUBCASE("No-stop mode")
  {
    CHECK(dev.i2c_read_data(0x50, 4, data, I2cMode::NO_STOP) == ErrorCode::INVALID_PARAMETER);
    CHECK(mock.written.empty());
  }
}

/* ========================================================================= */
/* GPIO Tests                                                                */
/* ========================================================================= */

TEST_CASE("GPIO runtime access")
{
  MockTransport mock;
  Device dev(mock);
  open_device(mock, dev);

  Frame& gpio = mock.reply(0x51);

  SUBCASE("Pin index")
  {
    bool value = false;
    GpioDirection dir = GpioDirection::OUTPUT;
    CHECK(dev.gpio_read_value(4, value) == ErrorCode::INVALID_PARAMETER);
    CHECK(dev.gpio_write_value(4, true) == ErrorCode::INVALID_PARAMETER);
    CHECK(dev.gpio_read_direction(4, dir) == ErrorCode::INVALID_PARAMETER);
    CHECK(dev.gpio_write_powerup_value(4, true) == ErrorCode::INVALID_PARAMETER);
    CHECK(mock.written.empty());
  }

  SUBCASE("Value of a pin not in GPIO mode")
  {
    WarningLog log;
    dev.set_warning_handler(&WarningLog::record, &log);
    gpio[4] = GPIO_VALUE_NOT_SET;

    bool value = false;
    REQUIRE(dev.gpio_read_value(1, value) == ErrorCode::OK);
    CHECK(value);
    REQUIRE(log.codes.size() == 1);
    CHECK(log.codes[0] == ErrorCode::PIN_NOT_GPIO);
  }

  SUBCASE("Warnings discarded on request")
  {
    dev.set_warning_handler(nullptr);
    gpio[4] = GPIO_VALUE_NOT_SET;

    bool value = false;
    CHECK(dev.gpio_read_value(1, value) == ErrorCode::OK);
    CHECK(value);
  }

  SUBCASE("Value of a GPIO pin")
  {
    WarningLog log;
    dev.set_warning_handler(&WarningLog::record, &log);
    gpio[6] = 0x01;

    bool value = false;
    REQUIRE(dev.gpio_read_value(2, value) == ErrorCode::OK);
    CHECK(value);
    CHECK(log.codes.empty());
  }

  SUBCASE("Direction")
  {
    gpio[9] = 0x01;
    gpio[5] = 0xEF;
    GpioDirection dir = GpioDirection::OUTPUT;
    REQUIRE(dev.gpio_read_direction(3, dir) == ErrorCode::OK);
    CHECK(dir == GpioDirection::INPUT);
    REQUIRE(dev.gpio_read_direction(1, dir) == ErrorCode::OK);
    CHECK(dir == GpioDirection::NOT_SET);
  }

  SUBCASE("Write value")
  {
    REQUIRE(dev.gpio_write_value(2, true) == ErrorCode::OK);
    const Frame& cmd = mock.written[0];
    CHECK(cmd[0] == 0x50);
    CHECK(cmd[10] == 0x01);
    CHECK(cmd[11] == 0x01);
    CHECK(cmd[12] == 0x00);
    CHECK(cmd[2] == 0x00);
  }

  SUBCASE("Write direction")
  {
    REQUIRE(dev.gpio_write_direction(0, GpioDirection::INPUT) == ErrorCode::OK);
    const Frame& cmd = mock.written[0];
    CHECK(cmd[2] == 0x00);
    CHECK(cmd[4] == 0x01);
    CHECK(cmd[5] == 0x01);
    CHECK(dev.gpio_write_direction(0, GpioDirection::NOT_SET) == ErrorCode::INVALID_PARAMETER);
  }
}

TEST_CASE("GPIO pin function in SRAM")
{
  MockTransport mock;
  Device dev(mock);
  open_device(mock, dev);

  // Pins 0, 1, 3: GPIO input with value 1. Pin 2: ADC.
  Frame& gpio = mock.reply(0x51);
  gpio[2] = 1;
  gpio[3] = 1;
  gpio[4] = 1;
  gpio[5] = 1;
  gpio[6] = GPIO_VALUE_NOT_SET;
  gpio[7] = 0xEF;
  gpio[8] = 1;
  gpio[9] = 1;

  Frame& sram = mock.reply(0x61);
  sram[6] = 0x40;
  sram[7] = 0x0C;
  sram[22] = 0x18;
  sram[23] = 0x18;
  sram[24] = 0x02;
  sram[25] = 0x18;

  SUBCASE("Other pins keep direction and value")
  {
    REQUIRE(dev.gpio2_write_function(Gpio2Function::DAC1) == ErrorCode::OK);
    REQUIRE(mock.opcodes() == std::vector<uint8_t>{0x61, 0x51, 0x51, 0x61, 0x60, 0x60});

    const Frame& pins = mock.written[4];
    CHECK(pins[7] == 0x80);
    CHECK(pins[8] == 0x18);
    CHECK(pins[9] == 0x18);
    CHECK(pins[10] == 0x03);
    CHECK(pins[11] == 0x18);

    // Voltage references restored afterwards
    const Frame& vref = mock.written[5];
    CHECK(vref[3] == 0x82);
    CHECK(vref[5] == 0x83);
    CHECK(vref[7] == 0x00);
  }

  SUBCASE("GPIO pin keeps its own state")
  {
    REQUIRE(dev.gpio1_write_function(Gpio1Function::GPIO) == ErrorCode::OK);
    CHECK(mock.written[4][9] == 0x18);
  }

  SUBCASE("Read-back")
  {
    Gpio2Function function = Gpio2Function::GPIO;
    REQUIRE(dev.gpio2_read_function(function) == ErrorCode::OK);
    CHECK(function == Gpio2Function::ADC2);
  }

  SUBCASE("Function outside the pin's set")
  {
    CHECK(dev.gpio0_write_function(static_cast<Gpio0Function>(3)) ==
          ErrorCode::INVALID_PARAMETER);
    CHECK(mock.written.empty());
  }
}

TEST_CASE("GPIO power-up state")
{
  MockTransport mock;
  Device dev(mock, "pw");
  open_device(mock, dev);

  Frame& block = mock.reply(0xB0);
  block[2] = 4;
  block[4] = 0x10;
  block[5] = 0x02;

  SUBCASE("Value")
  {
    bool value = false;
    REQUIRE(dev.gpio_read_powerup_value(0, value) == ErrorCode::OK);
    CHECK(value);
  }

  SUBCASE("Direction forces the GPIO function first")
  {
    REQUIRE(dev.gpio_write_powerup_direction(1, GpioDirection::INPUT) == ErrorCode::OK);
    REQUIRE(mock.opcodes() == std::vector<uint8_t>{0xB0, 0xB1, 0xB0, 0xB1});

    CHECK(mock.written[1][1] == 0x01);
    CHECK(mock.written[1][3] == 0x00);
    CHECK(mock.written[3][3] == 0x0A);
    CHECK(mock.written[3][6] == 0x00);  // no password on GP-Settings
  }
}

/* ========================================================================= */
/* Reset Tests                                                               */
/* ========================================================================= */

TEST_CASE("Chip reset")
{
  MockTransport mock;
  Device dev(mock);
  open_device(mock, dev);

  SUBCASE("Disconnect is not an error")
  {
    mock.fail_write = true;
    CHECK(dev.reset_chip() == ErrorCode::OK);
    CHECK_FALSE(dev.is_open());

    const Frame& cmd = mock.written[0];
    CHECK(cmd[0] == 0x70);
    CHECK(cmd[1] == 0xAB);
    CHECK(cmd[2] == 0xCD);
    CHECK(cmd[3] == 0xEF);
  }

  SUBCASE("No reply")
  {
    mock.empty_reply = true;
    CHECK(dev.reset_chip() == ErrorCode::OK);
    CHECK_FALSE(dev.is_open());
  }
}
