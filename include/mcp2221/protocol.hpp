/**
 * @file protocol.hpp
 * @brief MCP2221 HID protocol definitions
 *
 * Command codes, register sub-codes, setting enumerations and error codes
 * of the MCP2221/MCP2221A USB-HID bridge.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace mcp2221
{

/* ========================================================================= */
/* Frame format constants                                                    */
/* ========================================================================= */

/**
 * @brief HID report size in bytes
 *
 * Commands and responses are always exactly this long.
 */
constexpr size_t FRAME_SIZE = 64;

/**
 * @brief Maximum payload size of a command frame (everything after the opcode)
 */
constexpr size_t MAX_PAYLOAD_SIZE = FRAME_SIZE - 1;

/** @brief Default USB vendor ID of the chip family (Microchip) */
constexpr uint16_t DEFAULT_VENDOR_ID = 0x04D8;

/** @brief Default USB product ID of the chip family */
constexpr uint16_t DEFAULT_PRODUCT_ID = 0x00DD;

constexpr size_t GPIO_PIN_COUNT = 4;
constexpr size_t ADC_CHANNEL_COUNT = 3;

constexpr size_t MAX_PASSWORD_LENGTH = 8;
constexpr size_t MAX_USB_STRING_LENGTH = 30;  ///< UTF-16 code units
constexpr size_t MAX_FACTORY_SERIAL_LENGTH = 60;
constexpr uint16_t MAX_USB_CURRENT_MA = 510;

/** @brief I2C engine clock used by the speed divisor */
constexpr uint32_t I2C_CLOCK_HZ = 12000000;
constexpr uint32_t I2C_MIN_SPEED_HZ = 46333;
constexpr uint32_t I2C_MAX_SPEED_HZ = 4000000;
constexpr uint8_t I2C_MAX_ADDRESS = 0x7F;
constexpr size_t I2C_MAX_TRANSFER_LENGTH = 0xFFFF;

/** @brief Maximum data bytes carried by one I2C frame */
constexpr size_t I2C_CHUNK_SIZE = 60;

/**
 * Command frame:
 *
 * [OPCODE][PAYLOAD...][0x00 padding]   (64 bytes)
 *
 * Response frame:
 *
 * [OPCODE][STATUS][DATA...]            (64 bytes)
 *
 * - OPCODE: echoes the command opcode
 * - STATUS: 0x00 on success, opcode-specific failure code otherwise
 *
 * Some hosts need an extra leading report-ID byte on write; this is handled
 * by the transport and never seen here.
 */
using Frame = std::array<uint8_t, FRAME_SIZE>;

/* ========================================================================= */
/* Command codes                                                             */
/* ========================================================================= */

enum class Command : uint8_t
{
  /**
   * @brief Status / set parameters
   *
   * Without arguments: returns I2C engine state, ADC values, firmware version.
   * Byte 2 = 0x10 cancels the current I2C transfer, byte 3 = 0x20 sets the
   * I2C speed divisor from byte 4.
   */
  STATUS = 0x10,

  /** @brief Fetch data gathered by a previous I2C read */
  I2C_GET_DATA = 0x40,

  /** @brief Runtime GPIO direction/value (alter flags per pin) */
  SET_GPIO = 0x50,

  /** @brief Runtime GPIO direction/value read-back */
  GET_GPIO = 0x51,

  /**
   * @brief Write SRAM settings
   *
   * Also the GP designation command: bytes 8..11 carry the four pin settings
   * and are applied when byte 7 has bit 7 set.
   */
  SET_SRAM = 0x60,

  /** @brief Read SRAM Chip-Settings and GP-Settings blocks */
  GET_SRAM = 0x61,

  /**
   * @brief Reset chip
   *
   * The device disconnects immediately; no response is expected.
   */
  RESET = 0x70,

  I2C_WRITE = 0x90,
  I2C_READ = 0x91,
  I2C_WRITE_REPEATED_START = 0x92,
  I2C_READ_REPEATED_START = 0x93,
  I2C_WRITE_NO_STOP = 0x94,

  READ_FLASH = 0xB0,
  WRITE_FLASH = 0xB1,

  /** @brief Send flash access password */
  UNLOCK = 0xB2,
};

/** @brief Register blocks reachable with READ_FLASH / WRITE_FLASH */
enum class FlashSubcode : uint8_t
{
  CHIP_SETTINGS = 0x00,
  GP_SETTINGS = 0x01,
  USB_MANUFACTURER = 0x02,
  USB_PRODUCT = 0x03,
  USB_SERIAL_NUMBER = 0x04,
  CHIP_FACTORY_SERIAL = 0x05,
};

/** @brief Register blocks reachable with GET_SRAM / SET_SRAM */
enum class SramSubcode : uint8_t
{
  CHIP_SETTINGS = 0x00,
  GP_SETTINGS = 0x01,
};

/* ========================================================================= */
/* Device status codes                                                       */
/* ========================================================================= */

/** @brief STATUS byte of an I2C write/read request while the engine is busy */
constexpr uint8_t I2C_STATUS_BUSY = 0x01;

/** @brief STATUS byte of I2C_GET_DATA when the slave did not answer */
constexpr uint8_t I2C_STATUS_READ_ERROR = 0x41;

/** @brief Data-length byte of I2C_GET_DATA when the slave reported an error */
constexpr uint8_t I2C_DATA_LENGTH_ERROR = 0x7F;

/** @brief GET_GPIO value byte for a pin not assigned to GPIO */
constexpr uint8_t GPIO_VALUE_NOT_SET = 0xEE;

/** @brief Bit 7 of an SRAM setting byte: apply this byte */
constexpr uint8_t SRAM_ENABLE_BIT = 0x80;

/* ========================================================================= */
/* Setting enumerations                                                      */
/* ========================================================================= */

enum class MemoryType : uint8_t
{
  SRAM = 0x00,
  FLASH = 0x01,
};

enum class ClockDutyCycle : uint8_t
{
  PERCENT_0 = 0x00,
  PERCENT_25 = 0x01,
  PERCENT_50 = 0x02,
  PERCENT_75 = 0x03,
};

enum class ClockFrequency : uint8_t
{
  CLOCK_24MHZ = 0x01,
  CLOCK_12MHZ = 0x02,
  CLOCK_6MHZ = 0x03,
  CLOCK_3MHZ = 0x04,
  CLOCK_1_5MHZ = 0x05,
  CLOCK_750KHZ = 0x06,
  CLOCK_375KHZ = 0x07,
};

enum class ReferenceVoltageValue : uint8_t
{
  OFF = 0x00,
  VOLTAGE_1_024V = 0x01,
  VOLTAGE_2_048V = 0x02,
  VOLTAGE_4_096V = 0x03,
};

enum class ReferenceVoltageSource : uint8_t
{
  VDD = 0x00,
  INTERNAL = 0x01,
};

enum class SecurityOption : uint8_t
{
  UNSECURED = 0x00,
  PASSWORD_PROTECTED = 0x01,
  PERMANENTLY_LOCKED = 0x02,
};

enum class GpioDirection : uint8_t
{
  OUTPUT = 0x00,
  INPUT = 0x01,
  NOT_SET = 0xEF,  ///< reported for pins not assigned to GPIO
};

enum class Gpio0Function : uint8_t
{
  GPIO = 0x00,
  USB_SUSPEND = 0x01,
  UART_RX_LED = 0x02,
};

enum class Gpio1Function : uint8_t
{
  GPIO = 0x00,
  CLOCK_OUTPUT = 0x01,
  ADC1 = 0x02,
  UART_TX_LED = 0x03,
  INTERRUPT = 0x04,
};

enum class Gpio2Function : uint8_t
{
  GPIO = 0x00,
  USB_CONFIGURED = 0x01,
  ADC2 = 0x02,
  DAC1 = 0x03,
};

enum class Gpio3Function : uint8_t
{
  GPIO = 0x00,
  I2C_LED = 0x01,
  ADC3 = 0x02,
  DAC2 = 0x03,
};

enum class I2cMode : uint8_t
{
  START = 0x90,
  REPEATED_START = 0x92,
  NO_STOP = 0x94,
};

enum class I2cCancelResponse : uint8_t
{
  NO_OP = 0x00,
  MARKED_FOR_CANCELLATION = 0x10,
  IN_IDLE_MODE = 0x11,
};

enum class I2cSpeedResponse : uint8_t
{
  NO_OP = 0x00,
  SPEED_CONSIDERED = 0x20,
  SPEED_NOT_SET = 0x21,
};

/* ========================================================================= */
/* Error codes                                                               */
/* ========================================================================= */

/**
 * @brief Driver error codes
 *
 * Defined via errors.def for consistency with the C API.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "mcp2221/errors.def"
#undef ERR
};

/** @brief Device unreachable: not opened, open failed, or transport failure */
constexpr bool is_connectivity_error(ErrorCode err)
{
  return (static_cast<uint8_t>(err) & 0xF0) == 0x10;
}

/** @brief Device answered but the answer was not usable */
constexpr bool is_protocol_error(ErrorCode err)
{
  return (static_cast<uint8_t>(err) & 0xF0) == 0x20;
}

constexpr bool is_warning(ErrorCode err)
{
  return (static_cast<uint8_t>(err) & 0xF0) == 0x40;
}

/**
 * @brief Get error message string
 * @param err Error code
 * @return Error message (static string)
 */
const char* error_message(ErrorCode err);

}  // namespace mcp2221
