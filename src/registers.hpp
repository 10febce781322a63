/**
 * @file registers.hpp
 * @brief SRAM/flash register image access (internal)
 *
 * Pure encode/decode helpers behind the Device register operations. Flash and
 * SRAM images have different layouts; every function here names the memory
 * space it works on.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "mcp2221/protocol.hpp"

namespace mcp2221
{
namespace internal
{

constexpr size_t MAX_REGISTER_BYTE = 8;
constexpr uint8_t MAX_REGISTER_BIT = 7;

/** @brief Offset of the data area in READ_FLASH / GET_SRAM responses */
constexpr size_t BLOCK_DATA_OFFSET = 4;

/* ========================================================================= */
/* Bit fields                                                                */
/* ========================================================================= */

/**
 * @brief Validate a bit-field descriptor
 *
 * @param byte Register byte index (0 to MAX_REGISTER_BYTE)
 * @param bits Bit indices within the byte (0 to MAX_REGISTER_BIT)
 * @return ErrorCode::OK or INVALID_PARAMETER
 */
ErrorCode check_bit_access(size_t byte, const std::vector<uint8_t>& bits);

/**
 * @brief Extract bits from one byte of a register image
 *
 * @param image Register image
 * @param byte  Byte index
 * @param bits  Bit indices, in the order the results are wanted
 * @param out   Bit values, one per entry of @p bits
 * @return INVALID_PARAMETER for bad indices, INVALID_RESPONSE if the image
 *         is shorter than @p byte
 */
ErrorCode read_bits(const std::vector<uint8_t>& image, size_t byte,
                    const std::vector<uint8_t>& bits, std::vector<bool>& out);

/**
 * @brief Overwrite bits of one image byte, leaving the others untouched
 */
ErrorCode patch_bits(std::vector<uint8_t>& image, size_t byte, const std::vector<uint8_t>& bits,
                     const std::vector<bool>& values);

/** @brief Pack a bit list (LSB first) into a value */
uint8_t bits_to_value(const std::vector<bool>& bits);

/** @brief Unpack the @p width low bits of @p value (LSB first) */
std::vector<bool> value_to_bits(uint8_t value, size_t width);

/* ========================================================================= */
/* Block extraction                                                          */
/* ========================================================================= */

/**
 * @brief Extract the register block of a READ_FLASH response
 *
 * Response: [B0][STATUS][LEN][xx][DATA...]; the data is clamped to the frame.
 */
ErrorCode extract_flash_block(const Frame& response, std::vector<uint8_t>& out);

/**
 * @brief Extract a register block of a GET_SRAM response
 *
 * Response: [61][STATUS][CS_LEN][GP_LEN][CHIP SETTINGS...][GP SETTINGS...]
 * The GP-Settings block starts right after the Chip-Settings block.
 */
ErrorCode extract_sram_block(const Frame& response, SramSubcode code, std::vector<uint8_t>& out);

/* ========================================================================= */
/* Write frames                                                              */
/* ========================================================================= */

/**
 * @brief Build a WRITE_FLASH frame for a register image
 *
 * Frame: [B1][SUBCODE][IMAGE...][PASSWORD...]. The Chip-Settings block always
 * carries the password field, even when protection is disabled, so
 * @p password is appended (possibly empty) for that sub-code only.
 *
 * @return INVALID_PARAMETER if the result does not fit in one frame
 */
ErrorCode build_flash_write(FlashSubcode code, const std::vector<uint8_t>& image,
                            const std::string& password, Frame& out);

/**
 * @brief Build a SET_SRAM frame changing one setting byte
 *
 * SET_SRAM doubles as the GP designation command, so the frame re-asserts all
 * four pins: a pin in GPIO mode (GET_GPIO value byte <= 1) gets its current
 * value and direction, any other pin gets its raw SRAM GP byte back. The
 * target byte is then placed at 2 + byte (Chip-Settings) or 8 + byte
 * (GP-Settings, with the alter-GP flag set in byte 7).
 *
 * @param gpio_state GET_GPIO response
 * @param sram_gp    SRAM GP-Settings image (4 bytes)
 * @param code       Target block
 * @param byte       Byte index within the SET_SRAM layout of @p code
 * @param value      Byte value
 * @param out        Output frame
 */
ErrorCode build_sram_write(const Frame& gpio_state, const std::vector<uint8_t>& sram_gp,
                           SramSubcode code, size_t byte, uint8_t value, Frame& out);

/** @brief SET_SRAM frame replacing the four GP designations */
ErrorCode build_gp_designation(const std::vector<uint8_t>& pins, Frame& out);

/**
 * @brief Temporary GP designations used to settle the ADC at open time
 *
 * Pins 1 to 3 in GPIO input mode are switched to ADC and pins in ADC mode to
 * GPIO input; everything else is kept.
 */
std::vector<uint8_t> sanitized_pin_settings(const std::vector<uint8_t>& pins);

/**
 * @brief Build a SET_GPIO frame touching one pin
 *
 * Per pin n, four bytes at 2 + 4n: [ALTER_VALUE][VALUE][ALTER_DIR][DIR].
 */
void build_gpio_set(size_t pin, bool alter_value, uint8_t value, bool alter_direction,
                    uint8_t direction, Frame& out);

/* ========================================================================= */
/* USB string descriptors                                                    */
/* ========================================================================= */

/**
 * @brief Build a WRITE_FLASH frame for a USB string descriptor
 *
 * Frame: [B1][SUBCODE][2N+2][0x03][UTF-16LE...]
 *
 * @param value UTF-8 string, at most MAX_USB_STRING_LENGTH UTF-16 code units
 */
ErrorCode build_usb_string_write(FlashSubcode code, const std::string& value, Frame& out);

/**
 * @brief Decode a USB string descriptor block
 *
 * Blocks shorter than 60 bytes carry two trailing bytes that are not part of
 * the string; full-length blocks are decoded as they are.
 */
std::string decode_usb_string(const std::vector<uint8_t>& block);

}  // namespace internal
}  // namespace mcp2221
