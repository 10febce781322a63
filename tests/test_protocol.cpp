/**
 * @file test_protocol.cpp
 * @brief Frame codec and register image unit tests
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <string>
#include <vector>

#include "frame.hpp"
#include "mcp2221/protocol.hpp"
#include "registers.hpp"
#include "utf.hpp"

using namespace mcp2221;

/* ========================================================================= */
/* Frame Codec Tests                                                         */
/* ========================================================================= */

TEST_CASE("Command frame building")
{
  Frame frame;
  frame.fill(0xAA);

  SUBCASE("Opcode only")
  {
    REQUIRE(internal::build_command(Command::STATUS, nullptr, 0, frame) == ErrorCode::OK);
    CHECK(frame[0] == 0x10);
    for (size_t i = 1; i < FRAME_SIZE; ++i)
    {
      CHECK(frame[i] == 0x00);
    }
  }

  SUBCASE("Payload follows the opcode")
  {
    const uint8_t payload[] = {0xAB, 0xCD, 0xEF};
    REQUIRE(internal::build_command(Command::RESET, payload, 3, frame) == ErrorCode::OK);
    CHECK(frame[0] == 0x70);
    CHECK(frame[1] == 0xAB);
    CHECK(frame[2] == 0xCD);
    CHECK(frame[3] == 0xEF);
    CHECK(frame[4] == 0x00);
  }

  SUBCASE("Largest payload")
  {
    std::vector<uint8_t> payload(MAX_PAYLOAD_SIZE, 0x55);
    REQUIRE(internal::build_command(0x90, payload.data(), payload.size(), frame) ==
            ErrorCode::OK);
    CHECK(frame[FRAME_SIZE - 1] == 0x55);
  }

  SUBCASE("Payload too large")
  {
    std::vector<uint8_t> payload(MAX_PAYLOAD_SIZE + 1, 0x55);
    CHECK(internal::build_command(0x90, payload.data(), payload.size(), frame) ==
          ErrorCode::INVALID_PARAMETER);
  }
}

TEST_CASE("Response validation")
{
  uint8_t response[FRAME_SIZE] = {0x10, 0x00};

  SUBCASE("Matching opcode and zero status")
  {
    CHECK(internal::parse_response(response, FRAME_SIZE, 0x10) == ErrorCode::OK);
  }

  SUBCASE("Empty response")
  {
    CHECK(internal::parse_response(response, 0, 0x10) == ErrorCode::EMPTY_RESPONSE);
    CHECK(internal::verify_opcode(nullptr, FRAME_SIZE, 0x10) == ErrorCode::EMPTY_RESPONSE);
  }

  SUBCASE("Opcode mismatch")
  {
    CHECK(internal::parse_response(response, FRAME_SIZE, 0x51) == ErrorCode::OPCODE_MISMATCH);
  }

  SUBCASE("Nonzero status")
  {
    response[1] = 0x01;
    CHECK(internal::verify_opcode(response, FRAME_SIZE, 0x10) == ErrorCode::OK);
    CHECK(internal::parse_response(response, FRAME_SIZE, 0x10) == ErrorCode::COMMAND_FAILED);
  }

  SUBCASE("Report without status byte")
  {
    CHECK(internal::parse_response(response, 1, 0x10) == ErrorCode::INVALID_RESPONSE);
  }
}

TEST_CASE("Error classification")
{
  CHECK(is_connectivity_error(ErrorCode::NOT_CONNECTED));
  CHECK(is_connectivity_error(ErrorCode::OPEN_FAILED));
  CHECK(is_connectivity_error(ErrorCode::IO_ERROR));
  CHECK(is_protocol_error(ErrorCode::EMPTY_RESPONSE));
  CHECK(is_protocol_error(ErrorCode::I2C_SLAVE_ERROR));
  CHECK(is_warning(ErrorCode::PIN_NOT_GPIO));
  CHECK_FALSE(is_connectivity_error(ErrorCode::INVALID_PARAMETER));
  CHECK_FALSE(is_protocol_error(ErrorCode::OK));

  CHECK(std::string(error_message(ErrorCode::OPCODE_MISMATCH)) ==
        "response code does not match command");
  CHECK(std::string(error_message(static_cast<ErrorCode>(0xFF))) == "unknown error");
}

/* ========================================================================= */
/* Bit Field Tests                                                           */
/* ========================================================================= */

TEST_CASE("Bit field access")
{
  std::vector<uint8_t> image = {0x00, 0b00011010, 0xFF};

  SUBCASE("Read selected bits in request order")
  {
    std::vector<bool> bits;
    REQUIRE(internal::read_bits(image, 1, {1, 3, 4, 0}, bits) == ErrorCode::OK);
    REQUIRE(bits.size() == 4);
    CHECK(bits[0]);
    CHECK(bits[1]);
    CHECK(bits[2]);
    CHECK_FALSE(bits[3]);
  }

  SUBCASE("Out-of-range descriptors are rejected")
  {
    std::vector<bool> bits;
    CHECK(internal::read_bits(image, 9, {0}, bits) == ErrorCode::INVALID_PARAMETER);
    CHECK(internal::read_bits(image, 0, {8}, bits) == ErrorCode::INVALID_PARAMETER);
    CHECK(internal::check_bit_access(8, {7}) == ErrorCode::OK);
  }

  SUBCASE("Byte beyond the image")
  {
    std::vector<bool> bits;
    CHECK(internal::read_bits(image, 5, {0}, bits) == ErrorCode::INVALID_RESPONSE);
  }

  SUBCASE("Patch leaves other bits untouched")
  {
    REQUIRE(internal::patch_bits(image, 2, {0, 1, 2}, {false, true, false}) == ErrorCode::OK);
    CHECK(image[2] == 0b11111010);
    CHECK(image[1] == 0b00011010);
  }

  SUBCASE("Patch with mismatched value count")
  {
    CHECK(internal::patch_bits(image, 2, {0, 1}, {true}) == ErrorCode::INVALID_PARAMETER);
  }

  SUBCASE("Value packing is LSB first")
  {
    CHECK(internal::bits_to_value({true, false, true}) == 5);
    const std::vector<bool> bits = internal::value_to_bits(6, 3);
    REQUIRE(bits.size() == 3);
    CHECK_FALSE(bits[0]);
    CHECK(bits[1]);
    CHECK(bits[2]);
  }
}

/* ========================================================================= */
/* Register Block Tests                                                      */
/* ========================================================================= */

TEST_CASE("Register block extraction")
{
  Frame response{};
  response[0] = 0x61;
  response[2] = 3;
  response[3] = 4;
  response[4] = 0x11;
  response[5] = 0x22;
  response[6] = 0x33;
  response[7] = 0x01;
  response[8] = 0x02;
  response[9] = 0x03;
  response[10] = 0x04;

  SUBCASE("SRAM Chip-Settings block")
  {
    std::vector<uint8_t> block;
    REQUIRE(internal::extract_sram_block(response, SramSubcode::CHIP_SETTINGS, block) ==
            ErrorCode::OK);
    CHECK(block == std::vector<uint8_t>{0x11, 0x22, 0x33});
  }

  SUBCASE("SRAM GP-Settings block follows Chip-Settings")
  {
    std::vector<uint8_t> block;
    REQUIRE(internal::extract_sram_block(response, SramSubcode::GP_SETTINGS, block) ==
            ErrorCode::OK);
    CHECK(block == std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04});
  }

  SUBCASE("Flash block is clamped to the frame")
  {
    response[2] = 0xFF;
    std::vector<uint8_t> block;
    REQUIRE(internal::extract_flash_block(response, block) == ErrorCode::OK);
    CHECK(block.size() == FRAME_SIZE - internal::BLOCK_DATA_OFFSET);
  }
}

TEST_CASE("Flash write frame")
{
  const std::vector<uint8_t> image = {0x01, 0x02, 0x03};
  Frame frame;

  SUBCASE("Chip-Settings carries the password")
  {
    REQUIRE(internal::build_flash_write(FlashSubcode::CHIP_SETTINGS, image, "pw", frame) ==
            ErrorCode::OK);
    CHECK(frame[0] == 0xB1);
    CHECK(frame[1] == 0x00);
    CHECK(frame[2] == 0x01);
    CHECK(frame[4] == 0x03);
    CHECK(frame[5] == 'p');
    CHECK(frame[6] == 'w');
    CHECK(frame[7] == 0x00);
  }

  SUBCASE("GP-Settings never carries the password")
  {
    REQUIRE(internal::build_flash_write(FlashSubcode::GP_SETTINGS, image, "pw", frame) ==
            ErrorCode::OK);
    CHECK(frame[1] == 0x01);
    CHECK(frame[5] == 0x00);
  }

  SUBCASE("Oversized image")
  {
    const std::vector<uint8_t> big(FRAME_SIZE, 0x00);
    CHECK(internal::build_flash_write(FlashSubcode::GP_SETTINGS, big, "", frame) ==
          ErrorCode::INVALID_PARAMETER);
  }
}

/* ========================================================================= */
/* SRAM Write Reconstruction Tests                                           */
/* ========================================================================= */

TEST_CASE("SRAM write re-asserts the GP pins")
{
  // Pins 0, 1 and 3: GPIO input, value 1. Pin 2: ADC (not GPIO).
  Frame gpio{};
  gpio[0] = 0x51;
  gpio[2] = 0x01;
  gpio[3] = 0x01;
  gpio[4] = 0x01;
  gpio[5] = 0x01;
  gpio[6] = GPIO_VALUE_NOT_SET;
  gpio[7] = 0xEF;
  gpio[8] = 0x01;
  gpio[9] = 0x01;
  const std::vector<uint8_t> sram_gp = {0x08, 0x08, 0x02, 0x08};

  Frame frame;

  SUBCASE("Pin function change keeps the other pins")
  {
    REQUIRE(internal::build_sram_write(gpio, sram_gp, SramSubcode::GP_SETTINGS, 2, 0x03, frame) ==
            ErrorCode::OK);
    CHECK(frame[0] == 0x60);
    CHECK(frame[7] == 0x80);
    CHECK(frame[8] == 0x18);
    CHECK(frame[9] == 0x18);
    CHECK(frame[10] == 0x03);
    CHECK(frame[11] == 0x18);
  }

  SUBCASE("Chip-Settings change keeps the pins without altering them")
  {
    REQUIRE(internal::build_sram_write(gpio, sram_gp, SramSubcode::CHIP_SETTINGS, 2, 0x9F,
                                       frame) == ErrorCode::OK);
    CHECK(frame[4] == 0x9F);
    CHECK(frame[7] == 0x00);
    CHECK(frame[8] == 0x18);
    CHECK(frame[10] == 0x02);
  }

  SUBCASE("Byte index limits")
  {
    CHECK(internal::build_sram_write(gpio, sram_gp, SramSubcode::CHIP_SETTINGS, 5, 0, frame) ==
          ErrorCode::INVALID_PARAMETER);
    CHECK(internal::build_sram_write(gpio, sram_gp, SramSubcode::GP_SETTINGS, 4, 0, frame) ==
          ErrorCode::INVALID_PARAMETER);
  }

  SUBCASE("Short GP image")
  {
    CHECK(internal::build_sram_write(gpio, {0x00}, SramSubcode::GP_SETTINGS, 0, 0, frame) ==
          ErrorCode::INVALID_RESPONSE);
  }
}

TEST_CASE("Pin sanitization designations")
{
  const std::vector<uint8_t> pins = {0x08, 0x08, 0x02, 0x01};
  const std::vector<uint8_t> tmp = internal::sanitized_pin_settings(pins);

  REQUIRE(tmp.size() == 4);
  CHECK(tmp[0] == 0x08);  // pin 0 has no ADC
  CHECK(tmp[1] == 0x02);  // GPIO input -> ADC
  CHECK(tmp[2] == 0x08);  // ADC -> GPIO input
  CHECK(tmp[3] == 0x01);  // other function kept
}

TEST_CASE("SET_GPIO frame")
{
  Frame frame;
  internal::build_gpio_set(3, false, 0, true, 0x01, frame);

  CHECK(frame[0] == 0x50);
  CHECK(frame[14] == 0x00);
  CHECK(frame[15] == 0x00);
  CHECK(frame[16] == 0x01);
  CHECK(frame[17] == 0x01);
  CHECK(frame[2] == 0x00);
}

/* ========================================================================= */
/* USB String Tests                                                          */
/* ========================================================================= */

TEST_CASE("USB string descriptors")
{
  Frame frame;

  SUBCASE("ASCII string")
  {
    REQUIRE(internal::build_usb_string_write(FlashSubcode::USB_PRODUCT, "MCP", frame) ==
            ErrorCode::OK);
    CHECK(frame[0] == 0xB1);
    CHECK(frame[1] == 0x03);
    CHECK(frame[2] == 8);
    CHECK(frame[3] == 0x03);
    CHECK(frame[4] == 'M');
    CHECK(frame[5] == 0x00);
    CHECK(frame[8] == 'P');
  }

  SUBCASE("Non-ASCII string")
  {
    REQUIRE(internal::build_usb_string_write(FlashSubcode::USB_MANUFACTURER, "\xC3\xA9", frame) ==
            ErrorCode::OK);
    CHECK(frame[2] == 4);
    CHECK(frame[4] == 0xE9);
    CHECK(frame[5] == 0x00);
  }

  SUBCASE("Length limit")
  {
    CHECK(internal::build_usb_string_write(FlashSubcode::USB_SERIAL_NUMBER,
                                           std::string(30, 'x'), frame) == ErrorCode::OK);
    CHECK(frame[2] == 62);
    CHECK(internal::build_usb_string_write(FlashSubcode::USB_SERIAL_NUMBER,
                                           std::string(31, 'x'), frame) ==
          ErrorCode::INVALID_PARAMETER);
  }

  SUBCASE("Wrong sub-code")
  {
    CHECK(internal::build_usb_string_write(FlashSubcode::CHIP_SETTINGS, "x", frame) ==
          ErrorCode::INVALID_PARAMETER);
  }

  SUBCASE("Malformed UTF-8")
  {
    CHECK(internal::build_usb_string_write(FlashSubcode::USB_PRODUCT, "\xC3", frame) ==
          ErrorCode::INVALID_PARAMETER);
  }

  SUBCASE("Short block drops the trailing bytes")
  {
    const std::vector<uint8_t> block = {'M', 0, 'C', 0, 'P', 0, 0x03, 0x00};
    CHECK(internal::decode_usb_string(block) == "MCP");
  }

  SUBCASE("Full block is decoded as it is")
  {
    std::vector<uint8_t> block;
    for (int i = 0; i < 30; ++i)
    {
      block.push_back('a');
      block.push_back(0);
    }
    CHECK(internal::decode_usb_string(block) == std::string(30, 'a'));
  }
}

TEST_CASE("UTF conversion")
{
  std::u16string units;

  REQUIRE(internal::utf8_to_utf16("\xF0\x9F\x98\x80", units));
  REQUIRE(units.size() == 2);
  CHECK(units[0] == 0xD83D);
  CHECK(units[1] == 0xDE00);
  CHECK(internal::utf16_to_utf8(units) == "\xF0\x9F\x98\x80");

  CHECK_FALSE(internal::utf8_to_utf16("\xED\xA0\x80", units));  // encoded surrogate
  CHECK(internal::utf16_to_utf8(std::u16string(1, static_cast<char16_t>(0xD800))) ==
        "\xEF\xBF\xBD");
}
