/**
 * @file mcp2221.h
 * @brief MCP2221 C API
 *
 * C-compatible interface to the MCP2221 driver. The HID transport is
 * supplied by the caller as a pair of blocking read/write callbacks.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Protocol constants                                                        */
  /* ========================================================================= */

  /** @brief HID report size */
#define MCP2221_FRAME_SIZE 64

#define MCP2221_DEFAULT_VENDOR_ID 0x04D8
#define MCP2221_DEFAULT_PRODUCT_ID 0x00DD

  /* ========================================================================= */
  /* Enumerations                                                              */
  /* ========================================================================= */

  typedef enum
  {
    MCP2221_MEM_SRAM = 0x00,
    MCP2221_MEM_FLASH = 0x01,
  } mcp2221_memory_t;

  typedef enum
  {
    MCP2221_GPIO_OUTPUT = 0x00,
    MCP2221_GPIO_INPUT = 0x01,
    MCP2221_GPIO_NOT_SET = 0xEF,
  } mcp2221_gpio_direction_t;

  typedef enum
  {
    MCP2221_I2C_START = 0x90,
    MCP2221_I2C_REPEATED_START = 0x92,
    MCP2221_I2C_NO_STOP = 0x94,
  } mcp2221_i2c_mode_t;

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) MCP2221_ERR_##name = val,
#include "mcp2221/errors.def"
#undef ERR
  } mcp2221_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* mcp2221_strerror(mcp2221_error_t err);

  /* ========================================================================= */
  /* Device handle                                                             */
  /* ========================================================================= */

  /** @brief Opaque handle to a device session */
  typedef struct MCP2221 MCP2221;

  /**
   * @brief HID write callback
   *
   * @param user User-defined context pointer
   * @param data Report to send (MCP2221_FRAME_SIZE bytes, no report ID)
   * @param len  Number of bytes
   * @return 0 on success, nonzero on failure
   */
  typedef int (*mcp2221_write_fn)(void* user, const uint8_t* data, size_t len);

  /**
   * @brief HID read callback (blocking)
   *
   * @param user     User-defined context pointer
   * @param data     Destination buffer
   * @param len      Buffer size
   * @param received Number of bytes stored
   * @return 0 on success, nonzero on failure
   */
  typedef int (*mcp2221_read_fn)(void* user, uint8_t* data, size_t len, size_t* received);

  /**
   * @brief Warning callback
   *
   * Called for non-fatal conditions (e.g. MCP2221_ERR_PIN_NOT_GPIO); the
   * operation still completes.
   *
   * @param user    User context pointer passed to mcp2221_set_warning_handler()
   * @param code    Warning code
   * @param message Human-readable description
   */
  typedef void (*mcp2221_warning_fn)(void* user, mcp2221_error_t code, const char* message);

  /* ========================================================================= */
  /* Lifecycle functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Create a closed device session
   *
   * @param write_fn HID write callback
   * @param read_fn  HID read callback
   * @param user     User context pointer (passed to both callbacks)
   * @param password Flash access password, NUL-terminated (NULL for none)
   * @return Session handle, or NULL on invalid arguments / allocation failure
   */
  MCP2221* mcp2221_create(mcp2221_write_fn write_fn, mcp2221_read_fn read_fn, void* user,
                          const char* password);

  /**
   * @brief Destroy a session (closes it first)
   * @param dev Session handle (NULL-safe)
   */
  void mcp2221_destroy(MCP2221* dev);

  mcp2221_error_t mcp2221_open(MCP2221* dev);
  void mcp2221_close(MCP2221* dev);
  int mcp2221_is_open(const MCP2221* dev);

  /**
   * @brief Set the default memory target of dual-space settings
   * @return MCP2221_ERR_INVALID_PARAMETER for anything but SRAM or FLASH
   */
  mcp2221_error_t mcp2221_set_memory_target(MCP2221* dev, mcp2221_memory_t mem);

  /**
   * @brief Install a warning handler
   *
   * Warnings are logged to stderr until a handler is installed. NULL restores
   * that default.
   */
  mcp2221_error_t mcp2221_set_warning_handler(MCP2221* dev, mcp2221_warning_fn fn, void* user);

  /* ========================================================================= */
  /* Operation functions                                                       */
  /* ========================================================================= */

  mcp2221_error_t mcp2221_gpio_read_direction(MCP2221* dev, size_t pin,
                                              mcp2221_gpio_direction_t* value);
  mcp2221_error_t mcp2221_gpio_write_direction(MCP2221* dev, size_t pin,
                                               mcp2221_gpio_direction_t value);
  mcp2221_error_t mcp2221_gpio_read_value(MCP2221* dev, size_t pin, int* value);
  mcp2221_error_t mcp2221_gpio_write_value(MCP2221* dev, size_t pin, int value);

  /** @brief Read ADC channel 0 to 2 */
  mcp2221_error_t mcp2221_read_adc(MCP2221* dev, size_t channel, uint16_t* value);
  mcp2221_error_t mcp2221_write_dac(MCP2221* dev, uint8_t value);

  mcp2221_error_t mcp2221_i2c_read_speed(MCP2221* dev, uint32_t* speed);
  mcp2221_error_t mcp2221_i2c_write_speed(MCP2221* dev, uint32_t speed);

  mcp2221_error_t mcp2221_i2c_write(MCP2221* dev, uint8_t address, const uint8_t* data,
                                    size_t len, mcp2221_i2c_mode_t mode);

  /**
   * @brief Read from an I2C slave
   *
   * @param out Destination buffer, at least @p len bytes
   */
  mcp2221_error_t mcp2221_i2c_read(MCP2221* dev, uint8_t address, uint8_t* out, size_t len,
                                   mcp2221_i2c_mode_t mode);

  /**
   * @brief Read the firmware version
   * @param out Destination, at least 5 bytes (4 characters and NUL)
   */
  mcp2221_error_t mcp2221_read_firmware_version(MCP2221* dev, char* out, size_t size);

  /** @brief Reset the chip; the session is closed afterwards */
  mcp2221_error_t mcp2221_reset(MCP2221* dev);

#ifdef __cplusplus
} /* extern "C" */
#endif
