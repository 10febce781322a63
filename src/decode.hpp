/**
 * @file decode.hpp
 * @brief Raw device codes to setting enumerations (internal)
 *
 * Each overload accepts only the codes of its closed variant set and leaves
 * @p out untouched otherwise.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>

#include "mcp2221/protocol.hpp"

namespace mcp2221
{
namespace internal
{

inline bool decode(uint8_t raw, ClockDutyCycle& out)
{
  if (raw > 0x03)
  {
    return false;
  }
  out = static_cast<ClockDutyCycle>(raw);
  return true;
}

inline bool decode(uint8_t raw, ClockFrequency& out)
{
  if (raw < 0x01 || raw > 0x07)
  {
    return false;
  }
  out = static_cast<ClockFrequency>(raw);
  return true;
}

inline bool decode(uint8_t raw, ReferenceVoltageValue& out)
{
  if (raw > 0x03)
  {
    return false;
  }
  out = static_cast<ReferenceVoltageValue>(raw);
  return true;
}

inline bool decode(uint8_t raw, ReferenceVoltageSource& out)
{
  if (raw > 0x01)
  {
    return false;
  }
  out = static_cast<ReferenceVoltageSource>(raw);
  return true;
}

inline bool decode(uint8_t raw, SecurityOption& out)
{
  if (raw > 0x02)
  {
    return false;
  }
  out = static_cast<SecurityOption>(raw);
  return true;
}

inline bool decode(uint8_t raw, GpioDirection& out)
{
  if (raw != 0x00 && raw != 0x01 && raw != 0xEF)
  {
    return false;
  }
  out = static_cast<GpioDirection>(raw);
  return true;
}

inline bool decode(uint8_t raw, Gpio0Function& out)
{
  if (raw > 0x02)
  {
    return false;
  }
  out = static_cast<Gpio0Function>(raw);
  return true;
}

inline bool decode(uint8_t raw, Gpio1Function& out)
{
  if (raw > 0x04)
  {
    return false;
  }
  out = static_cast<Gpio1Function>(raw);
  return true;
}

inline bool decode(uint8_t raw, Gpio2Function& out)
{
  if (raw > 0x03)
  {
    return false;
  }
  out = static_cast<Gpio2Function>(raw);
  return true;
}

inline bool decode(uint8_t raw, Gpio3Function& out)
{
  if (raw > 0x03)
  {
    return false;
  }
  out = static_cast<Gpio3Function>(raw);
  return true;
}

inline bool decode(uint8_t raw, I2cCancelResponse& out)
{
  if (raw != 0x00 && raw != 0x10 && raw != 0x11)
  {
    return false;
  }
  out = static_cast<I2cCancelResponse>(raw);
  return true;
}

inline bool decode(uint8_t raw, I2cSpeedResponse& out)
{
  if (raw != 0x00 && raw != 0x20 && raw != 0x21)
  {
    return false;
  }
  out = static_cast<I2cSpeedResponse>(raw);
  return true;
}

}  // namespace internal
}  // namespace mcp2221
