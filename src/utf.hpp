/**
 * @file utf.hpp
 * @brief UTF-8 / UTF-16 conversion (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

namespace mcp2221
{
namespace internal
{

/**
 * @brief Convert UTF-8 to UTF-16
 * @return false on malformed input
 */
bool utf8_to_utf16(const std::string& in, std::u16string& out);

/** @brief Convert UTF-16 to UTF-8; unpaired surrogates become U+FFFD */
std::string utf16_to_utf8(const std::u16string& in);

/** @brief Append one code point to a UTF-8 string */
void append_utf8(std::string& out, uint32_t cp);

}  // namespace internal
}  // namespace mcp2221
