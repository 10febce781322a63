/**
 * @file utf.cpp
 * @brief UTF-8 / UTF-16 conversion implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "utf.hpp"

namespace mcp2221
{
namespace internal
{

namespace
{

constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

bool is_high_surrogate(uint32_t c)
{
  return c >= 0xD800 && c <= 0xDBFF;
}

bool is_low_surrogate(uint32_t c)
{
  return c >= 0xDC00 && c <= 0xDFFF;
}

}  // namespace

void append_utf8(std::string& out, uint32_t cp)
{
  if (cp < 0x80)
  {
    out.push_back(static_cast<char>(cp));
  }
  else if (cp < 0x800)
  {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  else if (cp < 0x10000)
  {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
  else
  {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool utf8_to_utf16(const std::string& in, std::u16string& out)
{
  out.clear();
  size_t i = 0;

  while (i < in.size())
  {
    const uint8_t lead = static_cast<uint8_t>(in[i]);
    uint32_t cp = 0;
    size_t extra = 0;

    if (lead < 0x80)
    {
      cp = lead;
    }
    else if ((lead & 0xE0) == 0xC0)
    {
      cp = lead & 0x1F;
      extra = 1;
    }
    else if ((lead & 0xF0) == 0xE0)
    {
      cp = lead & 0x0F;
      extra = 2;
    }
    else if ((lead & 0xF8) == 0xF0)
    {
      cp = lead & 0x07;
      extra = 3;
    }
    else
    {
      return false;
    }

    // Truncated sequence
    if (extra > 0 && i + extra >= in.size())
    {
      return false;
    }

    for (size_t k = 1; k <= extra; ++k)
    {
      const uint8_t cont = static_cast<uint8_t>(in[i + k]);
      if ((cont & 0xC0) != 0x80)
      {
        return false;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }
    i += extra + 1;

    if (cp > 0x10FFFF || is_high_surrogate(cp) || is_low_surrogate(cp))
    {
      return false;
    }

    if (cp >= 0x10000)
    {
      cp -= 0x10000;
      out.push_back(static_cast<char16_t>(0xD800 | (cp >> 10)));
      out.push_back(static_cast<char16_t>(0xDC00 | (cp & 0x3FF)));
    }
    else
    {
      out.push_back(static_cast<char16_t>(cp));
    }
  }

  return true;
}

std::string utf16_to_utf8(const std::u16string& in)
{
  std::string out;
  out.reserve(in.size());

  for (size_t i = 0; i < in.size(); ++i)
  {
    const uint32_t c = in[i];

    if (is_high_surrogate(c) && i + 1 < in.size() && is_low_surrogate(in[i + 1]))
    {
      const uint32_t low = in[++i];
      append_utf8(out, 0x10000 + ((c - 0xD800) << 10) + (low - 0xDC00));
    }
    else if (is_high_surrogate(c) || is_low_surrogate(c))
    {
      append_utf8(out, REPLACEMENT_CHAR);
    }
    else
    {
      append_utf8(out, c);
    }
  }

  return out;
}

}  // namespace internal
}  // namespace mcp2221
