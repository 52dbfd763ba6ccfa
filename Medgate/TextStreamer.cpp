#include "TextStreamer.hpp"

#include <algorithm>
#include <utility>

namespace Medgate
{
std::size_t completeUtf8Prefix(std::string_view text) noexcept
{
  const std::size_t n = text.size();
  // A sequence is at most 4 bytes, only the tail needs checking.
  for (std::size_t back = 1; back <= std::min<std::size_t>(4, n); back++)
  {
    const auto c = static_cast<unsigned char>(text[n - back]);
    if ((c & 0xC0) == 0x80)
      continue;

    std::size_t len = 1;
    if ((c & 0xE0) == 0xC0)
      len = 2;
    else if ((c & 0xF0) == 0xE0)
      len = 3;
    else if ((c & 0xF8) == 0xF0)
      len = 4;
    return back < len ? n - back : n;
  }
  return n;
}

char32_t lastCodePoint(std::string_view text) noexcept
{
  std::size_t start = text.size();
  while (start > 0 && (static_cast<unsigned char>(text[start - 1]) & 0xC0) == 0x80)
    start--;
  if (start == 0)
    return 0;
  start--;

  const auto lead = static_cast<unsigned char>(text[start]);
  const std::size_t len = text.size() - start;
  if (lead < 0x80)
    return len == 1 ? lead : 0;
  if ((lead & 0xE0) == 0xC0 && len == 2)
    return char32_t(lead & 0x1F) << 6 | (text[start + 1] & 0x3F);
  if ((lead & 0xF0) == 0xE0 && len == 3)
    return char32_t(lead & 0x0F) << 12 | char32_t(text[start + 1] & 0x3F) << 6
           | (text[start + 2] & 0x3F);
  if ((lead & 0xF8) == 0xF0 && len == 4)
    return char32_t(lead & 0x07) << 18 | char32_t(text[start + 1] & 0x3F) << 12
           | char32_t(text[start + 2] & 0x3F) << 6 | (text[start + 3] & 0x3F);
  return 0;
}

bool isCjkIdeograph(char32_t c) noexcept
{
  return (c >= 0x4E00 && c <= 0x9FFF) || (c >= 0x3400 && c <= 0x4DBF)
         || (c >= 0x20000 && c <= 0x2A6DF) || (c >= 0x2A700 && c <= 0x2B73F)
         || (c >= 0x2B740 && c <= 0x2B81F) || (c >= 0x2B820 && c <= 0x2CEAF)
         || (c >= 0xF900 && c <= 0xFAFF) || (c >= 0x2F800 && c <= 0x2FA1F);
}

TextStreamer::TextStreamer(Decoder decode, TextCallback emit)
    : m_decode{std::move(decode)}
    , m_emit{std::move(emit)}
{
}

bool TextStreamer::put(int64_t token)
{
  m_cache.push_back(token);
  const std::string text = m_decode(m_cache);

  if (text.ends_with('\n'))
  {
    std::string_view printable = std::string_view(text).substr(m_printed);
    m_cache.clear();
    m_printed = 0;
    return emit(printable);
  }

  // Ideographic scripts have no spaces to wait for.
  if (text.size() > m_printed && isCjkIdeograph(lastCodePoint(text)))
  {
    const std::string_view printable = std::string_view(text).substr(m_printed);
    m_printed = text.size();
    return emit(printable);
  }

  const std::size_t space = text.rfind(' ');
  if (space == std::string::npos || space + 1 <= m_printed)
    return true;

  const std::size_t stable = completeUtf8Prefix(std::string_view(text).substr(0, space + 1));
  if (stable <= m_printed)
    return true;

  const std::string_view printable
      = std::string_view(text).substr(m_printed, stable - m_printed);
  m_printed = stable;
  return emit(printable);
}

bool TextStreamer::end()
{
  if (m_cache.empty())
    return true;

  const std::string text = m_decode(m_cache);
  m_cache.clear();
  const std::size_t printed = std::exchange(m_printed, 0);
  if (text.size() <= printed)
    return true;
  return emit(std::string_view(text).substr(printed));
}

bool TextStreamer::emit(std::string_view text)
{
  if (text.empty())
    return true;
  return m_emit(text);
}
}
