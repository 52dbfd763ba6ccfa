#pragma once
#include <Medgate/GenerativeModel.hpp>

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace Medgate
{
// Accumulates generated tokens and emits text once it is stable:
// a full line, everything up to a trailing CJK ideograph, otherwise
// everything up to the last space.
// Incomplete UTF-8 sequences are held back until the next token.
class TextStreamer
{
public:
  using Decoder = std::function<std::string(std::span<const int64_t>)>;

  TextStreamer(Decoder decode, TextCallback emit);

  // Returns false when the receiver asked to stop.
  bool put(int64_t token);
  bool end();

private:
  bool emit(std::string_view text);

  Decoder m_decode;
  TextCallback m_emit;
  std::vector<int64_t> m_cache;
  std::size_t m_printed{};
};

// Length of the longest prefix of text that does not end inside a
// multi-byte UTF-8 sequence.
std::size_t completeUtf8Prefix(std::string_view text) noexcept;

// Last code point of text, 0 if text ends inside a multi-byte sequence.
char32_t lastCodePoint(std::string_view text) noexcept;
bool isCjkIdeograph(char32_t c) noexcept;
}
