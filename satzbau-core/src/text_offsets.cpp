#include "text_offsets.hpp"

namespace {
static inline size_t utf8SeqLen(unsigned char c) {
  if (c < 0x80)
    return 1;
  if (c < 0xE0)
    return 2;
  if (c < 0xF0)
    return 3;
  return 4;
}
} // namespace

namespace Satzbau {
namespace text {

size_t codePointLength(const std::string &text) {
  size_t count = 0;
  size_t i = 0;
  while (i < text.size()) {
    i += utf8SeqLen(static_cast<unsigned char>(text[i]));
    ++count;
  }
  return count;
}

size_t codePointToByteOffset(const std::string &text, size_t codePoint) {
  size_t i = 0;
  size_t cp = 0;
  while (i < text.size() && cp < codePoint) {
    i += utf8SeqLen(static_cast<unsigned char>(text[i]));
    ++cp;
  }
  return i > text.size() ? text.size() : i;
}

size_t byteToCodePointOffset(const std::string &text, size_t byteOffset) {
  if (byteOffset > text.size())
    byteOffset = text.size();
  size_t i = 0;
  size_t cp = 0;
  while (i < byteOffset) {
    i += utf8SeqLen(static_cast<unsigned char>(text[i]));
    ++cp;
  }
  return cp;
}

std::string sliceCodePoints(const std::string &text, size_t start,
                            size_t end) {
  if (end <= start)
    return std::string();
  size_t from = codePointToByteOffset(text, start);
  size_t to = codePointToByteOffset(text, end);
  return text.substr(from, to - from);
}

} // namespace text
} // namespace Satzbau
