#pragma once

#include <cstddef>
#include <string>

namespace Satzbau {
namespace text {

// Character offsets exchanged with the parser are Unicode code points.
size_t codePointLength(const std::string &text);

// Byte offset of the given code point index, clamped to text.size().
size_t codePointToByteOffset(const std::string &text, size_t codePoint);

// Number of code points that start before the given byte offset.
size_t byteToCodePointOffset(const std::string &text, size_t byteOffset);

// Substring between two code point offsets.
std::string sliceCodePoints(const std::string &text, size_t start, size_t end);

} // namespace text
} // namespace Satzbau
