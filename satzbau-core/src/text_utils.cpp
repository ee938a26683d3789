#include "text_utils.hpp"

namespace Satzbau {
namespace text {

std::string TextUtils::sanitizeUTF8(const std::string &input) {
  if (input.empty())
    return input;

  std::string result;
  result.reserve(input.size());

  for (size_t i = 0; i < input.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(input[i]);

    if (c < 0x80) {
      // keep tab, newline and carriage return
      if (c >= 0x20 || c == 0x09 || c == 0x0A || c == 0x0D) {
        result += static_cast<char>(c);
      }
      continue;
    }

    size_t seqLen = 0;
    if ((c & 0xE0) == 0xC0)
      seqLen = 2;
    else if ((c & 0xF0) == 0xE0)
      seqLen = 3;
    else if ((c & 0xF8) == 0xF0)
      seqLen = 4;
    else
      continue; // stray continuation or invalid start byte

    if (i + seqLen > input.size())
      break;

    if (isValidUtf8Sequence(input, i, seqLen)) {
      result.append(input, i, seqLen);
      i += seqLen - 1;
    }
  }

  return result;
}

std::string TextUtils::sanitizeKeepingOffsets(const std::string &input) {
  static const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

  std::string result;
  result.reserve(input.size());

  for (size_t i = 0; i < input.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(input[i]);

    if (c < 0x80) {
      if (c >= 0x20 || c == 0x09 || c == 0x0A || c == 0x0D)
        result += static_cast<char>(c);
      else
        result += ' ';
      continue;
    }

    size_t seqLen = 0;
    if ((c & 0xE0) == 0xC0)
      seqLen = 2;
    else if ((c & 0xF0) == 0xE0)
      seqLen = 3;
    else if ((c & 0xF8) == 0xF0)
      seqLen = 4;

    if (seqLen > 0 && i + seqLen <= input.size() &&
        isValidUtf8Sequence(input, i, seqLen)) {
      result.append(input, i, seqLen);
      i += seqLen - 1;
    } else {
      result += kReplacement;
    }
  }

  return result;
}

bool TextUtils::isValidUtf8Sequence(const std::string &input, size_t start,
                                    size_t length) {
  for (size_t j = 1; j < length; ++j) {
    unsigned char cont = static_cast<unsigned char>(input[start + j]);
    if ((cont & 0xC0) != 0x80)
      return false;
  }
  unsigned char lead = static_cast<unsigned char>(input[start]);
  // overlong two-byte forms
  if (length == 2 && lead < 0xC2)
    return false;
  return true;
}

std::string TextUtils::toLower(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  for (size_t i = 0; i < input.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    if (c >= 'A' && c <= 'Z') {
      out += static_cast<char>(c + 0x20);
    } else if (c == 0xC3 && i + 1 < input.size()) {
      unsigned char next = static_cast<unsigned char>(input[i + 1]);
      // U+00C0..U+00DE except U+00D7 (multiplication sign)
      if (next >= 0x80 && next <= 0x9E && next != 0x97)
        next = static_cast<unsigned char>(next + 0x20);
      out += static_cast<char>(c);
      out += static_cast<char>(next);
      ++i;
    } else {
      out += static_cast<char>(c);
    }
  }
  return out;
}

std::string TextUtils::capitalize(const std::string &input) {
  if (input.empty())
    return input;
  std::string out = input;
  unsigned char c = static_cast<unsigned char>(out[0]);
  if (c >= 'a' && c <= 'z') {
    out[0] = static_cast<char>(c - 0x20);
  } else if (c == 0xC3 && out.size() > 1) {
    unsigned char next = static_cast<unsigned char>(out[1]);
    if (next >= 0xA0 && next <= 0xBE && next != 0xB7)
      out[1] = static_cast<char>(next - 0x20);
  }
  return out;
}

bool TextUtils::equalsIgnoreCase(const std::string &a, const std::string &b) {
  if (a.size() != b.size())
    return false;
  return toLower(a) == toLower(b);
}

bool TextUtils::startsWith(const std::string &s, const std::string &prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool TextUtils::endsWith(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string TextUtils::stripVerbEnding(const std::string &lemma) {
  if (endsWith(lemma, "ern"))
    return lemma.substr(0, lemma.size() - 3);
  if (endsWith(lemma, "en"))
    return lemma.substr(0, lemma.size() - 2);
  if (endsWith(lemma, "n"))
    return lemma.substr(0, lemma.size() - 1);
  return lemma;
}

bool TextUtils::lemmaMatches(const std::string &tokenLemma,
                             const std::string &expected) {
  if (tokenLemma.empty() || expected.empty())
    return false;

  std::string a = toLower(tokenLemma);
  std::string b = toLower(expected);
  if (a == b)
    return true;
  if (startsWith(a, b) || startsWith(b, a))
    return true;
  return stripVerbEnding(a) == stripVerbEnding(b);
}

} // namespace text
} // namespace Satzbau
