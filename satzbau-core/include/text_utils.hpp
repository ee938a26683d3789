#pragma once

#include <cstddef>
#include <string>

namespace Satzbau {
namespace text {

class TextUtils {
public:
  // Drops invalid UTF-8 sequences and control characters.
  static std::string sanitizeUTF8(const std::string &input);

  // Same cleanup without changing the code point count: control characters
  // become spaces and every invalid byte becomes U+FFFD. Used for sentence
  // text, which parser offsets index into.
  static std::string sanitizeKeepingOffsets(const std::string &input);

  // Lowercases ASCII and Latin-1 capitals (Ä, Ö, Ü, ...). Other code points
  // are copied unchanged.
  static std::string toLower(const std::string &input);
  static bool equalsIgnoreCase(const std::string &a, const std::string &b);

  static bool startsWith(const std::string &s, const std::string &prefix);
  static bool endsWith(const std::string &s, const std::string &suffix);

  // Removes one trailing -ern, -en or -n.
  static std::string stripVerbEnding(const std::string &lemma);

  // Lenient lemma comparison used for verbs: equal, prefix in either
  // direction, or equal after stripping the infinitive ending.
  static bool lemmaMatches(const std::string &tokenLemma,
                           const std::string &expected);

  // Capitalises the first code point ("angst" -> "Angst").
  static std::string capitalize(const std::string &input);

private:
  static bool isValidUtf8Sequence(const std::string &input, size_t start,
                                  size_t length);
};

} // namespace text
} // namespace Satzbau
