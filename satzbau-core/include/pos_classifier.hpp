#pragma once

#include "sentence.hpp"
#include <map>
#include <string>
#include <vector>

namespace Satzbau {
namespace pos {

// Stateless classification of parser tokens. Works on the coarse UD tag,
// the fine STTS tag, the dependency label and the morphology map, in that
// order of preference, so that partially annotated tokens still classify.
class POSClassifier {
public:
  // "Case=Nom|Number=Sing" -> {Case: Nom, Number: Sing}
  static std::map<std::string, std::string>
  parseMorphology(const std::string &feature);

  // Empty string when the feature is absent.
  static std::string morph(const Token &token, const std::string &key);

  static bool isVerb(const Token &token);
  static bool isAuxiliary(const Token &token);
  static bool isVerbOrAux(const Token &token);
  static bool isFiniteVerb(const Token &token);
  static bool isInfinitive(const Token &token);
  static bool isPastParticiple(const Token &token);
  static bool isModalVerb(const Token &token);
  static bool isModalLemma(const std::string &lemma);
  static bool isPerfectAuxiliaryLemma(const std::string &lemma);

  static bool isNoun(const Token &token);
  static bool isProperNoun(const Token &token);
  static bool isDeterminer(const Token &token);
  static bool isAdjective(const Token &token);
  static bool isPronoun(const Token &token);
  static bool isNumeral(const Token &token);
  static bool isPunctuation(const Token &token);
  static bool isComma(const Token &token);
  static bool isClausePunctuation(const Token &token);

  static bool isPreposition(const Token &token);
  // "zur" -> "zu", "am" -> "an"; empty when not a known contraction.
  static std::string contractedPrepositionBase(const std::string &surface);
  // Preposition token whose lemma or contracted base equals `lemma`.
  static bool matchesPreposition(const Token &token, const std::string &lemma);

  static bool isReflexivePronoun(const Token &token);
  static bool isReflexiveForm(const std::string &surface);
  static bool isSubject(const Token &token);

  static bool isSeparableParticle(const Token &token);
  static bool isParticleLike(const Token &token);
  static const std::vector<std::string> &separablePrefixes();

  static bool isSubordinatingConjunction(const Token &token);
  static bool isCoordinatingConjunction(const Token &token);
  static bool isRelativePronounTag(const Token &token);
  static bool isRelativePronounLemma(const std::string &lemma);

private:
  static std::vector<std::string> splitFeature(const std::string &feature,
                                               char delimiter);
  static bool tagStartsWith(const Token &token, const char *prefix);
};

} // namespace pos
} // namespace Satzbau
