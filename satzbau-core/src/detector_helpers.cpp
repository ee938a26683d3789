#include "detector_helpers.hpp"
#include "detector.hpp"
#include "pos_classifier.hpp"

namespace Satzbau {

const char *detectorId(DetectorKind kind) {
  switch (kind) {
  case DetectorKind::Collocation:
    return "collocation";
  case DetectorKind::SubordinateClause:
    return "subordinate-clause";
  case DetectorKind::SeparableVerb:
    return "separable-verb";
  case DetectorKind::Agreement:
    return "agreement";
  case DetectorKind::WordOrder:
    return "word-order";
  case DetectorKind::Passive:
    return "passive";
  case DetectorKind::Causative:
    return "causative";
  case DetectorKind::Tense:
    return "tense";
  case DetectorKind::Case:
    return "case";
  case DetectorKind::Mood:
    return "mood";
  case DetectorKind::ModalVerb:
    return "modal-verb";
  case DetectorKind::ReflexiveVerb:
    return "reflexive-verb";
  case DetectorKind::Conditional:
    return "conditional";
  case DetectorKind::Preposition:
    return "preposition";
  case DetectorKind::Custom:
    return "custom";
  }
  return "custom";
}

namespace detect {

using pos::POSClassifier;

CharRange tokenRange(const Sentence &sentence, size_t from, size_t to) {
  CharRange range;
  if (from >= sentence.tokens.size() || to >= sentence.tokens.size() ||
      from > to)
    return range;
  range.start = sentence.tokens[from].characterStart;
  range.end = sentence.tokens[to].characterEnd;
  return range;
}

std::vector<CharRange> tokenRanges(const Sentence &sentence,
                                   const std::vector<size_t> &indices) {
  std::vector<CharRange> ranges;
  ranges.reserve(indices.size());
  for (size_t i : indices) {
    if (i < sentence.tokens.size())
      ranges.push_back(tokenRange(sentence, i, i));
  }
  return ranges;
}

std::vector<std::string> tokenTexts(const Sentence &sentence,
                                    const std::vector<size_t> &indices) {
  std::vector<std::string> texts;
  for (size_t i : indices) {
    if (i < sentence.tokens.size())
      texts.push_back(sentence.tokens[i].text);
  }
  return texts;
}

DetectionResult makeResult(const GrammarPoint &point,
                           std::vector<CharRange> positions, double confidence,
                           json details, const std::string &label) {
  DetectionResult result;
  result.grammarPointId = point.id;
  result.category = point.category;
  result.level = point.level;
  result.name = point.name;
  result.label = label.empty() ? point.name : label;
  result.positions = std::move(positions);
  result.confidence = confidence;
  result.details = std::move(details);
  return result;
}

std::optional<size_t> findFollowingParticiple(const Sentence &sentence,
                                              size_t from) {
  const auto &tokens = sentence.tokens;
  for (size_t i = from + 1; i < tokens.size(); ++i) {
    const Token &t = tokens[i];
    if (POSClassifier::isPastParticiple(t))
      return i;
    if (POSClassifier::isClausePunctuation(t) ||
        POSClassifier::isSubordinatingConjunction(t))
      return std::nullopt;
    bool skippable = POSClassifier::isDeterminer(t) ||
                     POSClassifier::isNoun(t) ||
                     POSClassifier::isAdjective(t) ||
                     POSClassifier::isPreposition(t) ||
                     POSClassifier::isPronoun(t) || t.pos == "ADV" ||
                     t.pos == "PART" || POSClassifier::isNumeral(t);
    if (!skippable)
      return std::nullopt;
  }
  return std::nullopt;
}

std::optional<size_t> findFollowingInfinitive(const Sentence &sentence,
                                              size_t from, size_t window) {
  const auto &tokens = sentence.tokens;
  for (size_t i = from + 1; i < tokens.size() && i <= from + window; ++i) {
    if (POSClassifier::isClausePunctuation(tokens[i]))
      return std::nullopt;
    if (POSClassifier::isInfinitive(tokens[i]))
      return i;
  }
  return std::nullopt;
}

} // namespace detect
} // namespace Satzbau
