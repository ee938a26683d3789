#include "dependency_utils.hpp"
#include "detector_helpers.hpp"
#include "peer_detectors.hpp"
#include "pos_classifier.hpp"
#include "text_utils.hpp"

#include <algorithm>

namespace Satzbau {
namespace detect {

using pos::POSClassifier;
using text::TextUtils;

namespace {

const std::vector<std::string> kTemporalNouns = {
    "tag",    "woche", "monat",  "jahr",   "morgen",     "abend",
    "nacht",  "stunde", "minute", "zeit",  "wochenende", "mittag"};

bool isPhraseHead(const Token &token) {
  return POSClassifier::isNoun(token) ||
         (POSClassifier::isPronoun(token) && !POSClassifier::isDeterminer(token) &&
          token.tag != "PPOSAT");
}

// Start of the noun phrase headed by `head`: preceding determiners and
// adjectives that agree in case and do not attach elsewhere.
size_t phraseStart(const Sentence &sentence, size_t head,
                   const std::string &caseValue) {
  const auto &tokens = sentence.tokens;
  size_t start = head;
  while (start > 0) {
    const Token &prev = tokens[start - 1];
    if (!POSClassifier::isDeterminer(prev) && !POSClassifier::isAdjective(prev))
      break;
    std::string prevCase = POSClassifier::morph(prev, "Case");
    if (!prevCase.empty() && prevCase != caseValue)
      break;
    auto prevHead = deps::headIndex(tokens, start - 1);
    if (prevHead && *prevHead != head)
      break;
    --start;
  }
  return start;
}

std::string dativeContext(const Sentence &sentence, size_t start,
                          size_t head) {
  const Token &noun = sentence.tokens[head];
  bool temporal = std::find(kTemporalNouns.begin(), kTemporalNouns.end(),
                            TextUtils::toLower(noun.lemma)) !=
                  kTemporalNouns.end();
  if (temporal || (start < head && POSClassifier::isNumeral(sentence.tokens[start])))
    return "temporal";

  bool governed = static_cast<bool>(
      deps::findChild(sentence.tokens, head, [](const Token &t) {
        return POSClassifier::isPreposition(t);
      }));
  if (governed ||
      (start > 0 && POSClassifier::isPreposition(sentence.tokens[start - 1])))
    return "prepositional";
  return "indirect-object";
}

} // namespace

CaseDetector::CaseDetector(const GrammarCatalog &catalog)
    : nominativePoint_(catalog.get("a1-nominative-case")),
      accusativePoint_(catalog.get("a1-accusative-case")),
      dativePoint_(catalog.get("a2-dative-case")) {}

std::vector<DetectionResult>
CaseDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &head = tokens[i];
    if (!isPhraseHead(head))
      continue;
    std::string caseValue = POSClassifier::morph(head, "Case");

    const GrammarPoint *point = nullptr;
    if (caseValue == "Nom")
      point = &nominativePoint_;
    else if (caseValue == "Acc")
      point = &accusativePoint_;
    else if (caseValue == "Dat")
      point = &dativePoint_;
    else
      continue;

    size_t start = phraseStart(sentence, i, caseValue);
    std::vector<size_t> indices;
    for (size_t j = start; j <= i; ++j)
      indices.push_back(j);

    json details = {{"case", caseValue},
                    {"head", head.text},
                    {"words", tokenTexts(sentence, indices)}};
    if (caseValue == "Dat")
      details["dativeContext"] = dativeContext(sentence, start, i);

    results.push_back(makeResult(*point, {tokenRange(sentence, start, i)}, 0.90,
                                 std::move(details)));
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
