#include "dependency_utils.hpp"
#include "detector_helpers.hpp"
#include "peer_detectors.hpp"
#include "pos_classifier.hpp"

#include <optional>
#include <string>

namespace Satzbau {
namespace detect {

using pos::POSClassifier;

namespace {

bool canFront(const Token &t) {
  return t.pos == "ADV" || t.pos == "PRON" || t.pos == "NOUN" ||
         t.pos == "DET" || t.pos == "PROPN";
}

} // namespace

WordOrderDetector::WordOrderDetector(const GrammarCatalog &catalog)
    : point_(catalog.get("a2-svo-word-order")) {}

std::vector<DetectionResult>
WordOrderDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;
  if (tokens.size() < 2)
    return results;

  // a leading subordinate clause is the first constituent; the main clause
  // starts after its closing comma
  size_t start = 0;
  bool frontedClause = false;
  if (POSClassifier::isSubordinatingConjunction(tokens[0])) {
    std::optional<size_t> comma;
    for (size_t i = 1; i < tokens.size(); ++i) {
      if (POSClassifier::isComma(tokens[i])) {
        comma = i;
        break;
      }
    }
    if (!comma || *comma + 1 >= tokens.size())
      return results;
    start = *comma + 1;
    frontedClause = true;
  }

  if (frontedClause) {
    if (!POSClassifier::isFiniteVerb(tokens[start]))
      return results;
    json details = {{"pattern", "V2"},
                    {"verb", tokens[start].text},
                    {"firstConstituent", "subordinate-clause"},
                    {"inversion", true}};
    results.push_back(makeResult(point_, {tokenRange(sentence, 0, start)}, 0.70,
                                 std::move(details)));
    return results;
  }

  std::optional<size_t> verb;
  for (size_t i = start; i < tokens.size(); ++i) {
    const Token &t = tokens[i];
    if (POSClassifier::isComma(t) || POSClassifier::isSubordinatingConjunction(t))
      break;
    if (POSClassifier::isFiniteVerb(t)) {
      verb = i;
      break;
    }
  }
  // verb-first: questions and imperatives
  if (!verb || *verb == start || POSClassifier::isPunctuation(tokens[start]))
    return results;

  const Token &first = tokens[start];
  bool inversion = true;
  for (size_t k = start; k < *verb; ++k) {
    if (POSClassifier::isSubject(tokens[k]))
      inversion = false;
  }

  if (*verb == start + 1) {
    json details = {{"pattern", "V2"},
                    {"verb", tokens[*verb].text},
                    {"firstConstituent", first.text},
                    {"inversion", inversion}};
    results.push_back(makeResult(point_, {tokenRange(sentence, start, *verb)},
                                 0.80, std::move(details)));
    return results;
  }

  if (!canFront(first))
    return results;
  for (size_t k = start; k < *verb; ++k) {
    if (!deps::depthBelow(tokens, *verb, k, static_cast<int>(tokens.size())))
      return results;
  }

  std::string constituent;
  for (size_t k = start; k < *verb; ++k) {
    if (!constituent.empty())
      constituent += " ";
    constituent += tokens[k].text;
  }
  json details = {{"pattern", "V2"},
                  {"verb", tokens[*verb].text},
                  {"firstConstituent", constituent},
                  {"inversion", inversion}};
  results.push_back(makeResult(point_, {tokenRange(sentence, start, *verb)},
                               0.70, std::move(details)));
  return results;
}

} // namespace detect
} // namespace Satzbau
