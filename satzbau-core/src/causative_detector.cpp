#include "detector_helpers.hpp"
#include "peer_detectors.hpp"
#include "pos_classifier.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <optional>

namespace Satzbau {
namespace detect {

using pos::POSClassifier;
using text::TextUtils;

namespace {

constexpr size_t kInfinitiveWindow = 4;

// Infinitive before a non-finite "lassen" ("reparieren lassen").
std::optional<size_t> findPrecedingInfinitive(const Sentence &sentence,
                                              size_t lassen) {
  const auto &tokens = sentence.tokens;
  size_t first = lassen > kInfinitiveWindow ? lassen - kInfinitiveWindow : 0;
  for (size_t i = lassen; i > first;) {
    --i;
    if (POSClassifier::isClausePunctuation(tokens[i]))
      return std::nullopt;
    if (POSClassifier::isInfinitive(tokens[i]))
      return i;
  }
  return std::nullopt;
}

} // namespace

CausativeDetector::CausativeDetector(const GrammarCatalog &catalog)
    : causativePoint_(catalog.get("b2-causative-construction")),
      permissivePoint_(catalog.get("c1-permissive-passive")) {}

std::vector<DetectionResult>
CausativeDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &lassen = tokens[i];
    if (!POSClassifier::isVerbOrAux(lassen) ||
        TextUtils::toLower(lassen.lemma) != "lassen")
      continue;

    auto infinitive = findFollowingInfinitive(sentence, i, kInfinitiveWindow);
    if (!infinitive && !POSClassifier::isFiniteVerb(lassen))
      infinitive = findPrecedingInfinitive(sentence, i);
    if (!infinitive)
      continue;

    size_t lo = std::min(i, *infinitive);
    size_t hi = std::max(i, *infinitive);
    std::optional<size_t> reflexive;
    for (size_t j = lo + 1; j < hi; ++j) {
      if (POSClassifier::isReflexivePronoun(tokens[j]) &&
          !POSClassifier::isSubject(tokens[j])) {
        reflexive = j;
        break;
      }
    }

    std::vector<size_t> indices = {i, *infinitive};
    if (reflexive)
      indices.push_back(*reflexive);
    std::sort(indices.begin(), indices.end());

    json details = {{"verb", lassen.text},
                    {"infinitive", tokens[*infinitive].text},
                    {"words", tokenTexts(sentence, indices)}};
    if (reflexive) {
      details["reflexive"] = tokens[*reflexive].text;
      results.push_back(makeResult(permissivePoint_,
                                   tokenRanges(sentence, indices), 0.85,
                                   std::move(details)));
    } else {
      results.push_back(makeResult(causativePoint_,
                                   tokenRanges(sentence, indices), 0.90,
                                   std::move(details)));
    }
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
