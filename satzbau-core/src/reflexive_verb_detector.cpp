#include "dependency_utils.hpp"
#include "detector_helpers.hpp"
#include "peer_detectors.hpp"
#include "pos_classifier.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <optional>
#include <set>

namespace Satzbau {
namespace detect {

using pos::POSClassifier;
using text::TextUtils;

namespace {

constexpr size_t kPositionWindow = 3;

// Without a dependency link only unambiguous reflexives count; "mir" or
// "ihm" are ordinary personal pronouns far more often.
bool isMarkedReflexive(const Token &token) {
  return POSClassifier::isPronoun(token) &&
         (token.tag == "PRF" || POSClassifier::morph(token, "Reflex") == "Yes" ||
          TextUtils::toLower(token.lemma) == "sich" ||
          TextUtils::toLower(token.text) == "sich");
}

std::optional<size_t> nearbyReflexive(const Sentence &sentence, size_t verb,
                                      const std::set<size_t> &used) {
  const auto &tokens = sentence.tokens;
  size_t first = verb > kPositionWindow ? verb - kPositionWindow : 0;
  size_t last = std::min(tokens.size() - 1, verb + kPositionWindow);
  for (size_t j = first; j <= last; ++j) {
    if (j == verb || used.count(j) || !deps::inSameClause(tokens, j, verb))
      continue;
    if (isMarkedReflexive(tokens[j]) && !POSClassifier::isSubject(tokens[j]) &&
        !deps::headIndex(tokens, j))
      return j;
  }
  return std::nullopt;
}

} // namespace

ReflexiveVerbDetector::ReflexiveVerbDetector(const GrammarCatalog &catalog)
    : point_(catalog.get("a2-reflexive-verbs")) {}

std::vector<DetectionResult>
ReflexiveVerbDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;
  std::set<size_t> used;

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &verb = tokens[i];
    if (!POSClassifier::isVerb(verb))
      continue;

    double confidence = 0.95;
    auto pronoun = deps::findChild(tokens, i, [](const Token &t) {
      return POSClassifier::isReflexivePronoun(t) &&
             !POSClassifier::isSubject(t);
    });
    if (pronoun && used.count(*pronoun))
      pronoun.reset();
    if (!pronoun) {
      pronoun = nearbyReflexive(sentence, i, used);
      confidence = 0.80;
    }
    if (!pronoun)
      continue;
    used.insert(*pronoun);

    std::vector<size_t> indices = {std::min(i, *pronoun), std::max(i, *pronoun)};
    json details = {{"verb", verb.text},
                    {"lemma", verb.lemma},
                    {"reflexivePronoun", tokens[*pronoun].text},
                    {"position", *pronoun < i ? "before" : "after"}};
    results.push_back(makeResult(point_, tokenRanges(sentence, indices),
                                 confidence, std::move(details),
                                 "sich " + verb.lemma));
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
