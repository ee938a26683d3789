#include "dependency_utils.hpp"
#include "detector_helpers.hpp"
#include "peer_detectors.hpp"
#include "pos_classifier.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace Satzbau {
namespace detect {

using pos::POSClassifier;
using text::TextUtils;

namespace {

// Verbs that merely start like a separable prefix.
const std::vector<std::string> kFalsePrefixVerbs = {
    "antworten", "beißen", "beinhalten", "beichten", "zucken",
    "zuckern",   "hinken", "herrschen",  "ahnen",    "mitteln"};

std::string separablePrefix(const std::string &lemma) {
  std::string lower = TextUtils::toLower(lemma);
  if (std::find(kFalsePrefixVerbs.begin(), kFalsePrefixVerbs.end(), lower) !=
      kFalsePrefixVerbs.end())
    return std::string();

  std::string best;
  for (const auto &prefix : POSClassifier::separablePrefixes()) {
    // the remaining stem must still look like a verb
    if (lower.size() >= prefix.size() + 4 &&
        TextUtils::startsWith(lower, prefix) && prefix.size() > best.size())
      best = prefix;
  }
  return best;
}

bool hasModalNearby(const std::vector<Token> &tokens, size_t verb) {
  size_t first = verb > 4 ? verb - 4 : 0;
  for (size_t i = first; i < verb; ++i) {
    if (POSClassifier::isModalVerb(tokens[i]) &&
        deps::inSameClause(tokens, i, verb))
      return true;
  }
  auto head = deps::headIndex(tokens, verb);
  return head && POSClassifier::isModalVerb(tokens[*head]);
}

bool inSubordinateClause(const std::vector<Token> &tokens, size_t verb) {
  for (size_t i = verb; i > 0;) {
    --i;
    if (POSClassifier::isComma(tokens[i]))
      return false;
    if (POSClassifier::isSubordinatingConjunction(tokens[i]) ||
        POSClassifier::isRelativePronounTag(tokens[i]))
      return true;
  }
  return false;
}

} // namespace

SeparableVerbDetector::SeparableVerbDetector(const GrammarCatalog &catalog)
    : point_(catalog.get("b1-separable-verbs")) {}

std::vector<DetectionResult>
SeparableVerbDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;
  std::set<std::pair<size_t, size_t>> emitted;

  // detached particle
  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &particle = tokens[i];
    if (!POSClassifier::isSeparableParticle(particle))
      continue;

    std::optional<size_t> verb;
    double confidence = 0.95;
    auto head = deps::headIndex(tokens, i);
    if (head && POSClassifier::isVerbOrAux(tokens[*head])) {
      verb = head;
    } else {
      for (size_t j = i; j > 0;) {
        --j;
        if (!deps::inSameClause(tokens, j, i))
          break;
        if (POSClassifier::isFiniteVerb(tokens[j])) {
          verb = j;
          confidence = 0.80;
          break;
        }
      }
    }
    if (!verb || !emitted.insert({*verb, i}).second)
      continue;

    const Token &v = tokens[*verb];
    std::string fullVerb = TextUtils::toLower(particle.text) + v.lemma;
    json details = {{"form", "separated"},
                    {"verb", v.text},
                    {"particle", particle.text},
                    {"fullVerb", fullVerb},
                    {"resolvedBy", confidence > 0.9 ? "dependency" : "position"}};
    results.push_back(makeResult(point_, tokenRanges(sentence, {*verb, i}),
                                 confidence, std::move(details), fullVerb));
  }

  // prefix still attached to the verb
  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &v = tokens[i];
    if (!POSClassifier::isVerb(v))
      continue;
    std::string prefix = separablePrefix(v.lemma);
    if (prefix.empty() || emitted.count({i, i}))
      continue;

    // a detached particle already claimed this verb
    bool claimed = std::any_of(
        emitted.begin(), emitted.end(),
        [&](const std::pair<size_t, size_t> &p) { return p.first == i; });
    if (claimed)
      continue;

    const char *context = nullptr;
    double confidence = 0.0;
    if (POSClassifier::isInfinitive(v)) {
      bool modal = hasModalNearby(tokens, i);
      context = modal ? "modal-infinitive" : "infinitive";
      confidence = modal ? 0.90 : 0.85;
    } else if (POSClassifier::isPastParticiple(v)) {
      context = "participle";
      confidence = 0.90;
    } else if (POSClassifier::isFiniteVerb(v) && inSubordinateClause(tokens, i)) {
      context = "subordinate";
      confidence = 0.85;
    }
    if (!context)
      continue;

    emitted.insert({i, i});
    json details = {{"form", "combined"},
                    {"verb", v.text},
                    {"particle", prefix},
                    {"fullVerb", TextUtils::toLower(v.lemma)},
                    {"context", context}};
    results.push_back(makeResult(point_, tokenRanges(sentence, {i}), confidence,
                                 std::move(details),
                                 TextUtils::toLower(v.lemma)));
  }

  return results;
}

} // namespace detect
} // namespace Satzbau
