#include "dependency_utils.hpp"
#include "detector_helpers.hpp"
#include "peer_detectors.hpp"
#include "pos_classifier.hpp"

#include <algorithm>
#include <optional>

namespace Satzbau {
namespace detect {

using pos::POSClassifier;

namespace {

constexpr size_t kInfinitiveWindow = 8;
constexpr size_t kVerbFinalWindow = 3;

std::optional<size_t> dependentInfinitive(const Sentence &sentence,
                                          size_t modal) {
  const auto &tokens = sentence.tokens;
  auto head = deps::headIndex(tokens, modal);
  if (head && POSClassifier::isInfinitive(tokens[*head]))
    return head;
  if (auto after = findFollowingInfinitive(sentence, modal, kInfinitiveWindow))
    return after;

  // Verb-final clauses: "..., weil ich nicht kommen kann."
  size_t first = modal > kVerbFinalWindow ? modal - kVerbFinalWindow : 0;
  for (size_t i = modal; i > first;) {
    --i;
    if (POSClassifier::isClausePunctuation(tokens[i]))
      break;
    if (POSClassifier::isInfinitive(tokens[i]))
      return i;
  }
  return std::nullopt;
}

bool isQuestion(const Sentence &sentence) {
  return !sentence.tokens.empty() && sentence.tokens.back().text == "?";
}

} // namespace

ModalVerbDetector::ModalVerbDetector(const GrammarCatalog &catalog)
    : point_(catalog.get("b1-modal-verbs")) {}

std::vector<DetectionResult>
ModalVerbDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &modal = tokens[i];
    if (!POSClassifier::isVerbOrAux(modal) || !POSClassifier::isModalVerb(modal))
      continue;

    auto infinitive = dependentInfinitive(sentence, i);
    if (infinitive) {
      std::vector<size_t> indices = {std::min(i, *infinitive),
                                     std::max(i, *infinitive)};
      json details = {{"modal", modal.text},
                      {"lemma", modal.lemma},
                      {"infinitive", tokens[*infinitive].text}};
      results.push_back(makeResult(point_, tokenRanges(sentence, indices), 0.95,
                                   std::move(details)));
    } else if (isQuestion(sentence)) {
      json details = {{"modal", modal.text},
                      {"lemma", modal.lemma},
                      {"usage", "standalone"}};
      results.push_back(makeResult(point_, {tokenRange(sentence, i, i)}, 0.80,
                                   std::move(details)));
    }
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
