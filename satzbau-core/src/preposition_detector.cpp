#include "dependency_utils.hpp"
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

constexpr size_t kObjectWindow = 3;

const std::vector<std::string> kDativePrepositions = {
    "mit", "bei", "von", "zu", "aus", "nach", "seit", "ab", "gegenüber", "außer"};

const std::vector<std::string> kAccusativePrepositions = {
    "durch", "für", "gegen", "ohne", "um", "bis", "entlang"};

const std::vector<std::string> kTwoWayPrepositions = {
    "in", "an", "auf", "unter", "über", "vor", "hinter", "neben", "zwischen"};

const std::vector<std::string> kDativeContractions = {
    "zum", "zur", "beim", "vom", "im", "am", "unterm", "hinterm", "überm"};

const std::vector<std::string> kAccusativeContractions = {
    "ins", "ans", "aufs", "durchs", "fürs", "ums", "übers", "vors"};

bool isIn(const std::vector<std::string> &set, const std::string &value) {
  return std::find(set.begin(), set.end(), value) != set.end();
}

std::string impliedCase(const std::string &surface) {
  std::string lower = TextUtils::toLower(surface);
  if (isIn(kDativeContractions, lower))
    return "Dat";
  if (isIn(kAccusativeContractions, lower))
    return "Acc";
  return std::string();
}

bool isObjectCandidate(const Token &token) {
  return POSClassifier::isNoun(token) || POSClassifier::isPronoun(token) ||
         POSClassifier::isDeterminer(token);
}

// Object of the preposition at `prep`: its dependency head when that is
// nominal and follows it, otherwise the next nominal token nearby.
std::optional<size_t> findObject(const Sentence &sentence, size_t prep) {
  const auto &tokens = sentence.tokens;
  auto head = deps::headIndex(tokens, prep);
  if (head && *head > prep && isObjectCandidate(tokens[*head]))
    return head;
  for (size_t i = prep + 1; i < tokens.size() && i <= prep + kObjectWindow;
       ++i) {
    const Token &t = tokens[i];
    if (POSClassifier::isVerbOrAux(t) || POSClassifier::isPunctuation(t))
      return std::nullopt;
    if (isObjectCandidate(t))
      return i;
  }
  return std::nullopt;
}

// Case of the object phrase between the preposition and `object`.
std::string objectCase(const Sentence &sentence, size_t prep, size_t object) {
  std::string value = POSClassifier::morph(sentence.tokens[object], "Case");
  for (size_t i = prep + 1; value.empty() && i < object; ++i)
    value = POSClassifier::morph(sentence.tokens[i], "Case");
  return value;
}

} // namespace

PrepositionDetector::PrepositionDetector(const GrammarCatalog &catalog)
    : dativePoint_(catalog.get("a2-dative-prepositions")),
      accusativePoint_(catalog.get("a2-accusative-prepositions")) {}

std::vector<DetectionResult>
PrepositionDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &prep = tokens[i];
    if (!POSClassifier::isPreposition(prep))
      continue;

    std::string base = POSClassifier::contractedPrepositionBase(prep.text);
    if (base.empty())
      base = TextUtils::toLower(prep.lemma.empty() ? prep.text : prep.lemma);
    bool twoWay = isIn(kTwoWayPrepositions, base);

    auto object = findObject(sentence, i);
    std::string caseValue = impliedCase(prep.text);
    if (caseValue.empty() && object)
      caseValue = objectCase(sentence, i, *object);

    const GrammarPoint *point = nullptr;
    if (caseValue == "Dat" && (twoWay || isIn(kDativePrepositions, base)))
      point = &dativePoint_;
    else if (caseValue == "Acc" &&
             (twoWay || isIn(kAccusativePrepositions, base)))
      point = &accusativePoint_;
    if (!point)
      continue;

    json details = {{"preposition", prep.text},
                    {"case", caseValue},
                    {"twoWay", twoWay}};
    if (twoWay)
      details["usage"] = caseValue == "Dat" ? "location" : "direction";
    if (object) {
      details["object"] = tokens[*object].text;
      results.push_back(makeResult(*point, {tokenRange(sentence, i, *object)},
                                   0.90, std::move(details)));
    } else {
      results.push_back(makeResult(*point, {tokenRange(sentence, i, i)}, 0.85,
                                   std::move(details)));
    }
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
