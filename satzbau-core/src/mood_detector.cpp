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

constexpr size_t kInfinitiveWindow = 8;

const std::vector<std::string> kWuerdeForms = {"würde", "würdest", "würden",
                                               "würdet"};

// Synthetic Konjunktiv II forms that differ from the indicative.
const std::vector<std::string> kUmlautForms = {
    "wäre",    "wärst",    "wärest",   "wären",   "wärt",    "wäret",
    "hätte",   "hättest",  "hätten",   "hättet",  "könnte",  "könntest",
    "könnten", "könntet",  "müsste",   "müsstest", "müssten", "müsstet",
    "dürfte",  "dürftest", "dürften",  "dürftet", "möchte",  "möchtest",
    "möchten", "möchtet",  "käme",     "kämen",   "ginge",   "gingen",
    "wüsste",  "wüssten"};

// Forms that only read as Konjunktiv II when the parser marks the mood.
const std::vector<std::string> kAmbiguousForms = {
    "sollte", "solltest", "sollten", "solltet",
    "wollte", "wolltest", "wollten", "wolltet"};

const std::vector<std::string> kSayingVerbs = {
    "sagen",    "erzählen", "berichten", "meinen", "behaupten",
    "denken",   "glauben",  "erklären",  "betonen", "mitteilen"};

bool isIn(const std::vector<std::string> &set, const std::string &value) {
  return std::find(set.begin(), set.end(), value) != set.end();
}

bool hasSubjunctiveMood(const Token &token) {
  std::string mood = POSClassifier::morph(token, "Mood");
  return mood == "Sub" || mood == "Subj";
}

bool isImperative(const Token &token) {
  if (token.tag == "VVIMP" || token.tag == "VAIMP")
    return true;
  return POSClassifier::isVerbOrAux(token) &&
         POSClassifier::morph(token, "Mood") == "Imp";
}

bool sayingVerbBefore(const Sentence &sentence, size_t verb) {
  for (size_t i = 0; i < verb; ++i) {
    const Token &t = sentence.tokens[i];
    if (POSClassifier::isVerb(t) &&
        isIn(kSayingVerbs, TextUtils::toLower(t.lemma)))
      return true;
  }
  return false;
}

} // namespace

MoodDetector::MoodDetector(const GrammarCatalog &catalog)
    : imperativePoint_(catalog.get("a1-imperative")),
      conditionalPoint_(catalog.get("b1-konjunktiv-II-conditional")),
      subjunctivePoint_(catalog.get("b1-konjunktiv-II-subjunctive")),
      reportedPoint_(catalog.get("b2-konjunktiv-I")) {}

std::vector<DetectionResult>
MoodDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &verb = tokens[i];
    if (!POSClassifier::isVerbOrAux(verb))
      continue;
    std::string lower = TextUtils::toLower(verb.text);

    if (isImperative(verb)) {
      json details = {{"verb", verb.text}, {"mood", "imperative"}};
      results.push_back(makeResult(imperativePoint_,
                                   {tokenRange(sentence, i, i)}, 0.95,
                                   std::move(details)));
      continue;
    }

    if (isIn(kWuerdeForms, lower)) {
      std::vector<size_t> indices = {i};
      json details = {{"auxiliary", verb.text}, {"mood", "konjunktiv-II"}};
      if (auto inf = findFollowingInfinitive(sentence, i, kInfinitiveWindow)) {
        indices.push_back(*inf);
        details["infinitive"] = tokens[*inf].text;
      }
      results.push_back(makeResult(conditionalPoint_,
                                   tokenRanges(sentence, indices), 0.98,
                                   std::move(details)));
      continue;
    }

    bool subjunctive = hasSubjunctiveMood(verb);
    bool umlautForm = isIn(kUmlautForms, lower);
    if (umlautForm || (subjunctive && isIn(kAmbiguousForms, lower))) {
      json details = {{"verb", verb.text}, {"mood", "konjunktiv-II"}};
      results.push_back(makeResult(subjunctivePoint_,
                                   {tokenRange(sentence, i, i)},
                                   subjunctive ? 0.90 : 0.85,
                                   std::move(details)));
      continue;
    }

    if (subjunctive && sayingVerbBefore(sentence, i)) {
      json details = {{"verb", verb.text},
                      {"mood", "konjunktiv-I"},
                      {"use", "reported-speech"}};
      results.push_back(makeResult(reportedPoint_,
                                   {tokenRange(sentence, i, i)}, 0.85,
                                   std::move(details)));
    }
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
