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

const std::vector<std::string> kConditionalMarkers = {"wenn", "falls",
                                                      "sofern"};

bool isConditionalMarker(const Token &token) {
  std::string lower = TextUtils::toLower(token.text);
  if (std::find(kConditionalMarkers.begin(), kConditionalMarkers.end(),
                lower) == kConditionalMarkers.end())
    return false;
  return POSClassifier::isSubordinatingConjunction(token) ||
         (token.pos.empty() && token.tag.empty());
}

bool isSubjunctive(const Token &token) {
  std::string mood = POSClassifier::morph(token, "Mood");
  if (mood == "Sub" || mood == "Subj")
    return true;
  std::string lower = TextUtils::toLower(token.text);
  return TextUtils::startsWith(lower, "hätt") ||
         TextUtils::startsWith(lower, "wär") ||
         TextUtils::startsWith(lower, "würd");
}

std::optional<size_t> nextFiniteVerb(const Sentence &sentence, size_t from) {
  const auto &tokens = sentence.tokens;
  for (size_t i = from + 1; i < tokens.size(); ++i) {
    if (POSClassifier::isClausePunctuation(tokens[i]))
      return std::nullopt;
    if (POSClassifier::isFiniteVerb(tokens[i]))
      return i;
  }
  return std::nullopt;
}

std::optional<size_t> firstComma(const Sentence &sentence, size_t from) {
  for (size_t i = from; i < sentence.tokens.size(); ++i) {
    if (POSClassifier::isComma(sentence.tokens[i]))
      return i;
  }
  return std::nullopt;
}

} // namespace

ConditionalDetector::ConditionalDetector(const GrammarCatalog &catalog)
    : conditionalPoint_(catalog.get("b2-conditional-sentences")),
      invertedPoint_(catalog.get("c1-advanced-conditionals")) {}

std::vector<DetectionResult>
ConditionalDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;

  for (size_t i = 0; i < tokens.size(); ++i) {
    if (!isConditionalMarker(tokens[i]))
      continue;
    auto verb = nextFiniteVerb(sentence, i);
    if (!verb)
      continue;

    std::string type = "real";
    if (isSubjunctive(tokens[*verb])) {
      type = "unreal";
      for (size_t j = i + 1; j < *verb; ++j) {
        if (POSClassifier::isPastParticiple(tokens[j]))
          type = "past-unreal";
      }
    }
    json details = {{"conjunction", tokens[i].text},
                    {"verb", tokens[*verb].text},
                    {"conditionalType", type}};
    results.push_back(makeResult(conditionalPoint_,
                                 {tokenRange(sentence, i, *verb)}, 0.90,
                                 std::move(details)));
  }

  // "Hätte ich Zeit, käme ich mit." Verb-first questions are excluded.
  if (!tokens.empty() && POSClassifier::isFiniteVerb(tokens[0]) &&
      isSubjunctive(tokens[0]) && tokens.back().text != "?") {
    auto comma = firstComma(sentence, 1);
    if (comma && *comma > 1) {
      json details = {{"verb", tokens[0].text},
                      {"conditionalType", "inverted"}};
      results.push_back(makeResult(invertedPoint_,
                                   {tokenRange(sentence, 0, *comma - 1)}, 0.80,
                                   std::move(details)));
    }
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
