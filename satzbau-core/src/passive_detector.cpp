#include "detector_helpers.hpp"
#include "peer_detectors.hpp"
#include "pos_classifier.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <optional>
#include <string>

namespace Satzbau {
namespace detect {

using pos::POSClassifier;
using text::TextUtils;

namespace {

bool hasLemma(const Token &t, const char *lemma) {
  return TextUtils::toLower(t.lemma) == lemma;
}

bool isPastForm(const Token &werden) {
  if (POSClassifier::morph(werden, "Tense") == "Past")
    return true;
  return TextUtils::startsWith(TextUtils::toLower(werden.text), "wurd");
}

bool isAgentPreposition(const Token &t) {
  return POSClassifier::matchesPreposition(t, "von") ||
         POSClassifier::matchesPreposition(t, "durch");
}

} // namespace

PassiveDetector::PassiveDetector(const GrammarCatalog &catalog)
    : presentPoint_(catalog.get("b1-passive-voice-present")),
      pastPoint_(catalog.get("b1-passive-voice-past")),
      agentPoint_(catalog.get("b2-passive-von-durch")),
      statalPoint_(catalog.get("b2-statal-passive")) {}

std::vector<DetectionResult>
PassiveDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &aux = tokens[i];
    if (!POSClassifier::isVerbOrAux(aux) || !hasLemma(aux, "werden"))
      continue;
    // "worden" closes a perfect passive that the finite verb already covers
    if (POSClassifier::isPastParticiple(aux))
      continue;

    auto participle = findFollowingParticiple(sentence, i);
    if (!participle)
      continue;

    bool past = isPastForm(aux);
    const GrammarPoint &point = past ? pastPoint_ : presentPoint_;
    json details = {{"tense", past ? "past" : "present"},
                    {"auxiliary", aux.text},
                    {"participle", tokens[*participle].text}};
    results.push_back(makeResult(point, tokenRanges(sentence, {i, *participle}),
                                 0.95, details));

    // agent phrase inside the same clause
    std::optional<size_t> agent;
    for (size_t j = i + 1; j < tokens.size(); ++j) {
      if (POSClassifier::isClausePunctuation(tokens[j]))
        break;
      if (j != *participle && isAgentPreposition(tokens[j])) {
        agent = j;
        break;
      }
    }
    if (!agent)
      continue;

    size_t agentEnd = *agent;
    for (size_t j = *agent + 1; j < tokens.size(); ++j) {
      const Token &t = tokens[j];
      if (POSClassifier::isClausePunctuation(t) || POSClassifier::isVerbOrAux(t))
        break;
      agentEnd = j;
      if (POSClassifier::isNoun(t) || t.pos == "PRON")
        break;
    }

    std::vector<size_t> order = {i, *agent, *participle};
    std::sort(order.begin(), order.end());
    std::vector<CharRange> positions;
    for (size_t idx : order) {
      if (idx == *agent)
        positions.push_back(tokenRange(sentence, *agent, agentEnd));
      else
        positions.push_back(tokenRange(sentence, idx, idx));
    }

    json agentDetails = details;
    agentDetails["agentPreposition"] = tokens[*agent].text;
    agentDetails["agent"] = tokens[agentEnd].text;
    results.push_back(
        makeResult(agentPoint_, std::move(positions), 0.95, agentDetails));
  }

  // sein + participle
  for (size_t i = 0; i + 1 < tokens.size(); ++i) {
    const Token &aux = tokens[i];
    if (!POSClassifier::isVerbOrAux(aux) || !hasLemma(aux, "sein"))
      continue;
    const Token &next = tokens[i + 1];
    if (!POSClassifier::isPastParticiple(next))
      continue;

    // perfect passive: "ist gebaut worden"
    if (i + 2 < tokens.size() && hasLemma(tokens[i + 2], "werden")) {
      json details = {{"tense", "perfect"},
                      {"auxiliary", aux.text},
                      {"participle", next.text},
                      {"passiveAuxiliary", tokens[i + 2].text}};
      results.push_back(makeResult(pastPoint_,
                                   tokenRanges(sentence, {i, i + 1, i + 2}),
                                   0.95, std::move(details)));
      continue;
    }
    // aux of the participle means perfect tense ("ist gekommen")
    if (aux.dep == "aux")
      continue;

    json details = {{"auxiliary", aux.text}, {"participle", next.text}};
    results.push_back(makeResult(statalPoint_,
                                 tokenRanges(sentence, {i, i + 1}), 0.90,
                                 std::move(details)));
  }

  return results;
}

} // namespace detect
} // namespace Satzbau
