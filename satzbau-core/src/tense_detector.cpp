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

constexpr size_t kAuxiliaryWindow = 6;

bool isSubjunctiveOrImperative(const Token &token) {
  std::string mood = POSClassifier::morph(token, "Mood");
  return mood == "Sub" || mood == "Subj" || mood == "Imp" ||
         token.tag == "VVIMP" || token.tag == "VAIMP";
}

bool isPerfectAuxiliary(const Token &token) {
  if (!POSClassifier::isAuxiliary(token) && !POSClassifier::isVerb(token))
    return false;
  std::string lemma = TextUtils::toLower(token.lemma);
  return lemma == "haben" || lemma == "sein";
}

// haben/sein that builds the perfect with the participle at `participle`.
// Dependency children win; otherwise the nearest candidate in the same
// clause, searching backward first for verb-second order.
std::optional<size_t> findPerfectAuxiliary(const Sentence &sentence,
                                           size_t participle) {
  const auto &tokens = sentence.tokens;
  auto child = deps::findChild(tokens, participle, [](const Token &t) {
    return t.dep == "aux" && isPerfectAuxiliary(t);
  });
  if (child)
    return child;

  size_t first = participle > kAuxiliaryWindow ? participle - kAuxiliaryWindow : 0;
  for (size_t i = participle; i > first;) {
    --i;
    if (!deps::inSameClause(tokens, i, participle))
      break;
    if (isPerfectAuxiliary(tokens[i]) && tokens[i].dep != "aux:pass" &&
        tokens[i].dep != "cop")
      return i;
  }
  for (size_t i = participle + 1;
       i < tokens.size() && i <= participle + 2; ++i) {
    if (POSClassifier::isClausePunctuation(tokens[i]))
      break;
    if (isPerfectAuxiliary(tokens[i]) && tokens[i].dep != "aux:pass" &&
        tokens[i].dep != "cop")
      return i;
  }
  return std::nullopt;
}

bool followedByWorden(const Sentence &sentence, size_t participle) {
  size_t next = participle + 1;
  return next < sentence.tokens.size() &&
         TextUtils::toLower(sentence.tokens[next].text) == "worden";
}

} // namespace

TenseDetector::TenseDetector(const GrammarCatalog &catalog)
    : presentPoint_(catalog.get("a1-present-tense")),
      pastPoint_(catalog.get("a2-simple-past")),
      perfectPoint_(catalog.get("a2-present-perfect")),
      perfectSeinPoint_(catalog.get("b1-present-perfect-sein")) {}

std::vector<DetectionResult>
TenseDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;
  std::set<size_t> perfectAuxiliaries;

  for (size_t i = 0; i < tokens.size(); ++i) {
    if (!POSClassifier::isPastParticiple(tokens[i]) ||
        TextUtils::toLower(tokens[i].lemma) == "werden")
      continue;
    auto aux = findPerfectAuxiliary(sentence, i);
    if (!aux)
      continue;
    // "ist gebaut worden" is a passive; its auxiliary is not a tense marker.
    if (followedByWorden(sentence, i)) {
      perfectAuxiliaries.insert(*aux);
      continue;
    }

    const Token &auxiliary = tokens[*aux];
    bool withSein = TextUtils::toLower(auxiliary.lemma) == "sein";
    bool pluperfect = POSClassifier::morph(auxiliary, "Tense") == "Past";
    perfectAuxiliaries.insert(*aux);

    std::vector<size_t> indices = {std::min(i, *aux), std::max(i, *aux)};
    json details = {{"auxiliary", auxiliary.text},
                    {"participle", tokens[i].text},
                    {"tense", pluperfect ? "past-perfect" : "present-perfect"}};
    results.push_back(makeResult(withSein ? perfectSeinPoint_ : perfectPoint_,
                                 tokenRanges(sentence, indices),
                                 pluperfect ? 0.90 : 0.95, std::move(details)));
  }

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &verb = tokens[i];
    if (!POSClassifier::isFiniteVerb(verb) || isSubjunctiveOrImperative(verb) ||
        perfectAuxiliaries.count(i))
      continue;

    std::string tense = POSClassifier::morph(verb, "Tense");
    if (tense != "Pres" && tense != "Past")
      continue;

    json details = {{"verb", verb.text},
                    {"lemma", verb.lemma},
                    {"tense", tense == "Pres" ? "present" : "past"}};
    results.push_back(makeResult(tense == "Pres" ? presentPoint_ : pastPoint_,
                                 {tokenRange(sentence, i, i)}, 0.98,
                                 std::move(details)));
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
