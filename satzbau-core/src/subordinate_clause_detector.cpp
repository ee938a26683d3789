#include "subordinate_clause_detector.hpp"
#include "dependency_utils.hpp"
#include "detector_helpers.hpp"
#include "pos_classifier.hpp"
#include "text_offsets.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>

namespace Satzbau {
namespace detect {

using pos::POSClassifier;
using text::TextUtils;

namespace {

static bool isDebugEnabled() {
  static const bool debug = (std::getenv("SATZBAU_DEBUG") != nullptr);
  return debug;
}

const std::map<std::string, std::string> kConjunctionFunctions = {
    {"dass", "completive"},   {"ob", "interrogative"},
    {"weil", "causal"},       {"da", "causal"},
    {"wenn", "conditional"},  {"falls", "conditional"},
    {"sofern", "conditional"}, {"obwohl", "concessive"},
    {"obgleich", "concessive"}, {"obschon", "concessive"},
    {"als", "temporal"},      {"nachdem", "temporal"},
    {"bevor", "temporal"},    {"während", "temporal"},
    {"bis", "temporal"},      {"seit", "temporal"},
    {"sobald", "temporal"},   {"sooft", "temporal"},
    {"damit", "purpose"},     {"sodass", "result"},
    {"indem", "modal"}};

const std::map<std::string, std::string> kInfinitiveFunctions = {
    {"um", "purpose"},
    {"ohne", "manner"},
    {"statt", "alternative"},
    {"anstatt", "alternative"}};

constexpr double kNestingFactor = 0.9;

std::string markerLemma(const Token &t) {
  return TextUtils::toLower(t.lemma.empty() ? t.text : t.lemma);
}

bool isZu(const Token &t) {
  return t.tag == "PTKZU" || t.tag == "VVIZU" ||
         TextUtils::toLower(t.text) == "zu";
}

const char *verbForm(const Token &t, const ClauseVerb &verb) {
  if (verb.compound)
    return "compound";
  if (verb.finite)
    return "finite";
  if (POSClassifier::isInfinitive(t))
    return "infinitive";
  if (POSClassifier::isPastParticiple(t))
    return "participle";
  return "unknown";
}

} // namespace

const char *markerKindName(MarkerKind kind) {
  switch (kind) {
  case MarkerKind::Conjunction:
    return "conjunction";
  case MarkerKind::RelativePronoun:
    return "relative-pronoun";
  case MarkerKind::InfinitiveMarker:
    return "infinitive-marker";
  }
  return "unknown";
}

const char *clauseTypeName(ClauseType type) {
  switch (type) {
  case ClauseType::Completive:
    return "completive";
  case ClauseType::Adverbial:
    return "adverbial";
  case ClauseType::Relative:
    return "relative";
  case ClauseType::Infinitive:
    return "infinitive";
  }
  return "unknown";
}

const char *verbStrategyName(VerbStrategy strategy) {
  switch (strategy) {
  case VerbStrategy::MarkerHead:
    return "marker-head";
  case VerbStrategy::RelativeScan:
    return "relative-scan";
  case VerbStrategy::InfinitiveScan:
    return "infinitive-scan";
  case VerbStrategy::FiniteScan:
    return "finite-scan";
  case VerbStrategy::AnyVerb:
    return "any-verb";
  }
  return "unknown";
}

SubordinateClauseDetector::SubordinateClauseDetector(
    const GrammarCatalog &catalog)
    : adverbialPoint_(catalog.get("b1-subordinate-clauses")),
      relativePoint_(catalog.get("b1-relative-clauses")),
      infinitivePoint_(catalog.get("b2-infinitive-clauses")) {}

bool SubordinateClauseDetector::isConjunctionMarker(const Token &token) {
  return POSClassifier::isSubordinatingConjunction(token) &&
         kConjunctionFunctions.count(markerLemma(token)) > 0;
}

bool SubordinateClauseDetector::isRelativeMarker(const Sentence &sentence,
                                                 size_t index) {
  const auto &tokens = sentence.tokens;
  const Token &t = tokens[index];
  if (POSClassifier::isRelativePronounTag(t))
    return true;
  // untagged input: pronoun from the relative set right after a comma,
  // optionally behind a preposition ("..., mit dem ...")
  if (t.pos != "PRON" || !t.tag.empty() ||
      !POSClassifier::isRelativePronounLemma(markerLemma(t)))
    return false;
  if (index >= 1 && POSClassifier::isComma(tokens[index - 1]))
    return true;
  return index >= 2 && POSClassifier::isPreposition(tokens[index - 1]) &&
         POSClassifier::isComma(tokens[index - 2]);
}

std::vector<ClauseMarker>
SubordinateClauseDetector::findMarkers(const Sentence &sentence) {
  const auto &tokens = sentence.tokens;
  std::vector<ClauseMarker> markers;

  for (size_t i = 0; i < tokens.size(); ++i) {
    const Token &t = tokens[i];
    ClauseMarker marker;
    marker.tokenIndex = i;
    marker.lemma = markerLemma(t);
    marker.text = t.text;

    if (isConjunctionMarker(t)) {
      marker.kind = MarkerKind::Conjunction;
      markers.push_back(marker);
      continue;
    }
    if (isRelativeMarker(sentence, i)) {
      marker.kind = MarkerKind::RelativePronoun;
      markers.push_back(marker);
      continue;
    }
    if (kInfinitiveFunctions.count(marker.lemma)) {
      for (size_t j = i + 1; j < tokens.size() && j <= i + 3; ++j) {
        if (isZu(tokens[j])) {
          marker.kind = MarkerKind::InfinitiveMarker;
          marker.zuIndex = j;
          markers.push_back(marker);
          break;
        }
      }
    }
  }
  return markers;
}

void SubordinateClauseDetector::linkCompound(const Sentence &sentence,
                                             const ClauseMarker &marker,
                                             ClauseVerb &verb) {
  const auto &tokens = sentence.tokens;
  const Token &vt = tokens[verb.tokenIndex];

  std::function<bool(const Token &)> isAuxiliary;
  if (POSClassifier::isPastParticiple(vt)) {
    isAuxiliary = [](const Token &t) {
      return POSClassifier::isVerbOrAux(t) &&
             POSClassifier::isPerfectAuxiliaryLemma(t.lemma);
    };
  } else if (POSClassifier::isInfinitive(vt) &&
             marker.kind != MarkerKind::InfinitiveMarker) {
    isAuxiliary = [](const Token &t) {
      return POSClassifier::isVerbOrAux(t) && POSClassifier::isModalVerb(t);
    };
  } else {
    return;
  }

  auto stops = [](const Token &t) {
    return POSClassifier::isClausePunctuation(t) ||
           POSClassifier::isSubordinatingConjunction(t);
  };

  for (size_t i = verb.tokenIndex; i > marker.tokenIndex + 1;) {
    --i;
    if (stops(tokens[i]))
      break;
    if (isAuxiliary(tokens[i])) {
      verb.compound = true;
      verb.auxiliaryIndex = i;
      return;
    }
  }
  // verb-final clauses put the finite auxiliary after the participle
  for (size_t i = verb.tokenIndex + 1; i < tokens.size(); ++i) {
    if (stops(tokens[i]) || POSClassifier::isCoordinatingConjunction(tokens[i]))
      break;
    if (isAuxiliary(tokens[i])) {
      verb.compound = true;
      verb.auxiliaryIndex = i;
      return;
    }
  }
}

std::optional<ClauseVerb>
SubordinateClauseDetector::locateVerb(const Sentence &sentence,
                                      const ClauseMarker &marker) {
  const auto &tokens = sentence.tokens;
  const size_t m = marker.tokenIndex;
  std::optional<size_t> found;
  VerbStrategy strategy = VerbStrategy::MarkerHead;

  auto head = deps::headIndex(tokens, m);
  if (head && *head > m && POSClassifier::isVerbOrAux(tokens[*head]))
    found = head;

  if (!found && marker.kind == MarkerKind::RelativePronoun) {
    for (size_t i = m + 1; i < tokens.size(); ++i) {
      if (POSClassifier::isClausePunctuation(tokens[i]))
        break;
      if (POSClassifier::isFiniteVerb(tokens[i])) {
        found = i;
        strategy = VerbStrategy::RelativeScan;
        break;
      }
    }
  }

  if (!found && marker.kind == MarkerKind::InfinitiveMarker && marker.zuIndex) {
    size_t zu = *marker.zuIndex;
    if (tokens[zu].tag == "VVIZU") {
      found = zu;
      strategy = VerbStrategy::InfinitiveScan;
    }
    for (size_t i = zu + 1; !found && i < tokens.size(); ++i) {
      const Token &t = tokens[i];
      if (POSClassifier::isPunctuation(t))
        break;
      if (POSClassifier::isInfinitive(t) ||
          (POSClassifier::isVerb(t) && !POSClassifier::isFiniteVerb(t))) {
        found = i;
        strategy = VerbStrategy::InfinitiveScan;
      }
    }
  }

  if (!found) {
    for (size_t i = m + 1; i < tokens.size(); ++i) {
      const Token &t = tokens[i];
      if (POSClassifier::isPunctuation(t) ||
          POSClassifier::isSubordinatingConjunction(t))
        break;
      if (POSClassifier::isFiniteVerb(t)) {
        found = i;
        strategy = VerbStrategy::FiniteScan;
        break;
      }
    }
  }

  if (!found) {
    for (size_t i = m + 1; i < tokens.size(); ++i) {
      const Token &t = tokens[i];
      if (POSClassifier::isPunctuation(t))
        break;
      if (POSClassifier::isVerbOrAux(t)) {
        found = i;
        strategy = VerbStrategy::AnyVerb;
        break;
      }
    }
  }

  if (!found)
    return std::nullopt;

  const Token &vt = tokens[*found];
  ClauseVerb verb;
  verb.tokenIndex = *found;
  verb.lemma = vt.lemma;
  verb.text = vt.text;
  verb.tag = vt.tag;
  verb.finite = POSClassifier::isFiniteVerb(vt) ||
                vt.tag.find("FIN") != std::string::npos;
  verb.strategy = strategy;
  linkCompound(sentence, marker, verb);
  return verb;
}

ClauseBoundary
SubordinateClauseDetector::extendBoundary(const Sentence &sentence,
                                          const ClauseMarker &marker,
                                          const ClauseVerb &verb) {
  const auto &tokens = sentence.tokens;
  ClauseBoundary boundary;
  boundary.start = marker.tokenIndex;
  boundary.end = std::max(verb.tokenIndex,
                          verb.auxiliaryIndex.value_or(verb.tokenIndex));

  bool infinitive = marker.kind == MarkerKind::InfinitiveMarker;
  for (size_t i = boundary.end + 1; i < tokens.size(); ++i) {
    const Token &t = tokens[i];
    if (POSClassifier::isSeparableParticle(t)) {
      boundary.end = i;
      continue;
    }
    if (POSClassifier::isClausePunctuation(t) ||
        POSClassifier::isCoordinatingConjunction(t) ||
        POSClassifier::isSubordinatingConjunction(t) ||
        isRelativeMarker(sentence, i))
      break;
    if (infinitive && POSClassifier::isFiniteVerb(t))
      break;
    boundary.end = i;
  }

  boundary.startChar = tokens[boundary.start].characterStart;
  boundary.endChar = tokens[boundary.end].characterEnd;
  return boundary;
}

std::string SubordinateClauseDetector::clauseFunction(const ClauseMarker &marker) {
  switch (marker.kind) {
  case MarkerKind::Conjunction: {
    auto it = kConjunctionFunctions.find(marker.lemma);
    return it == kConjunctionFunctions.end() ? std::string() : it->second;
  }
  case MarkerKind::RelativePronoun:
    return "attributive";
  case MarkerKind::InfinitiveMarker: {
    auto it = kInfinitiveFunctions.find(marker.lemma);
    return it == kInfinitiveFunctions.end() ? std::string() : it->second;
  }
  }
  return std::string();
}

void SubordinateClauseDetector::applyNesting(std::vector<Clause> &clauses) {
  auto strictlyInside = [](const ClauseBoundary &inner,
                           const ClauseBoundary &outer) {
    return outer.startChar <= inner.startChar &&
           inner.endChar <= outer.endChar &&
           (outer.startChar < inner.startChar || inner.endChar < outer.endChar);
  };

  std::vector<bool> nested(clauses.size(), false);
  for (size_t a = 0; a < clauses.size(); ++a) {
    for (size_t b = 0; b < clauses.size(); ++b) {
      if (a == b)
        continue;
      if (strictlyInside(clauses[a].boundary, clauses[b].boundary) ||
          strictlyInside(clauses[b].boundary, clauses[a].boundary)) {
        nested[a] = true;
        break;
      }
    }
  }
  for (size_t i = 0; i < clauses.size(); ++i) {
    if (!nested[i])
      continue;
    clauses[i].nested = true;
    clauses[i].confidence *= kNestingFactor;
  }
}

std::vector<Clause>
SubordinateClauseDetector::findClauses(const Sentence &sentence) const {
  std::vector<Clause> clauses;

  for (const auto &marker : findMarkers(sentence)) {
    auto verb = locateVerb(sentence, marker);
    if (!verb) {
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] no clause verb for marker '" << marker.text
                  << "' at " << marker.tokenIndex << std::endl;
      }
      continue;
    }

    Clause clause;
    clause.marker = marker;
    clause.verb = *verb;
    clause.boundary = extendBoundary(sentence, marker, *verb);
    clause.function = clauseFunction(marker);

    switch (marker.kind) {
    case MarkerKind::Conjunction:
      clause.type = (marker.lemma == "dass" || marker.lemma == "ob")
                        ? ClauseType::Completive
                        : ClauseType::Adverbial;
      break;
    case MarkerKind::RelativePronoun:
      clause.type = ClauseType::Relative;
      break;
    case MarkerKind::InfinitiveMarker:
      clause.type = ClauseType::Infinitive;
      break;
    }

    if (marker.kind == MarkerKind::Conjunction ||
        marker.kind == MarkerKind::RelativePronoun) {
      clause.confidence = (verb->finite || verb->compound) ? 0.95 : 0.85;
    } else if (marker.kind == MarkerKind::InfinitiveMarker) {
      clause.confidence = 0.80;
    } else {
      clause.confidence = 0.75;
    }

    clauses.push_back(std::move(clause));
  }

  applyNesting(clauses);
  return clauses;
}

std::vector<DetectionResult>
SubordinateClauseDetector::detect(const Sentence &sentence) const {
  std::vector<DetectionResult> results;

  for (const auto &clause : findClauses(sentence)) {
    const GrammarPoint *point = &adverbialPoint_;
    if (clause.type == ClauseType::Relative)
      point = &relativePoint_;
    else if (clause.type == ClauseType::Infinitive)
      point = &infinitivePoint_;

    const Token &vt = sentence.tokens[clause.verb.tokenIndex];
    json details = {
        {"marker", clause.marker.text},
        {"markerType", markerKindName(clause.marker.kind)},
        {"clauseType", clauseTypeName(clause.type)},
        {"function", clause.function},
        {"verb", clause.verb.text},
        {"verbLemma", clause.verb.lemma},
        {"verbForm", verbForm(vt, clause.verb)},
        {"verbStrategy", verbStrategyName(clause.verb.strategy)},
        {"nested", clause.nested},
        {"startToken", clause.boundary.start},
        {"endToken", clause.boundary.end},
        {"text", text::sliceCodePoints(sentence.text, clause.boundary.startChar,
                                       clause.boundary.endChar)}};
    if (clause.verb.auxiliaryIndex)
      details["auxiliary"] = sentence.tokens[*clause.verb.auxiliaryIndex].text;

    CharRange range{clause.boundary.startChar, clause.boundary.endChar};
    results.push_back(makeResult(*point, {range}, clause.confidence,
                                 std::move(details),
                                 clause.marker.lemma + "-clause"));
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
