#include "pos_classifier.hpp"
#include "text_utils.hpp"

#include <algorithm>

namespace Satzbau {
namespace pos {

namespace {

using text::TextUtils;

bool contains(const std::vector<std::string> &set, const std::string &value) {
  return std::find(set.begin(), set.end(), value) != set.end();
}

const std::vector<std::string> kModalLemmas = {
    "müssen", "können", "sollen", "dürfen", "wollen", "mögen", "möchten"};

const std::vector<std::string> kReflexiveForms = {
    "mich", "dich", "sich", "uns", "euch", "mir", "dir", "ihm", "ihr", "ihnen"};

const std::vector<std::string> kRelativeLemmas = {
    "der",     "die",    "das",     "dem",     "den",
    "des",     "dessen", "deren",   "denen",   "welcher",
    "welche",  "welches", "welchem", "welchen"};

const std::vector<std::string> kSeparablePrefixes = {
    "ab",  "an",  "auf", "aus",   "bei",  "durch",  "ein",
    "fort", "her", "hin", "los",  "mit",  "nach",   "statt",
    "vor", "weg", "weiter", "zu", "zurück"};

const std::vector<std::pair<std::string, std::string>> kContractions = {
    {"zum", "zu"},      {"zur", "zu"},       {"am", "an"},
    {"ans", "an"},      {"im", "in"},        {"ins", "in"},
    {"vom", "von"},     {"beim", "bei"},     {"aufs", "auf"},
    {"durchs", "durch"}, {"fürs", "für"},    {"übers", "über"},
    {"ums", "um"},      {"unterm", "unter"}, {"hinterm", "hinter"},
    {"überm", "über"},  {"vors", "vor"}};

} // namespace

std::vector<std::string> POSClassifier::splitFeature(const std::string &feature,
                                                     char delimiter) {
  std::vector<std::string> result;
  std::string current;

  for (char c : feature) {
    if (c == delimiter) {
      result.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  if (!current.empty()) {
    result.push_back(current);
  }

  return result;
}

std::map<std::string, std::string>
POSClassifier::parseMorphology(const std::string &feature) {
  std::map<std::string, std::string> morph;
  for (const auto &field : splitFeature(feature, '|')) {
    auto eq = field.find('=');
    if (eq == std::string::npos || eq == 0)
      continue;
    morph[field.substr(0, eq)] = field.substr(eq + 1);
  }
  return morph;
}

std::string POSClassifier::morph(const Token &token, const std::string &key) {
  auto it = token.morph.find(key);
  return it == token.morph.end() ? std::string() : it->second;
}

bool POSClassifier::tagStartsWith(const Token &token, const char *prefix) {
  return TextUtils::startsWith(token.tag, prefix);
}

bool POSClassifier::isVerb(const Token &token) {
  return token.pos == "VERB" || tagStartsWith(token, "VV");
}

bool POSClassifier::isAuxiliary(const Token &token) {
  return token.pos == "AUX" || tagStartsWith(token, "VA") ||
         tagStartsWith(token, "VM");
}

bool POSClassifier::isVerbOrAux(const Token &token) {
  return isVerb(token) || isAuxiliary(token);
}

bool POSClassifier::isFiniteVerb(const Token &token) {
  if (!token.tag.empty()) {
    return token.tag == "VVFIN" || token.tag == "VAFIN" ||
           token.tag == "VMFIN" || token.tag == "VVIMP" ||
           token.tag == "VAIMP";
  }
  return isVerbOrAux(token) && morph(token, "VerbForm") == "Fin";
}

bool POSClassifier::isInfinitive(const Token &token) {
  if (!token.tag.empty()) {
    return token.tag == "VVINF" || token.tag == "VAINF" ||
           token.tag == "VMINF" || token.tag == "VVIZU";
  }
  return isVerbOrAux(token) && morph(token, "VerbForm") == "Inf";
}

bool POSClassifier::isPastParticiple(const Token &token) {
  if (!token.tag.empty()) {
    return token.tag == "VVPP" || token.tag == "VAPP" || token.tag == "VMPP";
  }
  return isVerbOrAux(token) && morph(token, "VerbForm") == "Part" &&
         morph(token, "Tense") != "Pres";
}

bool POSClassifier::isModalLemma(const std::string &lemma) {
  return contains(kModalLemmas, TextUtils::toLower(lemma));
}

bool POSClassifier::isModalVerb(const Token &token) {
  return tagStartsWith(token, "VM") || isModalLemma(token.lemma);
}

bool POSClassifier::isPerfectAuxiliaryLemma(const std::string &lemma) {
  std::string l = TextUtils::toLower(lemma);
  return l == "haben" || l == "sein" || l == "werden";
}

bool POSClassifier::isNoun(const Token &token) {
  return token.pos == "NOUN" || token.pos == "PROPN" || token.tag == "NN" ||
         token.tag == "NE";
}

bool POSClassifier::isProperNoun(const Token &token) {
  return token.pos == "PROPN" || token.tag == "NE";
}

bool POSClassifier::isDeterminer(const Token &token) {
  return token.pos == "DET" || token.tag == "ART";
}

bool POSClassifier::isAdjective(const Token &token) {
  return token.pos == "ADJ" || token.tag == "ADJA" || token.tag == "ADJD";
}

bool POSClassifier::isPronoun(const Token &token) {
  return token.pos == "PRON" || token.tag == "PRF" ||
         tagStartsWith(token, "PP") || token.tag == "PDS" ||
         token.tag == "PIS" || token.tag == "PRELS" || token.tag == "PWS";
}

bool POSClassifier::isNumeral(const Token &token) {
  return token.pos == "NUM" || token.tag == "CARD";
}

bool POSClassifier::isPunctuation(const Token &token) {
  return token.pos == "PUNCT" || tagStartsWith(token, "$");
}

bool POSClassifier::isComma(const Token &token) {
  return isPunctuation(token) && token.text == ",";
}

bool POSClassifier::isClausePunctuation(const Token &token) {
  if (!isPunctuation(token))
    return false;
  const std::string &t = token.text;
  return t == "," || t == "." || t == ";" || t == "!" || t == "?" || t == ":";
}

bool POSClassifier::isPreposition(const Token &token) {
  return token.pos == "ADP" || token.tag == "APPR" || token.tag == "APPRART" ||
         token.tag == "APPO" || token.tag == "APZR";
}

std::string POSClassifier::contractedPrepositionBase(const std::string &surface) {
  std::string lower = TextUtils::toLower(surface);
  for (const auto &entry : kContractions) {
    if (entry.first == lower)
      return entry.second;
  }
  return std::string();
}

bool POSClassifier::matchesPreposition(const Token &token,
                                       const std::string &lemma) {
  if (!isPreposition(token))
    return false;
  std::string expected = TextUtils::toLower(lemma);
  if (TextUtils::toLower(token.lemma) == expected ||
      TextUtils::toLower(token.text) == expected)
    return true;
  return contractedPrepositionBase(token.text) == expected;
}

bool POSClassifier::isReflexiveForm(const std::string &surface) {
  return contains(kReflexiveForms, TextUtils::toLower(surface));
}

bool POSClassifier::isReflexivePronoun(const Token &token) {
  if (!isPronoun(token))
    return false;
  if (morph(token, "Reflex") == "Yes" || token.tag == "PRF")
    return true;
  if (TextUtils::toLower(token.lemma) == "sich")
    return true;
  return isReflexiveForm(token.text);
}

bool POSClassifier::isSubject(const Token &token) {
  return token.dep == "nsubj" || token.dep == "nsubj:pass" ||
         token.dep == "sb" || token.dep == "sbp";
}

bool POSClassifier::isSeparableParticle(const Token &token) {
  return token.tag == "PTKVZ" || token.dep == "svp" ||
         token.dep == "compound:prt";
}

bool POSClassifier::isParticleLike(const Token &token) {
  return isSeparableParticle(token) || token.pos == "PART" ||
         token.pos == "ADV" || token.pos == "ADP";
}

const std::vector<std::string> &POSClassifier::separablePrefixes() {
  return kSeparablePrefixes;
}

bool POSClassifier::isSubordinatingConjunction(const Token &token) {
  return token.pos == "SCONJ" || token.tag == "KOUS" || token.tag == "KOUI";
}

bool POSClassifier::isCoordinatingConjunction(const Token &token) {
  return token.pos == "CCONJ" || token.tag == "KON";
}

bool POSClassifier::isRelativePronounTag(const Token &token) {
  return token.tag == "PRELS" || token.tag == "PRELAT" ||
         morph(token, "PronType") == "Rel";
}

bool POSClassifier::isRelativePronounLemma(const std::string &lemma) {
  return contains(kRelativeLemmas, TextUtils::toLower(lemma));
}

} // namespace pos
} // namespace Satzbau
