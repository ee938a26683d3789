#include "sentence.hpp"

#include <algorithm>

namespace Satzbau {

namespace {

struct LevelEntry {
  CefrLevel level;
  const char *name;
};

struct CategoryEntry {
  GrammarCategory category;
  const char *name;
};

const LevelEntry kLevels[] = {
    {CefrLevel::A1, "A1"}, {CefrLevel::A2, "A2"}, {CefrLevel::B1, "B1"},
    {CefrLevel::B2, "B2"}, {CefrLevel::C1, "C1"}, {CefrLevel::C2, "C2"},
};

const CategoryEntry kCategories[] = {
    {GrammarCategory::Tense, "tense"},
    {GrammarCategory::Case, "case"},
    {GrammarCategory::Voice, "voice"},
    {GrammarCategory::Mood, "mood"},
    {GrammarCategory::Agreement, "agreement"},
    {GrammarCategory::Article, "article"},
    {GrammarCategory::Adjective, "adjective"},
    {GrammarCategory::Pronoun, "pronoun"},
    {GrammarCategory::Preposition, "preposition"},
    {GrammarCategory::Conjunction, "conjunction"},
    {GrammarCategory::VerbForm, "verb-form"},
    {GrammarCategory::WordOrder, "word-order"},
    {GrammarCategory::SeparableVerb, "separable-verb"},
    {GrammarCategory::ModalVerb, "modal-verb"},
    {GrammarCategory::ReflexiveVerb, "reflexive-verb"},
    {GrammarCategory::Passive, "passive"},
    {GrammarCategory::Collocation, "collocation"},
};

} // namespace

const char *levelName(CefrLevel level) {
  for (const auto &entry : kLevels) {
    if (entry.level == level)
      return entry.name;
  }
  return "B1";
}

bool parseLevel(const std::string &name, CefrLevel &out) {
  for (const auto &entry : kLevels) {
    if (name == entry.name) {
      out = entry.level;
      return true;
    }
  }
  return false;
}

const std::vector<CefrLevel> &allLevels() {
  static const std::vector<CefrLevel> levels = [] {
    std::vector<CefrLevel> v;
    for (const auto &entry : kLevels)
      v.push_back(entry.level);
    return v;
  }();
  return levels;
}

const char *categoryName(GrammarCategory category) {
  for (const auto &entry : kCategories) {
    if (entry.category == category)
      return entry.name;
  }
  return "collocation";
}

bool parseCategory(const std::string &name, GrammarCategory &out) {
  for (const auto &entry : kCategories) {
    if (name == entry.name) {
      out = entry.category;
      return true;
    }
  }
  return false;
}

const std::vector<GrammarCategory> &allCategories() {
  static const std::vector<GrammarCategory> categories = [] {
    std::vector<GrammarCategory> v;
    for (const auto &entry : kCategories)
      v.push_back(entry.category);
    return v;
  }();
  return categories;
}

CharRange DetectionResult::span() const {
  if (positions.empty())
    return CharRange{};
  CharRange r = positions.front();
  for (const auto &p : positions) {
    r.start = std::min(r.start, p.start);
    r.end = std::max(r.end, p.end);
  }
  return r;
}

} // namespace Satzbau
