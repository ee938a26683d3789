#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Satzbau {

using json = nlohmann::json;

enum class CefrLevel { A1, A2, B1, B2, C1, C2 };

enum class GrammarCategory {
  Tense,
  Case,
  Voice,
  Mood,
  Agreement,
  Article,
  Adjective,
  Pronoun,
  Preposition,
  Conjunction,
  VerbForm,
  WordOrder,
  SeparableVerb,
  ModalVerb,
  ReflexiveVerb,
  Passive,
  Collocation
};

const char *levelName(CefrLevel level);
bool parseLevel(const std::string &name, CefrLevel &out);
const std::vector<CefrLevel> &allLevels();

const char *categoryName(GrammarCategory category);
bool parseCategory(const std::string &name, GrammarCategory &out);
const std::vector<GrammarCategory> &allCategories();

// Dependency head as delivered by the upstream parser: a token index, a
// token text/lemma that still has to be resolved, or nothing (root).
struct HeadRef {
  enum class Kind { None, Index, Text };

  Kind kind{Kind::None};
  int index{-1};
  std::string text;

  static HeadRef none() { return HeadRef{}; }
  static HeadRef fromIndex(int idx) {
    HeadRef h;
    h.kind = Kind::Index;
    h.index = idx;
    return h;
  }
  static HeadRef fromText(const std::string &value) {
    HeadRef h;
    h.kind = Kind::Text;
    h.text = value;
    return h;
  }
};

struct Token {
  std::string text;  // surface form
  std::string lemma; // base form
  std::string pos;   // coarse UD tag (VERB, ADP, ...)
  std::string tag;   // fine STTS tag (VVFIN, PTKVZ, ...)
  std::string dep;   // dependency relation
  HeadRef head;
  std::map<std::string, std::string> morph; // Case=Nom, Number=Sing, ...
  int index{0};
  int characterStart{0}; // code point offsets into Sentence::text
  int characterEnd{0};

  // named entity annotation
  std::string entityType; // LOC, PER, ORG, MISC
  int entityId{-1};
  bool entityStart{false};
  bool entityEnd{false};
  std::string entityText;

  bool isEntity() const { return entityId >= 0 || !entityType.empty(); }
};

struct Entity {
  int id{-1};
  std::string type;
  std::string text;
  std::vector<int> tokenIndices;
  int start{0};
  int end{0};
};

struct Sentence {
  std::string text;
  std::vector<Token> tokens;
  std::vector<Entity> entities;
};

struct CharRange {
  int start{0};
  int end{0};

  bool operator==(const CharRange &o) const {
    return start == o.start && end == o.end;
  }
  bool operator!=(const CharRange &o) const { return !(*this == o); }
};

struct DetectionResult {
  std::string grammarPointId;
  GrammarCategory category{GrammarCategory::Collocation};
  CefrLevel level{CefrLevel::B1};
  std::string name;  // grammar point display name
  std::string label; // concrete instance, e.g. "sich freuen auf"
  std::vector<CharRange> positions;
  double confidence{0.0};
  json details = json::object();

  // Smallest range covering all positions.
  CharRange span() const;
};

} // namespace Satzbau
