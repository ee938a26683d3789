#pragma once

#include "errors.hpp"
#include "sentence.hpp"
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Satzbau {

// Allowed dependency labels per companion role plus traversal bounds.
struct DependencySignature {
  std::vector<std::string> verbDeps;
  std::vector<std::string> reflexiveDeps;
  std::vector<std::string> prepDeps;
  std::vector<std::string> nounDeps;
  std::vector<std::string> particleDeps;
  int maxDepth{3};
  // Final labels a collapsed path may end on; empty means role defaults.
  std::vector<std::string> mustMatchDeps;
  // Preferred final labels when several candidates qualify.
  std::vector<std::string> shouldMatchDeps;

  static const DependencySignature &globalDefaults();
};

struct ReflexivePrepPattern {
  std::string preposition;
  std::string particle; // separable particle, e.g. "vor" in vorbereiten
};

struct VerbPrepPattern {
  std::string preposition;
  std::string particle;
};

struct VerbNounPattern {
  std::string noun; // empty: any noun object
};

struct SeparablePattern {
  std::string particle;
};

using CollocationPattern = std::variant<ReflexivePrepPattern, VerbPrepPattern,
                                        VerbNounPattern, SeparablePattern>;

// Order follows the CollocationPattern alternatives.
enum class CollocationKind { ReflexivePrep, VerbPrep, VerbNoun, Separable };

const char *kindName(CollocationKind kind);

struct CollocationDefinition {
  std::string id;
  std::string verbLemma; // stem without separable particle
  std::string label;
  std::string grammarPointId;
  std::string meaning;
  std::vector<std::string> examples;
  DependencySignature signature;
  CollocationPattern pattern;

  CollocationKind kind() const {
    return static_cast<CollocationKind>(pattern.index());
  }
  // Separable particle of the verb, if any.
  std::string particle() const;
};

class CollocationTable {
public:
  // {"defaults": {...signature...}, "collocations": [{...}, ...]}
  static CollocationTable fromJson(const json &doc);
  static CollocationTable fromFile(const std::string &path);

  // Validates and stores; throws CatalogError on duplicate ids.
  void add(CollocationDefinition definition);

  const CollocationDefinition *find(const std::string &id) const;
  const std::vector<CollocationDefinition> &definitions() const {
    return definitions_;
  }
  size_t size() const { return definitions_.size(); }

  static std::string deriveLabel(const CollocationDefinition &definition);

private:
  std::vector<CollocationDefinition> definitions_;
  std::unordered_map<std::string, size_t> byId_;
};

} // namespace Satzbau
