#include "collocation_table.hpp"
#include "grammar_catalog.hpp"
#include "text_utils.hpp"

#include <algorithm>

namespace Satzbau {

namespace {

using text::TextUtils;

const char *kDefaultGrammarPoint = "b1-collocations";

void mergeLabels(std::vector<std::string> &target,
                 const std::vector<std::string> &extra) {
  for (const auto &label : extra) {
    if (std::find(target.begin(), target.end(), label) == target.end())
      target.push_back(label);
  }
}

std::vector<std::string> readLabels(const json &obj, const char *key,
                                    const std::string &where) {
  std::vector<std::string> labels;
  if (!obj.contains(key))
    return labels;
  if (!obj[key].is_array()) {
    throw CatalogError(where + ": '" + key + "' must be an array");
  }
  for (const auto &label : obj[key]) {
    if (!label.is_string()) {
      throw CatalogError(where + ": '" + key + "' must contain strings");
    }
    labels.push_back(label.get<std::string>());
  }
  return labels;
}

// Reads signature fields from `obj` and merges them into `sig`.
void applySignature(const json &obj, DependencySignature &sig,
                    const std::string &where) {
  mergeLabels(sig.verbDeps, readLabels(obj, "verbDeps", where));
  mergeLabels(sig.reflexiveDeps, readLabels(obj, "reflexiveDeps", where));
  mergeLabels(sig.prepDeps, readLabels(obj, "prepDeps", where));
  mergeLabels(sig.nounDeps, readLabels(obj, "nounDeps", where));
  mergeLabels(sig.particleDeps, readLabels(obj, "particleDeps", where));
  if (obj.contains("maxDepth")) {
    if (!obj["maxDepth"].is_number_integer() || obj["maxDepth"] < 1) {
      throw CatalogError(where + ": 'maxDepth' must be a positive integer");
    }
    sig.maxDepth = obj["maxDepth"];
  }
  // must/should lists replace rather than merge
  if (obj.contains("mustMatchDeps"))
    sig.mustMatchDeps = readLabels(obj, "mustMatchDeps", where);
  if (obj.contains("shouldMatchDeps"))
    sig.shouldMatchDeps = readLabels(obj, "shouldMatchDeps", where);
}

std::string requireString(const json &entry, const char *key,
                          const std::string &where) {
  if (!entry.contains(key) || !entry[key].is_string() ||
      entry[key].get<std::string>().empty()) {
    throw CatalogError(where + ": missing string field '" + key + "'");
  }
  return entry[key].get<std::string>();
}

std::string optionalString(const json &entry, const char *key) {
  if (entry.contains(key) && entry[key].is_string())
    return entry[key].get<std::string>();
  return std::string();
}

CollocationDefinition parseDefinition(const json &entry,
                                      const DependencySignature &defaults,
                                      const std::string &position) {
  if (!entry.is_object()) {
    throw CatalogError(position + ": not an object");
  }

  CollocationDefinition def;
  def.id = requireString(entry, "id", position);
  std::string where = "collocation '" + def.id + "'";
  def.verbLemma = requireString(entry, "verb", where);

  std::string type = requireString(entry, "type", where);
  if (type == "reflexive-prep") {
    def.pattern = ReflexivePrepPattern{requireString(entry, "preposition", where),
                                       optionalString(entry, "particle")};
  } else if (type == "verb-prep") {
    def.pattern = VerbPrepPattern{requireString(entry, "preposition", where),
                                  optionalString(entry, "particle")};
  } else if (type == "verb-noun") {
    def.pattern = VerbNounPattern{optionalString(entry, "noun")};
  } else if (type == "separable") {
    def.pattern = SeparablePattern{requireString(entry, "particle", where)};
  } else {
    throw CatalogError(where + ": unknown type '" + type + "'");
  }

  def.label = optionalString(entry, "label");
  def.meaning = optionalString(entry, "meaning");
  def.grammarPointId = optionalString(entry, "grammarPoint");
  if (def.grammarPointId.empty())
    def.grammarPointId = kDefaultGrammarPoint;
  if (entry.contains("examples") && entry["examples"].is_array()) {
    for (const auto &ex : entry["examples"]) {
      if (ex.is_string())
        def.examples.push_back(ex.get<std::string>());
    }
  }

  def.signature = defaults;
  // legacy per-role lists sit directly on the entry
  applySignature(entry, def.signature, where);
  if (entry.contains("dependencySignature")) {
    if (!entry["dependencySignature"].is_object()) {
      throw CatalogError(where + ": 'dependencySignature' must be an object");
    }
    applySignature(entry["dependencySignature"], def.signature, where);
  }

  return def;
}

} // namespace

const DependencySignature &DependencySignature::globalDefaults() {
  static const DependencySignature defaults = [] {
    DependencySignature sig;
    sig.verbDeps = {"obj", "dobj", "oa", "obl", "nk"};
    sig.reflexiveDeps = {"obj", "iobj", "refl", "oa", "dobj"};
    sig.prepDeps = {"case", "op", "mnr", "prep"};
    sig.nounDeps = {"obj", "dobj", "oa", "nmod", "obl", "pobj", "nk"};
    sig.particleDeps = {"svp", "compound:prt", "prt", "mo", "advmod"};
    sig.maxDepth = 3;
    return sig;
  }();
  return defaults;
}

const char *kindName(CollocationKind kind) {
  switch (kind) {
  case CollocationKind::ReflexivePrep:
    return "reflexive-prep";
  case CollocationKind::VerbPrep:
    return "verb-prep";
  case CollocationKind::VerbNoun:
    return "verb-noun";
  case CollocationKind::Separable:
    return "separable";
  }
  return "unknown";
}

std::string CollocationDefinition::particle() const {
  if (auto p = std::get_if<ReflexivePrepPattern>(&pattern))
    return p->particle;
  if (auto p = std::get_if<VerbPrepPattern>(&pattern))
    return p->particle;
  if (auto p = std::get_if<SeparablePattern>(&pattern))
    return p->particle;
  return std::string();
}

std::string CollocationTable::deriveLabel(const CollocationDefinition &def) {
  std::string verb = def.particle() + def.verbLemma;
  if (auto p = std::get_if<ReflexivePrepPattern>(&def.pattern))
    return "sich " + verb + " " + p->preposition;
  if (auto p = std::get_if<VerbPrepPattern>(&def.pattern))
    return verb + " " + p->preposition;
  if (auto p = std::get_if<VerbNounPattern>(&def.pattern)) {
    if (p->noun.empty())
      return verb;
    return TextUtils::capitalize(p->noun) + " " + verb;
  }
  return verb;
}

CollocationTable CollocationTable::fromJson(const json &doc) {
  if (!doc.is_object() || !doc.contains("collocations") ||
      !doc["collocations"].is_array()) {
    throw CatalogError("collocation table: expected {\"collocations\": [...]}");
  }

  DependencySignature defaults = DependencySignature::globalDefaults();
  if (doc.contains("defaults")) {
    if (!doc["defaults"].is_object()) {
      throw CatalogError("collocation table: 'defaults' must be an object");
    }
    applySignature(doc["defaults"], defaults, "collocation defaults");
  }

  CollocationTable table;
  size_t position = 0;
  for (const auto &entry : doc["collocations"]) {
    table.add(parseDefinition(entry, defaults,
                              "collocation #" + std::to_string(position++)));
  }
  return table;
}

CollocationTable CollocationTable::fromFile(const std::string &path) {
  return fromJson(readJsonFile(path));
}

void CollocationTable::add(CollocationDefinition definition) {
  if (definition.id.empty() || definition.verbLemma.empty()) {
    throw CatalogError("collocation definition without id or verb");
  }
  if (byId_.count(definition.id)) {
    throw CatalogError("duplicate collocation id '" + definition.id + "'");
  }
  if (definition.kind() == CollocationKind::VerbNoun &&
      std::get<VerbNounPattern>(definition.pattern).noun.empty() &&
      definition.label.empty()) {
    throw CatalogError("collocation '" + definition.id +
                       "': verb-noun without noun needs a label");
  }
  if (definition.grammarPointId.empty())
    definition.grammarPointId = kDefaultGrammarPoint;
  if (definition.label.empty())
    definition.label = deriveLabel(definition);

  byId_[definition.id] = definitions_.size();
  definitions_.push_back(std::move(definition));
}

const CollocationDefinition *
CollocationTable::find(const std::string &id) const {
  auto it = byId_.find(id);
  if (it == byId_.end())
    return nullptr;
  return &definitions_[it->second];
}

} // namespace Satzbau
