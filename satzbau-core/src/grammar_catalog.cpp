#include "grammar_catalog.hpp"

#include <fstream>

namespace Satzbau {

namespace {

std::string requireString(const json &entry, const char *key,
                          const std::string &where) {
  if (!entry.contains(key) || !entry[key].is_string() ||
      entry[key].get<std::string>().empty()) {
    throw CatalogError(where + ": missing string field '" + key + "'");
  }
  return entry[key].get<std::string>();
}

} // namespace

json readJsonFile(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw CatalogError("cannot open " + path);
  }
  try {
    return json::parse(in);
  } catch (const json::exception &e) {
    throw CatalogError(path + ": " + e.what());
  }
}

GrammarCatalog GrammarCatalog::fromJson(const json &doc) {
  if (!doc.is_object() || !doc.contains("grammarPoints") ||
      !doc["grammarPoints"].is_array()) {
    throw CatalogError("grammar catalog: expected {\"grammarPoints\": [...]}");
  }

  GrammarCatalog catalog;
  size_t position = 0;
  for (const auto &entry : doc["grammarPoints"]) {
    std::string where = "grammar point #" + std::to_string(position++);
    if (!entry.is_object()) {
      throw CatalogError(where + ": not an object");
    }

    GrammarPoint point;
    point.id = requireString(entry, "id", where);
    where = "grammar point '" + point.id + "'";
    point.name = requireString(entry, "name", where);

    std::string category = requireString(entry, "category", where);
    if (!parseCategory(category, point.category)) {
      throw CatalogError(where + ": unknown category '" + category + "'");
    }
    std::string level = requireString(entry, "level", where);
    if (!parseLevel(level, point.level)) {
      throw CatalogError(where + ": unknown level '" + level + "'");
    }

    if (entry.contains("description") && entry["description"].is_string())
      point.description = entry["description"];
    if (entry.contains("explanation") && entry["explanation"].is_string())
      point.explanation = entry["explanation"];
    if (entry.contains("examples") && entry["examples"].is_array()) {
      for (const auto &ex : entry["examples"]) {
        if (ex.is_string())
          point.examples.push_back(ex.get<std::string>());
      }
    }

    catalog.add(std::move(point));
  }
  return catalog;
}

GrammarCatalog GrammarCatalog::fromFile(const std::string &path) {
  return fromJson(readJsonFile(path));
}

void GrammarCatalog::add(GrammarPoint point) {
  if (byId_.count(point.id)) {
    throw CatalogError("duplicate grammar point id '" + point.id + "'");
  }
  byId_[point.id] = points_.size();
  points_.push_back(std::move(point));
}

const GrammarPoint *GrammarCatalog::find(const std::string &id) const {
  auto it = byId_.find(id);
  if (it == byId_.end())
    return nullptr;
  return &points_[it->second];
}

const GrammarPoint &GrammarCatalog::get(const std::string &id) const {
  const GrammarPoint *point = find(id);
  if (!point) {
    throw CatalogError("unknown grammar point id '" + id + "'");
  }
  return *point;
}

} // namespace Satzbau
