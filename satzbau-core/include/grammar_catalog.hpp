#pragma once

#include "errors.hpp"
#include "sentence.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace Satzbau {

struct GrammarPoint {
  std::string id;
  GrammarCategory category{GrammarCategory::Collocation};
  CefrLevel level{CefrLevel::B1};
  std::string name;
  std::string description;
  std::string explanation;
  std::vector<std::string> examples;
};

class GrammarCatalog {
public:
  // {"grammarPoints": [{"id", "category", "level", "name", ...}]}
  static GrammarCatalog fromJson(const json &doc);
  static GrammarCatalog fromFile(const std::string &path);

  // Throws CatalogError on duplicate ids.
  void add(GrammarPoint point);

  const GrammarPoint *find(const std::string &id) const;
  // Throws CatalogError when the id is unknown.
  const GrammarPoint &get(const std::string &id) const;

  const std::vector<GrammarPoint> &points() const { return points_; }
  size_t size() const { return points_.size(); }

private:
  std::vector<GrammarPoint> points_;
  std::unordered_map<std::string, size_t> byId_;
};

// Reads a whole JSON file; throws CatalogError on I/O or parse failure.
json readJsonFile(const std::string &path);

} // namespace Satzbau
