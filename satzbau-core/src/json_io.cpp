#include "json_io.hpp"
#include "pos_classifier.hpp"
#include "text_offsets.hpp"
#include "text_utils.hpp"

#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace Satzbau {
namespace io {

namespace {

using text::TextUtils;

std::string stringField(const json &obj, const char *key) {
  if (obj.contains(key) && obj[key].is_string())
    return TextUtils::sanitizeUTF8(obj[key].get<std::string>());
  return std::string();
}

int intField(const json &obj, const char *key, int fallback) {
  if (obj.contains(key) && obj[key].is_number_integer())
    return obj[key].get<int>();
  return fallback;
}

bool isInteger(const std::string &s) {
  if (s.empty())
    return false;
  size_t i = (s[0] == '-') ? 1 : 0;
  if (i == s.size())
    return false;
  for (; i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i])))
      return false;
  }
  return true;
}

HeadRef parseHead(const json &token) {
  if (!token.contains("head") || token["head"].is_null())
    return HeadRef::none();
  const json &head = token["head"];
  if (head.is_number_integer())
    return HeadRef::fromIndex(head.get<int>());
  if (head.is_string()) {
    std::string value = TextUtils::sanitizeUTF8(head.get<std::string>());
    if (isInteger(value)) {
      try {
        return HeadRef::fromIndex(std::stoi(value));
      } catch (const std::out_of_range &) {
        return HeadRef::none();
      }
    }
    if (value.empty())
      return HeadRef::none();
    return HeadRef::fromText(value);
  }
  return HeadRef::none();
}

std::map<std::string, std::string> parseMorph(const json &token) {
  std::map<std::string, std::string> morph;
  if (!token.contains("morph"))
    return morph;
  const json &m = token["morph"];
  if (m.is_string())
    return pos::POSClassifier::parseMorphology(m.get<std::string>());
  if (m.is_object()) {
    for (auto it = m.begin(); it != m.end(); ++it) {
      if (it.value().is_string())
        morph[it.key()] = it.value().get<std::string>();
    }
  }
  return morph;
}

json positionsToJson(const std::vector<CharRange> &positions) {
  json out = json::array();
  for (const auto &p : positions)
    out.push_back({{"start", p.start}, {"end", p.end}});
  return out;
}

} // namespace

Sentence sentenceFromJson(const json &payload) {
  if (!payload.is_object() || !payload.contains("text") ||
      !payload["text"].is_string()) {
    throw InputError("sentence: missing 'text'");
  }
  if (!payload.contains("tokens") || !payload["tokens"].is_array()) {
    throw InputError("sentence: missing 'tokens'");
  }

  Sentence sentence;
  sentence.text =
      TextUtils::sanitizeKeepingOffsets(payload["text"].get<std::string>());
  const int length = static_cast<int>(text::codePointLength(sentence.text));

  // parser index -> position in the token vector
  std::unordered_map<int, int> positionOf;
  int previousIndex = 0;

  for (const auto &item : payload["tokens"]) {
    const int position = static_cast<int>(sentence.tokens.size());
    const std::string where = "token #" + std::to_string(position);
    if (!item.is_object() || !item.contains("text") || !item["text"].is_string())
      throw InputError(where + ": missing 'text'");

    Token token;
    token.text = stringField(item, "text");
    token.lemma = stringField(item, "lemma");
    token.pos = stringField(item, "pos");
    token.tag = stringField(item, "tag");
    token.dep = stringField(item, "dep");
    token.head = parseHead(item);
    token.morph = parseMorph(item);

    int index = intField(item, "index", position);
    if (position > 0 && index <= previousIndex) {
      throw InputError(where + ": index " + std::to_string(index) +
                       " is not increasing");
    }
    previousIndex = index;
    positionOf[index] = position;
    token.index = position;

    if (!item.contains("characterStart") || !item.contains("characterEnd"))
      throw InputError(where + ": missing character offsets");
    token.characterStart = intField(item, "characterStart", -1);
    token.characterEnd = intField(item, "characterEnd", -1);
    if (token.characterStart < 0 || token.characterEnd <= token.characterStart ||
        token.characterEnd > length) {
      throw InputError(where + ": invalid character offsets [" +
                       std::to_string(token.characterStart) + ", " +
                       std::to_string(token.characterEnd) + ")");
    }

    token.entityType = stringField(item, "entity_type");
    if (item.contains("entity_id") && item["entity_id"].is_number_integer())
      token.entityId = item["entity_id"].get<int>();
    if (item.contains("is_entity_start") && item["is_entity_start"].is_boolean())
      token.entityStart = item["is_entity_start"];
    if (item.contains("is_entity_end") && item["is_entity_end"].is_boolean())
      token.entityEnd = item["is_entity_end"];
    token.entityText = stringField(item, "entity_text");

    sentence.tokens.push_back(std::move(token));
  }

  for (auto &token : sentence.tokens) {
    if (token.head.kind != HeadRef::Kind::Index)
      continue;
    auto it = positionOf.find(token.head.index);
    if (it == positionOf.end())
      token.head = HeadRef::none();
    else
      token.head.index = it->second;
  }

  if (payload.contains("entities") && payload["entities"].is_array()) {
    for (const auto &item : payload["entities"]) {
      if (!item.is_object())
        continue;
      Entity entity;
      entity.id = intField(item, "id", -1);
      entity.type = stringField(item, "type");
      if (entity.type.empty())
        entity.type = stringField(item, "label");
      entity.text = stringField(item, "text");
      entity.start = intField(item, "start", 0);
      entity.end = intField(item, "end", 0);
      const char *tokensKey = item.contains("tokenIndices") ? "tokenIndices"
                                                            : "tokens";
      if (item.contains(tokensKey) && item[tokensKey].is_array()) {
        for (const auto &idx : item[tokensKey]) {
          if (!idx.is_number_integer())
            continue;
          auto it = positionOf.find(idx.get<int>());
          if (it != positionOf.end())
            entity.tokenIndices.push_back(it->second);
        }
      }
      sentence.entities.push_back(std::move(entity));
    }
  }

  return sentence;
}

std::vector<Sentence> documentFromJson(const json &payload) {
  const json *list = &payload;
  if (payload.is_object() && payload.contains("sentences"))
    list = &payload["sentences"];
  if (!list->is_array()) {
    throw InputError("document: expected an array of sentences");
  }

  std::vector<Sentence> sentences;
  for (const auto &item : *list)
    sentences.push_back(sentenceFromJson(item));
  return sentences;
}

json resultToJson(const DetectionResult &result) {
  CharRange span = result.span();
  return {{"grammarPointId", result.grammarPointId},
          {"grammarPoint",
           {{"id", result.grammarPointId},
            {"name", result.name},
            {"category", categoryName(result.category)},
            {"level", levelName(result.level)}}},
          {"label", result.label},
          {"position", {{"start", span.start}, {"end", span.end}}},
          {"positions", positionsToJson(result.positions)},
          {"confidence", result.confidence},
          {"details", result.details}};
}

json analysisToJson(const AnalysisResult &analysis) {
  json points = json::array();
  for (const auto &r : analysis.grammarPoints)
    points.push_back(resultToJson(r));

  json byLevel = json::object();
  for (const auto &entry : analysis.byLevel) {
    json list = json::array();
    for (const auto &r : entry.second)
      list.push_back(resultToJson(r));
    byLevel[levelName(entry.first)] = list;
  }

  json byCategory = json::object();
  for (const auto &entry : analysis.byCategory) {
    json list = json::array();
    for (const auto &r : entry.second)
      list.push_back(resultToJson(r));
    byCategory[categoryName(entry.first)] = list;
  }

  json levels = json::object();
  for (const auto &entry : analysis.summary.levels)
    levels[levelName(entry.first)] = entry.second;
  json categories = json::object();
  for (const auto &entry : analysis.summary.categories)
    categories[categoryName(entry.first)] = entry.second;

  json out = {{"sentence", analysis.sentence},
              {"grammarPoints", points},
              {"byLevel", byLevel},
              {"byCategory", byCategory},
              {"summary",
               {{"totalPoints", analysis.summary.totalPoints},
                {"levels", levels},
                {"categories", categories}}},
              {"usedFallback", analysis.usedFallback}};
  if (!analysis.failedDetectors.empty())
    out["failedDetectors"] = analysis.failedDetectors;
  return out;
}

json documentToJson(const std::vector<AnalysisResult> &analyses) {
  json sentences = json::array();
  size_t total = 0;
  for (const auto &a : analyses) {
    sentences.push_back(analysisToJson(a));
    total += a.summary.totalPoints;
  }
  return {{"sentences", sentences}, {"totalPoints", total}};
}

} // namespace io
} // namespace Satzbau
