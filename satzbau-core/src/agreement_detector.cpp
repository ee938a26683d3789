#include "dependency_utils.hpp"
#include "detector_helpers.hpp"
#include "peer_detectors.hpp"
#include "pos_classifier.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace Satzbau {
namespace detect {

using pos::POSClassifier;

namespace {

const std::vector<std::string> kChunkDeps = {"det",  "amod",  "compound",
                                             "nmod", "appos", "case", "nk"};

// Relations whose dependents inflect with the head noun.
const std::vector<std::string> kAgreeingDeps = {"det", "amod", "nk"};

const char *kFeatures[] = {"Case", "Number", "Gender"};

bool has(const std::vector<std::string> &labels, const std::string &label) {
  return std::find(labels.begin(), labels.end(), label) != labels.end();
}

bool isChunkHead(const Token &t) {
  return POSClassifier::isNoun(t) || t.pos == "PRON" ||
         POSClassifier::isNumeral(t);
}

} // namespace

AgreementDetector::AgreementDetector(const GrammarCatalog &catalog)
    : point_(catalog.get("b1-adjective-agreement")) {}

std::vector<DetectionResult>
AgreementDetector::detect(const Sentence &sentence) const {
  const auto &tokens = sentence.tokens;
  std::vector<DetectionResult> results;

  for (size_t head = 0; head < tokens.size(); ++head) {
    const Token &h = tokens[head];
    if (!isChunkHead(h))
      continue;

    // nouns hanging off another noun belong to that noun's chunk
    auto parent = deps::headIndex(tokens, head);
    if (parent && has(kChunkDeps, h.dep) && isChunkHead(tokens[*parent]))
      continue;

    std::set<size_t> members = {head};
    std::vector<size_t> frontier = {head};
    while (!frontier.empty()) {
      size_t node = frontier.back();
      frontier.pop_back();
      for (size_t child : deps::children(tokens, node)) {
        if (has(kChunkDeps, tokens[child].dep) && members.insert(child).second)
          frontier.push_back(child);
      }
    }
    if (members.size() < 2)
      continue;

    bool excluded = std::any_of(members.begin(), members.end(), [&](size_t i) {
      return POSClassifier::isProperNoun(tokens[i]) || tokens[i].isEntity();
    });
    if (excluded)
      continue;

    std::vector<size_t> compared = {head};
    for (size_t child : deps::children(tokens, head)) {
      const Token &c = tokens[child];
      bool inflecting = POSClassifier::isDeterminer(c) ||
                        (POSClassifier::isAdjective(c) && c.tag != "ADJD");
      if (inflecting && has(kAgreeingDeps, c.dep))
        compared.push_back(child);
    }
    if (compared.size() < 2)
      continue;

    std::string state = "correct";
    json conflicts = json::array();
    json features = json::object();
    bool missing = false;

    for (const char *feature : kFeatures) {
      std::set<std::string> values;
      for (size_t i : compared) {
        std::string value = POSClassifier::morph(tokens[i], feature);
        if (!value.empty())
          values.insert(value);
        else if (std::string(feature) != "Gender")
          missing = true; // gender is absent in the plural
      }
      if (values.size() == 1)
        features[feature] = *values.begin();
      else if (values.size() > 1)
        conflicts.push_back(feature);
    }

    double confidence = 0.85;
    if (!conflicts.empty()) {
      state = "error";
    } else if (missing) {
      state = "uncertain";
      confidence = 0.60;
    }

    size_t first = *members.begin();
    size_t last = *members.rbegin();
    std::vector<size_t> ordered(members.begin(), members.end());
    json details = {{"state", state},
                    {"head", h.text},
                    {"features", features},
                    {"conflicts", conflicts},
                    {"words", tokenTexts(sentence, ordered)}};
    results.push_back(makeResult(point_, {tokenRange(sentence, first, last)},
                                 confidence, std::move(details)));
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
