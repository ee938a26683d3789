#pragma once

#include "ai_fallback.hpp"
#include "collocation_detector.hpp"
#include "collocation_table.hpp"
#include "detection_engine.hpp"
#include "grammar_catalog.hpp"
#include "sentence.hpp"
#include <memory>
#include <string>
#include <vector>

// Configuration structures (shared by the analyzer and its callers)
struct CatalogConfig {
  std::string grammarPointsPath; // grammar_points.json
  std::string collocationsPath;  // collocations.json
};

struct AnalysisConfig {
  double minConfidence = 0.5; // results below this are dropped
  bool parallelSentences = true;
  int maxWorkers = 0; // 0: one per hardware thread

  struct DetectorToggles {
    bool collocation = true;
    bool subordinateClause = true;
    bool separableVerb = true;
    bool agreement = true;
    bool wordOrder = true;
    bool passive = true;
    bool causative = true;
    bool tense = true;
    bool caseMarking = true; // "case"
    bool mood = true;
    bool modalVerb = true;
    bool reflexiveVerb = true;
    bool conditional = true;
    bool preposition = true;
  } detectors;

  struct CollocationSettings {
    int windowSize = 4;
    int separableWindow = 6;
  } collocation;
};

struct SatzbauConfig {
  CatalogConfig catalog;
  AnalysisConfig analysis;
  Satzbau::fallback::FallbackConfig fallback;
};

namespace Satzbau {

// Defaults with catalog paths under SATZBAU_DATA_DIR (environment first,
// then the compiled-in location).
SatzbauConfig defaultConfig();

// Overlays the keys present in `options`; unknown keys and keys of the
// wrong type are ignored.
void applyConfigJson(const json &options, SatzbauConfig &config);

// defaultConfig() overlaid with a JSON file. Throws CatalogError.
SatzbauConfig loadConfigFile(const std::string &path);

// Worker threads used for a document of `sentences` sentences; never more
// than the sentence count and at least one.
size_t documentWorkers(size_t sentences, int maxWorkers);

class Analyzer {
public:
  Analyzer();
  ~Analyzer();

  // Loads catalogs and builds the detector set. Returns false (and logs)
  // when the catalogs or configuration are invalid.
  bool initialize(const SatzbauConfig &config);

  // Same, with catalogs supplied by the caller.
  bool initialize(const SatzbauConfig &config,
                  std::shared_ptr<const GrammarCatalog> catalog,
                  std::shared_ptr<const CollocationTable> collocations);

  AnalysisResult analyzeSentence(const Sentence &sentence) const;
  std::vector<AnalysisResult>
  analyzeDocument(const std::vector<Sentence> &sentences) const;

  // Parser JSON in, output contract JSON out. Throws InputError.
  json analyzeJson(const json &document) const;

  bool isInitialized() const;
  const DetectionEngine &engine() const;
  const SatzbauConfig &config() const { return config_; }

  // Replaces the configured fallback, e.g. with a test double.
  void setFallback(std::shared_ptr<fallback::FallbackAnnotator> annotator);

  // Trace hook for the collocation matcher; takes effect on the next
  // initialize().
  void setTraceSink(detect::TraceSink sink) { trace_ = std::move(sink); }

private:
  std::unique_ptr<DetectionEngine> engine_;
  SatzbauConfig config_;
  std::shared_ptr<const GrammarCatalog> catalog_;
  std::shared_ptr<const CollocationTable> collocations_;
  detect::TraceSink trace_;
};

} // namespace Satzbau
