#include "analyzer.hpp"
#include "json_io.hpp"
#include "peer_detectors.hpp"
#include "subordinate_clause_detector.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <thread>

#ifndef SATZBAU_DATA_DIR
#define SATZBAU_DATA_DIR "data"
#endif

namespace Satzbau {

namespace {

static bool isDebugEnabled() {
  static const bool debug = (std::getenv("SATZBAU_DEBUG") != nullptr);
  return debug;
}

std::unique_ptr<DetectionEngine>
buildEngine(const SatzbauConfig &config, const GrammarCatalog &catalog,
            std::shared_ptr<const CollocationTable> collocations,
            const detect::TraceSink &trace) {
  EngineOptions options;
  options.minConfidence = config.analysis.minConfidence;
  options.fallbackTimeout = std::chrono::milliseconds(config.fallback.timeoutMs);
  auto engine = std::make_unique<DetectionEngine>(options);

  const auto &toggles = config.analysis.detectors;
  if (toggles.collocation) {
    detect::CollocationOptions colloc;
    colloc.windowSize = static_cast<size_t>(config.analysis.collocation.windowSize);
    colloc.separableWindow =
        static_cast<size_t>(config.analysis.collocation.separableWindow);
    engine->registerDetector(std::make_unique<detect::CollocationDetector>(
        std::move(collocations), catalog, colloc, trace));
  }
  if (toggles.subordinateClause)
    engine->registerDetector(
        std::make_unique<detect::SubordinateClauseDetector>(catalog));
  if (toggles.separableVerb)
    engine->registerDetector(
        std::make_unique<detect::SeparableVerbDetector>(catalog));
  if (toggles.agreement)
    engine->registerDetector(std::make_unique<detect::AgreementDetector>(catalog));
  if (toggles.wordOrder)
    engine->registerDetector(std::make_unique<detect::WordOrderDetector>(catalog));
  if (toggles.passive)
    engine->registerDetector(std::make_unique<detect::PassiveDetector>(catalog));
  if (toggles.causative)
    engine->registerDetector(std::make_unique<detect::CausativeDetector>(catalog));
  if (toggles.tense)
    engine->registerDetector(std::make_unique<detect::TenseDetector>(catalog));
  if (toggles.caseMarking)
    engine->registerDetector(std::make_unique<detect::CaseDetector>(catalog));
  if (toggles.mood)
    engine->registerDetector(std::make_unique<detect::MoodDetector>(catalog));
  if (toggles.modalVerb)
    engine->registerDetector(std::make_unique<detect::ModalVerbDetector>(catalog));
  if (toggles.reflexiveVerb)
    engine->registerDetector(
        std::make_unique<detect::ReflexiveVerbDetector>(catalog));
  if (toggles.conditional)
    engine->registerDetector(
        std::make_unique<detect::ConditionalDetector>(catalog));
  if (toggles.preposition)
    engine->registerDetector(
        std::make_unique<detect::PrepositionDetector>(catalog));
  return engine;
}

} // namespace

SatzbauConfig defaultConfig() {
  SatzbauConfig config;
  const char *env = std::getenv("SATZBAU_DATA_DIR");
  std::string dataDir = (env && *env) ? env : SATZBAU_DATA_DIR;
  config.catalog.grammarPointsPath = dataDir + "/grammar_points.json";
  config.catalog.collocationsPath = dataDir + "/collocations.json";
  return config;
}

void applyConfigJson(const json &opts, SatzbauConfig &config) {
  if (!opts.is_object())
    return;

  if (opts.contains("catalog") && opts["catalog"].is_object()) {
    auto catalog = opts["catalog"];
    if (catalog.contains("grammarPoints") && catalog["grammarPoints"].is_string()) {
      config.catalog.grammarPointsPath = catalog["grammarPoints"];
    }
    if (catalog.contains("collocations") && catalog["collocations"].is_string()) {
      config.catalog.collocationsPath = catalog["collocations"];
    }
  }

  if (opts.contains("analysis") && opts["analysis"].is_object()) {
    auto analysis = opts["analysis"];
    if (analysis.contains("minConfidence") &&
        analysis["minConfidence"].is_number()) {
      config.analysis.minConfidence = analysis["minConfidence"];
    }
    if (analysis.contains("parallelSentences") &&
        analysis["parallelSentences"].is_boolean()) {
      config.analysis.parallelSentences = analysis["parallelSentences"];
    }
    if (analysis.contains("maxWorkers") &&
        analysis["maxWorkers"].is_number_integer() &&
        analysis["maxWorkers"] >= 0) {
      config.analysis.maxWorkers = analysis["maxWorkers"];
    }

    if (analysis.contains("detectors") && analysis["detectors"].is_object()) {
      auto detectors = analysis["detectors"];
      auto &toggles = config.analysis.detectors;
      if (detectors.contains("collocation") &&
          detectors["collocation"].is_boolean()) {
        toggles.collocation = detectors["collocation"];
      }
      if (detectors.contains("subordinateClause") &&
          detectors["subordinateClause"].is_boolean()) {
        toggles.subordinateClause = detectors["subordinateClause"];
      }
      if (detectors.contains("separableVerb") &&
          detectors["separableVerb"].is_boolean()) {
        toggles.separableVerb = detectors["separableVerb"];
      }
      if (detectors.contains("agreement") && detectors["agreement"].is_boolean()) {
        toggles.agreement = detectors["agreement"];
      }
      if (detectors.contains("wordOrder") && detectors["wordOrder"].is_boolean()) {
        toggles.wordOrder = detectors["wordOrder"];
      }
      if (detectors.contains("passive") && detectors["passive"].is_boolean()) {
        toggles.passive = detectors["passive"];
      }
      if (detectors.contains("causative") && detectors["causative"].is_boolean()) {
        toggles.causative = detectors["causative"];
      }
      if (detectors.contains("tense") && detectors["tense"].is_boolean()) {
        toggles.tense = detectors["tense"];
      }
      if (detectors.contains("case") && detectors["case"].is_boolean()) {
        toggles.caseMarking = detectors["case"];
      }
      if (detectors.contains("mood") && detectors["mood"].is_boolean()) {
        toggles.mood = detectors["mood"];
      }
      if (detectors.contains("modalVerb") && detectors["modalVerb"].is_boolean()) {
        toggles.modalVerb = detectors["modalVerb"];
      }
      if (detectors.contains("reflexiveVerb") &&
          detectors["reflexiveVerb"].is_boolean()) {
        toggles.reflexiveVerb = detectors["reflexiveVerb"];
      }
      if (detectors.contains("conditional") &&
          detectors["conditional"].is_boolean()) {
        toggles.conditional = detectors["conditional"];
      }
      if (detectors.contains("preposition") &&
          detectors["preposition"].is_boolean()) {
        toggles.preposition = detectors["preposition"];
      }
    }

    if (analysis.contains("collocation") && analysis["collocation"].is_object()) {
      auto colloc = analysis["collocation"];
      if (colloc.contains("windowSize") &&
          colloc["windowSize"].is_number_integer() && colloc["windowSize"] > 0) {
        config.analysis.collocation.windowSize = colloc["windowSize"];
      }
      if (colloc.contains("separableWindow") &&
          colloc["separableWindow"].is_number_integer() &&
          colloc["separableWindow"] > 0) {
        config.analysis.collocation.separableWindow = colloc["separableWindow"];
      }
    }
  }

  if (opts.contains("fallback") && opts["fallback"].is_object()) {
    auto fb = opts["fallback"];
    if (fb.contains("enabled") && fb["enabled"].is_boolean()) {
      config.fallback.enabled = fb["enabled"];
    }
    if (fb.contains("endpoint") && fb["endpoint"].is_string()) {
      config.fallback.endpoint = fb["endpoint"];
    }
    if (fb.contains("model") && fb["model"].is_string()) {
      config.fallback.model = fb["model"];
    }
    if (fb.contains("apiKeyEnv") && fb["apiKeyEnv"].is_string()) {
      config.fallback.apiKeyEnv = fb["apiKeyEnv"];
    }
    if (fb.contains("timeoutMs") && fb["timeoutMs"].is_number_integer() &&
        fb["timeoutMs"] > 0) {
      config.fallback.timeoutMs = fb["timeoutMs"];
    }
    if (fb.contains("connectTimeoutMs") &&
        fb["connectTimeoutMs"].is_number_integer() &&
        fb["connectTimeoutMs"] > 0) {
      config.fallback.connectTimeoutMs = fb["connectTimeoutMs"];
    }
    if (fb.contains("maxConfidence") && fb["maxConfidence"].is_number()) {
      config.fallback.maxConfidence = fb["maxConfidence"];
    }
  }
}

size_t documentWorkers(size_t sentences, int maxWorkers) {
  size_t limit = maxWorkers > 0 ? static_cast<size_t>(maxWorkers)
                                : std::thread::hardware_concurrency();
  if (limit == 0)
    limit = 2;
  return std::max<size_t>(1, std::min(limit, sentences));
}

SatzbauConfig loadConfigFile(const std::string &path) {
  SatzbauConfig config = defaultConfig();
  applyConfigJson(readJsonFile(path), config);
  return config;
}

Analyzer::Analyzer() = default;
Analyzer::~Analyzer() = default;

bool Analyzer::initialize(const SatzbauConfig &config) {
  std::shared_ptr<const GrammarCatalog> catalog;
  std::shared_ptr<const CollocationTable> collocations;
  try {
    catalog = std::make_shared<const GrammarCatalog>(
        GrammarCatalog::fromFile(config.catalog.grammarPointsPath));
    collocations = std::make_shared<const CollocationTable>(
        CollocationTable::fromFile(config.catalog.collocationsPath));
  } catch (const CatalogError &e) {
    std::cerr << "[ERROR] Failed to load catalogs: " << e.what() << std::endl;
    return false;
  }
  return initialize(config, std::move(catalog), std::move(collocations));
}

bool Analyzer::initialize(const SatzbauConfig &config,
                          std::shared_ptr<const GrammarCatalog> catalog,
                          std::shared_ptr<const CollocationTable> collocations) {
  if (!catalog || !collocations) {
    std::cerr << "[ERROR] Analyzer needs a grammar catalog and a collocation "
                 "table"
              << std::endl;
    return false;
  }

  std::unique_ptr<DetectionEngine> engine;
  try {
    engine = buildEngine(config, *catalog, collocations, trace_);
    if (config.fallback.enabled) {
      engine->setFallback(
          std::make_shared<fallback::AiFallbackClient>(config.fallback, catalog));
    }
  } catch (const CatalogError &e) {
    std::cerr << "[ERROR] Failed to build detectors: " << e.what() << std::endl;
    return false;
  }

  config_ = config;
  catalog_ = std::move(catalog);
  collocations_ = std::move(collocations);
  engine_ = std::move(engine);

  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] Analyzer initialized: " << catalog_->size()
              << " grammar points, " << collocations_->size()
              << " collocations, " << engine_->detectorIds().size()
              << " detectors" << std::endl;
  }
  return true;
}

bool Analyzer::isInitialized() const { return engine_ != nullptr; }

const DetectionEngine &Analyzer::engine() const {
  if (!engine_) {
    throw std::logic_error("Analyzer is not initialized");
  }
  return *engine_;
}

void Analyzer::setFallback(
    std::shared_ptr<fallback::FallbackAnnotator> annotator) {
  if (engine_)
    engine_->setFallback(std::move(annotator));
}

AnalysisResult Analyzer::analyzeSentence(const Sentence &sentence) const {
  if (!engine_) {
    AnalysisResult empty;
    empty.sentence = sentence.text;
    DetectionEngine::aggregate(empty);
    return empty;
  }
  return engine_->analyze(sentence);
}

std::vector<AnalysisResult>
Analyzer::analyzeDocument(const std::vector<Sentence> &sentences) const {
  std::vector<AnalysisResult> results;
  results.reserve(sentences.size());

  if (!config_.analysis.parallelSentences || sentences.size() < 2) {
    for (const auto &s : sentences)
      results.push_back(analyzeSentence(s));
    return results;
  }

  const size_t workers =
      documentWorkers(sentences.size(), config_.analysis.maxWorkers);
  results.resize(sentences.size());
  std::atomic<size_t> next{0};

  std::vector<std::future<void>> pending;
  pending.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    pending.push_back(std::async(std::launch::async, [this, &sentences,
                                                      &results, &next]() {
      for (size_t i = next++; i < sentences.size(); i = next++)
        results[i] = analyzeSentence(sentences[i]);
    }));
  }
  for (auto &f : pending)
    f.get();
  return results;
}

json Analyzer::analyzeJson(const json &document) const {
  if (document.is_object() && document.contains("tokens")) {
    return io::analysisToJson(analyzeSentence(io::sentenceFromJson(document)));
  }
  return io::documentToJson(analyzeDocument(io::documentFromJson(document)));
}

} // namespace Satzbau
