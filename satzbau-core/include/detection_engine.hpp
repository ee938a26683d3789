#pragma once

#include "ai_fallback.hpp"
#include "detector.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Satzbau {

struct AnalysisSummary {
  size_t totalPoints{0};
  std::map<CefrLevel, size_t> levels;
  std::map<GrammarCategory, size_t> categories;
};

struct AnalysisResult {
  std::string sentence;
  std::vector<DetectionResult> grammarPoints;
  std::map<CefrLevel, std::vector<DetectionResult>> byLevel;
  std::map<GrammarCategory, std::vector<DetectionResult>> byCategory;
  AnalysisSummary summary;
  bool usedFallback{false};
  std::vector<std::string> failedDetectors;
};

struct EngineOptions {
  double minConfidence{0.5};
  std::chrono::milliseconds fallbackTimeout{10000};
};

class DetectionEngine {
public:
  explicit DetectionEngine(EngineOptions options = EngineOptions());

  // Throws std::invalid_argument on a null detector or a duplicate id.
  void registerDetector(std::unique_ptr<Detector> detector);
  void setFallback(std::shared_ptr<fallback::FallbackAnnotator> annotator);

  const Detector *detector(DetectorKind kind) const;
  const Detector *detector(const std::string &id) const;
  std::vector<std::string> detectorIds() const;

  AnalysisResult analyze(const Sentence &sentence) const;

  const EngineOptions &options() const { return options_; }

  // Groups and counts an already merged result list.
  static void aggregate(AnalysisResult &result);

private:
  std::vector<DetectionResult> runDetector(const Detector &detector,
                                           const Sentence &sentence,
                                           bool &failed) const;
  std::vector<DetectionResult> runFallback(const Sentence &sentence) const;
  std::vector<DetectionResult> merge(std::vector<DetectionResult> results) const;

  EngineOptions options_;
  std::vector<std::unique_ptr<Detector>> detectors_;
  std::shared_ptr<fallback::FallbackAnnotator> fallback_;
};

// Rejects results with positions outside the sentence, empty ranges or a
// confidence outside [0, 1].
bool isWellFormed(const DetectionResult &result, const Sentence &sentence,
                  std::string &reason);

} // namespace Satzbau
