#include "detection_engine.hpp"
#include "text_offsets.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <future>
#include <iostream>
#include <stdexcept>

namespace Satzbau {

namespace {

static bool isDebugEnabled() {
  static const bool debug = (std::getenv("SATZBAU_DEBUG") != nullptr);
  return debug;
}

bool samePositions(const DetectionResult &a, const DetectionResult &b) {
  return a.positions == b.positions;
}

} // namespace

bool isWellFormed(const DetectionResult &result, const Sentence &sentence,
                  std::string &reason) {
  if (result.grammarPointId.empty()) {
    reason = "missing grammar point id";
    return false;
  }
  if (!std::isfinite(result.confidence) || result.confidence < 0.0 ||
      result.confidence > 1.0) {
    reason = "confidence out of range";
    return false;
  }
  if (result.positions.empty()) {
    reason = "no positions";
    return false;
  }
  const int length = static_cast<int>(text::codePointLength(sentence.text));
  for (const auto &p : result.positions) {
    if (p.start < 0 || p.end <= p.start || p.end > length) {
      reason = "position [" + std::to_string(p.start) + ", " +
               std::to_string(p.end) + ") outside sentence";
      return false;
    }
  }
  return true;
}

DetectionEngine::DetectionEngine(EngineOptions options) : options_(options) {}

void DetectionEngine::registerDetector(std::unique_ptr<Detector> detector) {
  if (!detector) {
    throw std::invalid_argument("null detector");
  }
  std::string id = detector->id();
  if (this->detector(id)) {
    throw std::invalid_argument("detector '" + id + "' already registered");
  }
  detectors_.push_back(std::move(detector));
}

void DetectionEngine::setFallback(
    std::shared_ptr<fallback::FallbackAnnotator> annotator) {
  fallback_ = std::move(annotator);
}

const Detector *DetectionEngine::detector(DetectorKind kind) const {
  for (const auto &d : detectors_) {
    if (d->kind() == kind)
      return d.get();
  }
  return nullptr;
}

const Detector *DetectionEngine::detector(const std::string &id) const {
  for (const auto &d : detectors_) {
    if (d->id() == id)
      return d.get();
  }
  return nullptr;
}

std::vector<std::string> DetectionEngine::detectorIds() const {
  std::vector<std::string> ids;
  for (const auto &d : detectors_)
    ids.push_back(d->id());
  return ids;
}

std::vector<DetectionResult>
DetectionEngine::runDetector(const Detector &detector, const Sentence &sentence,
                             bool &failed) const {
  failed = false;
  std::vector<DetectionResult> results;
  try {
    results = detector.detect(sentence);
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] detector " << detector.id()
              << " failed: " << e.what() << std::endl;
    failed = true;
    return {};
  } catch (...) {
    std::cerr << "[ERROR] detector " << detector.id()
              << " failed with a non-standard exception" << std::endl;
    failed = true;
    return {};
  }

  for (const auto &r : results) {
    std::string reason;
    if (!isWellFormed(r, sentence, reason)) {
      std::cerr << "[WARN] detector " << detector.id()
                << " returned a malformed result (" << reason
                << "); dropping its output" << std::endl;
      failed = true;
      return {};
    }
  }
  return results;
}

std::vector<DetectionResult>
DetectionEngine::runFallback(const Sentence &sentence) const {
  std::vector<DetectionResult> accepted;
  try {
    auto future = fallback_->annotate(sentence);
    if (future.wait_for(options_.fallbackTimeout) != std::future_status::ready) {
      std::cerr << "[WARN] AI fallback timed out after "
                << options_.fallbackTimeout.count() << "ms" << std::endl;
      return accepted;
    }
    for (auto &r : future.get()) {
      std::string reason;
      if (isWellFormed(r, sentence, reason)) {
        accepted.push_back(std::move(r));
      } else if (isDebugEnabled()) {
        std::cerr << "[DEBUG] dropping fallback result: " << reason
                  << std::endl;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "[WARN] AI fallback failed: " << e.what() << std::endl;
    accepted.clear();
  }
  return accepted;
}

std::vector<DetectionResult>
DetectionEngine::merge(std::vector<DetectionResult> results) const {
  std::vector<DetectionResult> merged;
  for (auto &r : results) {
    if (r.confidence < options_.minConfidence)
      continue;
    auto dup = std::find_if(merged.begin(), merged.end(),
                            [&](const DetectionResult &m) {
                              return m.grammarPointId == r.grammarPointId &&
                                     m.label == r.label && samePositions(m, r);
                            });
    if (dup == merged.end()) {
      merged.push_back(std::move(r));
    } else if (r.confidence > dup->confidence) {
      *dup = std::move(r);
    }
  }

  std::stable_sort(merged.begin(), merged.end(),
                   [](const DetectionResult &a, const DetectionResult &b) {
                     int sa = a.positions.front().start;
                     int sb = b.positions.front().start;
                     if (sa != sb)
                       return sa < sb;
                     return a.grammarPointId < b.grammarPointId;
                   });
  return merged;
}

void DetectionEngine::aggregate(AnalysisResult &result) {
  result.byLevel.clear();
  result.byCategory.clear();
  result.summary = AnalysisSummary();
  for (CefrLevel level : allLevels()) {
    result.byLevel[level];
    result.summary.levels[level] = 0;
  }
  for (GrammarCategory category : allCategories()) {
    result.byCategory[category];
    result.summary.categories[category] = 0;
  }

  for (const auto &r : result.grammarPoints) {
    result.byLevel[r.level].push_back(r);
    result.byCategory[r.category].push_back(r);
    ++result.summary.levels[r.level];
    ++result.summary.categories[r.category];
  }
  result.summary.totalPoints = result.grammarPoints.size();
}

AnalysisResult DetectionEngine::analyze(const Sentence &sentence) const {
  AnalysisResult result;
  result.sentence = sentence.text;

  std::vector<DetectionResult> collected;
  for (const auto &d : detectors_) {
    bool failed = false;
    auto found = runDetector(*d, sentence, failed);
    if (failed)
      result.failedDetectors.push_back(d->id());
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] " << d->id() << ": " << found.size()
                << " results" << std::endl;
    }
    for (auto &r : found)
      collected.push_back(std::move(r));
  }

  result.grammarPoints = merge(std::move(collected));

  if (result.grammarPoints.empty() && fallback_) {
    auto extra = runFallback(sentence);
    if (!extra.empty()) {
      result.usedFallback = true;
      result.grammarPoints = std::move(extra);
    }
  }

  aggregate(result);
  return result;
}

} // namespace Satzbau
