#pragma once

#include "sentence.hpp"
#include <string>
#include <vector>

namespace Satzbau {

enum class DetectorKind {
  Collocation,
  SubordinateClause,
  SeparableVerb,
  Agreement,
  WordOrder,
  Passive,
  Causative,
  Tense,
  Case,
  Mood,
  ModalVerb,
  ReflexiveVerb,
  Conditional,
  Preposition,
  Custom
};

// Stable registry id ("collocation", "subordinate-clause", ...).
const char *detectorId(DetectorKind kind);

class Detector {
public:
  virtual ~Detector() = default;

  virtual DetectorKind kind() const = 0;
  // Registry key; built-in detectors use detectorId(kind()).
  virtual std::string id() const { return detectorId(kind()); }

  // Pure function of the sentence. May throw; the engine isolates faults.
  virtual std::vector<DetectionResult> detect(const Sentence &sentence) const = 0;
};

} // namespace Satzbau
