#pragma once

#include "detection_engine.hpp"
#include "errors.hpp"
#include "sentence.hpp"
#include <vector>

namespace Satzbau {
namespace io {

// Parser payload -> Sentence. Token indices are rebased to positions and
// numeric heads remapped accordingly. Throws InputError on contract
// violations.
Sentence sentenceFromJson(const json &payload);

// Either [sentence, ...] or {"sentences": [...]}.
std::vector<Sentence> documentFromJson(const json &payload);

json resultToJson(const DetectionResult &result);
json analysisToJson(const AnalysisResult &analysis);
json documentToJson(const std::vector<AnalysisResult> &analyses);

} // namespace io
} // namespace Satzbau
