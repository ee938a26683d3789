#pragma once

#include "grammar_catalog.hpp"
#include "sentence.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Satzbau {
namespace detect {

// Character range spanning tokens[from..to] inclusive.
CharRange tokenRange(const Sentence &sentence, size_t from, size_t to);

// One range per token, in the order given.
std::vector<CharRange> tokenRanges(const Sentence &sentence,
                                   const std::vector<size_t> &indices);

std::vector<std::string> tokenTexts(const Sentence &sentence,
                                    const std::vector<size_t> &indices);

DetectionResult makeResult(const GrammarPoint &point,
                           std::vector<CharRange> positions, double confidence,
                           json details = json::object(),
                           const std::string &label = std::string());

// First past participle after `from`, skipping nominal material between the
// auxiliary and the participle. Stops at clause punctuation.
std::optional<size_t> findFollowingParticiple(const Sentence &sentence,
                                              size_t from);

// First infinitive within `window` tokens after `from`.
std::optional<size_t> findFollowingInfinitive(const Sentence &sentence,
                                              size_t from, size_t window);

} // namespace detect
} // namespace Satzbau
