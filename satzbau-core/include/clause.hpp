#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace Satzbau {
namespace detect {

enum class MarkerKind { Conjunction, RelativePronoun, InfinitiveMarker };

enum class ClauseType { Completive, Adverbial, Relative, Infinitive };

// How the clause verb was located.
enum class VerbStrategy {
  MarkerHead,
  RelativeScan,
  InfinitiveScan,
  FiniteScan,
  AnyVerb
};

struct ClauseMarker {
  size_t tokenIndex{0};
  MarkerKind kind{MarkerKind::Conjunction};
  std::string lemma; // lowercased
  std::string text;
  std::optional<size_t> zuIndex; // infinitive markers only
};

struct ClauseVerb {
  size_t tokenIndex{0};
  std::string lemma;
  std::string text;
  std::string tag;
  bool finite{false};
  bool compound{false};
  std::optional<size_t> auxiliaryIndex;
  VerbStrategy strategy{VerbStrategy::MarkerHead};
};

struct ClauseBoundary {
  size_t start{0}; // token indices, inclusive
  size_t end{0};
  int startChar{0};
  int endChar{0};
};

struct Clause {
  ClauseMarker marker;
  ClauseVerb verb;
  ClauseBoundary boundary;
  ClauseType type{ClauseType::Adverbial};
  std::string function; // causal, temporal, ...
  double confidence{0.0};
  bool nested{false};
};

const char *markerKindName(MarkerKind kind);
const char *clauseTypeName(ClauseType type);
const char *verbStrategyName(VerbStrategy strategy);

} // namespace detect
} // namespace Satzbau
