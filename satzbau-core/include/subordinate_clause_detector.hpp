#pragma once

#include "clause.hpp"
#include "detector.hpp"
#include "grammar_catalog.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Satzbau {
namespace detect {

class SubordinateClauseDetector : public Detector {
public:
  explicit SubordinateClauseDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::SubordinateClause; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

  // Clauses with nesting already applied, in marker order.
  std::vector<Clause> findClauses(const Sentence &sentence) const;

  static std::vector<ClauseMarker> findMarkers(const Sentence &sentence);
  static std::optional<ClauseVerb> locateVerb(const Sentence &sentence,
                                              const ClauseMarker &marker);
  static ClauseBoundary extendBoundary(const Sentence &sentence,
                                       const ClauseMarker &marker,
                                       const ClauseVerb &verb);

  // Semantic function of a marker lemma; "completive" for dass,
  // "attributive" for relative pronouns, empty when unknown.
  static std::string clauseFunction(const ClauseMarker &marker);

private:
  static bool isConjunctionMarker(const Token &token);
  static bool isRelativeMarker(const Sentence &sentence, size_t index);
  static void linkCompound(const Sentence &sentence, const ClauseMarker &marker,
                           ClauseVerb &verb);
  static void applyNesting(std::vector<Clause> &clauses);

  GrammarPoint adverbialPoint_;
  GrammarPoint relativePoint_;
  GrammarPoint infinitivePoint_;
};

} // namespace detect
} // namespace Satzbau
