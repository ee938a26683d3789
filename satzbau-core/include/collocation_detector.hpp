#pragma once

#include "collocation_table.hpp"
#include "detector.hpp"
#include "grammar_catalog.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Satzbau {
namespace detect {

enum class MatchTier { Strict, Loose, Collapsed, Window };

const char *tierName(MatchTier tier);

struct TraceEvent {
  std::string definitionId;
  size_t verbIndex{0};
  MatchTier tier{MatchTier::Strict};
  bool matched{false};
};

using TraceSink = std::function<void(const TraceEvent &)>;

struct CollocationOptions {
  size_t windowSize{4};
  size_t separableWindow{6};
};

struct CollocationMatch {
  const CollocationDefinition *definition{nullptr};
  size_t verbIndex{0};     // token that triggered the attempt
  size_t canonicalVerb{0}; // content verb after collapsing aux/modal
  MatchTier tier{MatchTier::Strict};
  double confidence{0.0};
  std::vector<size_t> tokenIndices; // verb and companions, sentence order
  std::vector<std::string> relations;
};

struct CollocationAttempt {
  std::string definitionId;
  CollocationKind kind{CollocationKind::VerbPrep};
  size_t verbIndex{0};
  size_t canonicalVerb{0};
  std::optional<MatchTier> tier; // nullopt: no tier succeeded
  std::vector<size_t> tokenIndices;
  bool emitted{false}; // false for separable definitions
};

class CollocationDetector : public Detector {
public:
  // Throws CatalogError if a definition references an unknown grammar point.
  CollocationDetector(std::shared_ptr<const CollocationTable> table,
                      const GrammarCatalog &catalog,
                      CollocationOptions options = CollocationOptions(),
                      TraceSink trace = TraceSink());

  DetectorKind kind() const override { return DetectorKind::Collocation; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

  // All matches including separable definitions.
  std::vector<CollocationMatch> match(const Sentence &sentence) const;

  // Every (definition, verb) pair that was tried.
  std::vector<CollocationAttempt> explain(const Sentence &sentence) const;

  static double tierConfidence(CollocationKind kind, MatchTier tier,
                               int hops = 1);

  // Follows aux/modal tokens up to the main verb they belong to.
  static size_t canonicalVerb(const std::vector<Token> &tokens, size_t index);

private:
  enum class Role { Reflexive, Preposition, Noun, Particle };

  struct Companion {
    Role role;
    std::string lemma;
  };

  struct Found {
    size_t index{0};
    int hops{1};
    std::string relation;
  };

  std::vector<Companion> companionsFor(const CollocationDefinition &def,
                                       bool particleAttached) const;

  bool qualifies(Role role, const std::string &lemma, const Token &t) const;
  std::vector<std::string> allowedLabels(Role role,
                                         const DependencySignature &sig) const;
  bool better(const Found &a, const Found &b, size_t verb,
              const Sentence &sentence, const DependencySignature &sig,
              Role role) const;
  void consider(std::optional<Found> &best, const Found &candidate,
                size_t verb, const Sentence &sentence,
                const DependencySignature &sig, Role role) const;

  std::optional<Found> findStrict(const Sentence &sentence,
                                  const CollocationDefinition &def,
                                  const Companion &c, size_t verb) const;
  std::optional<Found> findLoose(const Sentence &sentence,
                                 const CollocationDefinition &def,
                                 const Companion &c, size_t verb) const;
  std::optional<Found> findCollapsed(const Sentence &sentence,
                                     const CollocationDefinition &def,
                                     const Companion &c, size_t verb) const;
  std::optional<Found> findInWindow(const Sentence &sentence,
                                    const Companion &c, size_t trigger,
                                    size_t verb) const;

  std::optional<CollocationMatch>
  matchDefinition(const Sentence &sentence, const CollocationDefinition &def,
                  size_t trigger, size_t verb) const;

  template <typename Visitor>
  void forEachCandidate(const Sentence &sentence, Visitor visit) const;

  std::shared_ptr<const CollocationTable> table_;
  std::unordered_map<std::string, GrammarPoint> points_;
  CollocationOptions options_;
  TraceSink trace_;
};

} // namespace detect
} // namespace Satzbau
