#include "collocation_detector.hpp"
#include "dependency_utils.hpp"
#include "detector_helpers.hpp"
#include "pos_classifier.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <set>

namespace Satzbau {
namespace detect {

using pos::POSClassifier;
using text::TextUtils;

namespace {

static bool isDebugEnabled() {
  static const bool debug = (std::getenv("SATZBAU_DEBUG") != nullptr);
  return debug;
}

// Edges a collapsed path may pass through without consuming depth.
const std::vector<std::string> kIgnorableDeps = {"det", "amod", "case",
                                                 "compound", "nk"};

bool contains(const std::vector<std::string> &labels, const std::string &l) {
  return std::find(labels.begin(), labels.end(), l) != labels.end();
}

std::vector<std::string> merged(const std::vector<std::string> &a,
                                const std::vector<std::string> &b) {
  std::vector<std::string> out = a;
  for (const auto &label : b) {
    if (!contains(out, label))
      out.push_back(label);
  }
  return out;
}

size_t distance(size_t a, size_t b) { return a > b ? a - b : b - a; }

const MatchTier kTiers[] = {MatchTier::Strict, MatchTier::Loose,
                            MatchTier::Collapsed, MatchTier::Window};

} // namespace

const char *tierName(MatchTier tier) {
  switch (tier) {
  case MatchTier::Strict:
    return "strict";
  case MatchTier::Loose:
    return "loose";
  case MatchTier::Collapsed:
    return "collapsed";
  case MatchTier::Window:
    return "window";
  }
  return "unknown";
}

CollocationDetector::CollocationDetector(
    std::shared_ptr<const CollocationTable> table,
    const GrammarCatalog &catalog, CollocationOptions options, TraceSink trace)
    : table_(std::move(table)), options_(options), trace_(std::move(trace)) {
  if (!table_) {
    throw CatalogError("collocation detector needs a collocation table");
  }
  for (const auto &def : table_->definitions()) {
    if (!points_.count(def.grammarPointId))
      points_[def.grammarPointId] = catalog.get(def.grammarPointId);
  }
}

double CollocationDetector::tierConfidence(CollocationKind kind,
                                           MatchTier tier, int hops) {
  switch (tier) {
  case MatchTier::Strict:
    switch (kind) {
    case CollocationKind::ReflexivePrep:
      return 0.98;
    case CollocationKind::VerbPrep:
      return 0.95;
    case CollocationKind::VerbNoun:
      return 0.92;
    case CollocationKind::Separable:
      return 0.95;
    }
    break;
  case MatchTier::Loose:
    switch (kind) {
    case CollocationKind::ReflexivePrep:
      return 0.85;
    case CollocationKind::VerbPrep:
      return 0.82;
    case CollocationKind::VerbNoun:
      return 0.78;
    case CollocationKind::Separable:
      return 0.80;
    }
    break;
  case MatchTier::Collapsed: {
    // 0.72 for a direct edge, 0.02 less per extra hop, never below 0.62
    double c = 0.72 - 0.02 * std::max(0, hops - 1);
    return std::max(c, 0.62);
  }
  case MatchTier::Window:
    switch (kind) {
    case CollocationKind::ReflexivePrep:
      return 0.60;
    case CollocationKind::VerbPrep:
      return 0.56;
    case CollocationKind::VerbNoun:
      return 0.52;
    case CollocationKind::Separable:
      return 0.55;
    }
    break;
  }
  return 0.5;
}

size_t CollocationDetector::canonicalVerb(const std::vector<Token> &tokens,
                                          size_t index) {
  size_t current = index;
  // aux chains are short; the bound also cuts cycles
  for (int step = 0; step < 4 && current < tokens.size(); ++step) {
    const Token &t = tokens[current];
    bool auxLike = POSClassifier::isAuxiliary(t) || t.dep == "aux" ||
                   t.dep == "aux:pass";
    if (!auxLike)
      break;
    auto head = deps::headIndex(tokens, current);
    if (!head || !POSClassifier::isVerbOrAux(tokens[*head]))
      break;
    current = *head;
  }
  return current;
}

std::vector<CollocationDetector::Companion>
CollocationDetector::companionsFor(const CollocationDefinition &def,
                                   bool particleAttached) const {
  std::vector<Companion> companions;
  if (auto p = std::get_if<ReflexivePrepPattern>(&def.pattern)) {
    companions.push_back({Role::Reflexive, std::string()});
    companions.push_back({Role::Preposition, p->preposition});
  } else if (auto p = std::get_if<VerbPrepPattern>(&def.pattern)) {
    companions.push_back({Role::Preposition, p->preposition});
  } else if (auto p = std::get_if<VerbNounPattern>(&def.pattern)) {
    companions.push_back({Role::Noun, p->noun});
  }
  std::string particle = def.particle();
  if (!particle.empty() && !particleAttached)
    companions.push_back({Role::Particle, particle});
  return companions;
}

bool CollocationDetector::qualifies(Role role, const std::string &lemma,
                                    const Token &t) const {
  switch (role) {
  case Role::Reflexive:
    return POSClassifier::isReflexivePronoun(t) && !POSClassifier::isSubject(t);
  case Role::Preposition:
    return POSClassifier::matchesPreposition(t, lemma);
  case Role::Noun:
    return POSClassifier::isNoun(t) &&
           (lemma.empty() || TextUtils::equalsIgnoreCase(t.lemma, lemma) ||
            TextUtils::equalsIgnoreCase(t.text, lemma));
  case Role::Particle:
    return POSClassifier::isParticleLike(t) &&
           TextUtils::equalsIgnoreCase(t.text, lemma);
  }
  return false;
}

std::vector<std::string>
CollocationDetector::allowedLabels(Role role,
                                   const DependencySignature &sig) const {
  switch (role) {
  case Role::Reflexive:
    return sig.reflexiveDeps;
  case Role::Preposition:
    return sig.prepDeps;
  case Role::Noun:
    return merged(sig.nounDeps, sig.verbDeps);
  case Role::Particle:
    return sig.particleDeps;
  }
  return {};
}

bool CollocationDetector::better(const Found &a, const Found &b, size_t verb,
                                 const Sentence &sentence,
                                 const DependencySignature &sig,
                                 Role role) const {
  auto preferred = [&](const Found &f) {
    if (contains(sig.shouldMatchDeps, f.relation))
      return true;
    return role == Role::Particle &&
           POSClassifier::isSeparableParticle(sentence.tokens[f.index]);
  };
  bool pa = preferred(a);
  bool pb = preferred(b);
  if (pa != pb)
    return pa;
  if (a.hops != b.hops)
    return a.hops < b.hops;
  size_t da = distance(a.index, verb);
  size_t db = distance(b.index, verb);
  if (da != db)
    return da < db;
  return a.index < b.index;
}

void CollocationDetector::consider(std::optional<Found> &best,
                                   const Found &candidate, size_t verb,
                                   const Sentence &sentence,
                                   const DependencySignature &sig,
                                   Role role) const {
  if (!best || better(candidate, *best, verb, sentence, sig, role))
    best = candidate;
}

std::optional<CollocationDetector::Found>
CollocationDetector::findStrict(const Sentence &sentence,
                                const CollocationDefinition &def,
                                const Companion &c, size_t verb) const {
  const auto &tokens = sentence.tokens;
  const auto &sig = def.signature;
  std::vector<std::string> allowed = allowedLabels(c.role, sig);
  std::optional<Found> best;

  for (size_t child : deps::children(tokens, verb)) {
    const Token &t = tokens[child];
    if (!qualifies(c.role, c.lemma, t))
      continue;
    bool labelOk = contains(allowed, t.dep) ||
                   (c.role == Role::Particle &&
                    POSClassifier::isSeparableParticle(t));
    if (labelOk)
      consider(best, Found{child, 1, t.dep}, verb, sentence, sig, c.role);
  }

  // preposition heading a noun argument: verb -> noun -> preposition
  if (c.role == Role::Preposition) {
    std::vector<std::string> nounLabels = merged(sig.nounDeps, sig.verbDeps);
    for (size_t child : deps::children(tokens, verb)) {
      const Token &n = tokens[child];
      if (!(POSClassifier::isNoun(n) || POSClassifier::isPronoun(n)) ||
          !contains(nounLabels, n.dep))
        continue;
      for (size_t grandchild : deps::children(tokens, child)) {
        const Token &p = tokens[grandchild];
        if (qualifies(c.role, c.lemma, p) && contains(allowed, p.dep))
          consider(best, Found{grandchild, 2, p.dep}, verb, sentence, sig,
                   c.role);
      }
    }
  }
  return best;
}

std::optional<CollocationDetector::Found>
CollocationDetector::findLoose(const Sentence &sentence,
                               const CollocationDefinition &def,
                               const Companion &c, size_t verb) const {
  const auto &tokens = sentence.tokens;
  const auto &sig = def.signature;
  std::optional<Found> best;

  for (size_t idx : deps::descendants(tokens, verb, sig.maxDepth)) {
    const Token &t = tokens[idx];
    if (!qualifies(c.role, c.lemma, t) ||
        !deps::inSameClause(tokens, verb, idx))
      continue;
    int hops = deps::depthBelow(tokens, verb, idx, sig.maxDepth)
                   .value_or(sig.maxDepth);
    consider(best, Found{idx, hops, t.dep}, verb, sentence, sig, c.role);
  }
  return best;
}

std::optional<CollocationDetector::Found>
CollocationDetector::findCollapsed(const Sentence &sentence,
                                   const CollocationDefinition &def,
                                   const Companion &c, size_t verb) const {
  const auto &tokens = sentence.tokens;
  const auto &sig = def.signature;
  std::vector<std::string> traversable = merged(sig.verbDeps, sig.nounDeps);
  const int maxHops = sig.maxDepth * 2;

  struct Frame {
    size_t node;
    int cost; // argument edges taken
    int hops; // all edges taken
  };

  std::optional<Found> best;
  std::vector<int> bestHops(tokens.size(), maxHops + 1);
  std::vector<Frame> stack = {{verb, 0, 0}};
  bestHops[verb] = 0;

  while (!stack.empty()) {
    Frame frame = stack.back();
    stack.pop_back();

    for (size_t child : deps::children(tokens, frame.node)) {
      const Token &t = tokens[child];
      int hops = frame.hops + 1;
      if (hops > maxHops || hops >= bestHops[child])
        continue;
      bestHops[child] = hops;

      if (qualifies(c.role, c.lemma, t) &&
          (sig.mustMatchDeps.empty() || contains(sig.mustMatchDeps, t.dep)))
        consider(best, Found{child, hops, t.dep}, verb, sentence, sig, c.role);

      if (contains(kIgnorableDeps, t.dep)) {
        stack.push_back({child, frame.cost, hops});
      } else if (contains(traversable, t.dep) && frame.cost + 1 <= sig.maxDepth) {
        stack.push_back({child, frame.cost + 1, hops});
      }
    }
  }
  return best;
}

std::optional<CollocationDetector::Found>
CollocationDetector::findInWindow(const Sentence &sentence, const Companion &c,
                                  size_t trigger, size_t verb) const {
  const auto &tokens = sentence.tokens;
  std::optional<Found> best;
  DependencySignature none;

  if (c.role == Role::Particle) {
    // detached particles follow the finite verb
    size_t last = std::min(tokens.size() - 1, trigger + options_.separableWindow);
    for (size_t i = trigger + 1; i <= last; ++i) {
      if (i == verb || !qualifies(c.role, c.lemma, tokens[i]) ||
          !deps::inSameClause(tokens, trigger, i))
        continue;
      consider(best, Found{i, static_cast<int>(i - trigger), tokens[i].dep},
               trigger, sentence, none, c.role);
    }
    return best;
  }

  size_t first = verb > options_.windowSize ? verb - options_.windowSize : 0;
  size_t last = std::min(tokens.size() - 1, verb + options_.windowSize);
  for (size_t i = first; i <= last; ++i) {
    if (i == verb || !qualifies(c.role, c.lemma, tokens[i]) ||
        !deps::inSameClause(tokens, verb, i))
      continue;
    consider(best, Found{i, static_cast<int>(distance(i, verb)), tokens[i].dep},
             verb, sentence, none, c.role);
  }
  return best;
}

std::optional<CollocationMatch>
CollocationDetector::matchDefinition(const Sentence &sentence,
                                     const CollocationDefinition &def,
                                     size_t trigger, size_t verb) const {
  const Token &vt = sentence.tokens[verb];
  std::string particle = def.particle();

  bool attached = false;
  if (!particle.empty() &&
      TextUtils::lemmaMatches(vt.lemma, particle + def.verbLemma)) {
    attached = true;
  } else if (!TextUtils::lemmaMatches(vt.lemma, def.verbLemma)) {
    return std::nullopt;
  }

  std::vector<Companion> companions = companionsFor(def, attached);

  for (size_t t = 0; t < 4; ++t) {
    MatchTier tier = kTiers[t];
    std::vector<Found> found;
    int collapsedHops = 1;
    bool ok = true;

    for (const auto &c : companions) {
      std::optional<Found> f;
      // a tier also accepts anything an earlier tier would have found
      for (size_t m = 0; m <= t && !f; ++m) {
        switch (kTiers[m]) {
        case MatchTier::Strict:
          f = findStrict(sentence, def, c, verb);
          break;
        case MatchTier::Loose:
          f = findLoose(sentence, def, c, verb);
          break;
        case MatchTier::Collapsed:
          f = findCollapsed(sentence, def, c, verb);
          if (f)
            collapsedHops = std::max(collapsedHops, f->hops);
          break;
        case MatchTier::Window:
          f = findInWindow(sentence, c, trigger, verb);
          break;
        }
      }
      bool duplicate =
          f && (f->index == verb ||
                std::any_of(found.begin(), found.end(),
                            [&](const Found &o) { return o.index == f->index; }));
      if (!f || duplicate) {
        ok = false;
        break;
      }
      found.push_back(*f);
    }

    if (trace_)
      trace_(TraceEvent{def.id, verb, tier, ok});
    if (!ok)
      continue;

    CollocationMatch match;
    match.definition = &def;
    match.verbIndex = trigger;
    match.canonicalVerb = verb;
    match.tier = tier;
    match.confidence = tierConfidence(def.kind(), tier, collapsedHops);
    match.tokenIndices.push_back(verb);
    for (size_t i = 0; i < found.size(); ++i) {
      match.tokenIndices.push_back(found[i].index);
      const char *role = "particle";
      switch (companions[i].role) {
      case Role::Reflexive:
        role = "reflexive";
        break;
      case Role::Preposition:
        role = "preposition";
        break;
      case Role::Noun:
        role = "noun";
        break;
      case Role::Particle:
        break;
      }
      match.relations.push_back(std::string(role) + ":" + found[i].relation);
    }
    std::sort(match.tokenIndices.begin(), match.tokenIndices.end());

    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] collocation " << def.id << " matched at verb "
                << verb << " tier=" << tierName(tier)
                << " confidence=" << match.confidence << std::endl;
    }
    return match;
  }
  return std::nullopt;
}

template <typename Visitor>
void CollocationDetector::forEachCandidate(const Sentence &sentence,
                                           Visitor visit) const {
  const auto &tokens = sentence.tokens;
  std::set<size_t> seen;
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (!POSClassifier::isVerbOrAux(tokens[i]))
      continue;
    size_t verb = canonicalVerb(tokens, i);
    if (!seen.insert(verb).second)
      continue;
    visit(i, verb);
  }
}

std::vector<CollocationMatch>
CollocationDetector::match(const Sentence &sentence) const {
  std::vector<CollocationMatch> matches;
  forEachCandidate(sentence, [&](size_t trigger, size_t verb) {
    for (const auto &def : table_->definitions()) {
      if (auto m = matchDefinition(sentence, def, trigger, verb))
        matches.push_back(std::move(*m));
    }
  });
  return matches;
}

std::vector<CollocationAttempt>
CollocationDetector::explain(const Sentence &sentence) const {
  std::vector<CollocationAttempt> attempts;
  forEachCandidate(sentence, [&](size_t trigger, size_t verb) {
    for (const auto &def : table_->definitions()) {
      std::string particle = def.particle();
      const Token &vt = sentence.tokens[verb];
      bool verbMatches =
          TextUtils::lemmaMatches(vt.lemma, def.verbLemma) ||
          (!particle.empty() &&
           TextUtils::lemmaMatches(vt.lemma, particle + def.verbLemma));
      if (!verbMatches)
        continue;

      CollocationAttempt attempt;
      attempt.definitionId = def.id;
      attempt.kind = def.kind();
      attempt.verbIndex = trigger;
      attempt.canonicalVerb = verb;
      if (auto m = matchDefinition(sentence, def, trigger, verb)) {
        attempt.tier = m->tier;
        attempt.tokenIndices = m->tokenIndices;
        attempt.emitted = def.kind() != CollocationKind::Separable;
      }
      attempts.push_back(std::move(attempt));
    }
  });
  return attempts;
}

std::vector<DetectionResult>
CollocationDetector::detect(const Sentence &sentence) const {
  std::vector<DetectionResult> results;
  for (const auto &m : match(sentence)) {
    const CollocationDefinition &def = *m.definition;
    // separable verbs belong to SeparableVerbDetector
    if (def.kind() == CollocationKind::Separable)
      continue;

    json details = {{"collocationId", def.id},
                    {"type", kindName(def.kind())},
                    {"tier", tierName(m.tier)},
                    {"verb", def.particle() + def.verbLemma},
                    {"words", tokenTexts(sentence, m.tokenIndices)},
                    {"tokenIndices", m.tokenIndices},
                    {"relations", m.relations}};
    if (!def.meaning.empty())
      details["meaning"] = def.meaning;

    results.push_back(makeResult(points_.at(def.grammarPointId),
                                 tokenRanges(sentence, m.tokenIndices),
                                 m.confidence, std::move(details), def.label));
  }
  return results;
}

} // namespace detect
} // namespace Satzbau
