#pragma once

#include "detector.hpp"
#include "grammar_catalog.hpp"
#include <vector>

namespace Satzbau {
namespace detect {

// Detached particle plus verb ("stehe ... auf") and combined forms
// ("aufstehen", "aufgestanden") in infinitive, participle or subordinate
// context.
class SeparableVerbDetector : public Detector {
public:
  explicit SeparableVerbDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::SeparableVerb; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint point_;
};

// Case/number/gender agreement inside noun phrases.
class AgreementDetector : public Detector {
public:
  explicit AgreementDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::Agreement; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint point_;
};

// Verb-second order in main clauses.
class WordOrderDetector : public Detector {
public:
  explicit WordOrderDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::WordOrder; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint point_;
};

// werden-passive (present/past, with agent) and sein-passive.
class PassiveDetector : public Detector {
public:
  explicit PassiveDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::Passive; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint presentPoint_;
  GrammarPoint pastPoint_;
  GrammarPoint agentPoint_;
  GrammarPoint statalPoint_;
};

// lassen + infinitive, and "sich lassen" as permissive passive.
class CausativeDetector : public Detector {
public:
  explicit CausativeDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::Causative; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint causativePoint_;
  GrammarPoint permissivePoint_;
};

// Present and simple past of finite verbs; perfect tense from a haben/sein
// auxiliary plus past participle.
class TenseDetector : public Detector {
public:
  explicit TenseDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::Tense; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint presentPoint_;
  GrammarPoint pastPoint_;
  GrammarPoint perfectPoint_;
  GrammarPoint perfectSeinPoint_;
};

// Nominative, accusative and dative noun phrases, read from the Case
// feature of the phrase head.
class CaseDetector : public Detector {
public:
  explicit CaseDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::Case; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint nominativePoint_;
  GrammarPoint accusativePoint_;
  GrammarPoint dativePoint_;
};

// Imperative, Konjunktiv II (würde-form and synthetic forms) and
// Konjunktiv I in reported speech.
class MoodDetector : public Detector {
public:
  explicit MoodDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::Mood; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint imperativePoint_;
  GrammarPoint conditionalPoint_;
  GrammarPoint subjunctivePoint_;
  GrammarPoint reportedPoint_;
};

// Modal verb plus dependent infinitive, or a bare modal in a question.
class ModalVerbDetector : public Detector {
public:
  explicit ModalVerbDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::ModalVerb; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint point_;
};

// Verb with a reflexive pronoun object ("ich wasche mich").
class ReflexiveVerbDetector : public Detector {
public:
  explicit ReflexiveVerbDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override {
    return DetectorKind::ReflexiveVerb;
  }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint point_;
};

// wenn/falls clauses, and conditionals with a fronted subjunctive verb
// ("Hätte ich Zeit, ...").
class ConditionalDetector : public Detector {
public:
  explicit ConditionalDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::Conditional; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint conditionalPoint_;
  GrammarPoint invertedPoint_;
};

// Prepositions governing the dative or the accusative, checked against the
// case of their object.
class PrepositionDetector : public Detector {
public:
  explicit PrepositionDetector(const GrammarCatalog &catalog);

  DetectorKind kind() const override { return DetectorKind::Preposition; }
  std::vector<DetectionResult> detect(const Sentence &sentence) const override;

private:
  GrammarPoint dativePoint_;
  GrammarPoint accusativePoint_;
};

} // namespace detect
} // namespace Satzbau
