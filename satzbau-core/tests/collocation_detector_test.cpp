#include <gtest/gtest.h>

#include <algorithm>

#include "collocation_detector.hpp"
#include "test_support.hpp"

using namespace Satzbau;
using namespace Satzbau::detect;
using satzbau_test::buildSentence;

namespace {

CollocationDetector makeDetector(TraceSink trace = TraceSink()) {
  return CollocationDetector(satzbau_test::collocations(),
                             satzbau_test::catalog(), CollocationOptions(),
                             std::move(trace));
}

std::shared_ptr<const CollocationTable> tableFrom(const char *text) {
  return std::make_shared<const CollocationTable>(
      CollocationTable::fromJson(json::parse(text)));
}

const DetectionResult *findLabel(const std::vector<DetectionResult> &results,
                                 const std::string &label) {
  for (const auto &r : results) {
    if (r.label == label)
      return &r;
  }
  return nullptr;
}

} // namespace

TEST(CollocationDetectorTest, DirectReflexivePrepositionIsStrict) {
  Sentence s = satzbau_test::freueMichAufKonzert();
  auto results = makeDetector().detect(s);

  ASSERT_EQ(results.size(), 1u);
  const DetectionResult &r = results[0];
  EXPECT_EQ(r.grammarPointId, "b1-collocations");
  EXPECT_EQ(r.label, "sich freuen auf");
  EXPECT_DOUBLE_EQ(r.confidence, 0.98);
  EXPECT_EQ(r.details["tier"], "strict");
  EXPECT_EQ(r.details["tokenIndices"], json({1, 2, 3}));

  ASSERT_EQ(r.positions.size(), 3u);
  EXPECT_EQ(r.positions[0], (CharRange{4, 9}));
  EXPECT_EQ(r.positions[1], (CharRange{10, 14}));
  EXPECT_EQ(r.positions[2], (CharRange{15, 18}));
}

TEST(CollocationDetectorTest, ModalSentenceFallsBackToLooseTier) {
  Sentence s = satzbau_test::erinnerteSichAnKindheit();
  auto results = makeDetector().detect(s);

  const DetectionResult *r = findLabel(results, "sich erinnern an");
  ASSERT_NE(r, nullptr);
  EXPECT_EQ(r->details["tier"], "loose");
  EXPECT_DOUBLE_EQ(r->confidence, 0.85);
  EXPECT_EQ(r->details["tokenIndices"], json({10, 12, 15}));
  EXPECT_EQ(r->details["words"], json({"sich", "an", "erinnern"}));
}

TEST(CollocationDetectorTest, AuxiliaryCollapsesToContentVerb) {
  Sentence s = satzbau_test::erinnerteSichAnKindheit();
  EXPECT_EQ(CollocationDetector::canonicalVerb(s.tokens, 8), 15u);
  EXPECT_EQ(CollocationDetector::canonicalVerb(s.tokens, 6), 6u);

  auto matches = makeDetector().match(s);
  auto it = std::find_if(matches.begin(), matches.end(),
                         [](const CollocationMatch &m) {
                           return m.definition->id == "sich-erinnern-an";
                         });
  ASSERT_NE(it, matches.end());
  EXPECT_EQ(it->verbIndex, 8u);
  EXPECT_EQ(it->canonicalVerb, 15u);
}

TEST(CollocationDetectorTest, TraceReportsEveryTierTried) {
  std::vector<TraceEvent> events;
  auto detector = makeDetector([&](const TraceEvent &e) {
    if (e.definitionId == "sich-erinnern-an")
      events.push_back(e);
  });
  detector.detect(satzbau_test::erinnerteSichAnKindheit());

  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].tier, MatchTier::Strict);
  EXPECT_FALSE(events[0].matched);
  EXPECT_EQ(events[1].tier, MatchTier::Loose);
  EXPECT_TRUE(events[1].matched);
}

TEST(CollocationDetectorTest, WindowTierWhenTreeIsMissing) {
  Sentence s = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "", -1, ""},
      {"warte", "warten", "VERB", "VVFIN", "", -1, ""},
      {"auf", "auf", "ADP", "APPR", "", -1, ""},
      {"dich", "du", "PRON", "PPER", "", -1, ""},
      {".", ".", "PUNCT", "$.", "", -1, ""},
  });
  auto results = makeDetector().detect(s);
  const DetectionResult *r = findLabel(results, "warten auf");
  ASSERT_NE(r, nullptr);
  EXPECT_EQ(r->details["tier"], "window");
  EXPECT_DOUBLE_EQ(r->confidence, 0.56);
}

TEST(CollocationDetectorTest, WindowStopsAtClauseBoundary) {
  Sentence s = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "", -1, ""},
      {"warte", "warten", "VERB", "VVFIN", "", -1, ""},
      {",", ",", "PUNCT", "$,", "", -1, ""},
      {"auf", "auf", "ADP", "APPR", "", -1, ""},
      {"dich", "du", "PRON", "PPER", "", -1, ""},
  });
  EXPECT_TRUE(makeDetector().detect(s).empty());
}

TEST(CollocationDetectorTest, DeeperPrepositionIsLoose) {
  auto table = tableFrom(R"({"collocations": [
    {"id": "halten-von", "type": "verb-prep", "verb": "halten",
     "preposition": "von"}]})");
  // hält -obj-> nichts -nmod-> Plänen -case-> von
  Sentence s = buildSentence({
      {"Er", "er", "PRON", "PPER", "nsubj", 1, ""},
      {"hält", "halten", "VERB", "VVFIN", "ROOT", -1, ""},
      {"nichts", "nichts", "PRON", "PIS", "obj", 1, ""},
      {"von", "von", "ADP", "APPR", "case", 4, ""},
      {"Plänen", "Plan", "NOUN", "NN", "nmod", 2, ""},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  CollocationDetector detector(table, satzbau_test::catalog());
  auto results = detector.detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].details["tier"], "loose");
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.82);
}

TEST(CollocationDetectorTest, PrepositionUnderNounArgumentIsStrict) {
  auto table = tableFrom(R"({"collocations": [
    {"id": "denken-an", "type": "verb-prep", "verb": "denken",
     "preposition": "an"}]})");
  Sentence s = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "nsubj", 1, ""},
      {"denke", "denken", "VERB", "VVFIN", "ROOT", -1, ""},
      {",", ",", "PUNCT", "$,", "punct", 1, ""},
      {"oft", "oft", "ADV", "ADV", "advmod", 1, ""},
      {"an", "an", "ADP", "APPR", "case", 5, ""},
      {"dich", "du", "PRON", "PPER", "obl", 1, ""},
  });
  CollocationDetector detector(table, satzbau_test::catalog());
  auto results = detector.detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].details["tier"], "strict");
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.95);
}

TEST(CollocationDetectorTest, CollapsedTierCrossesClauseBoundaries) {
  auto table = tableFrom(R"({"collocations": [
    {"id": "denken-an", "type": "verb-prep", "verb": "denken",
     "preposition": "an"}]})");
  // denke -obl-> besonders -nmod-> Freunde -case-> an, with a comma in
  // between so neither the loose nor the window tier applies
  Sentence s = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "nsubj", 1, ""},
      {"denke", "denken", "VERB", "VVFIN", "ROOT", -1, ""},
      {",", ",", "PUNCT", "$,", "punct", 1, ""},
      {"besonders", "besonders", "ADV", "ADV", "obl", 1, ""},
      {"an", "an", "ADP", "APPR", "case", 5, ""},
      {"Freunde", "Freund", "NOUN", "NN", "nmod", 3, ""},
  });
  CollocationDetector detector(table, satzbau_test::catalog());
  auto results = detector.detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].details["tier"], "collapsed");
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.68);
}

TEST(CollocationDetectorTest, CollapsedConfidenceDecaysWithHops) {
  EXPECT_DOUBLE_EQ(
      CollocationDetector::tierConfidence(CollocationKind::VerbPrep,
                                          MatchTier::Collapsed, 1),
      0.72);
  EXPECT_DOUBLE_EQ(
      CollocationDetector::tierConfidence(CollocationKind::VerbPrep,
                                          MatchTier::Collapsed, 3),
      0.68);
  EXPECT_DOUBLE_EQ(
      CollocationDetector::tierConfidence(CollocationKind::ReflexivePrep,
                                          MatchTier::Collapsed, 20),
      0.62);
  EXPECT_DOUBLE_EQ(
      CollocationDetector::tierConfidence(CollocationKind::VerbNoun,
                                          MatchTier::Window),
      0.52);
}

TEST(CollocationDetectorTest, TiersAreStrictlyOrderedForEveryKind) {
  const CollocationKind kinds[] = {
      CollocationKind::ReflexivePrep, CollocationKind::VerbPrep,
      CollocationKind::VerbNoun, CollocationKind::Separable};
  for (CollocationKind kind : kinds) {
    double strict = CollocationDetector::tierConfidence(kind, MatchTier::Strict);
    double loose = CollocationDetector::tierConfidence(kind, MatchTier::Loose);
    double window = CollocationDetector::tierConfidence(kind, MatchTier::Window);
    EXPECT_GT(strict, loose) << kindName(kind);
    EXPECT_GT(loose, window) << kindName(kind);
    for (int hops : {1, 2, 5, 50}) {
      double collapsed =
          CollocationDetector::tierConfidence(kind, MatchTier::Collapsed, hops);
      EXPECT_GT(loose, collapsed) << kindName(kind) << " hops " << hops;
      EXPECT_GT(collapsed, window) << kindName(kind) << " hops " << hops;
    }
  }
}

TEST(CollocationDetectorTest, SeparableDefinitionsAreNotEmitted) {
  Sentence s = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "nsubj", 1, ""},
      {"stehe", "stehen", "VERB", "VVFIN", "ROOT", -1, ""},
      {"früh", "früh", "ADV", "ADJD", "advmod", 1, ""},
      {"auf", "auf", "ADP", "PTKVZ", "compound:prt", 1, ""},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  auto detector = makeDetector();
  EXPECT_TRUE(detector.detect(s).empty());

  auto matches = detector.match(s);
  auto it = std::find_if(matches.begin(), matches.end(),
                         [](const CollocationMatch &m) {
                           return m.definition->id == "aufstehen";
                         });
  ASSERT_NE(it, matches.end());
  EXPECT_EQ(it->tier, MatchTier::Strict);
  EXPECT_EQ(it->tokenIndices, std::vector<size_t>({1, 3}));

  auto attempts = detector.explain(s);
  auto attempt = std::find_if(attempts.begin(), attempts.end(),
                              [](const CollocationAttempt &a) {
                                return a.definitionId == "aufstehen";
                              });
  ASSERT_NE(attempt, attempts.end());
  ASSERT_TRUE(attempt->tier.has_value());
  EXPECT_FALSE(attempt->emitted);
}

TEST(CollocationDetectorTest, DetachedParticleCompletesParticleVerb) {
  // Sie bereitet sich auf die Prüfung vor.
  Sentence s = buildSentence({
      {"Sie", "sie", "PRON", "PPER", "nsubj", 1, ""},
      {"bereitet", "bereiten", "VERB", "VVFIN", "ROOT", -1, ""},
      {"sich", "sich", "PRON", "PRF", "obj", 1, ""},
      {"auf", "auf", "ADP", "APPR", "case", 5, ""},
      {"die", "der", "DET", "ART", "det", 5, ""},
      {"Prüfung", "Prüfung", "NOUN", "NN", "obl", 1, ""},
      {"vor", "vor", "ADP", "PTKVZ", "compound:prt", 1, ""},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  auto results = makeDetector().detect(s);
  const DetectionResult *r = findLabel(results, "sich vorbereiten auf");
  ASSERT_NE(r, nullptr);
  EXPECT_EQ(r->details["tier"], "strict");
  EXPECT_EQ(r->details["tokenIndices"], json({1, 2, 3, 6}));
}

TEST(CollocationDetectorTest, NounCollocationAfterPerfectAuxiliary) {
  // Ich habe einen Fehler gemacht.
  Sentence s = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "nsubj", 4, ""},
      {"habe", "haben", "AUX", "VAFIN", "aux", 4, ""},
      {"einen", "ein", "DET", "ART", "det", 3, ""},
      {"Fehler", "Fehler", "NOUN", "NN", "obj", 4, ""},
      {"gemacht", "machen", "VERB", "VVPP", "ROOT", -1, ""},
      {".", ".", "PUNCT", "$.", "punct", 4, ""},
  });
  auto results = makeDetector().detect(s);
  const DetectionResult *r = findLabel(results, "einen Fehler machen");
  ASSERT_NE(r, nullptr);
  EXPECT_DOUBLE_EQ(r->confidence, 0.92);
  EXPECT_EQ(r->details["tokenIndices"], json({3, 4}));
  // the auxiliary haben must not trigger "Angst haben" and friends
  EXPECT_EQ(findLabel(results, "Angst haben"), nullptr);
}

TEST(CollocationDetectorTest, ReflexiveSubjectDoesNotCount) {
  Sentence s = buildSentence({
      {"Sich", "sich", "PRON", "PRF", "nsubj", 1, ""},
      {"freuen", "freuen", "VERB", "VVINF", "ROOT", -1, ""},
      {"auf", "auf", "ADP", "APPR", "case", 3, ""},
      {"Ferien", "Ferien", "NOUN", "NN", "obl", 1, ""},
  });
  EXPECT_EQ(findLabel(makeDetector().detect(s), "sich freuen auf"), nullptr);
}

TEST(CollocationDetectorTest, UnknownGrammarPointFailsConstruction) {
  auto table = tableFrom(R"({"collocations": [
    {"id": "x", "type": "verb-prep", "verb": "warten", "preposition": "auf",
     "grammarPoint": "z9-missing"}]})");
  EXPECT_THROW(CollocationDetector detector(table, satzbau_test::catalog()),
               CatalogError);
}
