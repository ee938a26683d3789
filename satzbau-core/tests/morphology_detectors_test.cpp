#include <gtest/gtest.h>

#include "peer_detectors.hpp"
#include "test_support.hpp"

using namespace Satzbau;
using namespace Satzbau::detect;
using satzbau_test::buildSentence;

// ---- tense ----

TEST(TenseDetectorTest, PresentAndSimplePast) {
  Sentence present = buildSentence({
      {"Er", "er", "PRON", "PPER", "nsubj", 1, "Case=Nom"},
      {"spielt", "spielen", "VERB", "VVFIN", "ROOT", -1,
       "Mood=Ind|Tense=Pres|VerbForm=Fin"},
      {"heute", "heute", "ADV", "ADV", "advmod", 1, ""},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  auto results = TenseDetector(satzbau_test::catalog()).detect(present);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "a1-present-tense");
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.98);
  EXPECT_EQ(results[0].positions[0], (CharRange{3, 9}));

  Sentence past = buildSentence({
      {"Sie", "sie", "PRON", "PPER", "nsubj", 1, "Case=Nom"},
      {"kam", "kommen", "VERB", "VVFIN", "ROOT", -1,
       "Mood=Ind|Tense=Past|VerbForm=Fin"},
      {"gestern", "gestern", "ADV", "ADV", "advmod", 1, ""},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  results = TenseDetector(satzbau_test::catalog()).detect(past);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "a2-simple-past");
  EXPECT_EQ(results[0].details["tense"], "past");
}

TEST(TenseDetectorTest, PerfectWithHabenConsumesTheAuxiliary) {
  Sentence s = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "nsubj", 4, "Case=Nom"},
      {"habe", "haben", "AUX", "VAFIN", "aux", 4,
       "Mood=Ind|Tense=Pres|VerbForm=Fin"},
      {"das", "der", "DET", "ART", "det", 3, "Case=Acc"},
      {"Buch", "Buch", "NOUN", "NN", "obj", 4, "Case=Acc"},
      {"gelesen", "lesen", "VERB", "VVPP", "ROOT", -1, "VerbForm=Part"},
      {".", ".", "PUNCT", "$.", "punct", 4, ""},
  });
  auto results = TenseDetector(satzbau_test::catalog()).detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "a2-present-perfect");
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.95);
  ASSERT_EQ(results[0].positions.size(), 2u);
  EXPECT_EQ(results[0].positions[0], (CharRange{4, 8}));
  EXPECT_EQ(results[0].positions[1], (CharRange{18, 25}));
}

TEST(TenseDetectorTest, PastPerfectWithSein) {
  Sentence s = buildSentence({
      {"Wir", "wir", "PRON", "PPER", "nsubj", 4, "Case=Nom"},
      {"waren", "sein", "AUX", "VAFIN", "aux", 4,
       "Mood=Ind|Tense=Past|VerbForm=Fin"},
      {"nach", "nach", "ADP", "APPR", "case", 3, ""},
      {"Hause", "Haus", "NOUN", "NN", "obl", 4, "Case=Dat"},
      {"gegangen", "gehen", "VERB", "VVPP", "ROOT", -1, "VerbForm=Part"},
      {".", ".", "PUNCT", "$.", "punct", 4, ""},
  });
  auto results = TenseDetector(satzbau_test::catalog()).detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "b1-present-perfect-sein");
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.90);
  EXPECT_EQ(results[0].details["tense"], "past-perfect");
}

TEST(TenseDetectorTest, PerfectPassiveIsNotATense) {
  Sentence s = buildSentence({
      {"Das", "der", "DET", "ART", "det", 1, ""},
      {"Haus", "Haus", "NOUN", "NN", "nsubj:pass", 3, ""},
      {"ist", "sein", "AUX", "VAFIN", "aux", 3,
       "Mood=Ind|Tense=Pres|VerbForm=Fin"},
      {"gebaut", "bauen", "VERB", "VVPP", "ROOT", -1, "VerbForm=Part"},
      {"worden", "werden", "AUX", "VAPP", "aux:pass", 3, "VerbForm=Part"},
      {".", ".", "PUNCT", "$.", "punct", 3, ""},
  });
  EXPECT_TRUE(TenseDetector(satzbau_test::catalog()).detect(s).empty());
}

// ---- case ----

TEST(CaseDetectorTest, NounPhrasesByCase) {
  auto results =
      CaseDetector(satzbau_test::catalog()).detect(satzbau_test::freueMichAufKonzert());
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].grammarPointId, "a1-nominative-case");
  EXPECT_EQ(results[0].positions[0], (CharRange{0, 3}));
  EXPECT_EQ(results[1].grammarPointId, "a1-accusative-case");
  EXPECT_EQ(results[1].positions[0], (CharRange{10, 14}));
  EXPECT_EQ(results[2].grammarPointId, "a1-accusative-case");
  EXPECT_EQ(results[2].positions[0], (CharRange{19, 30}));
  EXPECT_EQ(results[2].details["words"], json::array({"das", "Konzert"}));
}

TEST(CaseDetectorTest, DativeContexts) {
  Sentence indirect = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "nsubj", 1, "Case=Nom"},
      {"gebe", "geben", "VERB", "VVFIN", "ROOT", -1, ""},
      {"dem", "der", "DET", "ART", "det", 3, "Case=Dat|Gender=Masc"},
      {"Mann", "Mann", "NOUN", "NN", "iobj", 1, "Case=Dat|Gender=Masc"},
      {"das", "der", "DET", "ART", "det", 5, "Case=Acc"},
      {"Buch", "Buch", "NOUN", "NN", "obj", 1, "Case=Acc"},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  auto results = CaseDetector(satzbau_test::catalog()).detect(indirect);
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[1].grammarPointId, "a2-dative-case");
  EXPECT_EQ(results[1].positions[0], (CharRange{9, 17}));
  EXPECT_EQ(results[1].details["dativeContext"], "indirect-object");

  Sentence governed = buildSentence({
      {"Er", "er", "PRON", "PPER", "nsubj", 1, "Case=Nom"},
      {"fährt", "fahren", "VERB", "VVFIN", "ROOT", -1, ""},
      {"mit", "mit", "ADP", "APPR", "case", 4, ""},
      {"dem", "der", "DET", "ART", "det", 4, "Case=Dat"},
      {"Zug", "Zug", "NOUN", "NN", "obl", 1, "Case=Dat"},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  results = CaseDetector(satzbau_test::catalog()).detect(governed);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[1].details["dativeContext"], "prepositional");
}

TEST(CaseDetectorTest, GenitiveAndUnmarkedNounsAreSkipped) {
  Sentence s = buildSentence({
      {"Das", "der", "DET", "ART", "det", 1, ""},
      {"Auto", "Auto", "NOUN", "NN", "nsubj", -1, ""},
      {"des", "der", "DET", "ART", "det", 3, "Case=Gen"},
      {"Vaters", "Vater", "NOUN", "NN", "nmod", 1, "Case=Gen"},
  });
  EXPECT_TRUE(CaseDetector(satzbau_test::catalog()).detect(s).empty());
}

// ---- mood ----

TEST(MoodDetectorTest, Imperative) {
  Sentence s = buildSentence({
      {"Komm", "kommen", "VERB", "VVIMP", "ROOT", -1, "Mood=Imp"},
      {"bitte", "bitte", "ADV", "ADV", "advmod", 0, ""},
      {"her", "her", "ADV", "ADV", "advmod", 0, ""},
      {"!", "!", "PUNCT", "$.", "punct", 0, ""},
  });
  auto results = MoodDetector(satzbau_test::catalog()).detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "a1-imperative");
  EXPECT_EQ(results[0].positions[0], (CharRange{0, 4}));
}

TEST(MoodDetectorTest, WuerdeFormWithInfinitive) {
  Sentence s = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "nsubj", 3, "Case=Nom"},
      {"würde", "werden", "AUX", "VAFIN", "aux", 3, "Mood=Sub|VerbForm=Fin"},
      {"gern", "gern", "ADV", "ADV", "advmod", 3, ""},
      {"kommen", "kommen", "VERB", "VVINF", "ROOT", -1, "VerbForm=Inf"},
      {".", ".", "PUNCT", "$.", "punct", 3, ""},
  });
  auto results = MoodDetector(satzbau_test::catalog()).detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "b1-konjunktiv-II-conditional");
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.98);
  ASSERT_EQ(results[0].positions.size(), 2u);
  EXPECT_EQ(results[0].positions[1], (CharRange{15, 21}));
}

TEST(MoodDetectorTest, SyntheticKonjunktivTwo) {
  Sentence s = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "nsubj", 1, "Case=Nom"},
      {"hätte", "haben", "AUX", "VAFIN", "ROOT", -1, "Mood=Sub|VerbForm=Fin"},
      {"gern", "gern", "ADV", "ADV", "advmod", 1, ""},
      {"einen", "ein", "DET", "ART", "det", 4, "Case=Acc"},
      {"Kaffee", "Kaffee", "NOUN", "NN", "obj", 1, "Case=Acc"},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  auto results = MoodDetector(satzbau_test::catalog()).detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "b1-konjunktiv-II-subjunctive");
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.90);
}

TEST(MoodDetectorTest, KonjunktivOneNeedsAVerbOfSaying) {
  Sentence reported = buildSentence({
      {"Er", "er", "PRON", "PPER", "nsubj", 1, "Case=Nom"},
      {"sagte", "sagen", "VERB", "VVFIN", "ROOT", -1,
       "Mood=Ind|Tense=Past|VerbForm=Fin"},
      {",", ",", "PUNCT", "$,", "punct", 4, ""},
      {"er", "er", "PRON", "PPER", "nsubj", 4, "Case=Nom"},
      {"habe", "haben", "VERB", "VAFIN", "ccomp", 1, "Mood=Sub|VerbForm=Fin"},
      {"keine", "kein", "DET", "PIAT", "det", 6, "Case=Acc"},
      {"Zeit", "Zeit", "NOUN", "NN", "obj", 4, "Case=Acc"},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  auto results = MoodDetector(satzbau_test::catalog()).detect(reported);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "b2-konjunktiv-I");
  EXPECT_EQ(results[0].positions[0], (CharRange{13, 17}));
  EXPECT_EQ(results[0].details["use"], "reported-speech");

  Sentence wish = buildSentence({
      {"Es", "es", "PRON", "PPER", "expl", 1, ""},
      {"lebe", "leben", "VERB", "VVFIN", "ROOT", -1, "Mood=Sub|VerbForm=Fin"},
      {"der", "der", "DET", "ART", "det", 3, "Case=Nom"},
      {"König", "König", "NOUN", "NN", "nsubj", 1, "Case=Nom"},
      {"!", "!", "PUNCT", "$.", "punct", 1, ""},
  });
  EXPECT_TRUE(MoodDetector(satzbau_test::catalog()).detect(wish).empty());
}

// ---- modal verbs ----

TEST(ModalVerbDetectorTest, ModalWithDependentInfinitive) {
  Sentence s = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "nsubj", 3, "Case=Nom"},
      {"muss", "müssen", "AUX", "VMFIN", "aux", 3, "VerbForm=Fin"},
      {"heute", "heute", "ADV", "ADV", "advmod", 3, ""},
      {"arbeiten", "arbeiten", "VERB", "VVINF", "ROOT", -1, "VerbForm=Inf"},
      {".", ".", "PUNCT", "$.", "punct", 3, ""},
  });
  auto results = ModalVerbDetector(satzbau_test::catalog()).detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "b1-modal-verbs");
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.95);
  ASSERT_EQ(results[0].positions.size(), 2u);
  EXPECT_EQ(results[0].positions[0], (CharRange{4, 8}));
  EXPECT_EQ(results[0].positions[1], (CharRange{15, 23}));
  EXPECT_EQ(results[0].details["infinitive"], "arbeiten");
}

TEST(ModalVerbDetectorTest, VerbFinalWithoutDependencies) {
  Sentence s = buildSentence({
      {"weil", "weil", "SCONJ", "KOUS", "", -1, ""},
      {"ich", "ich", "PRON", "PPER", "", -1, ""},
      {"nicht", "nicht", "PART", "PTKNEG", "", -1, ""},
      {"kommen", "kommen", "VERB", "VVINF", "", -1, ""},
      {"kann", "können", "AUX", "VMFIN", "", -1, ""},
  });
  auto results = ModalVerbDetector(satzbau_test::catalog()).detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].positions[0], (CharRange{15, 21}));
  EXPECT_EQ(results[0].positions[1], (CharRange{22, 26}));
}

TEST(ModalVerbDetectorTest, StandaloneModalOnlyInQuestions) {
  Sentence question = buildSentence({
      {"Kannst", "können", "AUX", "VMFIN", "ROOT", -1, "VerbForm=Fin"},
      {"du", "du", "PRON", "PPER", "nsubj", 0, "Case=Nom"},
      {"das", "die", "PRON", "PDS", "obj", 0, "Case=Acc"},
      {"?", "?", "PUNCT", "$.", "punct", 0, ""},
  });
  auto results = ModalVerbDetector(satzbau_test::catalog()).detect(question);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.80);
  EXPECT_EQ(results[0].positions[0], (CharRange{0, 6}));
  EXPECT_EQ(results[0].details["usage"], "standalone");

  Sentence statement = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "nsubj", 1, "Case=Nom"},
      {"kann", "können", "AUX", "VMFIN", "ROOT", -1, "VerbForm=Fin"},
      {"Deutsch", "Deutsch", "NOUN", "NN", "obj", 1, "Case=Acc"},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  EXPECT_TRUE(ModalVerbDetector(satzbau_test::catalog()).detect(statement).empty());
}

// ---- reflexive verbs ----

TEST(ReflexiveVerbDetectorTest, ReflexiveObjectViaDependency) {
  auto results = ReflexiveVerbDetector(satzbau_test::catalog())
                     .detect(satzbau_test::freueMichAufKonzert());
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "a2-reflexive-verbs");
  EXPECT_EQ(results[0].label, "sich freuen");
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.95);
  ASSERT_EQ(results[0].positions.size(), 2u);
  EXPECT_EQ(results[0].positions[0], (CharRange{4, 9}));
  EXPECT_EQ(results[0].positions[1], (CharRange{10, 14}));
  EXPECT_EQ(results[0].details["position"], "after");
}

TEST(ReflexiveVerbDetectorTest, PositionFallbackNeedsAMarkedReflexive) {
  Sentence marked = buildSentence({
      {"Er", "er", "PRON", "PPER", "", -1, ""},
      {"wäscht", "waschen", "VERB", "VVFIN", "", -1, ""},
      {"sich", "sich", "PRON", "PRF", "", -1, ""},
      {".", ".", "PUNCT", "$.", "", -1, ""},
  });
  auto results = ReflexiveVerbDetector(satzbau_test::catalog()).detect(marked);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_DOUBLE_EQ(results[0].confidence, 0.80);
  EXPECT_EQ(results[0].details["reflexivePronoun"], "sich");

  Sentence plain = buildSentence({
      {"Ich", "ich", "PRON", "PPER", "", -1, ""},
      {"helfe", "helfen", "VERB", "VVFIN", "", -1, ""},
      {"ihm", "er", "PRON", "PPER", "", -1, ""},
      {".", ".", "PUNCT", "$.", "", -1, ""},
  });
  EXPECT_TRUE(ReflexiveVerbDetector(satzbau_test::catalog()).detect(plain).empty());
}

// ---- conditionals ----

TEST(ConditionalDetectorTest, ConditionalTypes) {
  Sentence real = buildSentence({
      {"Wenn", "wenn", "SCONJ", "KOUS", "mark", 3, ""},
      {"ich", "ich", "PRON", "PPER", "nsubj", 3, ""},
      {"Zeit", "Zeit", "NOUN", "NN", "obj", 3, ""},
      {"habe", "haben", "VERB", "VAFIN", "advcl", 5, "Mood=Ind|VerbForm=Fin"},
      {",", ",", "PUNCT", "$,", "punct", 3, ""},
      {"komme", "kommen", "VERB", "VVFIN", "ROOT", -1, "Mood=Ind|VerbForm=Fin"},
      {"ich", "ich", "PRON", "PPER", "nsubj", 5, ""},
      {".", ".", "PUNCT", "$.", "punct", 5, ""},
  });
  auto results = ConditionalDetector(satzbau_test::catalog()).detect(real);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "b2-conditional-sentences");
  EXPECT_EQ(results[0].positions[0], (CharRange{0, 18}));
  EXPECT_EQ(results[0].details["conditionalType"], "real");

  Sentence pastUnreal = buildSentence({
      {"Falls", "falls", "SCONJ", "KOUS", "", -1, ""},
      {"er", "er", "PRON", "PPER", "", -1, ""},
      {"gekommen", "kommen", "VERB", "VVPP", "", -1, ""},
      {"wäre", "sein", "AUX", "VAFIN", "", -1, "Mood=Sub"},
  });
  results = ConditionalDetector(satzbau_test::catalog()).detect(pastUnreal);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].details["conditionalType"], "past-unreal");
  EXPECT_EQ(results[0].positions[0], (CharRange{0, 22}));
}

TEST(ConditionalDetectorTest, FrontedSubjunctiveVerb) {
  std::vector<satzbau_test::Tok> tokens = {
      {"Hätte", "haben", "VERB", "VAFIN", "advcl", 4, "Mood=Sub|VerbForm=Fin"},
      {"ich", "ich", "PRON", "PPER", "nsubj", 0, ""},
      {"Zeit", "Zeit", "NOUN", "NN", "obj", 0, ""},
      {",", ",", "PUNCT", "$,", "punct", 0, ""},
      {"käme", "kommen", "VERB", "VVFIN", "ROOT", -1, "Mood=Sub|VerbForm=Fin"},
      {"ich", "ich", "PRON", "PPER", "nsubj", 4, ""},
      {"mit", "mit", "ADP", "PTKVZ", "compound:prt", 4, ""},
      {".", ".", "PUNCT", "$.", "punct", 4, ""},
  };
  auto results =
      ConditionalDetector(satzbau_test::catalog()).detect(buildSentence(tokens));
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "c1-advanced-conditionals");
  EXPECT_EQ(results[0].positions[0], (CharRange{0, 14}));

  tokens.back() = {"?", "?", "PUNCT", "$.", "punct", 4, ""};
  EXPECT_TRUE(
      ConditionalDetector(satzbau_test::catalog()).detect(buildSentence(tokens)).empty());
}

// ---- prepositions ----

TEST(PrepositionDetectorTest, TwoWayPrepositionWithAccusative) {
  auto results = PrepositionDetector(satzbau_test::catalog())
                     .detect(satzbau_test::freueMichAufKonzert());
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "a2-accusative-prepositions");
  EXPECT_EQ(results[0].positions[0], (CharRange{15, 30}));
  EXPECT_EQ(results[0].details["usage"], "direction");
  EXPECT_EQ(results[0].details["object"], "Konzert");
}

TEST(PrepositionDetectorTest, DativePrepositionViaDependency) {
  Sentence s = buildSentence({
      {"Er", "er", "PRON", "PPER", "nsubj", 1, "Case=Nom"},
      {"fährt", "fahren", "VERB", "VVFIN", "ROOT", -1, ""},
      {"mit", "mit", "ADP", "APPR", "case", 4, ""},
      {"dem", "der", "DET", "ART", "det", 4, "Case=Dat"},
      {"Zug", "Zug", "NOUN", "NN", "obl", 1, "Case=Dat"},
      {".", ".", "PUNCT", "$.", "punct", 1, ""},
  });
  auto results = PrepositionDetector(satzbau_test::catalog()).detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "a2-dative-prepositions");
  EXPECT_EQ(results[0].positions[0], (CharRange{9, 20}));
  EXPECT_FALSE(results[0].details["twoWay"].get<bool>());
}

TEST(PrepositionDetectorTest, ContractionImpliesCase) {
  Sentence s = buildSentence({
      {"Wir", "wir", "PRON", "PPER", "", -1, ""},
      {"gehen", "gehen", "VERB", "VVFIN", "", -1, ""},
      {"ins", "in", "ADP", "APPRART", "", -1, ""},
      {"Kino", "Kino", "NOUN", "NN", "", -1, ""},
      {".", ".", "PUNCT", "$.", "", -1, ""},
  });
  auto results = PrepositionDetector(satzbau_test::catalog()).detect(s);
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].grammarPointId, "a2-accusative-prepositions");
  EXPECT_EQ(results[0].positions[0], (CharRange{10, 18}));
}

TEST(PrepositionDetectorTest, CaseMismatchIsNotReported) {
  Sentence s = buildSentence({
      {"Er", "er", "PRON", "PPER", "nsubj", 1, "Case=Nom"},
      {"kommt", "kommen", "VERB", "VVFIN", "ROOT", -1, ""},
      {"ohne", "ohne", "ADP", "APPR", "case", 4, ""},
      {"seinem", "sein", "DET", "PPOSAT", "det", 4, "Case=Dat"},
      {"Bruder", "Bruder", "NOUN", "NN", "obl", 1, "Case=Dat"},
  });
  EXPECT_TRUE(PrepositionDetector(satzbau_test::catalog()).detect(s).empty());
}
