#include <gtest/gtest.h>

#include "pos_classifier.hpp"
#include "text_offsets.hpp"
#include "text_utils.hpp"

using Satzbau::Token;
using Satzbau::pos::POSClassifier;
using Satzbau::text::TextUtils;
namespace text = Satzbau::text;

TEST(TextUtilsTest, LowercasesUmlauts) {
  EXPECT_EQ(TextUtils::toLower("ÄRGER"), "ärger");
  EXPECT_EQ(TextUtils::toLower("Über"), "über");
  EXPECT_EQ(TextUtils::toLower("Straße"), "straße");
  EXPECT_TRUE(TextUtils::equalsIgnoreCase("Angst", "angst"));
  EXPECT_FALSE(TextUtils::equalsIgnoreCase("Angst", "Ängste"));
}

TEST(TextUtilsTest, CapitalizesFirstLetter) {
  EXPECT_EQ(TextUtils::capitalize("angst"), "Angst");
  EXPECT_EQ(TextUtils::capitalize("übung"), "Übung");
  EXPECT_EQ(TextUtils::capitalize(""), "");
}

TEST(TextUtilsTest, StripsInfinitiveEnding) {
  EXPECT_EQ(TextUtils::stripVerbEnding("erinnern"), "erinn");
  EXPECT_EQ(TextUtils::stripVerbEnding("freuen"), "freu");
  EXPECT_EQ(TextUtils::stripVerbEnding("tun"), "tu");
  EXPECT_EQ(TextUtils::stripVerbEnding("ich"), "ich");
}

TEST(TextUtilsTest, LemmaMatchingIsLenient) {
  EXPECT_TRUE(TextUtils::lemmaMatches("freuen", "freuen"));
  EXPECT_TRUE(TextUtils::lemmaMatches("Freuen", "freuen"));
  EXPECT_TRUE(TextUtils::lemmaMatches("freu", "freuen"));
  EXPECT_FALSE(TextUtils::lemmaMatches("warten", "denken"));
  EXPECT_FALSE(TextUtils::lemmaMatches("", "denken"));
}

TEST(TextUtilsTest, SanitizeDropsInvalidBytes) {
  std::string broken = "Kind\xFFheit";
  EXPECT_EQ(TextUtils::sanitizeUTF8(broken), "Kindheit");
  EXPECT_EQ(TextUtils::sanitizeUTF8("schön"), "schön");
  EXPECT_EQ(TextUtils::sanitizeUTF8(std::string("a\x01") + "b"), "ab");
}

TEST(TextUtilsTest, SanitizeKeepingOffsetsPreservesLength) {
  EXPECT_EQ(TextUtils::sanitizeKeepingOffsets("\fIch lese."), " Ich lese.");
  EXPECT_EQ(TextUtils::sanitizeKeepingOffsets("schön\tda"), "schön\tda");

  std::string broken = std::string("a") + "\xC3" + "b";
  std::string cleaned = TextUtils::sanitizeKeepingOffsets(broken);
  EXPECT_EQ(cleaned, "a\xEF\xBF\xBD" "b");
  EXPECT_EQ(text::codePointLength(cleaned), 3u);
}

TEST(TextOffsetsTest, CountsCodePoints) {
  EXPECT_EQ(text::codePointLength("plötzlich"), 9u);
  EXPECT_EQ(text::codePointLength(""), 0u);
  EXPECT_EQ(text::codePointToByteOffset("plötzlich", 3), 4u);
  EXPECT_EQ(text::byteToCodePointOffset("plötzlich", 4), 3u);
  EXPECT_EQ(text::sliceCodePoints("zu lächeln.", 3, 10), "lächeln");
  EXPECT_EQ(text::sliceCodePoints("abc", 2, 1), "");
}

TEST(POSClassifierTest, ParsesMorphology) {
  auto morph = POSClassifier::parseMorphology("Case=Nom|Number=Sing|bogus");
  EXPECT_EQ(morph.size(), 2u);
  EXPECT_EQ(morph["Case"], "Nom");
  EXPECT_EQ(morph["Number"], "Sing");
}

TEST(POSClassifierTest, RecognisesContractedPrepositions) {
  Token t;
  t.text = "zum";
  t.lemma = "zu";
  t.pos = "ADP";
  t.tag = "APPRART";
  EXPECT_TRUE(POSClassifier::matchesPreposition(t, "zu"));

  t.lemma = "";
  EXPECT_TRUE(POSClassifier::matchesPreposition(t, "zu"));
  EXPECT_FALSE(POSClassifier::matchesPreposition(t, "an"));
  EXPECT_EQ(POSClassifier::contractedPrepositionBase("Am"), "an");
}

TEST(POSClassifierTest, ReflexiveNeedsPronoun) {
  Token sich;
  sich.text = "sich";
  sich.lemma = "sich";
  sich.pos = "PRON";
  EXPECT_TRUE(POSClassifier::isReflexivePronoun(sich));

  Token noun = sich;
  noun.pos = "NOUN";
  noun.tag = "NN";
  EXPECT_FALSE(POSClassifier::isReflexivePronoun(noun));
}

TEST(POSClassifierTest, FiniteFromTagOrMorphology) {
  Token t;
  t.pos = "VERB";
  t.tag = "VVFIN";
  EXPECT_TRUE(POSClassifier::isFiniteVerb(t));

  t.tag = "";
  t.morph["VerbForm"] = "Fin";
  EXPECT_TRUE(POSClassifier::isFiniteVerb(t));

  t.morph["VerbForm"] = "Part";
  EXPECT_TRUE(POSClassifier::isPastParticiple(t));
  EXPECT_FALSE(POSClassifier::isFiniteVerb(t));
}
