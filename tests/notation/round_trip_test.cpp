// Round-trip tests -- parse(format(doc)) preserves content and format is a fixed point.

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "notation/document_builder.h"
#include "notation/document_parser.h"
#include "notation/formatter.h"
#include "notation/validator.h"
#include "test_helpers.h"

namespace sur {
namespace {

using test_helpers::noteElement;
using test_helpers::wrapComposition;

Document richDocument() {
  return DocumentBuilder()
      .addMetadata("name", "Albela Sajan")
      .addMetadata("raag", "bhoopali")
      .addMetadata("notes", "madhya laya: 90 // approx")
      .addScaleNote("S", "Sa")
      .addScaleNote("R", "Shuddha Re")
      .addScaleNote("g", "Komal Ga")
      .beginSection("Sthayi")
      .beginBeat().addRest()
      .beginBeat(true).addNote(Pitch::S, Octave::Middle, "al")
      .beginBeat().addNote(Pitch::R, Octave::Middle, "be")
      .beginBeat().addSustain()
      .beginRow()
      .beginBeat().addNote(Pitch::S).addNote(Pitch::R, Octave::Upper).addNote(Pitch::G)
      .beginBeat().addNote(Pitch::N, Octave::Lower, "aa re")
      .beginBeat().addLyrics("SR")
      .beginBeat().addLyrics("la").addNote(Pitch::P)
      .beginSection("Antara")
      .beginBeat().addNote(Pitch::M, Octave::Middle, "sa").addNote(Pitch::P, Octave::Middle, "ja")
      .beginBeat().addNote(Pitch::D, Octave::Middle, "re:mi")
      .build();
}

// ---------------------------------------------------------------------------
// Builder documents
// ---------------------------------------------------------------------------

TEST(RoundTripTest, ParseOfFormatPreservesContent) {
  Document original = richDocument();
  std::vector<ParseWarning> warnings;
  Document reparsed = parse(format(original), warnings);
  EXPECT_TRUE(warnings.empty());
  EXPECT_TRUE(sameContent(original, reparsed)) << format(original) << "\n---\n"
                                               << format(reparsed);
  EXPECT_NO_THROW(validate(reparsed));
}

TEST(RoundTripTest, PositionsSurviveRoundTrip) {
  Document original = richDocument();
  Document reparsed = parse(format(original));
  const auto& beats = reparsed.composition.sections[0].beats;
  ASSERT_EQ(beats.size(), original.composition.sections[0].beats.size());
  for (size_t idx = 0; idx < beats.size(); ++idx) {
    EXPECT_EQ(*beats[idx].position, *original.composition.sections[0].beats[idx].position)
        << "beat " << idx;
  }
}

TEST(RoundTripTest, FormatIsIdempotent) {
  std::string once = format(richDocument());
  std::string twice = format(parse(once));
  EXPECT_EQ(once, twice);
}

// ---------------------------------------------------------------------------
// Header and title text
// ---------------------------------------------------------------------------

DocumentBuilder oneBeatDocument(const std::string& title) {
  DocumentBuilder builder;
  builder.addMetadata("name", "Test")
      .addScaleNote("S", "Sa")
      .beginSection(title)
      .beginBeat()
      .addNote(Pitch::S);
  return builder;
}

/// Build, format, re-parse and compare; fails the test on any difference.
void expectRoundTrip(const DocumentBuilder& builder) {
  Document original = builder.build();
  std::vector<ParseWarning> warnings;
  Document reparsed = parse(format(original), warnings);
  EXPECT_TRUE(warnings.empty()) << format(original);
  EXPECT_TRUE(sameContent(original, reparsed)) << format(original);
  EXPECT_NO_THROW(validate(reparsed));
}

std::string rejectedField(const DocumentBuilder& builder) {
  try {
    builder.build();
  } catch (const ValidationError& err) {
    return err.field();
  }
  return "";
}

TEST(RoundTripTest, UnusualButWritableTitlesSurvive) {
  const char* titles[] = {"Sthayi (vilambit)", "Antara #2", "Madhya  laya", "sa:re [ga]",
                          "say \"aa\"", "Sanchari - 1"};
  for (const char* title : titles) {
    SCOPED_TRACE(title);
    expectRoundTrip(oneBeatDocument(title));
  }
}

TEST(RoundTripTest, TitlesFormatCannotWriteAreRejected) {
  const char* titles[] = {"Sthayi // part 1", " Sthayi", "Sthayi ", "   ", "two\nlines"};
  for (const char* title : titles) {
    EXPECT_EQ(rejectedField(oneBeatDocument(title)), "composition.sections[0].title") << title;
  }
}

TEST(RoundTripTest, UnusualButWritableHeaderTextSurvives) {
  DocumentBuilder builder = oneBeatDocument("Sthayi");
  builder.addMetadata("notes", "madhya: 90 // approx")
      .addMetadata("blank", "")
      .addMetadata("padded", "  wide  ")
      .addMetadata("taal-name", "teen taal")
      .addScaleNote("g", "Sa // Shadja")
      .addScaleNote("R", "Komal Re -> flat")
      .addScaleNote("r'", "Re: komal");
  expectRoundTrip(builder);
}

TEST(RoundTripTest, EmptyScaleNameIsRejected) {
  DocumentBuilder builder;
  builder.addMetadata("name", "Test")
      .addScaleNote("S", "")
      .beginSection("A")
      .beginBeat()
      .addRest();
  EXPECT_EQ(rejectedField(builder), "scale.S");
}

TEST(RoundTripTest, MetadataFormatCannotWriteIsRejected) {
  DocumentBuilder key_with_colon = oneBeatDocument("A");
  key_with_colon.addMetadata("laya:madhya", "v");
  EXPECT_EQ(rejectedField(key_with_colon), "metadata.laya:madhya");

  DocumentBuilder quoted_value = oneBeatDocument("A");
  quoted_value.addMetadata("k", "a\" // \"b");
  EXPECT_EQ(rejectedField(quoted_value), "metadata.k");

  DocumentBuilder marker_key = oneBeatDocument("A");
  marker_key.addMetadata("@SCALE", "x");
  EXPECT_EQ(rejectedField(marker_key), "metadata.@SCALE");
}

// ---------------------------------------------------------------------------
// Hand-written text
// ---------------------------------------------------------------------------

TEST(RoundTripTest, LooseTextSettlesAfterOneFormat) {
  const std::string loose = wrapComposition(
      "// opening\n"
      "#Sthayi\n"
      "b:   [S R G]  [ sa:S   re:R ]   .N S'   // tail\n"
      "b: \"aa re\":P *\n"
      "\n"
      "#Antara\n"
      "b: al be:S -\n");
  std::string first = format(parse(loose));
  std::string second = format(parse(first));
  EXPECT_EQ(first, second);
  EXPECT_TRUE(sameContent(parse(loose), parse(first)));
}

TEST(RoundTripTest, SustainRunStaysFourBeats) {
  Document doc = parse(wrapComposition("#A\nb: S * * *\n"));
  ASSERT_EQ(doc.composition.sections[0].beats.size(), 4u);
  std::string text = format(doc);
  EXPECT_NE(text.find("b: S * * *\n"), std::string::npos);

  Document again = parse(text);
  const auto& beats = again.composition.sections[0].beats;
  ASSERT_EQ(beats.size(), 4u);
  EXPECT_EQ(beats[0].elements[0], noteElement(Pitch::S));
  EXPECT_EQ(beats[3].elements[0], noteElement(Pitch::Sustain));
}

TEST(RoundTripTest, CompactAndBracketedFormsAreEquivalent) {
  Document compact = parse(wrapComposition("#A\nb: SRG\n"));
  Document bracketed = parse(wrapComposition("#A\nb: [S R G]\n"));
  EXPECT_TRUE(sameContent(compact, bracketed));
  EXPECT_EQ(format(compact), format(bracketed));
}

}  // namespace
}  // namespace sur
