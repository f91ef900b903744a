// Tests for notation/validator.h -- required fields and element invariants.

#include "notation/validator.h"

#include <gtest/gtest.h>

#include <string>

#include "notation/document_parser.h"
#include "test_helpers.h"

namespace sur {
namespace {

using test_helpers::lyricNoteElement;
using test_helpers::lyricsElement;
using test_helpers::makeBeat;
using test_helpers::noteElement;
using test_helpers::wrapComposition;

Document minimalDocument() {
  Document doc;
  doc.metadata["name"] = "Test";
  doc.scale["S"] = "Sa";
  Section section;
  section.title = "Sthayi";
  section.beats.push_back(makeBeat(0, 0, noteElement(Pitch::S)));
  doc.composition.sections.push_back(section);
  return doc;
}

// ---------------------------------------------------------------------------
// Document-level fields
// ---------------------------------------------------------------------------

TEST(ValidatorTest, MinimalDocumentPasses) {
  ValidationResult result = checkDocument(minimalDocument());
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.field.empty());
  EXPECT_TRUE(result.error_message.empty());
  EXPECT_NO_THROW(validate(minimalDocument()));
}

TEST(ValidatorTest, ParsedDocumentPasses) {
  Document doc = parse(wrapComposition("#A\nb: S [sa:S re:R] * -\n"));
  EXPECT_TRUE(checkDocument(doc).success);
}

TEST(ValidatorTest, MissingNameFails) {
  Document doc = minimalDocument();
  doc.metadata.erase("name");
  ValidationResult result = checkDocument(doc);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.field, "metadata.name");
  EXPECT_EQ(result.error_message, "Document must have a name in metadata");
}

TEST(ValidatorTest, EmptyNameFails) {
  Document doc = minimalDocument();
  doc.metadata["name"] = "";
  EXPECT_EQ(checkDocument(doc).field, "metadata.name");
}

TEST(ValidatorTest, EmptyScaleFails) {
  Document doc = minimalDocument();
  doc.scale.clear();
  ValidationResult result = checkDocument(doc);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.field, "scale");
}

TEST(ValidatorTest, NoSectionsFails) {
  Document doc = minimalDocument();
  doc.composition.sections.clear();
  ValidationResult result = checkDocument(doc);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.field, "composition.sections");
  EXPECT_EQ(result.error_message, "Document must have at least one section");
}

TEST(ValidatorTest, NameIsCheckedBeforeScale) {
  Document doc;
  EXPECT_EQ(checkDocument(doc).field, "metadata.name");
}

TEST(ValidatorTest, UntitledSectionFails) {
  Document doc = minimalDocument();
  doc.composition.sections[0].title.clear();
  EXPECT_EQ(checkDocument(doc).field, "composition.sections[0].title");
}

TEST(ValidatorTest, SectionWithoutBeatsPasses) {
  Document doc = minimalDocument();
  Section empty;
  empty.title = "Antara";
  doc.composition.sections.push_back(empty);
  EXPECT_TRUE(checkDocument(doc).success);
}

TEST(ValidatorTest, TitlesThatCannotBeWrittenBackFail) {
  const char* titles[] = {" Sthayi", "Sthayi\t", "Sthayi // part 1", "a\nb"};
  for (const char* title : titles) {
    Document doc = minimalDocument();
    doc.composition.sections[0].title = title;
    EXPECT_EQ(checkDocument(doc).field, "composition.sections[0].title") << title;
  }
}

// ---------------------------------------------------------------------------
// Metadata and scale text
// ---------------------------------------------------------------------------

TEST(ValidatorTest, MetadataKeysThatCannotBeWrittenBackFail) {
  const char* keys[] = {"", " raag", "laya:madhya", "a\"b", "x//y", "@CONFIG", "%%SCALE",
                        "two\nlines"};
  for (const char* key : keys) {
    Document doc = minimalDocument();
    doc.metadata[key] = "v";
    ValidationResult result = checkDocument(doc);
    EXPECT_FALSE(result.success) << key;
    EXPECT_EQ(result.field, std::string("metadata.") + key);
  }
}

TEST(ValidatorTest, MetadataValuesWithQuoteOrLineBreakFail) {
  Document doc = minimalDocument();
  doc.metadata["taal"] = "a\" // \"b";
  EXPECT_EQ(checkDocument(doc).field, "metadata.taal");
  doc.metadata["taal"] = "first\r\nsecond";
  EXPECT_EQ(checkDocument(doc).field, "metadata.taal");
}

TEST(ValidatorTest, WritableMetadataValuesPass) {
  Document doc = minimalDocument();
  doc.metadata["blank"] = "";
  doc.metadata["tempo"] = "  madhya: 90 // approx ";
  EXPECT_TRUE(checkDocument(doc).success);
}

TEST(ValidatorTest, ScaleEntriesThatCannotBeWrittenBackFail) {
  Document doc = minimalDocument();
  doc.scale["S"] = "";
  ValidationResult result = checkDocument(doc);
  EXPECT_EQ(result.field, "scale.S");
  EXPECT_EQ(result.error_message, "Scale name must not be empty");

  doc = minimalDocument();
  doc.scale["R"] = " Re";
  EXPECT_EQ(checkDocument(doc).field, "scale.R");

  doc = minimalDocument();
  doc.scale["G"] = "Ga \"shuddha\"";
  EXPECT_EQ(checkDocument(doc).field, "scale.G");

  doc = minimalDocument();
  doc.scale["a->b"] = "x";
  EXPECT_EQ(checkDocument(doc).field, "scale.a->b");
}

TEST(ValidatorTest, WritableScaleEntriesPass) {
  Document doc = minimalDocument();
  doc.scale["r'"] = "Re: komal";
  doc.scale["g"] = "Ga // komal";
  doc.scale["M"] = "Ma -> tivra";
  EXPECT_TRUE(checkDocument(doc).success);
}

// ---------------------------------------------------------------------------
// Beats and elements
// ---------------------------------------------------------------------------

TEST(ValidatorTest, BeatWithoutPositionFails) {
  Document doc = minimalDocument();
  doc.composition.sections[0].beats[0].position.reset();
  ValidationResult result = checkDocument(doc);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.field, "composition.sections[0].beats[0].position");
}

TEST(ValidatorTest, BeatWithoutElementsFails) {
  Document doc = minimalDocument();
  doc.composition.sections[0].beats.push_back(makeBeat(0, 1));
  EXPECT_EQ(checkDocument(doc).field, "composition.sections[0].beats[1].elements");
}

TEST(ValidatorTest, EmptyElementFails) {
  Document doc = minimalDocument();
  doc.composition.sections[0].beats[0].elements.push_back(Element{});
  EXPECT_EQ(checkDocument(doc).field, "composition.sections[0].beats[0].elements[1]");
}

TEST(ValidatorTest, LyricsOnlyElementPasses) {
  Document doc = minimalDocument();
  doc.composition.sections[0].beats.push_back(makeBeat(0, 1, lyricsElement("al")));
  EXPECT_TRUE(checkDocument(doc).success);
}

TEST(ValidatorTest, UnrepresentableLyricsFail) {
  const char* bad_lyrics[] = {"", "say \"hi\"", "two\nlines"};
  for (const char* lyrics : bad_lyrics) {
    Document doc = minimalDocument();
    doc.composition.sections[0].beats[0].elements[0] = lyricNoteElement(lyrics, Pitch::S);
    EXPECT_EQ(checkDocument(doc).field, "composition.sections[0].beats[0].elements[0]")
        << lyrics;
  }
}

TEST(ValidatorTest, SilenceWithOctaveFails) {
  Document doc = minimalDocument();
  doc.composition.sections[0].beats[0].elements[0] =
      noteElement(Pitch::Silence, Octave::Upper);
  ValidationResult result = checkDocument(doc);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error_message.find("silence cannot carry an octave"), std::string::npos);
}

TEST(ValidatorTest, SustainWithLyricsFails) {
  Document doc = minimalDocument();
  doc.composition.sections[0].beats[0].elements[0] = lyricNoteElement("aa", Pitch::Sustain);
  ValidationResult result = checkDocument(doc);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error_message.find("sustain cannot carry lyrics"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Throwing form
// ---------------------------------------------------------------------------

TEST(ValidatorTest, ValidateThrowsWithField) {
  Document doc = minimalDocument();
  doc.scale.clear();
  try {
    validate(doc);
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& err) {
    EXPECT_EQ(err.field(), "scale");
    EXPECT_STREQ(err.what(), "Scale must contain at least one note mapping");
  }
}

TEST(ValidatorTest, CheckDoesNotMutate) {
  Document doc = minimalDocument();
  Document copy = doc;
  checkDocument(doc);
  EXPECT_TRUE(sameContent(doc, copy));
}

}  // namespace
}  // namespace sur
