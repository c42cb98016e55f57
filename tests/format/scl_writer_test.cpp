// Tests for format/scl_writer.h -- canonical .scl output and round-trip with SclReader.

#include "format/scl_writer.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "format/scl_reader.h"

namespace scl {
namespace {

// ---------------------------------------------------------------------------
// Helper: a small mixed ratio/cents scale.
// ---------------------------------------------------------------------------

Scale makeMixedScale() {
  Scale scale;
  scale.description = "Mixed ratio and cents";
  scale.pitches = {Pitch::ratio(9, 8), Pitch::cents(386.313714), Pitch::ratio(3, 2),
                   Pitch::cents(1200.0)};
  return scale;
}

// ---------------------------------------------------------------------------
// Output layout
// ---------------------------------------------------------------------------

TEST(SclWriterTest, DefaultConstructionProducesEmptyText) {
  SclWriter writer;
  EXPECT_TRUE(writer.toString().empty());
}

TEST(SclWriterTest, LayoutWithoutName) {
  SclWriter writer;
  writer.build(makeMixedScale());
  EXPECT_EQ(writer.toString(),
            "Mixed ratio and cents\n"
            " 4\n"
            " 9/8\n"
            " 386.313714\n"
            " 3/2\n"
            " 1200.000000\n");
}

TEST(SclWriterTest, NameAddsHeaderComment) {
  Scale scale;
  scale.description = "Octave";
  scale.pitches = {Pitch::ratio(2, 1)};

  SclWriter writer;
  writer.build(scale, "octave.scl");
  EXPECT_EQ(writer.toString(),
            "! octave.scl\n"
            "!\n"
            "Octave\n"
            " 1\n"
            " 2/1\n");
}

TEST(SclWriterTest, EmptyScale) {
  SclWriter writer;
  writer.build(Scale{});
  EXPECT_EQ(writer.toString(), "\n 0\n");
}

TEST(SclWriterTest, BuildReplacesPreviousText) {
  SclWriter writer;
  writer.build(makeMixedScale(), "first");
  Scale octave;
  octave.description = "second";
  octave.pitches = {Pitch::ratio(2, 1)};
  writer.build(octave);
  EXPECT_EQ(writer.toString(), "second\n 1\n 2/1\n");
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------

TEST(SclWriterTest, WriteToStream) {
  std::ostringstream output;
  ASSERT_TRUE(writeScale(output, makeMixedScale(), "mixed"));
  EXPECT_EQ(output.str().rfind("! mixed\n!\nMixed ratio and cents\n", 0), 0u);
}

TEST(SclWriterTest, WriteToFailedStreamReturnsFalse) {
  std::ostringstream output;
  output.setstate(std::ios::badbit);
  EXPECT_FALSE(writeScale(output, makeMixedScale()));
}

TEST(SclWriterTest, WriteToFileAndReadBack) {
  std::string path = ::testing::TempDir() + "scl_writer_test_output.scl";
  SclWriter writer;
  writer.build(makeMixedScale(), "mixed.scl");
  ASSERT_TRUE(writer.writeToFile(path));

  std::ifstream file(path);
  std::stringstream contents;
  contents << file.rdbuf();
  EXPECT_EQ(contents.str(), writer.toString());
  std::remove(path.c_str());
}

TEST(SclWriterTest, WriteToInvalidPathReturnsFalse) {
  SclWriter writer;
  writer.build(makeMixedScale());
  EXPECT_FALSE(writer.writeToFile("/nonexistent_dir_12345/out.scl"));
}

// ---------------------------------------------------------------------------
// Round-trip: write with SclWriter, read back with SclReader
// ---------------------------------------------------------------------------

TEST(SclWriterTest, RoundTripPreservesDescriptionAndPitchText) {
  Scale original = makeMixedScale();
  SclWriter writer;
  writer.build(original);

  SclReader reader;
  ASSERT_TRUE(reader.readString(writer.toString())) << reader.getError();
  const Scale& parsed = reader.getScale();

  EXPECT_EQ(parsed.description, original.description);
  ASSERT_EQ(parsed.pitchCount(), original.pitchCount());
  for (size_t idx = 0; idx < parsed.pitches.size(); ++idx) {
    EXPECT_EQ(parsed.pitches[idx].toString(), original.pitches[idx].toString());
    EXPECT_EQ(parsed.pitches[idx].kind(), original.pitches[idx].kind());
  }
}

TEST(SclWriterTest, RoundTripWithNameKeepsFrequencies) {
  Scale original = makeMixedScale();
  SclWriter writer;
  writer.build(original, "mixed.scl");

  SclReader reader;
  ASSERT_TRUE(reader.readString(writer.toString())) << reader.getError();

  std::vector<double> expected = original.freqs(440.0);
  std::vector<double> actual = reader.getScale().freqs(440.0);
  ASSERT_EQ(actual.size(), expected.size());
  for (size_t idx = 0; idx < actual.size(); ++idx) {
    EXPECT_NEAR(actual[idx], expected[idx], 1e-9);
  }
}

TEST(SclWriterTest, CanonicalOutputIsStable) {
  // Reading and re-writing canonical output reproduces it byte for byte.
  SclWriter first;
  first.build(makeMixedScale(), "stable");

  SclReader reader;
  ASSERT_TRUE(reader.readString(first.toString())) << reader.getError();
  SclWriter second;
  second.build(reader.getScale(), "stable");
  EXPECT_EQ(second.toString(), first.toString());
}

}  // namespace
}  // namespace scl
